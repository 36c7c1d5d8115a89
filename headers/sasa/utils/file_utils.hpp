//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_FILE_UTILS_HPP
#define SASA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Whole-file reads and writes for SAS sources, reports and chunks.
 */

#include "sasa/result.hpp"
#include "sasa/error.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace sasa::file_utils {

    namespace fs = std::filesystem;

    /// Reads @p in to end of stream; a hard stream failure is an IoError.
    inline Result<std::string, Error> read_stream(std::istream& in) {
        std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return Result<std::string, Error>::failure(Error::io_error("Failed to read input stream"));
        }
        return Result<std::string, Error>::success(std::move(content));
    }

    /// Reads the file at @p path byte for byte.
    inline Result<std::string, Error> read_file(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return Result<std::string, Error>::failure(Error::not_found("File not found", path.string()));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(Error::io_error("Failed to open file", path.string()));
        }
        return read_stream(file).map_error([&path](const Error& error) {
            return error.with_context(path.string());
        });
    }

    /// Reads a command-line input: a file path, or standard input for "-".
    inline Result<std::string, Error> read_source(const std::string& input) {
        if (input == "-") {
            return read_stream(std::cin);
        }
        return read_file(input);
    }

    inline Result<void, Error> ensure_parent_directory(const fs::path& path) {
        const auto parent = path.parent_path();
        std::error_code ec;
        if (parent.empty() || fs::is_directory(parent, ec)) {
            return Result<void, Error>::success();
        }
        if (fs::create_directories(parent, ec); ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to create directory: " + ec.message(), parent.string()));
        }
        return Result<void, Error>::success();
    }

    /// Replaces the file at @p path with @p content, creating directories on the way.
    inline Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        return ensure_parent_directory(path).and_then([&]() {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to open file for writing", path.string()));
            }
            if (!file.write(content.data(), static_cast<std::streamsize>(content.size()))) {
                return Result<void, Error>::failure(Error::io_error("Failed to write file", path.string()));
            }
            return Result<void, Error>::success();
        });
    }

}  // namespace sasa::file_utils

#endif //SASA_FILE_UTILS_HPP
