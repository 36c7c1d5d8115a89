//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_JSON_UTILS_HPP
#define SASA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json wrappers that report failures through Result.
 */

#include "sasa/result.hpp"
#include "sasa/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace sasa::json_utils {

    using json = nlohmann::json;

    inline Result<json, Error> parse(const std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", "byte " + std::to_string(e.byte) + ": " + e.what())
            );
        }
    }

    /**
     * Serializes @p data; @p indent of -1 gives one line. Invalid UTF-8 copied
     * from SAS source is replaced with U+FFFD instead of throwing.
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

}  // namespace sasa::json_utils

#endif //SASA_JSON_UTILS_HPP
