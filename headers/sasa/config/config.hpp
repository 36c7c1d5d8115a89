//
// Created by gregorian-rayne on 1/11/26.
//

#ifndef SASA_CONFIG_HPP
#define SASA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for analysis runs.
 *
 * Example:
 *
 *     [analysis]
 *     token_budget = 4000
 *     chars_per_token = 4
 *     database_only = false
 *     include_unused_libraries = false
 *
 *     [libraries]
 *     builtin = ["WORK", "SASHELP", "SASUSER"]
 *
 *     [macros]
 *     builtin = ["LOG_STEP"]
 *
 *     [variables]
 *     ENV = "PROD"
 *
 *     [output]
 *     format = "json"
 *     pretty = true
 */

#include "sasa/analyzers/analyzer.hpp"
#include "sasa/error.hpp"
#include "sasa/result.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sasa::config {

    struct AnalysisConfig {
        std::size_t token_budget = 4000;
        std::size_t chars_per_token = 4;
        bool database_only = false;
        bool include_unused_libraries = false;
    };

    struct OutputConfig {
        std::string format = "json";
        bool pretty = true;
    };

    class Config {
    public:
        AnalysisConfig analysis;
        std::vector<std::string> builtin_libraries = {"WORK", "SASHELP", "SASUSER"};
        std::vector<std::string> builtin_macros;
        std::map<std::string, std::string> variables;
        OutputConfig output;

        /**
         * Loads configuration from a TOML file.
         *
         * @return NotFound if the file is missing, ParseError for malformed
         *         TOML, ConfigError for values of the wrong type or range.
         */
        [[nodiscard]] static Result<Config, Error> load_from_file(const std::filesystem::path& path);

        [[nodiscard]] static Result<Config, Error> load_from_string(const std::string& content);

        /**
         * Checks value ranges. All problems are reported in one error.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Builds analysis options from this configuration.
         */
        [[nodiscard]] analyzers::AnalysisOptions to_options() const;
    };

}  // namespace sasa::config

#endif //SASA_CONFIG_HPP
