//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SASA_CLI_OPTIONS_HPP
#define SASA_CLI_OPTIONS_HPP

/**
 * @file options.hpp
 * @brief Analysis options from config files and command-line flags.
 *
 * A --config file is applied first; explicit flags override it.
 */

#include "sasa/analyzers/analyzer.hpp"
#include "sasa/cli/commands/command.hpp"
#include "sasa/config/config.hpp"
#include "sasa/error.hpp"
#include "sasa/result.hpp"

#include <filesystem>
#include <string>

namespace sasa::cli
{
    struct CommandOptions {
        config::Config config;
        analyzers::AnalysisOptions analysis;
    };

    /**
     * Resolves options from --config, --tokens, --database-only,
     * --include-unused and repeated --define NAME=VALUE.
     */
    [[nodiscard]] Result<CommandOptions, Error> resolve_options(const ParsedArgs& args);

    /**
     * Splits a NAME=VALUE definition. A missing '=' or empty name fails
     * with InvalidArgument.
     */
    [[nodiscard]] Result<std::pair<std::string, std::string>, Error> parse_definition(const std::string& text);

    /**
     * Source name for placeholders: the file stem, or "stdin".
     */
    [[nodiscard]] std::string source_name_for(const std::string& input);

}  // namespace sasa::cli

#endif //SASA_CLI_OPTIONS_HPP
