//
// Created by gregorian-rayne on 1/12/26.
//

#include "sasa/cli/commands/options.hpp"
#include "sasa/utils/string_utils.hpp"

namespace sasa::cli
{
    Result<std::pair<std::string, std::string>, Error> parse_definition(const std::string& text) {
        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            return Result<std::pair<std::string, std::string>, Error>::failure(
                Error::invalid_argument("Expected NAME=VALUE", text)
            );
        }

        const auto name = string_utils::trim(std::string_view(text).substr(0, eq));
        if (name.empty()) {
            return Result<std::pair<std::string, std::string>, Error>::failure(
                Error::invalid_argument("Variable name is empty", text)
            );
        }

        return Result<std::pair<std::string, std::string>, Error>::success(
            std::make_pair(string_utils::to_upper(name), text.substr(eq + 1))
        );
    }

    std::string source_name_for(const std::string& input) {
        if (input.empty() || input == "-") {
            return "stdin";
        }
        return std::filesystem::path(input).stem().string();
    }

    Result<CommandOptions, Error> resolve_options(const ParsedArgs& args) {
        CommandOptions resolved;

        if (const auto path = args.get("config")) {
            auto loaded = config::Config::load_from_file(*path);
            if (loaded.is_err()) {
                return Result<CommandOptions, Error>::failure(loaded.error());
            }
            resolved.config = std::move(loaded.value());
        }

        auto& options = resolved.analysis;
        options = resolved.config.to_options();

        if (args.has("tokens")) {
            const auto tokens = args.get_int("tokens");
            if (!tokens || *tokens <= 0) {
                return Result<CommandOptions, Error>::failure(
                    Error::invalid_argument("--tokens must be a positive integer", args.get_or("tokens", ""))
                );
            }
            options.token_budget = static_cast<std::size_t>(*tokens);
        }

        if (args.get_flag("database-only")) {
            options.database_only = true;
        }
        if (args.get_flag("include-unused")) {
            options.include_unused_libraries = true;
        }

        for (const auto& definition : args.get_all("define")) {
            auto parsed = parse_definition(definition);
            if (parsed.is_err()) {
                return Result<CommandOptions, Error>::failure(parsed.error());
            }
            options.predefined_variables[parsed.value().first] = parsed.value().second;
        }

        return Result<CommandOptions, Error>::success(std::move(resolved));
    }

}  // namespace sasa::cli
