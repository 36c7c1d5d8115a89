//
// Created by gregorian-rayne on 1/11/26.
//

#include "sasa/config/config.hpp"
#include "sasa/exporters/exporter.hpp"
#include "sasa/utils/file_utils.hpp"
#include "sasa/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <sstream>

namespace sasa::config
{
    namespace {

        /**
         * Reads typed values out of one TOML table, recording a message for
         * every key present with the wrong type.
         */
        class TableReader {
        public:
            TableReader(const toml::table& table, std::string section, std::vector<std::string>& errors)
                : table_(table), section_(std::move(section)), errors_(errors) {}

            void read_bool(const std::string_view key, bool& out) const {
                const auto node = table_[key];
                if (!node) {
                    return;
                }
                if (const auto value = node.value<bool>(); value && node.is_boolean()) {
                    out = *value;
                } else {
                    type_error(key, "a boolean");
                }
            }

            void read_count(const std::string_view key, std::size_t& out) const {
                const auto node = table_[key];
                if (!node) {
                    return;
                }
                if (!node.is_integer()) {
                    type_error(key, "an integer");
                    return;
                }
                const auto value = node.value<std::int64_t>().value_or(0);
                if (value < 0) {
                    errors_.push_back(section_ + "." + std::string(key) + " must not be negative");
                    return;
                }
                out = static_cast<std::size_t>(value);
            }

            void read_string(const std::string_view key, std::string& out) const {
                const auto node = table_[key];
                if (!node) {
                    return;
                }
                if (const auto value = node.value<std::string>(); value && node.is_string()) {
                    out = *value;
                } else {
                    type_error(key, "a string");
                }
            }

            void read_string_list(const std::string_view key, std::vector<std::string>& out) const {
                const auto node = table_[key];
                if (!node) {
                    return;
                }
                const auto* array = node.as_array();
                if (array == nullptr) {
                    type_error(key, "an array of strings");
                    return;
                }

                std::vector<std::string> values;
                for (const auto& element : *array) {
                    const auto value = element.value<std::string>();
                    if (!value || !element.is_string()) {
                        type_error(key, "an array of strings");
                        return;
                    }
                    values.push_back(*value);
                }
                out = std::move(values);
            }

        private:
            void type_error(const std::string_view key, const std::string_view expected) const {
                errors_.push_back(section_ + "." + std::string(key) + " must be " + std::string(expected));
            }

            const toml::table& table_;
            std::string section_;
            std::vector<std::string>& errors_;
        };

        const toml::table* section(const toml::table& root, const std::string_view name,
                                   std::vector<std::string>& errors) {
            const auto node = root[name];
            if (!node) {
                return nullptr;
            }
            const auto* table = node.as_table();
            if (table == nullptr) {
                errors.push_back("[" + std::string(name) + "] must be a table");
            }
            return table;
        }

        /**
         * Variable values may be strings or scalars; scalars are stored in
         * their TOML spelling.
         */
        std::optional<std::string> variable_value(const toml::node& node) {
            if (const auto text = node.value_exact<std::string>()) {
                return *text;
            }
            if (const auto number = node.value_exact<std::int64_t>()) {
                return std::to_string(*number);
            }
            if (const auto flag = node.value_exact<bool>()) {
                return *flag ? "true" : "false";
            }
            if (node.is_floating_point()) {
                std::ostringstream ss;
                ss << node;
                return ss.str();
            }
            return std::nullopt;
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const std::filesystem::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(content.error());
        }

        return load_from_string(content.value()).map_error([&path](const Error& error) {
            return error.with_context(path.string());
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        toml::table root;
        try {
            root = toml::parse(content);
        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line << ", column " << err.source().begin.column;
            return Result<Config, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration: " + std::string(err.description()),
                                   where.str())
            );
        }

        Config config;
        std::vector<std::string> errors;

        if (const auto* analysis = section(root, "analysis", errors)) {
            const TableReader reader(*analysis, "analysis", errors);
            reader.read_count("token_budget", config.analysis.token_budget);
            reader.read_count("chars_per_token", config.analysis.chars_per_token);
            reader.read_bool("database_only", config.analysis.database_only);
            reader.read_bool("include_unused_libraries", config.analysis.include_unused_libraries);
        }

        if (const auto* libraries = section(root, "libraries", errors)) {
            TableReader(*libraries, "libraries", errors).read_string_list("builtin", config.builtin_libraries);
        }

        if (const auto* macros = section(root, "macros", errors)) {
            TableReader(*macros, "macros", errors).read_string_list("builtin", config.builtin_macros);
        }

        if (const auto* variables = section(root, "variables", errors)) {
            for (const auto& [key, node] : *variables) {
                if (auto value = variable_value(node)) {
                    config.variables[string_utils::to_upper(key.str())] = std::move(*value);
                } else {
                    errors.push_back("variables." + std::string(key.str()) + " must be a string or scalar");
                }
            }
        }

        if (const auto* output = section(root, "output", errors)) {
            const TableReader reader(*output, "output", errors);
            reader.read_string("format", config.output.format);
            reader.read_bool("pretty", config.output.pretty);
        }

        if (!errors.empty()) {
            return Result<Config, Error>::failure(
                Error::config_error("Invalid configuration:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<Config, Error>::failure(valid.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (analysis.token_budget == 0) {
            errors.emplace_back("token_budget must be positive");
        }

        if (analysis.chars_per_token == 0) {
            errors.emplace_back("chars_per_token must be positive");
        }

        if (!exporters::string_to_format(output.format)) {
            errors.emplace_back("output format must be json, markdown or text, got '" + output.format + "'");
        }

        for (const auto& library : builtin_libraries) {
            if (string_utils::is_blank(library)) {
                errors.emplace_back("builtin library names must not be blank");
                break;
            }
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    std::string Config::to_string() const {
        toml::array libraries;
        for (const auto& library : builtin_libraries) {
            libraries.push_back(library);
        }

        toml::array macros;
        for (const auto& macro : builtin_macros) {
            macros.push_back(macro);
        }

        toml::table vars;
        for (const auto& [name, value] : variables) {
            vars.insert(name, value);
        }

        const toml::table root{
            {"analysis", toml::table{
                {"token_budget", static_cast<std::int64_t>(analysis.token_budget)},
                {"chars_per_token", static_cast<std::int64_t>(analysis.chars_per_token)},
                {"database_only", analysis.database_only},
                {"include_unused_libraries", analysis.include_unused_libraries}
            }},
            {"libraries", toml::table{{"builtin", libraries}}},
            {"macros", toml::table{{"builtin", macros}}},
            {"variables", vars},
            {"output", toml::table{
                {"format", output.format},
                {"pretty", output.pretty}
            }}
        };

        std::ostringstream ss;
        ss << root << "\n";
        return ss.str();
    }

    analyzers::AnalysisOptions Config::to_options() const {
        analyzers::AnalysisOptions options;
        options.token_budget = analysis.token_budget;
        options.chars_per_token = analysis.chars_per_token;
        options.database_only = analysis.database_only;
        options.include_unused_libraries = analysis.include_unused_libraries;
        options.builtin_libraries = builtin_libraries;
        options.extra_builtin_macros = builtin_macros;
        options.predefined_variables = variables;
        return options;
    }

}  // namespace sasa::config
