//
// Created by gregorian-rayne on 1/12/26.
//

#include "sasa/cli/commands/command.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace sasa::cli
{
    const std::vector<ArgDef>& common_arguments() {
        static const std::vector<ArgDef> common = {
            {"help", 'h', "Show this help message", false, false},
            {"verbose", 'v', "Report progress and anomalies on stderr", false, false},
            {"quiet", 'q', "Only show errors", false, false},
            {"debug", 0, "Show debug output", false, false},
            {"json", 0, "Machine-readable output", false, false},
        };
        return common;
    }

    // ----------------------------------------------------------------------------
    // ParsedArgs
    // ----------------------------------------------------------------------------

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = {value};
    }

    void ParsedArgs::append(const std::string& name, const std::string& value) {
        values_[name].push_back(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<long long> ParsedArgs::get_int(const std::string& name) const {
        const auto text = get(name);
        if (!text) {
            return std::nullopt;
        }

        long long parsed = 0;
        const char* end = text->data() + text->size();
        const auto [ptr, ec] = std::from_chars(text->data(), end, parsed);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return parsed;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? std::vector<std::string>{} : it->second;
    }

    // ----------------------------------------------------------------------------
    // Command
    // ----------------------------------------------------------------------------

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: sasa " << name() << " [OPTIONS]";
        for (const auto& arg : arguments()) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        const auto defs = arguments();
        const auto missing = std::ranges::find_if(defs, [&args](const ArgDef& def) {
            return def.required && !args.has(def.name);
        });
        return missing == defs.end() ? std::string{} : "Missing required argument: --" + missing->name;
    }

    namespace {

        void print_option(std::ostream& os, const ArgDef& arg) {
            std::string names = arg.short_name ? std::string("-") + arg.short_name + ", " : "    ";
            names += "--" + arg.name;
            if (arg.takes_value) {
                names += " <" + arg.value_name + ">";
            }

            os << "  " << std::left << std::setw(30) << names << arg.description;
            if (!arg.default_value.empty()) {
                os << " (default: " << arg.default_value << ")";
            }
            if (arg.required) {
                os << " [required]";
            }
            if (arg.repeatable) {
                os << " [repeatable]";
            }
            os << "\n";
        }

    }  // namespace

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                print_option(std::cout, arg);
            }
            std::cout << "\n";
        }

        std::cout << "Common options:\n";
        for (const auto& arg : common_arguments()) {
            print_option(std::cout, arg);
        }
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            verbosity_ = Verbosity::Debug;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ > Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ > Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cerr << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cerr << "[DEBUG] " << msg << "\n";
        }
    }

    // ----------------------------------------------------------------------------
    // CommandRegistry
    // ----------------------------------------------------------------------------

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(commands_, [name](const auto& cmd) {
            return cmd->name() == name;
        });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        std::ranges::sort(result, {}, [](const Command* cmd) { return cmd->name(); });
        return result;
    }

    // ----------------------------------------------------------------------------
    // Argument parsing
    // ----------------------------------------------------------------------------

    namespace {

        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args) {
                for (const auto* list : {&defs, &common_arguments()}) {
                    for (const auto& def : *list) {
                        long_names_.try_emplace(def.name, &def);
                        if (def.short_name) {
                            short_names_.try_emplace(def.short_name, &def);
                        }
                    }
                }
                for (const auto& def : defs) {
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() {
                bool options_ended = false;
                for (index_ = 0; index_ < args_.size() && result_.success; ++index_) {
                    const auto& arg = args_[index_];
                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg == "-" || arg[0] != '-') {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg.starts_with("--")) {
                        parse_long(arg.substr(2));
                    } else {
                        parse_short(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void parse_long(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = long_names_.find(name);
                if (it == long_names_.end()) {
                    fail("Unknown option: --" + name);
                    return;
                }

                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    result_.args.set_flag(def.name);
                    return;
                }

                auto value = inline_value ? *inline_value : next_argument();
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                store(def, value);
            }

            void parse_short(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];
                    const auto it = short_names_.find(c);
                    if (it == short_names_.end()) {
                        fail(std::string("Unknown option: -") + c);
                        return;
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    // The rest of the token, or the next argument, is the value.
                    auto value = j + 1 < arg.size() ? arg.substr(j + 1) : next_argument();
                    if (value.empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                        return;
                    }
                    store(def, value);
                    return;
                }
            }

            std::string next_argument() {
                if (index_ + 1 < args_.size()) {
                    return args_[++index_];
                }
                return {};
            }

            void store(const ArgDef& def, const std::string& value) {
                if (def.repeatable) {
                    result_.args.append(def.name, value);
                } else {
                    result_.args.set(def.name, value);
                }
            }

            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const std::vector<std::string>& args_;
            std::unordered_map<std::string, const ArgDef*> long_names_;
            std::unordered_map<char, const ArgDef*> short_names_;
            ParseResult result_;
            std::size_t index_ = 0;
        };

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentParser(args, defs).run();
    }
}  // namespace sasa::cli
