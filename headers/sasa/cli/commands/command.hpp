//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SASA_COMMAND_HPP
#define SASA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand framework for the sasa executable.
 *
 * Each subcommand derives from Command, declares its options as ArgDefs and
 * registers one instance with the CommandRegistry from a static object in its
 * own translation unit. main() looks the command up, parses the remaining
 * arguments against its ArgDefs and calls execute().
 */

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sasa::cli
{
    /**
     * One option a command accepts: `--name`, optionally `-n`.
     */
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool required = false;
        bool takes_value = true;           ///< false for boolean flags
        std::string default_value;
        std::string value_name = "VALUE";  ///< placeholder shown in help
        bool repeatable = false;           ///< every occurrence is kept
    };

    /// Options every command understands (help, verbosity, JSON output).
    [[nodiscard]] const std::vector<ArgDef>& common_arguments();

    /**
     * Option values, flags and positional arguments of one invocation.
     * Every occurrence of an option is stored; get() returns the last one.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void append(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;
        /// Whole-string integer; "12abc" yields nullopt.
        [[nodiscard]] std::optional<long long> get_int(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::map<std::string, std::vector<std::string>> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose,
        Debug
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;
        [[nodiscard]] virtual std::string usage() const;
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Runs the command.
         *
         * @return Process exit code, 0 on success.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * Checks arguments before execute() is called.
         *
         * @return A message describing the problem, empty when valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void apply_common_flags(const ParsedArgs& args);

        // Reports go to stdout; everything below goes to stderr except print().
        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        /// Commands sorted by name.
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the command name.
     *
     * Accepts `--name value`, `--name=value`, `-n value`, `-nvalue` and
     * bundled short flags (`-vd`). `--` ends option parsing, and a lone `-`
     * is positional (standard input). Defaults from @p defs are applied first.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace sasa::cli

#endif //SASA_COMMAND_HPP
