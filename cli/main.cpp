//
// Created by gregorian-rayne on 1/13/26.
//

#include "sasa/cli/commands/command.hpp"
#include "sasa/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << sasa::PROJECT_NAME << " " << sasa::VERSION_STRING << "\n\n";
        std::cout << "Usage: sasa <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : sasa::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun 'sasa <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            print_usage();
            return 0;
        }
        if (command_name == "--version" || command_name == "version") {
            std::cout << sasa::PROJECT_SHORT_NAME << " " << sasa::VERSION_STRING << "\n";
            return 0;
        }

        auto* command = sasa::cli::CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: unknown command '" << command_name << "'\n\n";
            print_usage();
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        auto parsed = sasa::cli::parse_arguments(args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = command->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                return 1;
            }
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
