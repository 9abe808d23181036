//
// Created by gregorian-rayne on 2/16/26.
//

#include "bfa/cli/commands/command.hpp"
#include "bfa/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << bfa::PROJECT_NAME << " " << bfa::VERSION_STRING << "\n\n";
        std::cout << "Estimates how many contributors a project can lose before most of its\n"
                     "files are left without a knowledgeable owner.\n\n";
        std::cout << "Usage: " << bfa::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : bfa::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << bfa::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty() || args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        if (args[0] == "--version" || args[0] == "-V") {
            std::cout << bfa::PROJECT_SHORT_NAME << " " << bfa::VERSION_STRING << "\n";
            return 0;
        }

        auto* cmd = bfa::cli::CommandRegistry::instance().find(args[0]);
        if (!cmd) {
            std::cerr << "error: Unknown command: " << args[0] << "\n";
            std::cerr << "Run '" << bfa::PROJECT_SHORT_NAME << " --help' for a list of commands.\n";
            return 1;
        }

        const std::vector<std::string> rest(args.begin() + 1, args.end());
        const auto parsed = bfa::cli::parse_arguments(rest, cmd->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            cmd->print_help();
            return 0;
        }

        if (const auto problem = cmd->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n";
            return 1;
        }

        return cmd->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
