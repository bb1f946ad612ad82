#include <iostream>
#include <vector>
#include <string>
#include "cli/ego_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage(const EgoCLI& cli) {
    std::cout << "\n" << theme::color::MAGENTA << theme::color::BOLD << "  ego"
              << theme::color::RESET << theme::color::DIM
              << "  time and line delta for a coding session" << theme::color::RESET << "\n";
    std::cout << theme::section("Usage");
    std::cout << theme::color::CYAN << "    ego start "
              << theme::color::RESET << theme::color::YELLOW << "<PROJECT_DIRECTORY>"
              << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    ego end" << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    ego --version     Show version\n"
              << "    ego --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        EgoCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::MAGENTA << theme::color::BOLD << "ego"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << EGO_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
