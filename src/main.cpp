#include <iostream>
#include <vector>
#include <string>
#include "cli/simcoord_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage(const SimcoordCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    simcoord "
              << theme::color::RESET << theme::color::BROWN << "[--config file] [--db path]"
              << theme::color::RESET << theme::color::BLUE << " <command>"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    simcoord --version        Show version\n"
              << "    simcoord --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        SimcoordCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "simcoord"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SIMCOORD_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        return cli.run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
