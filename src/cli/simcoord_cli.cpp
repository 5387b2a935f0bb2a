#include "simcoord_cli.hpp"
#include "theme.hpp"
#include <iostream>

SimcoordCLI::SimcoordCLI() {
    register_all_commands();
}

void SimcoordCLI::register_all_commands() {
    register_jobs_commands(*this);
    register_service_commands(*this);
}

int SimcoordCLI::run(const std::vector<std::string>& argv) {
    std::string config_path;
    std::size_t i = 0;

    for (; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argv.size()) {
            config_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argv.size()) {
            store_override = argv[++i];
        } else {
            break;
        }
    }

    if (i >= argv.size()) {
        std::cout << theme::fail("Missing command.");
        print_help();
        return 1;
    }

    std::string command = argv[i];
    if (!has_command(command)) {
        return execute_command(command, {});
    }

    if (!load_config(config_path)) return 1;

    std::vector<std::string> args(argv.begin() + static_cast<std::ptrdiff_t>(i) + 1, argv.end());
    return execute_command(command, args);
}
