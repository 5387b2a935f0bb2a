#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Command registration, one function per command file
void register_jobs_commands(BaseCLI& cli);
void register_service_commands(BaseCLI& cli);

class SimcoordCLI : public BaseCLI {
public:
    SimcoordCLI();

    // Global options come before the command: --config <file>, --db <path>.
    // Returns the exit code.
    int run(const std::vector<std::string>& argv);

private:
    void register_all_commands();
};
