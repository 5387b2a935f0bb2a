#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

bool BaseCLI::load_config(const std::string& path) {
    auto result = path.empty() ? Config::load_default() : Config::load(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;
    if (!store_override.empty()) config->set_store_path(store_override);
    if (!config->log().file.empty()) set_log_path(config->log().file);
    return true;
}

bool BaseCLI::require_store() {
    if (coordinator) return true;
    if (!config.has_value() && !load_config()) return false;

    auto opened = open_job_store(config->store());
    if (opened.is_err()) {
        std::cout << theme::fail(opened.error);
        return false;
    }
    store = opened.value;
    coordinator = std::make_unique<JobCoordinator>(store, metrics.hooks());
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'simcoord --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Jobs",    {"submit", "status", "list", "cancel"}},
        {"Service", {"serve", "reap", "stats"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<30}", name + " " + it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}
