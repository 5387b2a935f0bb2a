#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <store/job_store.hpp>
#include <coordinator/coordinator.hpp>
#include <coordinator/coordinator_metrics.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Load simcoord.yaml (explicit path, or ./simcoord.yaml when empty) and
    // point the process log at the configured file.
    bool load_config(const std::string& path = "");

    // Open the store named by the config and build the coordinator.
    bool require_store();

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string store_override;                 // --db on the command line
    std::shared_ptr<JobStore> store;
    CoordinatorMetrics metrics;                 // outlives coordinator (hooks point here)
    std::unique_ptr<JobCoordinator> coordinator;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
