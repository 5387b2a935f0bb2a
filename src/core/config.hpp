#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ./simcoord.yaml (or the given file). A missing file at the default
    // location yields the built-in defaults with the reaper unconfigured.
    static Result<Config> load(const fs::path& path);
    static Result<Config> load_default(const fs::path& dir = fs::current_path());

    // Parse YAML text directly (tests, embedded configs)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const StoreConfig& store() const { return store_; }
    const WorkerConfig& worker() const { return worker_; }
    const ReaperConfig& reaper() const { return reaper_; }
    const LogConfig& log() const { return log_; }
    const fs::path& source() const { return source_; }

    // Overrides from the command line
    void set_store_path(const std::string& path) { store_.path = path; }

public:
    Config() = default;

private:
    StoreConfig store_;
    WorkerConfig worker_;
    ReaperConfig reaper_;
    LogConfig log_;
    fs::path source_;

    friend class ConfigParser;
};

bool config_exists(const fs::path& dir = fs::current_path());
fs::path get_config_path(const fs::path& dir = fs::current_path());
