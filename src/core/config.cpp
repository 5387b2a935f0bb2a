#include "config.hpp"
#include "constants.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

bool config_exists(const fs::path& dir) {
    return fs::exists(get_config_path(dir));
}

fs::path get_config_path(const fs::path& dir) {
    return dir / CONFIG_FILE_NAME;
}

class ConfigParser {
public:
    static Result<void> parse_root(const YAML::Node& root, Config& config);

private:
    static Result<void> parse_store(const YAML::Node& node, StoreConfig& store);
    static Result<void> parse_worker(const YAML::Node& node, WorkerConfig& worker);
    static Result<void> parse_reaper(const YAML::Node& node, ReaperConfig& reaper);
};

static Result<void> invalid(const std::string& msg) {
    return Result<void>::Err(msg, ErrorCode::InvalidConfig);
}

// Reads `key` as a duration. Absent keys leave `out` untouched.
static Result<void> read_duration(const YAML::Node& node, const char* section, const char* key,
                                  std::optional<std::chrono::seconds>& out) {
    if (!node[key]) return Result<void>::Ok();
    if (!node[key].IsScalar()) {
        return invalid(std::string(section) + "." + key + " must be a duration");
    }
    std::string text = node[key].as<std::string>();
    auto parsed = parse_duration(text);
    if (!parsed) {
        return invalid(std::string(section) + "." + key + ": invalid duration '" + text + "'");
    }
    out = parsed;
    return Result<void>::Ok();
}

Result<void> ConfigParser::parse_store(const YAML::Node& node, StoreConfig& store) {
    std::string backend = to_lower(node["backend"].as<std::string>("sqlite"));
    if (backend == "sqlite") {
        store.backend = StoreBackend::Sqlite;
    } else if (backend == "memory") {
        store.backend = StoreBackend::Memory;
    } else {
        return invalid("store.backend must be 'sqlite' or 'memory', got '" + backend + "'");
    }

    store.path = node["path"].as<std::string>(store.path);
    store.busy_timeout_ms = node["busy_timeout_ms"].as<int>(SQLITE_DEFAULT_BUSY_MS);
    if (store.busy_timeout_ms < 0) {
        return invalid("store.busy_timeout_ms must not be negative");
    }
    if (store.backend == StoreBackend::Sqlite && store.path.empty()) {
        return invalid("store.path is required for the sqlite backend");
    }
    return Result<void>::Ok();
}

Result<void> ConfigParser::parse_worker(const YAML::Node& node, WorkerConfig& worker) {
    worker.node = node["node"].as<std::string>("");
    worker.threads = node["threads"].as<int>(DEFAULT_WORKER_THREADS);
    if (worker.threads < 1) {
        return invalid("worker.threads must be at least 1");
    }

    std::optional<std::chrono::seconds> poll;
    auto r = read_duration(node, "worker", "poll_interval", poll);
    if (r.is_err()) return r;
    if (poll) worker.poll_interval = *poll;

    std::string policy = to_lower(node["on_failure"].as<std::string>("swallow"));
    if (policy == "swallow") {
        worker.on_failure = FailurePolicy::Swallow;
    } else if (policy == "rethrow") {
        worker.on_failure = FailurePolicy::Rethrow;
    } else {
        return invalid("worker.on_failure must be 'swallow' or 'rethrow', got '" + policy + "'");
    }
    return Result<void>::Ok();
}

Result<void> ConfigParser::parse_reaper(const YAML::Node& node, ReaperConfig& reaper) {
    auto r = read_duration(node, "reaper", "interval", reaper.interval);
    if (r.is_err()) return r;
    r = read_duration(node, "reaper", "deadline", reaper.deadline);
    if (r.is_err()) return r;

    // A half-configured reaper is a mistake, not a request for a default.
    if (reaper.interval.has_value() != reaper.deadline.has_value()) {
        return invalid("reaper needs both interval and deadline");
    }
    return Result<void>::Ok();
}

Result<void> ConfigParser::parse_root(const YAML::Node& root, Config& config) {
    if (root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return invalid("top level must be a mapping");

    if (root["store"]) {
        auto r = parse_store(root["store"], config.store_);
        if (r.is_err()) return r;
    }
    if (root["worker"]) {
        auto r = parse_worker(root["worker"], config.worker_);
        if (r.is_err()) return r;
    }
    if (root["reaper"]) {
        auto r = parse_reaper(root["reaper"], config.reaper_);
        if (r.is_err()) return r;
    }
    if (root["log"]) {
        config.log_.file = root["log"]["file"].as<std::string>("");
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        auto r = ConfigParser::parse_root(root, config);
        if (r.is_err()) return forward_error<Config>(r);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorCode::InvalidConfig);
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorCode::InvalidConfig);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config;
        auto r = ConfigParser::parse_root(root, config);
        if (r.is_err()) {
            return Result<Config>::Err(path.string() + ": " + r.error, r.code);
        }
        config.source_ = path;

        // Relative store paths are relative to the config file
        if (config.store_.backend == StoreBackend::Sqlite && config.store_.path != ":memory:") {
            fs::path db = config.store_.path;
            if (db.is_relative()) {
                config.store_.path = (path.parent_path() / db).lexically_normal().string();
            }
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorCode::InvalidConfig);
    }
}

Result<Config> Config::load_default(const fs::path& dir) {
    if (!config_exists(dir)) {
        return Result<Config>::Ok(Config{});
    }
    return load(get_config_path(dir));
}
