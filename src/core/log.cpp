#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

fs::path& configured_path() {
    static fs::path path = platform::temp_dir() / DEFAULT_LOG_NAME;
    return path;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

// Caller holds log_mutex().
void write_line(const fs::path& path, const std::string& line) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << line << "\n";
}

} // namespace

void set_log_path(const fs::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    configured_path() = path;
}

fs::path log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return configured_path();
}

fs::path job_log_path(const std::string& job_id) {
    return log_path().parent_path() / JOB_LOG_SUBDIR / (job_id + ".log");
}

void coord_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    write_line(configured_path(), fmt::format("[{}] {}", timestamp(), msg));
}

void coord_alert(const std::string& msg) {
    std::string line = fmt::format("[{}] ALERT {}", timestamp(), msg);
    std::lock_guard<std::mutex> lock(log_mutex());
    write_line(configured_path(), line);
    std::cerr << line << std::endl;
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    fs::path path = job_log_path(job_id);
    std::lock_guard<std::mutex> lock(log_mutex());
    write_line(path, fmt::format("[{}] {}", timestamp(), msg));
}
