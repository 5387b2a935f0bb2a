#include "utils.hpp"
#include "types.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <random>
#include <sstream>

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "none";
        case ErrorCode::NotFound:            return "not found";
        case ErrorCode::InvalidTransition:   return "invalid transition";
        case ErrorCode::ConcurrencyConflict: return "concurrency conflict";
        case ErrorCode::StoreFailure:        return "store failure";
        case ErrorCode::InvalidConfig:       return "invalid config";
        case ErrorCode::InvalidArgument:     return "invalid argument";
    }
    return "unknown";
}

std::string now_compact_stamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_buf);
    return fmt::format("{}-{:03d}", buf, static_cast<int>(ms.count()));
}

std::string random_hex(std::size_t len) {
    thread_local std::mt19937_64 rng(std::random_device{}());
    static const char HEX[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(len);
    for (std::size_t i = 0; i < len; ++i) out += HEX[dist(rng)];
    return out;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string piece;
    while (std::getline(ss, piece, delim)) {
        trim(piece);
        if (!piece.empty()) out.push_back(piece);
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
