#pragma once

#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Source of "now" for anything that stamps or compares timestamps.
// Injected so tests can move time without sleeping.
using NowFn = std::function<TimePoint()>;

inline TimePoint system_now() { return Clock::now(); }

// Typed failure kinds. Callers switch on these; the message is for humans.
enum class ErrorCode {
    None,
    NotFound,             // job id does not exist
    InvalidTransition,    // (from, to) not in the state machine table
    ConcurrencyConflict,  // expected version no longer matches the row
    StoreFailure,         // backing store I/O or corruption
    InvalidConfig,
    InvalidArgument,
};

const char* to_string(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct [[nodiscard]] Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::StoreFailure) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is(ErrorCode c) const { return code == c; }
};

// Specialization for void
template <>
struct [[nodiscard]] Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::StoreFailure) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is(ErrorCode c) const { return code == c; }
};

// Re-tag a failed result as another payload type, keeping message and code.
template <typename T, typename U>
Result<T> forward_error(const Result<U>& r) {
    return Result<T>::Err(r.error, r.code);
}

// ── Configuration structures ────────────────────────────────

enum class StoreBackend { Sqlite, Memory };

struct StoreConfig {
    StoreBackend backend = StoreBackend::Sqlite;
    std::string path = "simcoord.db";
    int busy_timeout_ms = 5000;
};

enum class FailurePolicy { Swallow, Rethrow };

struct WorkerConfig {
    std::string node;                          // claim token prefix (host name if empty)
    int threads = 4;
    std::chrono::seconds poll_interval{2};     // pending-job dispatcher scan period
    FailurePolicy on_failure = FailurePolicy::Swallow;
};

// No defaults on purpose: sweep frequency and deadline are deployment decisions.
struct ReaperConfig {
    std::optional<std::chrono::seconds> interval;
    std::optional<std::chrono::seconds> deadline;

    bool configured() const { return interval.has_value() && deadline.has_value(); }
};

struct LogConfig {
    std::string file;                          // empty = <temp>/simcoord.log
};

