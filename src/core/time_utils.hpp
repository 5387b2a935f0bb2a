#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "types.hpp"

// UTC ISO 8601 with millisecond precision: 2025-01-15T10:00:45.120Z
std::string to_iso(TimePoint tp);

// Optional variant: "-" when unset.
std::string to_iso(const std::optional<TimePoint>& tp);

// Parse the format produced by to_iso (milliseconds and trailing Z optional).
std::optional<TimePoint> parse_iso(const std::string& iso);

// Millisecond epoch conversion, used for stored timestamps.
int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

// Human-readable duration: "2h35m", "14m22s", "8s". Negative clamps to "0s".
std::string format_duration(std::chrono::seconds d);

// Duration between two optional instants, "-" if start is unset.
// If end is unset, measures up to `now` (for "still running" durations).
std::string format_elapsed(const std::optional<TimePoint>& start,
                           const std::optional<TimePoint>& end,
                           TimePoint now);

// Parse a configured duration. Accepts unit strings ("45s", "30m", "2h",
// "1h30m", "1d", bare seconds "90") and clock style "H:MM:SS" / "MM:SS".
// Returns nullopt on malformed input or zero duration.
std::optional<std::chrono::seconds> parse_duration(const std::string& text);
