#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cstdio>
#include <ctime>

using namespace std::chrono;

std::string to_iso(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += milliseconds(1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}Z", buf, static_cast<int>(ms.count()));
}

std::string to_iso(const std::optional<TimePoint>& tp) {
    return tp ? to_iso(*tp) : "-";
}

std::optional<TimePoint> parse_iso(const std::string& iso) {
    struct tm tm_buf = {};
    int millis = 0;
    int consumed = 0;
    if (std::sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) < 6) {
        return std::nullopt;
    }
    std::string rest = iso.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest[0] == '.') {
        if (std::sscanf(rest.c_str(), ".%3d", &millis) != 1) return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t) + milliseconds(millis);
}

int64_t to_epoch_ms(TimePoint tp) {
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(duration_cast<Clock::duration>(milliseconds(ms)));
}

std::string format_duration(seconds d) {
    long long total = d.count() < 0 ? 0 : static_cast<long long>(d.count());
    long long hours = total / 3600;
    long long mins = (total % 3600) / 60;
    long long secs = total % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_elapsed(const std::optional<TimePoint>& start,
                           const std::optional<TimePoint>& end,
                           TimePoint now) {
    if (!start) return "-";
    TimePoint stop = end ? *end : now;
    return format_duration(duration_cast<seconds>(stop - *start));
}

// "H:MM:SS" or "MM:SS"
static std::optional<seconds> parse_clock_duration(const std::string& text) {
    auto parts = split(text, ':');
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;
    long long total = 0;
    for (const auto& p : parts) {
        for (char c : p) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        total = total * 60 + safe_stoi(p, 0);
    }
    return seconds(total);
}

std::optional<seconds> parse_duration(const std::string& raw) {
    std::string text = to_lower(raw);
    trim(text);
    if (text.empty()) return std::nullopt;

    std::optional<seconds> parsed;
    if (text.find(':') != std::string::npos) {
        parsed = parse_clock_duration(text);
    } else {
        long long total = 0;
        long long number = 0;
        bool have_digits = false;
        for (char c : text) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                number = number * 10 + (c - '0');
                have_digits = true;
                continue;
            }
            if (!have_digits) return std::nullopt;
            switch (c) {
                case 'd': total += number * 86400; break;
                case 'h': total += number * 3600; break;
                case 'm': total += number * 60; break;
                case 's': total += number; break;
                default: return std::nullopt;
            }
            number = 0;
            have_digits = false;
        }
        if (have_digits) total += number;  // bare trailing number = seconds
        parsed = seconds(total);
    }

    if (!parsed || parsed->count() <= 0) return std::nullopt;
    return parsed;
}
