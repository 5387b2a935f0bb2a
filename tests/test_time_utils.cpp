#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using namespace std::chrono;

static TimePoint at(const char* iso) {
    auto tp = parse_iso(iso);
    EXPECT_TRUE(tp.has_value()) << iso;
    return tp.value_or(TimePoint{});
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(seconds(45)), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration(seconds(5 * 60 + 30)), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration(seconds(2 * 3600 + 15 * 60)), "2h15m");
}

TEST(TimeUtils, FormatDurationZero) {
    EXPECT_EQ(format_duration(seconds(0)), "0s");
}

TEST(TimeUtils, FormatDurationNegativeClamps) {
    EXPECT_EQ(format_duration(seconds(-30)), "0s");
}

TEST(TimeUtils, IsoRoundTripKeepsMilliseconds) {
    TimePoint tp = from_epoch_ms(1736935245120);  // 2025-01-15T10:00:45.120Z
    EXPECT_EQ(to_iso(tp), "2025-01-15T10:00:45.120Z");
    EXPECT_EQ(parse_iso(to_iso(tp)), tp);
}

TEST(TimeUtils, ParseIsoWithoutMillis) {
    EXPECT_EQ(to_epoch_ms(at("2025-01-15T10:00:45")), 1736935245000);
}

TEST(TimeUtils, ParseIsoGarbage) {
    EXPECT_FALSE(parse_iso("not-a-date").has_value());
    EXPECT_FALSE(parse_iso("").has_value());
}

TEST(TimeUtils, IsoOptionalUnset) {
    EXPECT_EQ(to_iso(std::optional<TimePoint>{}), "-");
}

TEST(TimeUtils, ElapsedUsesEndWhenSet) {
    auto start = at("2025-01-15T10:00:00");
    auto end = at("2025-01-15T10:05:30");
    EXPECT_EQ(format_elapsed(start, end, at("2025-01-16T00:00:00")), "5m30s");
}

TEST(TimeUtils, ElapsedRunningUsesNow) {
    auto start = at("2025-01-15T10:00:00");
    EXPECT_EQ(format_elapsed(start, std::nullopt, at("2025-01-15T12:15:00")), "2h15m");
}

TEST(TimeUtils, ElapsedWithoutStart) {
    EXPECT_EQ(format_elapsed(std::nullopt, std::nullopt, system_now()), "-");
}

TEST(TimeUtils, ParseDurationUnits) {
    EXPECT_EQ(parse_duration("45s"), seconds(45));
    EXPECT_EQ(parse_duration("30m"), minutes(30));
    EXPECT_EQ(parse_duration("2h"), hours(2));
    EXPECT_EQ(parse_duration("1h30m"), minutes(90));
    EXPECT_EQ(parse_duration("1d"), hours(24));
    EXPECT_EQ(parse_duration(" 2H "), hours(2));
}

TEST(TimeUtils, ParseDurationBareSeconds) {
    EXPECT_EQ(parse_duration("90"), seconds(90));
}

TEST(TimeUtils, ParseDurationClockStyle) {
    EXPECT_EQ(parse_duration("4:00:00"), hours(4));
    EXPECT_EQ(parse_duration("0:30:15"), seconds(30 * 60 + 15));
    EXPECT_EQ(parse_duration("05:00"), minutes(5));
}

TEST(TimeUtils, ParseDurationRejectsMalformed) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("soon").has_value());
    EXPECT_FALSE(parse_duration("h2").has_value());
    EXPECT_FALSE(parse_duration("2w").has_value());
    EXPECT_FALSE(parse_duration("1:2:3:4").has_value());
    EXPECT_FALSE(parse_duration("1:xx:00").has_value());
}

TEST(TimeUtils, ParseDurationRejectsZero) {
    EXPECT_FALSE(parse_duration("0s").has_value());
    EXPECT_FALSE(parse_duration("0:00:00").has_value());
}
