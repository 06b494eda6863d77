#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// An instant plus the UTC offset it was expressed in. Two timestamps are equal only
// when both the instant and the offset match, so a value survives a format/parse cycle
// unchanged.
struct Timestamp {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    TimePoint time{};
    int offsetMinutes{0};

    static Timestamp now();
    static Timestamp fromUnixSeconds(int64_t seconds, int offsetMinutes = 0);

    // YYYY-MM-DDTHH:MM:SS[.fraction]+HH:MM, fraction only when non-zero
    std::string toRfc3339() const;

    // Parses an RFC3339 timestamp at the start of text. On success, consumed receives
    // the number of characters that made up the timestamp so callers can inspect any
    // trailing suffix.
    static bool parseRfc3339Prefix(const std::string& text, Timestamp& out, size_t& consumed);

    // Whole-string variant of parseRfc3339Prefix.
    static bool parseRfc3339(const std::string& text, Timestamp& out);

    // Xen snapshot times look like 20240209T10:19:02Z
    static bool parseXenTimestamp(const std::string& text, Timestamp& out);

    int64_t unixSeconds() const;

    bool operator==(const Timestamp& other) const {
        return time == other.time && offsetMinutes == other.offsetMinutes;
    }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
    bool operator<(const Timestamp& other) const { return time < other.time; }
    bool operator>(const Timestamp& other) const { return time > other.time; }
    bool operator<=(const Timestamp& other) const { return time <= other.time; }
    bool operator>=(const Timestamp& other) const { return time >= other.time; }
};
