#include "common/timestamp.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace {

bool readDigits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    return true;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

bool makeTimePoint(int year, int month, int day, int hour, int minute, int second,
                   int64_t nanos, int offsetMinutes, Timestamp& out) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    int64_t localSeconds = static_cast<int64_t>(timegm(&tm));
    int64_t utcSeconds = localSeconds - static_cast<int64_t>(offsetMinutes) * 60;

    auto sinceEpoch = std::chrono::seconds(utcSeconds) + std::chrono::nanoseconds(nanos);
    out.time = Timestamp::TimePoint(std::chrono::duration_cast<Timestamp::Clock::duration>(sinceEpoch));
    out.offsetMinutes = offsetMinutes;
    return true;
}

} // namespace

Timestamp Timestamp::now() {
    Timestamp ts;
    ts.time = Clock::now();
    ts.offsetMinutes = 0;
    return ts;
}

Timestamp Timestamp::fromUnixSeconds(int64_t seconds, int offsetMinutes) {
    Timestamp ts;
    ts.time = TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(seconds)));
    ts.offsetMinutes = offsetMinutes;
    return ts;
}

int64_t Timestamp::unixSeconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::string Timestamp::toRfc3339() const {
    const int64_t nanosPerSecond = 1000000000LL;
    int64_t totalNanos = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();

    int64_t seconds = totalNanos / nanosPerSecond;
    int64_t nanos = totalNanos % nanosPerSecond;
    if (nanos < 0) {
        nanos += nanosPerSecond;
        seconds -= 1;
    }

    time_t local = static_cast<time_t>(seconds + static_cast<int64_t>(offsetMinutes) * 60);
    std::tm tm{};
    gmtime_r(&local, &tm);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::string result(buffer);

    if (nanos != 0) {
        char fraction[16];
        std::snprintf(fraction, sizeof(fraction), "%09lld", static_cast<long long>(nanos));
        std::string digits(fraction);
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        result += "." + digits;
    }

    int absOffset = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d",
                  offsetMinutes < 0 ? '-' : '+', absOffset / 60, absOffset % 60);
    result += buffer;
    return result;
}

bool Timestamp::parseRfc3339Prefix(const std::string& text, Timestamp& out, size_t& consumed) {
    int year, month, day, hour, minute, second;
    if (!readDigits(text, 0, 4, year) || text.size() < 19 || text[4] != '-' ||
        !readDigits(text, 5, 2, month) || text[7] != '-' ||
        !readDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !readDigits(text, 11, 2, hour) || text[13] != ':' ||
        !readDigits(text, 14, 2, minute) || text[16] != ':' ||
        !readDigits(text, 17, 2, second)) {
        return false;
    }

    size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits == 9) {
                return false;
            }
            nanos = nanos * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    if (pos >= text.size()) {
        return false;
    }

    int offsetMinutes = 0;
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int offsetHours, offsetMins;
        if (!readDigits(text, pos + 1, 2, offsetHours) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !readDigits(text, pos + 4, 2, offsetMins) ||
            offsetHours > 23 || offsetMins > 59) {
            return false;
        }
        offsetMinutes = offsetHours * 60 + offsetMins;
        if (text[pos] == '-') {
            offsetMinutes = -offsetMinutes;
        }
        pos += 6;
    } else {
        return false;
    }

    if (!makeTimePoint(year, month, day, hour, minute, second, nanos, offsetMinutes, out)) {
        return false;
    }
    consumed = pos;
    return true;
}

bool Timestamp::parseRfc3339(const std::string& text, Timestamp& out) {
    size_t consumed = 0;
    Timestamp parsed;
    if (!parseRfc3339Prefix(text, parsed, consumed) || consumed != text.size()) {
        return false;
    }
    out = parsed;
    return true;
}

bool Timestamp::parseXenTimestamp(const std::string& text, Timestamp& out) {
    int year, month, day, hour, minute, second;
    if (!readDigits(text, 0, 4, year) || !readDigits(text, 4, 2, month) ||
        !readDigits(text, 6, 2, day) || text.size() < 17 || text[8] != 'T' ||
        !readDigits(text, 9, 2, hour) || text[11] != ':' ||
        !readDigits(text, 12, 2, minute) || text[14] != ':' ||
        !readDigits(text, 15, 2, second)) {
        return false;
    }
    if (text.size() > 17 && !(text.size() == 18 && text[17] == 'Z')) {
        return false;
    }
    return makeTimePoint(year, month, day, hour, minute, second, 0, 0, out);
}
