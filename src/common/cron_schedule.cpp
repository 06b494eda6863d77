#include "common/cron_schedule.hpp"
#include "common/utils.hpp"
#include <cctype>
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace {

const char* const kMonthNames[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
const char* const kDayNames[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

int parseValue(const std::string& token, int minValue, int maxValue, const char* const* names,
               int nameCount, int nameBase, const std::string& field) {
    std::string lower = utils::toLower(token);
    for (int i = 0; names && i < nameCount; ++i) {
        if (lower == names[i]) {
            return nameBase + i;
        }
    }

    if (token.empty()) {
        throw std::invalid_argument("empty value in cron field '" + field + "'");
    }
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid value '" + token + "' in cron field '" + field + "'");
        }
    }
    int value = std::stoi(token);
    if (value < minValue || value > maxValue) {
        throw std::invalid_argument("value " + token + " out of range [" + std::to_string(minValue) +
                                    "," + std::to_string(maxValue) + "] in cron field '" + field + "'");
    }
    return value;
}

// Expands a field into the set of allowed values
std::vector<int> parseField(const std::string& field, int minValue, int maxValue,
                            const char* const* names = nullptr, int nameCount = 0, int nameBase = 0) {
    std::vector<int> values;
    for (const auto& item : utils::split(field, ",")) {
        std::string range = item;
        int step = 1;
        size_t slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            step = parseValue(item.substr(slash + 1), 1, maxValue, nullptr, 0, 0, field);
        }

        int low = minValue;
        int high = maxValue;
        if (range == "*" || range == "?") {
            // full range
        } else {
            size_t dash = range.find('-');
            if (dash != std::string::npos) {
                low = parseValue(range.substr(0, dash), minValue, maxValue, names, nameCount, nameBase, field);
                high = parseValue(range.substr(dash + 1), minValue, maxValue, names, nameCount, nameBase, field);
                if (low > high) {
                    throw std::invalid_argument("descending range '" + range + "' in cron field '" + field + "'");
                }
            } else {
                low = parseValue(range, minValue, maxValue, names, nameCount, nameBase, field);
                // "5/10" runs from 5 to the end of the range
                high = slash != std::string::npos ? maxValue : low;
            }
        }

        for (int v = low; v <= high; v += step) {
            values.push_back(v);
        }
    }
    return values;
}

bool isRestricted(const std::string& field) {
    return !(field == "*" || field == "?");
}

} // namespace

CronSchedule CronSchedule::parse(const std::string& expression) {
    std::istringstream stream(expression);
    std::vector<std::string> fields;
    std::string token;
    while (stream >> token) {
        fields.push_back(token);
    }

    if (fields.size() != 5 && fields.size() != 6) {
        throw std::invalid_argument("cron expression '" + expression + "' must have 5 or 6 fields");
    }

    CronSchedule schedule;
    schedule.expression_ = expression;
    schedule.fields_ = fields;

    size_t offset = 0;
    if (fields.size() == 6) {
        for (int v : parseField(fields[0], 0, 59)) {
            schedule.seconds_.set(v);
        }
        offset = 1;
    } else {
        schedule.seconds_.set(0);
    }

    for (int v : parseField(fields[offset], 0, 59)) {
        schedule.minutes_.set(v);
    }
    for (int v : parseField(fields[offset + 1], 0, 23)) {
        schedule.hours_.set(v);
    }
    for (int v : parseField(fields[offset + 2], 1, 31)) {
        schedule.daysOfMonth_.set(v);
    }
    for (int v : parseField(fields[offset + 3], 1, 12, kMonthNames, 12, 1)) {
        schedule.months_.set(v);
    }
    for (int v : parseField(fields[offset + 4], 0, 7, kDayNames, 7, 0)) {
        schedule.daysOfWeek_.set(v == 7 ? 0 : v);
    }

    schedule.dayOfMonthRestricted_ = isRestricted(fields[offset + 2]);
    schedule.dayOfWeekRestricted_ = isRestricted(fields[offset + 4]);
    return schedule;
}

std::string CronSchedule::withoutSeconds() const {
    if (fields_.size() == 5) {
        return utils::join(fields_, " ");
    }
    return utils::join(std::vector<std::string>(fields_.begin() + 1, fields_.end()), " ");
}

bool CronSchedule::matchesDay(int dayOfMonth, int month, int dayOfWeek) const {
    if (!months_.test(month)) {
        return false;
    }
    bool domMatch = daysOfMonth_.test(dayOfMonth);
    bool dowMatch = daysOfWeek_.test(dayOfWeek);
    if (dayOfMonthRestricted_ && dayOfWeekRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

Timestamp::TimePoint CronSchedule::next(Timestamp::TimePoint after) const {
    std::time_t start = std::chrono::system_clock::to_time_t(after) + 1;
    std::tm tm{};
    gmtime_r(&start, &tm);
    const int lastYear = tm.tm_year + 5;

    while (tm.tm_year <= lastYear) {
        if (!matchesDay(tm.tm_mday, tm.tm_mon + 1, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        } else if (!hours_.test(tm.tm_hour)) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        } else if (!minutes_.test(tm.tm_min)) {
            tm.tm_min += 1;
            tm.tm_sec = 0;
        } else if (!seconds_.test(tm.tm_sec)) {
            tm.tm_sec += 1;
        } else {
            return std::chrono::system_clock::from_time_t(timegm(&tm));
        }
        // Normalize the overflowed field and recompute the weekday
        std::time_t normalized = timegm(&tm);
        gmtime_r(&normalized, &tm);
    }

    throw std::runtime_error("cron expression '" + expression_ + "' never fires");
}
