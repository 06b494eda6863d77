#pragma once

#include "common/timestamp.hpp"
#include <bitset>
#include <string>
#include <vector>

// Cron expression evaluated in UTC. Accepts the classic five fields
// (minute hour day-of-month month day-of-week) or six with a leading seconds field.
// Fields take '*', numbers, names (JAN, MON), lists, ranges and '/step'.
class CronSchedule {
public:
    // Throws std::invalid_argument
    static CronSchedule parse(const std::string& expression);

    // First matching instant strictly after the given one
    Timestamp::TimePoint next(Timestamp::TimePoint after) const;

    const std::string& expression() const { return expression_; }

    // Five-field form, for consumers that do not understand seconds
    std::string withoutSeconds() const;

private:
    CronSchedule() = default;

    bool matchesDay(int dayOfMonth, int month, int dayOfWeek) const;

    std::string expression_;
    std::vector<std::string> fields_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool dayOfMonthRestricted_{false};
    bool dayOfWeekRestricted_{false};
};
