#include <gtest/gtest.h>
#include "common/cron_schedule.hpp"
#include <stdexcept>

namespace {

Timestamp::TimePoint at(const std::string& rfc3339) {
    Timestamp ts;
    if (!Timestamp::parseRfc3339(rfc3339, ts)) {
        throw std::invalid_argument("bad test timestamp " + rfc3339);
    }
    return ts.time;
}

std::string format(Timestamp::TimePoint time) {
    Timestamp ts;
    ts.time = time;
    return ts.toRfc3339();
}

// Friday
const char* const kStart = "2024-02-09T10:19:02Z";

} // namespace

TEST(CronScheduleTest, DailyAtMidnight) {
    CronSchedule schedule = CronSchedule::parse("0 0 0 * * *");
    EXPECT_EQ(format(schedule.next(at(kStart))), "2024-02-10T00:00:00+00:00");
}

TEST(CronScheduleTest, FiveFieldsStartAtSecondZero) {
    CronSchedule schedule = CronSchedule::parse("*/15 * * * *");
    EXPECT_EQ(format(schedule.next(at(kStart))), "2024-02-09T10:30:00+00:00");
}

TEST(CronScheduleTest, NextIsStrictlyAfter) {
    CronSchedule schedule = CronSchedule::parse("0 30 10 * * *");
    Timestamp::TimePoint first = schedule.next(at(kStart));
    EXPECT_EQ(format(first), "2024-02-09T10:30:00+00:00");
    EXPECT_EQ(format(schedule.next(first)), "2024-02-10T10:30:00+00:00");
}

TEST(CronScheduleTest, WeekdayNamesAndRanges) {
    CronSchedule schedule = CronSchedule::parse("0 30 9 * * MON-FRI");
    EXPECT_EQ(format(schedule.next(at(kStart))), "2024-02-12T09:30:00+00:00");
}

TEST(CronScheduleTest, SevenIsSunday) {
    CronSchedule schedule = CronSchedule::parse("0 0 * * 7");
    EXPECT_EQ(format(schedule.next(at(kStart))), "2024-02-11T00:00:00+00:00");
}

TEST(CronScheduleTest, ListsAndMonthNames) {
    CronSchedule schedule = CronSchedule::parse("0 0 6,18 1 mar,sep *");
    EXPECT_EQ(format(schedule.next(at(kStart))), "2024-03-01T06:00:00+00:00");
}

TEST(CronScheduleTest, RestrictedDayFieldsAreAlternatives) {
    // The 13th or any Friday, whichever comes first
    CronSchedule schedule = CronSchedule::parse("0 0 0 13 * FRI");
    Timestamp::TimePoint first = schedule.next(at(kStart));
    EXPECT_EQ(format(first), "2024-02-13T00:00:00+00:00");
    EXPECT_EQ(format(schedule.next(first)), "2024-02-16T00:00:00+00:00");
}

TEST(CronScheduleTest, LeapDay) {
    CronSchedule schedule = CronSchedule::parse("0 0 29 2 *");
    EXPECT_EQ(format(schedule.next(at("2024-03-01T00:00:00Z"))), "2028-02-29T00:00:00+00:00");
}

TEST(CronScheduleTest, StripsSecondsField) {
    EXPECT_EQ(CronSchedule::parse("0 0 0 * * *").withoutSeconds(), "0 0 * * *");
    EXPECT_EQ(CronSchedule::parse("*/5  1-3 * * *").withoutSeconds(), "*/5 1-3 * * *");
    EXPECT_EQ(CronSchedule::parse("0 0 0 * * *").expression(), "0 0 0 * * *");
}

TEST(CronScheduleTest, RejectsInvalidExpressions) {
    EXPECT_THROW(CronSchedule::parse(""), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("* * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("0 0 0 0 * * * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("61 * * * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("* 24 * * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("* * 0 * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("* * * * funday"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("5-1 * * * *"), std::invalid_argument);
    EXPECT_THROW(CronSchedule::parse("*/0 * * * *"), std::invalid_argument);
}

TEST(CronScheduleTest, ImpossibleDateNeverFires) {
    CronSchedule schedule = CronSchedule::parse("0 0 31 2 *");
    EXPECT_THROW(schedule.next(at(kStart)), std::runtime_error);
}
