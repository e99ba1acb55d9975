#include <ganttgen/core/calendar.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace ganttgen::core;

namespace {

Date ymd(int y, unsigned m, unsigned d) {
    return Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

DateTime at(int y, unsigned m, unsigned d, int hour = 0, int minute = 0) {
    return DateTime{ymd(y, m, d)} + std::chrono::hours{hour} + std::chrono::minutes{minute};
}

} // namespace

// ============================================================================
// days_in_month
// ============================================================================

TEST(CalendarTest, DaysInMonthRegularMonths) {
    EXPECT_EQ(days_in_month(2024, 1), 31u);
    EXPECT_EQ(days_in_month(2024, 4), 30u);
    EXPECT_EQ(days_in_month(2024, 6), 30u);
    EXPECT_EQ(days_in_month(2024, 12), 31u);
}

TEST(CalendarTest, DaysInMonthFebruaryLeapRules) {
    EXPECT_EQ(days_in_month(2023, 2), 28u);
    EXPECT_EQ(days_in_month(2024, 2), 29u);
    EXPECT_EQ(days_in_month(2100, 2), 28u);
    EXPECT_EQ(days_in_month(2000, 2), 29u);
}

TEST(CalendarTest, DaysInMonthDecemberRollsIntoNextYear) {
    EXPECT_EQ(days_in_month(1999, 12), 31u);
}

// ============================================================================
// weekend_shift
// ============================================================================

TEST(CalendarTest, WeekendShiftWeekdays) {
    // 2024-01-01 is a Monday
    for (unsigned d = 1; d <= 5; ++d) {
        EXPECT_EQ(weekend_shift(at(2024, 1, d)), std::chrono::days{0}) << "day " << d;
        EXPECT_FALSE(is_weekend(at(2024, 1, d)));
    }
}

TEST(CalendarTest, WeekendShiftSaturdayAndSunday) {
    EXPECT_EQ(weekend_shift(at(2024, 1, 6)), std::chrono::days{2});
    EXPECT_EQ(weekend_shift(at(2024, 1, 7)), std::chrono::days{1});
    EXPECT_TRUE(is_weekend(at(2024, 1, 6)));
    EXPECT_TRUE(is_weekend(at(2024, 1, 7)));
}

TEST(CalendarTest, WeekendShiftIgnoresTimeOfDay) {
    EXPECT_EQ(weekend_shift(at(2024, 1, 6, 23, 59)), std::chrono::days{2});
    EXPECT_EQ(weekend_shift(at(2024, 1, 8, 0, 1)), std::chrono::days{0});
}

TEST(CalendarTest, WeekendShiftAlwaysLandsOnWeekday) {
    DateTime t = at(2024, 3, 1);
    for (int i = 0; i < 30; ++i) {
        DateTime shifted = t + weekend_shift(t);
        EXPECT_FALSE(is_weekend(shifted));
        t += std::chrono::days{1};
    }
}

// ============================================================================
// Month snapping
// ============================================================================

TEST(CalendarTest, FirstAndLastOfMonth) {
    EXPECT_EQ(first_of_month(at(2024, 2, 17, 13)), ymd(2024, 2, 1));
    EXPECT_EQ(last_of_month(at(2024, 2, 17, 13)), ymd(2024, 2, 29));
    EXPECT_EQ(last_of_month(at(2023, 11, 1)), ymd(2023, 11, 30));
}

TEST(CalendarTest, NextMonthCrossesYear) {
    EXPECT_EQ(next_month(ymd(2023, 12, 15)), ymd(2024, 1, 1));
    EXPECT_EQ(next_month(ymd(2024, 1, 31)), ymd(2024, 2, 1));
}

TEST(CalendarTest, DaysBetweenTruncatesTowardZero) {
    EXPECT_EQ(days_between(at(2024, 1, 8), at(2024, 1, 1)), 7);
    EXPECT_EQ(days_between(at(2024, 1, 8, 12), at(2024, 1, 1)), 7);
    EXPECT_EQ(days_between(at(2024, 1, 1), at(2024, 1, 8)), -7);
    EXPECT_EQ(days_between(at(2024, 1, 1, 23), at(2024, 1, 1)), 0);
}

TEST(CalendarTest, MonthAbbreviation) {
    EXPECT_EQ(month_abbreviation(1), "Jan");
    EXPECT_EQ(month_abbreviation(9), "Sep");
    EXPECT_EQ(month_abbreviation(12), "Dec");
    EXPECT_THROW((void)month_abbreviation(0), std::out_of_range);
    EXPECT_THROW((void)month_abbreviation(13), std::out_of_range);
}

// ============================================================================
// Parsing and formatting
// ============================================================================

TEST(CalendarTest, ParseDate) {
    auto d = parse_date("2024-02-29");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, ymd(2024, 2, 29));
}

TEST(CalendarTest, ParseDateRejectsMalformed) {
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
    EXPECT_FALSE(parse_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_date("2024-1-01").has_value());
    EXPECT_FALSE(parse_date("2024/01/01").has_value());
    EXPECT_FALSE(parse_date("2024-01-01T00:00:00").has_value());
    EXPECT_FALSE(parse_date("").has_value());
}

TEST(CalendarTest, ParseDateTimeVariants) {
    EXPECT_EQ(parse_date_time("2024-01-01T09:30:15"),
              at(2024, 1, 1, 9, 30) + std::chrono::seconds{15});
    EXPECT_EQ(parse_date_time("2024-01-01 09:30"), at(2024, 1, 1, 9, 30));
    EXPECT_EQ(parse_date_time("2024-01-01T09:30:15.250"),
              at(2024, 1, 1, 9, 30) + std::chrono::seconds{15});
    EXPECT_EQ(parse_date_time("2024-01-01"), at(2024, 1, 1));
}

TEST(CalendarTest, ParseDateTimeRejectsMalformed) {
    EXPECT_FALSE(parse_date_time("2024-01-01T25:00:00").has_value());
    EXPECT_FALSE(parse_date_time("2024-01-01T09:60").has_value());
    EXPECT_FALSE(parse_date_time("2024-01-01T09").has_value());
    EXPECT_FALSE(parse_date_time("2024-01-01T09:30:15.").has_value());
    EXPECT_FALSE(parse_date_time("2024-01-01T09:30:15Z").has_value());
    EXPECT_FALSE(parse_date_time("yesterday").has_value());
}

TEST(CalendarTest, Formatting) {
    EXPECT_EQ(format_date(ymd(2024, 3, 7)), "2024-03-07");
    EXPECT_EQ(format_date_time(at(2024, 3, 7, 8, 5) + std::chrono::seconds{9}),
              "2024-03-07T08:05:09");
}

// ============================================================================
// Calendar range
// ============================================================================

TEST(CalendarTest, CalendarRangeBounds) {
    EXPECT_TRUE(in_calendar_range(DateTime{MIN_DATE}));
    EXPECT_TRUE(in_calendar_range(at(9999, 12, 31, 23, 59)));
    EXPECT_FALSE(in_calendar_range(DateTime{MIN_DATE} - std::chrono::seconds{1}));
    EXPECT_FALSE(in_calendar_range(DateTime{MAX_DATE + std::chrono::days{1}}));
    EXPECT_EQ(next_month(ymd(9999, 12, 1)), ymd(10000, 1, 1));
    EXPECT_GT(MAX_SPAN_DAYS, 3'650'000);
}
