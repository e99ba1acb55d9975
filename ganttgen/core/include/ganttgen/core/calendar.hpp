#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ganttgen::core {

/// @brief A calendar date with day precision.
/// @ingroup core_calendar
using Date = std::chrono::sys_days;

/// @brief A calendar date and wall-clock time with second precision.
///
/// Dates convert implicitly to DateTime (midnight of that day).
/// @ingroup core_calendar
using DateTime = std::chrono::sys_seconds;

/// @brief Earliest date a chart may reference.
/// @ingroup core_calendar
inline constexpr Date MIN_DATE{std::chrono::year{0} / std::chrono::January / 1};

/// @brief Latest date a chart may reference.
///
/// Four-digit years keep every month boundary, and the month after it,
/// representable as a `year_month_day`.
/// @ingroup core_calendar
inline constexpr Date MAX_DATE{std::chrono::year{9999} / std::chrono::December / 31};

/// @brief Days from MIN_DATE to MAX_DATE; no valid duration exceeds it.
/// @ingroup core_calendar
inline constexpr int64_t MAX_SPAN_DAYS = (MAX_DATE - MIN_DATE).count();

/// @brief True if @p instant lies within [MIN_DATE, MAX_DATE].
/// @ingroup core_calendar
[[nodiscard]] bool in_calendar_range(DateTime instant);

/// @brief Number of days in a month.
///
/// Computed as the day-of-month of "first day of the next month minus
/// one day", so leap years come out of the calendar arithmetic.
///
/// @param year   Proleptic Gregorian year.
/// @param month  Month number in [1, 12].
/// @return Day count in [28, 31].
/// @ingroup core_calendar
[[nodiscard]] unsigned days_in_month(int year, unsigned month);

/// @brief Offset that moves a date-time off a weekend.
///
/// Saturday shifts forward two days, Sunday one day, any weekday zero.
/// The time of day is ignored and preserved by the shift.
///
/// @param instant  The date-time to test.
/// @return 2, 1 or 0 days.
/// @ingroup core_calendar
[[nodiscard]] std::chrono::days weekend_shift(DateTime instant);

/// @brief True if @p instant falls on a Saturday or Sunday.
/// @ingroup core_calendar
[[nodiscard]] bool is_weekend(DateTime instant);

/// @brief First day of the month containing @p instant.
/// @ingroup core_calendar
[[nodiscard]] Date first_of_month(DateTime instant);

/// @brief Last day of the month containing @p instant.
/// @ingroup core_calendar
[[nodiscard]] Date last_of_month(DateTime instant);

/// @brief First day of the month following the one containing @p date.
/// @ingroup core_calendar
[[nodiscard]] Date next_month(Date date);

/// @brief Whole days from @p earlier to @p later, truncated toward zero.
///
/// Negative when @p later precedes @p earlier.
/// @ingroup core_calendar
[[nodiscard]] int64_t days_between(DateTime later, DateTime earlier);

/// @brief Three-letter English abbreviation of a month ("Jan" .. "Dec").
/// @param month  Month number in [1, 12].
/// @throws std::out_of_range  If @p month is outside [1, 12].
/// @ingroup core_calendar
[[nodiscard]] std::string_view month_abbreviation(unsigned month);

/// @brief Parse an ISO calendar date of the form `YYYY-MM-DD`.
/// @return The date, or an empty optional if the text is malformed or
///         names a day that does not exist.
/// @ingroup core_calendar
[[nodiscard]] std::optional<Date> parse_date(std::string_view text);

/// @brief Parse an ISO date-time of the form `YYYY-MM-DDTHH:MM[:SS[.fff]]`.
///
/// A space is accepted in place of the `T` separator, and a bare
/// `YYYY-MM-DD` is read as midnight. Fractional seconds are truncated.
///
/// @return The date-time, or an empty optional if the text is malformed.
/// @ingroup core_calendar
[[nodiscard]] std::optional<DateTime> parse_date_time(std::string_view text);

/// @brief Format a date as `YYYY-MM-DD`.
/// @ingroup core_calendar
[[nodiscard]] std::string format_date(Date date);

/// @brief Format a date-time as `YYYY-MM-DDTHH:MM:SS`.
/// @ingroup core_calendar
[[nodiscard]] std::string format_date_time(DateTime instant);

} // namespace ganttgen::core
