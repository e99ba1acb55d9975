#include <ganttgen/core/calendar.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace ganttgen::core {

namespace {

using std::chrono::days;
using std::chrono::year_month_day;

constexpr std::array<std::string_view, 12> MONTH_NAMES{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Parse exactly `len` decimal digits at `pos`; signs and spaces are rejected
bool parse_digits(std::string_view text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    const char* last = first + len;
    if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

year_month_day to_ymd(DateTime instant) {
    return year_month_day{std::chrono::floor<days>(instant)};
}

} // anonymous namespace

unsigned days_in_month(int year, unsigned month) {
    // the first day of the next month...
    const year_month_day first{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{1}};
    const year_month_day next = first + std::chrono::months{1};

    // ...is preceded by the last day of this month
    const year_month_day last{Date{next} - days{1}};
    return static_cast<unsigned>(last.day());
}

std::chrono::days weekend_shift(DateTime instant) {
    const std::chrono::weekday weekday{std::chrono::floor<days>(instant)};
    if (weekday == std::chrono::Saturday) {
        return days{2};
    }
    if (weekday == std::chrono::Sunday) {
        return days{1};
    }
    return days{0};
}

bool is_weekend(DateTime instant) {
    return weekend_shift(instant) != days{0};
}

bool in_calendar_range(DateTime instant) {
    return instant >= DateTime{MIN_DATE} && instant < DateTime{MAX_DATE + days{1}};
}

Date first_of_month(DateTime instant) {
    const auto ymd = to_ymd(instant);
    return Date{year_month_day{ymd.year(), ymd.month(), std::chrono::day{1}}};
}

Date last_of_month(DateTime instant) {
    const auto ymd = to_ymd(instant);
    const unsigned last_day = days_in_month(static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()));
    return Date{year_month_day{ymd.year(), ymd.month(), std::chrono::day{last_day}}};
}

Date next_month(Date date) {
    const year_month_day first{first_of_month(date)};
    return Date{first + std::chrono::months{1}};
}

int64_t days_between(DateTime later, DateTime earlier) {
    return static_cast<int64_t>(std::chrono::duration_cast<days>(later - earlier).count());
}

std::string_view month_abbreviation(unsigned month) {
    return MONTH_NAMES.at(month - 1);
}

std::optional<Date> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
        !parse_digits(text, 8, 2, day)) {
        return std::nullopt;
    }

    const year_month_day ymd{std::chrono::year{year},
                             std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{ymd};
}

std::optional<DateTime> parse_date_time(std::string_view text) {
    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    if (text.size() == 10) {
        return DateTime{*date};
    }

    if (text.size() < 16 || (text[10] != 'T' && text[10] != ' ') || text[13] != ':') {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_digits(text, 11, 2, hour) || !parse_digits(text, 14, 2, minute)) {
        return std::nullopt;
    }

    std::size_t pos = 16;
    if (pos < text.size()) {
        if (text[pos] != ':' || !parse_digits(text, pos + 1, 2, second)) {
            return std::nullopt;
        }
        pos += 3;
        if (pos < text.size()) {
            // Fractional seconds: at least one digit, value discarded
            if (text[pos] != '.' || pos + 1 == text.size()) {
                return std::nullopt;
            }
            const auto fraction = text.substr(pos + 1);
            if (!std::all_of(fraction.begin(), fraction.end(), [](char c) { return c >= '0' && c <= '9'; })) {
                return std::nullopt;
            }
        }
    }

    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    return DateTime{*date} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
           std::chrono::seconds{second};
}

std::string format_date(Date date) {
    const year_month_day ymd{date};
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

std::string format_date_time(DateTime instant) {
    const Date date = std::chrono::floor<days>(instant);
    const std::chrono::hh_mm_ss time{instant - DateTime{date}};
    std::ostringstream oss;
    oss << format_date(date) << 'T' << std::setfill('0')
        << std::setw(2) << time.hours().count() << ':'
        << std::setw(2) << time.minutes().count() << ':'
        << std::setw(2) << time.seconds().count();
    return oss.str();
}

} // namespace ganttgen::core
