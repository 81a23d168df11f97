// SPDX-License-Identifier: MIT
#include "optrisk/support/calendar_date.hpp"
#include <charconv>
#include <cstdio>

namespace optrisk {

namespace {

std::expected<int, std::string> parse_field(std::string_view text, size_t pos, size_t len) {
    int value = 0;
    const char* first = text.data() + pos;
    const char* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::unexpected("Failed to parse date: " + std::string(text));
    }
    return value;
}

}  // namespace

std::expected<CalendarDate, std::string> CalendarDate::from_ymd(int year, unsigned month, unsigned day) {
    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::unexpected("Invalid calendar date: " + std::to_string(year) + "-" +
                               std::to_string(month) + "-" + std::to_string(day));
    }
    return CalendarDate{std::chrono::sys_days{ymd}};
}

std::expected<CalendarDate, std::string> CalendarDate::parse(std::string_view text) {
    size_t month_pos;
    size_t day_pos;

    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        // ISO: YYYY-MM-DD
        month_pos = 5;
        day_pos = 8;
    } else if (text.size() == 8) {
        // Compact: YYYYMMDD
        month_pos = 4;
        day_pos = 6;
    } else {
        return std::unexpected("Date must be YYYY-MM-DD or YYYYMMDD: " + std::string(text));
    }

    auto year = parse_field(text, 0, 4);
    auto month = parse_field(text, month_pos, 2);
    auto day = parse_field(text, day_pos, 2);
    if (!year) return std::unexpected(year.error());
    if (!month) return std::unexpected(month.error());
    if (!day) return std::unexpected(day.error());
    if (*month < 1 || *day < 1) {
        return std::unexpected("Invalid calendar date: " + std::string(text));
    }

    return from_ymd(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
}

std::string CalendarDate::to_string() const {
    auto d = ymd();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(d.year()),
                  static_cast<unsigned>(d.month()),
                  static_cast<unsigned>(d.day()));
    return std::string(buf);
}

}  // namespace optrisk
