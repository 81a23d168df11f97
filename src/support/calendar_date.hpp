// SPDX-License-Identifier: MIT
/**
 * @file calendar_date.hpp
 * @brief Calendar date without time-of-day, with actual/365 year fractions
 */

#pragma once

#include <chrono>
#include <compare>
#include <expected>
#include <string>
#include <string_view>

namespace optrisk {

/// Calendar date (no time-of-day component)
///
/// Thin value type over std::chrono::sys_days. Valuation dates, expiries and
/// Monte Carlo horizon dates are all CalendarDate; differences are whole
/// calendar days.
class CalendarDate {
public:
    /// 1970-01-01
    constexpr CalendarDate() = default;

    constexpr explicit CalendarDate(std::chrono::sys_days days)
        : days_(days) {}

    /// Construct from year/month/day, returning an error for impossible dates
    static std::expected<CalendarDate, std::string> from_ymd(int year, unsigned month, unsigned day);

    /// Parse ISO "2026-06-19" or compact "20260619"
    static std::expected<CalendarDate, std::string> parse(std::string_view text);

    [[nodiscard]] constexpr std::chrono::sys_days sys_days() const { return days_; }

    [[nodiscard]] std::chrono::year_month_day ymd() const {
        return std::chrono::year_month_day{days_};
    }

    /// Date shifted by a (possibly negative) number of calendar days
    [[nodiscard]] constexpr CalendarDate add_days(long days) const {
        return CalendarDate{days_ + std::chrono::days{days}};
    }

    /// ISO "YYYY-MM-DD"
    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const CalendarDate&) const = default;

private:
    std::chrono::sys_days days_{};
};

/// Signed number of calendar days from `from` to `to`
constexpr long days_between(const CalendarDate& from, const CalendarDate& to) {
    return static_cast<long>((to.sys_days() - from.sys_days()).count());
}

/// Time to expiry in years on an actual/365 basis, clamped at zero
///
/// @param valuation Valuation date
/// @param expiry Option expiry date
/// @return max(days / 365, 0)
inline double year_fraction(const CalendarDate& valuation, const CalendarDate& expiry) {
    double tau = static_cast<double>(days_between(valuation, expiry)) / 365.0;
    return tau > 0.0 ? tau : 0.0;
}

}  // namespace optrisk
