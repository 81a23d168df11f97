// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "optrisk/support/calendar_date.hpp"

namespace optrisk {
namespace {

TEST(CalendarDateTest, ParseIso) {
    auto d = CalendarDate::parse("2026-06-19");
    ASSERT_TRUE(d.has_value());
    auto ymd = d->ymd();
    EXPECT_EQ(static_cast<int>(ymd.year()), 2026);
    EXPECT_EQ(static_cast<unsigned>(ymd.month()), 6u);
    EXPECT_EQ(static_cast<unsigned>(ymd.day()), 19u);
}

TEST(CalendarDateTest, ParseCompact) {
    auto iso = CalendarDate::parse("2026-01-22");
    auto compact = CalendarDate::parse("20260122");
    ASSERT_TRUE(iso.has_value());
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(*iso, *compact);
}

TEST(CalendarDateTest, RejectsMalformed) {
    EXPECT_FALSE(CalendarDate::parse("").has_value());
    EXPECT_FALSE(CalendarDate::parse("2026/01/22").has_value());
    EXPECT_FALSE(CalendarDate::parse("2026-1-22").has_value());
    EXPECT_FALSE(CalendarDate::parse("2026-AB-22").has_value());
}

TEST(CalendarDateTest, RejectsImpossibleDates) {
    EXPECT_FALSE(CalendarDate::parse("2026-02-30").has_value());
    EXPECT_FALSE(CalendarDate::parse("2026-13-01").has_value());
    EXPECT_FALSE(CalendarDate::from_ymd(2025, 2, 29).has_value());
    EXPECT_TRUE(CalendarDate::from_ymd(2024, 2, 29).has_value());
}

TEST(CalendarDateTest, ToStringRoundTrip) {
    auto d = CalendarDate::from_ymd(2026, 3, 5);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->to_string(), "2026-03-05");
}

TEST(CalendarDateTest, AddDaysCrossesMonthAndYear) {
    auto d = CalendarDate::parse("2025-12-30");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->add_days(3).to_string(), "2026-01-02");
    EXPECT_EQ(d->add_days(-30).to_string(), "2025-11-30");
}

TEST(CalendarDateTest, DaysBetweenIsSigned) {
    auto a = *CalendarDate::parse("2026-01-22");
    auto b = *CalendarDate::parse("2026-06-19");
    EXPECT_EQ(days_between(a, b), 148);
    EXPECT_EQ(days_between(b, a), -148);
    EXPECT_LT(a, b);
}

TEST(CalendarDateTest, YearFractionActual365) {
    auto a = *CalendarDate::parse("2025-01-01");
    auto b = *CalendarDate::parse("2026-01-01");
    EXPECT_DOUBLE_EQ(year_fraction(a, b), 1.0);
    EXPECT_DOUBLE_EQ(year_fraction(a, a.add_days(73)), 0.2);
}

TEST(CalendarDateTest, YearFractionClampsPastExpiry) {
    auto a = *CalendarDate::parse("2026-06-19");
    EXPECT_DOUBLE_EQ(year_fraction(a, a.add_days(-10)), 0.0);
    EXPECT_DOUBLE_EQ(year_fraction(a, a), 0.0);
}

}  // namespace
}  // namespace optrisk
