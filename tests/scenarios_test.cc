// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "optrisk/option/european_option.hpp"
#include "optrisk/scenario/scenarios.hpp"
#include <cmath>
#include <vector>

namespace optrisk {
namespace {

class ScenariosTest : public ::testing::Test {
protected:
    const CalendarDate today = *CalendarDate::parse("2026-01-22");
    const CalendarDate expiry = *CalendarDate::parse("2026-06-19");

    MarketSnapshot market{.spot = 185.0, .rate = 0.03, .dividend_yield = 0.005,
                          .volatility = 0.25, .timestamp = "2026-01-22"};

    std::vector<Position> book{
        {.contract = {.symbol = "AAPL", .type = OptionType::CALL, .strike = 180.0,
                      .expiry = expiry},
         .quantity = 1.0},
        {.contract = {.symbol = "AAPL", .type = OptionType::PUT, .strike = 160.0,
                      .expiry = expiry},
         .quantity = -1.0},
    };
};

TEST_F(ScenariosTest, SpotScenarioKeepsInputOrder) {
    const std::vector<double> spots{200.0, 150.0, 185.0};
    auto r = spot_scenario(book, market, today, spots);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 3u);
    for (size_t i = 0; i < spots.size(); ++i) {
        EXPECT_DOUBLE_EQ((*r)[i].swept_value, spots[i]);
        EXPECT_NEAR((*r)[i].value,
                    portfolio_price(book, market.with_spot(spots[i]), today), 1e-12);
    }
    // Long call, short put: value rises with spot
    EXPECT_GT((*r)[0].value, (*r)[2].value);
    EXPECT_GT((*r)[2].value, (*r)[1].value);
}

TEST_F(ScenariosTest, SpotScenarioRejectsBadGrids) {
    std::vector<double> empty;
    auto e = spot_scenario(book, market, today, empty);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.error().code, ValidationErrorCode::EmptyGrid);

    const std::vector<double> with_zero{180.0, 0.0};
    auto z = spot_scenario(book, market, today, with_zero);
    ASSERT_FALSE(z.has_value());
    EXPECT_EQ(z.error().code, ValidationErrorCode::InvalidSpotPrice);
    EXPECT_EQ(z.error().index, 1u);
}

TEST_F(ScenariosTest, VolScenarioAllowsZeroRejectsNegative) {
    const std::vector<double> vols{0.0, 0.2, 0.6};
    auto r = vol_scenario(book, market, today, vols);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 3u);
    EXPECT_DOUBLE_EQ((*r)[0].swept_value, 0.0);
    EXPECT_DOUBLE_EQ((*r)[0].greeks.vega, 0.0);

    const std::vector<double> bad{0.2, -0.1};
    auto b = vol_scenario(book, market, today, bad);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ValidationErrorCode::InvalidVolatility);
    EXPECT_EQ(b.error().index, 1u);
}

TEST_F(ScenariosTest, TimeScenarioAdvancesDateAndCollapsesAtExpiry) {
    const std::vector<int> days{0, 30, 148, 200};
    auto r = time_scenario(book, market, today, days);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 4u);
    EXPECT_EQ((*r)[1].date, today.add_days(30));
    EXPECT_EQ((*r)[2].date, expiry);

    // At and after expiry: intrinsic of call 180 at spot 185, put is out of the money
    EXPECT_DOUBLE_EQ((*r)[2].value, 5.0);
    EXPECT_DOUBLE_EQ((*r)[3].value, 5.0);
    EXPECT_DOUBLE_EQ((*r)[2].greeks.gamma, 0.0);
    EXPECT_DOUBLE_EQ((*r)[2].greeks.delta, 1.0);

    EXPECT_NEAR((*r)[0].value, portfolio_price(book, market, today), 1e-12);
}

TEST_F(ScenariosTest, TimeScenarioRejectsEmpty) {
    std::vector<int> none;
    auto r = time_scenario(book, market, today, none);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ValidationErrorCode::EmptyGrid);
}

TEST_F(ScenariosTest, CrashValuesAreNonIncreasing) {
    const std::vector<double> crashes{-0.15, -0.25, -0.50};
    auto r = crash_scenario(book, market, today, crashes);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 3u);
    EXPECT_NEAR((*r)[0].spot, 185.0 * 0.85, 1e-12);
    EXPECT_NEAR((*r)[2].spot, 92.5, 1e-12);
    EXPECT_DOUBLE_EQ((*r)[1].crash_pct, -0.25);
    EXPECT_GE((*r)[0].value, (*r)[1].value);
    EXPECT_GE((*r)[1].value, (*r)[2].value);
}

TEST_F(ScenariosTest, CrashRejectsNonNegativeAndTotalLoss) {
    for (double bad : {0.0, 0.1, -1.0, -1.5}) {
        const std::vector<double> crashes{-0.1, bad};
        auto r = crash_scenario(book, market, today, crashes);
        ASSERT_FALSE(r.has_value()) << bad;
        EXPECT_EQ(r.error().code, ValidationErrorCode::InvalidCrashFraction);
        EXPECT_EQ(r.error().index, 1u);
    }
}

TEST_F(ScenariosTest, InvalidPortfolioFailsBeforeEvaluation) {
    std::vector<Position> bad_book = book;
    bad_book[0].contract.strike = 0.0;
    const std::vector<double> spots{180.0};
    auto r = spot_scenario(bad_book, market, today, spots);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ValidationErrorCode::InvalidStrike);
    EXPECT_EQ(r.error().index, 0u);
}

}  // namespace
}  // namespace optrisk
