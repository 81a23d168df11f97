// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "optrisk/option/european_option.hpp"
#include "optrisk/option/iv_solver.hpp"
#include <vector>

namespace optrisk {
namespace {

class IVSolverTest : public ::testing::Test {
protected:
    const CalendarDate today = *CalendarDate::parse("2025-01-01");
    const CalendarDate expiry = today.add_days(182);   // ~0.5y

    MarketSnapshot market{.spot = 100.0, .rate = 0.03, .dividend_yield = 0.01,
                          .volatility = 0.0};

    OptionContract contract(OptionType type, double strike) const {
        return OptionContract{.symbol = "XYZ", .type = type, .strike = strike,
                              .expiry = expiry};
    }
};

TEST_F(IVSolverTest, RoundTripAcrossVolatilities) {
    for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
        for (double strike : {95.0, 100.0, 110.0}) {
            for (double sigma : {0.05, 0.1, 0.2, 0.35, 0.5, 0.8, 1.2}) {
                const OptionContract c = contract(type, strike);
                const double p = price(c, market.with_volatility(sigma), today);
                auto result = implied_vol(p, c, market, today);
                ASSERT_TRUE(result.has_value())
                    << "strike=" << strike << " sigma=" << sigma << " " << result.error();
                EXPECT_NEAR(result->implied_vol, sigma, 1e-4)
                    << "strike=" << strike << " sigma=" << sigma;
                EXPECT_GT(result->vega, 0.0);
                EXPECT_LT(result->final_error, 1e-6);
            }
        }
    }
}

TEST_F(IVSolverTest, NewtonHandlesAtTheMoney) {
    const OptionContract c = contract(OptionType::CALL, 100.0);
    const double p = price(c, market.with_volatility(0.25), today);
    auto result = implied_vol(p, c, market, today);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->method, IVMethod::Newton);
    EXPECT_LT(result->iterations, 10u);
}

TEST_F(IVSolverTest, FallsBackToBisectionOnFlatVega) {
    // Far out of the money from a tiny starting guess: vega is ~0 there
    const OptionContract c = contract(OptionType::CALL, 150.0);
    const double p = price(c, market.with_volatility(0.8), today);

    IVSolver solver(IVConfig{.initial_guess = 1e-4});
    auto result = solver.solve(IVQuery{.market_price = p, .contract = c,
                                       .market = market, .valuation_date = today});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->method, IVMethod::Bisection);
    EXPECT_NEAR(result->implied_vol, 0.8, 1e-4);
}

TEST_F(IVSolverTest, RejectsNonPositivePrice) {
    const OptionContract c = contract(OptionType::CALL, 100.0);
    for (double p : {0.0, -1.0}) {
        auto result = implied_vol(p, c, market, today);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, IVErrorCode::NonPositiveMarketPrice);
        EXPECT_FALSE(is_convergence_failure(result.error().code));
    }
}

TEST_F(IVSolverTest, RejectsExpiredContract) {
    const OptionContract c = contract(OptionType::PUT, 100.0);
    auto at_expiry = implied_vol(1.0, c, market, expiry);
    ASSERT_FALSE(at_expiry.has_value());
    EXPECT_EQ(at_expiry.error().code, IVErrorCode::ExpiredOption);

    auto after = implied_vol(1.0, c, market, expiry.add_days(5));
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, IVErrorCode::ExpiredOption);
}

TEST_F(IVSolverTest, RejectsInvalidSpotAndStrikeBeforeSolving) {
    const OptionContract c = contract(OptionType::CALL, 100.0);
    auto bad_spot = implied_vol(10.0, c, market.with_spot(-5.0), today);
    ASSERT_FALSE(bad_spot.has_value());
    EXPECT_EQ(bad_spot.error().code, IVErrorCode::InvalidInput);
    EXPECT_FALSE(is_convergence_failure(bad_spot.error().code));
    EXPECT_EQ(bad_spot.error().iterations, 0u);
    ASSERT_TRUE(bad_spot.error().cause.has_value());
    EXPECT_EQ(bad_spot.error().cause->code, ValidationErrorCode::InvalidSpotPrice);
    EXPECT_DOUBLE_EQ(bad_spot.error().cause->value, -5.0);

    auto bad_strike = implied_vol(10.0, contract(OptionType::CALL, 0.0), market, today);
    ASSERT_FALSE(bad_strike.has_value());
    EXPECT_EQ(bad_strike.error().code, IVErrorCode::InvalidInput);
    EXPECT_FALSE(is_convergence_failure(bad_strike.error().code));
    ASSERT_TRUE(bad_strike.error().cause.has_value());
    EXPECT_EQ(bad_strike.error().cause->code, ValidationErrorCode::InvalidStrike);
}

TEST_F(IVSolverTest, UnattainablePriceFailsToConverge) {
    // A call can never be worth more than the discounted spot
    const OptionContract c = contract(OptionType::CALL, 100.0);
    auto result = implied_vol(150.0, c, market, today);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::MaxIterationsExceeded);
    EXPECT_TRUE(is_convergence_failure(result.error().code));
    EXPECT_GT(result.error().iterations, 0u);
    ASSERT_TRUE(result.error().last_vol.has_value());
}

TEST_F(IVSolverTest, IgnoresMarketVolatilityField) {
    const OptionContract c = contract(OptionType::PUT, 105.0);
    const double p = price(c, market.with_volatility(0.3), today);
    auto a = implied_vol(p, c, market.with_volatility(0.0), today);
    auto b = implied_vol(p, c, market.with_volatility(2.0), today);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_DOUBLE_EQ(a->implied_vol, b->implied_vol);
}

TEST_F(IVSolverTest, BatchKeepsOrderAndCountsFailures) {
    std::vector<IVQuery> queries;
    const std::vector<double> sigmas{0.15, 0.3, 0.45};
    for (double s : sigmas) {
        const OptionContract c = contract(OptionType::CALL, 100.0);
        queries.push_back(IVQuery{
            .market_price = price(c, market.with_volatility(s), today),
            .contract = c,
            .market = market,
            .valuation_date = today
        });
    }
    queries.push_back(IVQuery{.market_price = -2.0, .contract = contract(OptionType::CALL, 100.0),
                              .market = market, .valuation_date = today});

    IVSolver solver;
    BatchIVResult batch = solver.solve_batch(queries);

    ASSERT_EQ(batch.results.size(), 4u);
    EXPECT_EQ(batch.failed_count, 1u);
    EXPECT_FALSE(batch.all_succeeded());
    for (size_t i = 0; i < sigmas.size(); ++i) {
        ASSERT_TRUE(batch.results[i].has_value());
        EXPECT_NEAR(batch.results[i]->implied_vol, sigmas[i], 1e-4);
    }
    ASSERT_FALSE(batch.results[3].has_value());
    EXPECT_EQ(batch.results[3].error().code, IVErrorCode::NonPositiveMarketPrice);
}

}  // namespace
}  // namespace optrisk
