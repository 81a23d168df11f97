// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "optrisk/scenario/monte_carlo.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace optrisk {
namespace {

class MonteCarloTest : public ::testing::Test {
protected:
    const CalendarDate today = *CalendarDate::parse("2026-01-22");
    const CalendarDate expiry = *CalendarDate::parse("2026-06-19");

    MarketSnapshot market{.spot = 185.0, .rate = 0.03, .dividend_yield = 0.005,
                          .volatility = 0.25};

    std::vector<Position> book{
        {.contract = {.symbol = "AAPL", .type = OptionType::CALL, .strike = 180.0,
                      .expiry = expiry},
         .quantity = 1.0},
        {.contract = {.symbol = "AAPL", .type = OptionType::PUT, .strike = 160.0,
                      .expiry = expiry},
         .quantity = -1.0},
    };

    MonteCarloConfig config(int n_sims = 4000) const {
        return MonteCarloConfig{.horizon_days = 30, .n_sims = n_sims, .seed = 42};
    }
};

TEST_F(MonteCarloTest, PercentilesAreNonDecreasing) {
    auto r = monte_carlo_scenario(book, market, today, config());
    ASSERT_TRUE(r.has_value());
    const auto& p = r->percentiles;
    const std::vector<double> q{p.p01, p.p05, p.p10, p.p25, p.p50, p.p75, p.p90, p.p95, p.p99};
    EXPECT_TRUE(std::is_sorted(q.begin(), q.end()));
}

TEST_F(MonteCarloTest, TailRiskOrdering) {
    auto r = monte_carlo_scenario(book, market, today, config());
    ASSERT_TRUE(r.has_value());
    const auto& t = r->tail_risk;
    EXPECT_DOUBLE_EQ(t.var_95, r->percentiles.p05);
    EXPECT_DOUBLE_EQ(t.var_99, r->percentiles.p01);
    EXPECT_LE(t.cvar_95, t.var_95);
    EXPECT_LE(t.cvar_99, t.var_99);
    EXPECT_LE(t.var_99, t.var_95);
}

TEST_F(MonteCarloTest, SameSeedIsReproducible) {
    auto a = monte_carlo_scenario(book, market, today, config());
    auto b = monte_carlo_scenario(book, market, today, config());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->summary.mean, b->summary.mean);
    EXPECT_EQ(a->summary.std, b->summary.std);
    EXPECT_EQ(a->percentiles.p50, b->percentiles.p50);
    EXPECT_EQ(a->tail_risk.cvar_99, b->tail_risk.cvar_99);
}

TEST_F(MonteCarloTest, DifferentSeedsDiffer) {
    MonteCarloConfig other = config();
    other.seed = 7;
    auto a = monte_carlo_scenario(book, market, today, config());
    auto b = monte_carlo_scenario(book, market, today, other);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->summary.mean, b->summary.mean);
}

TEST_F(MonteCarloTest, HigherVolatilityWidensDistribution) {
    MonteCarloConfig low = config();
    low.vol = 0.15;
    MonteCarloConfig high = config();
    high.vol = 0.45;
    auto a = monte_carlo_scenario(book, market, today, low);
    auto b = monte_carlo_scenario(book, market, today, high);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_GT(b->summary.std, a->summary.std);
}

TEST_F(MonteCarloTest, AssumptionsReflectResolvedInputs) {
    auto r = monte_carlo_scenario(book, market, today, config());
    ASSERT_TRUE(r.has_value());
    const auto& a = r->assumptions;
    EXPECT_EQ(a.model, "GBM");
    EXPECT_DOUBLE_EQ(a.spot, 185.0);
    EXPECT_DOUBLE_EQ(a.volatility, 0.25);
    EXPECT_DOUBLE_EQ(a.drift, 0.03 - 0.005);
    EXPECT_EQ(a.horizon_days, 30);
    EXPECT_EQ(a.n_simulations, 4000);
    EXPECT_DOUBLE_EQ(a.risk_free_rate, 0.03);
    EXPECT_DOUBLE_EQ(a.dividend_yield, 0.005);
    EXPECT_EQ(a.horizon_date, today.add_days(30));

    MonteCarloConfig overridden = config();
    overridden.drift = 0.1;
    auto o = monte_carlo_scenario(book, market, today, overridden);
    ASSERT_TRUE(o.has_value());
    EXPECT_DOUBLE_EQ(o->assumptions.drift, 0.1);
}

TEST_F(MonteCarloTest, SamplesOnlyWhenRequested) {
    auto without = monte_carlo_scenario(book, market, today, config(500));
    ASSERT_TRUE(without.has_value());
    EXPECT_FALSE(without->samples.has_value());

    MonteCarloConfig with = config(500);
    with.return_samples = true;
    auto r = monte_carlo_scenario(book, market, today, with);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->samples.has_value());
    ASSERT_EQ(r->samples->size(), 500u);

    double sum = 0.0;
    for (double v : *r->samples) sum += v;
    EXPECT_NEAR(sum / 500.0, r->summary.mean, 1e-9);
}

TEST_F(MonteCarloTest, MeanNearForwardRevaluation) {
    // A single long call: E[value at horizon] under risk-neutral drift is close
    // to today's value grown at the rate
    std::vector<Position> call_only{book[0]};
    auto r = monte_carlo_scenario(call_only, market, today, config(20000));
    ASSERT_TRUE(r.has_value());
    const double today_value = portfolio_price(call_only, market, today);
    const double grown = today_value * std::exp(0.03 * 30.0 / 365.0);
    EXPECT_NEAR(r->summary.mean, grown, 0.05 * grown);
}

TEST_F(MonteCarloTest, RejectsInvalidConfig) {
    MonteCarloConfig no_horizon = config();
    no_horizon.horizon_days = 0;
    auto a = monte_carlo_scenario(book, market, today, no_horizon);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ValidationErrorCode::InvalidHorizon);

    MonteCarloConfig no_sims = config();
    no_sims.n_sims = 0;
    auto b = monte_carlo_scenario(book, market, today, no_sims);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ValidationErrorCode::InvalidSimulationCount);

    auto c = monte_carlo_scenario(book, market.with_volatility(0.0), today, config());
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ValidationErrorCode::InvalidVolatility);

    MonteCarloConfig neg_vol = config();
    neg_vol.vol = -0.2;
    auto d = monte_carlo_scenario(book, market, today, neg_vol);
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST_F(MonteCarloTest, UnseededRunsSucceed) {
    MonteCarloConfig unseeded{.horizon_days = 10, .n_sims = 200};
    auto r = monte_carlo_scenario(book, market, today, unseeded);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(std::isfinite(r->summary.mean));
}

}  // namespace
}  // namespace optrisk
