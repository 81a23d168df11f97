// SPDX-License-Identifier: MIT
/**
 * @file monte_carlo.hpp
 * @brief Distribution of portfolio value at a horizon under GBM spot paths
 *
 * Terminal spots follow the closed form
 *   S_T = S0 · exp((μ − σ²/2)·T + σ·√T·Z),  T = horizon_days / 365
 * and each path revalues the full portfolio at today + horizon_days with a
 * flat volatility σ.
 *
 * Randomness is local to each call. With a seed the output is
 * bit-reproducible regardless of the OpenMP thread count, since draws are
 * generated sequentially before the parallel revaluation.
 */

#pragma once

#include "optrisk/portfolio/position.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace optrisk {

struct MonteCarloConfig {
    int horizon_days = 0;                 ///< Calendar days to the horizon (> 0)
    int n_sims = 10000;                   ///< Number of paths (> 0)
    std::optional<double> vol;            ///< Defaults to market volatility
    std::optional<double> drift;          ///< Defaults to rate − dividend_yield
    std::optional<std::uint64_t> seed;    ///< Unset: seeded from std::random_device
    bool return_samples = false;
};

/// Inputs the simulation actually ran with
struct MonteCarloAssumptions {
    std::string model = "GBM";
    double spot = 0.0;
    double volatility = 0.0;
    double drift = 0.0;
    int horizon_days = 0;
    int n_simulations = 0;
    double risk_free_rate = 0.0;
    double dividend_yield = 0.0;
    CalendarDate horizon_date;
};

struct DistributionSummary {
    double mean = 0.0;
    double std = 0.0;   ///< Population standard deviation
};

struct DistributionPercentiles {
    double p01 = 0.0;
    double p05 = 0.0;
    double p10 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

/// Value-at-risk levels are portfolio values, not losses
struct TailRisk {
    double var_95 = 0.0;    ///< p05
    double var_99 = 0.0;    ///< p01
    double cvar_95 = 0.0;   ///< Mean of outcomes <= var_95
    double cvar_99 = 0.0;   ///< Mean of outcomes <= var_99
};

struct MonteCarloResult {
    MonteCarloAssumptions assumptions;
    DistributionSummary summary;
    DistributionPercentiles percentiles;
    TailRisk tail_risk;
    std::optional<std::vector<double>> samples;   ///< Path order, only when requested
};

/**
 * @brief Simulate the portfolio value distribution at the horizon
 *
 * @return Result, or InvalidHorizon (horizon_days <= 0), InvalidSimulationCount
 *         (n_sims <= 0), InvalidVolatility (resolved σ <= 0 or non-finite),
 *         or any portfolio/market validation error
 */
std::expected<MonteCarloResult, ValidationError>
monte_carlo_scenario(std::span<const Position> positions, const MarketSnapshot& market,
                     const CalendarDate& today, const MonteCarloConfig& config);

}  // namespace optrisk
