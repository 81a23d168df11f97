// SPDX-License-Identifier: MIT
#include "optrisk/scenario/monte_carlo.hpp"
#include "optrisk/math/sample_statistics.hpp"
#include "optrisk/scenario/sweep_validation.hpp"
#include "optrisk/support/optrisk_trace.h"
#include "optrisk/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace optrisk {

namespace {

std::mt19937_64 make_generator(const std::optional<std::uint64_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937_64(*seed);
    }
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

}  // namespace

std::expected<MonteCarloResult, ValidationError>
monte_carlo_scenario(std::span<const Position> positions, const MarketSnapshot& market,
                     const CalendarDate& today, const MonteCarloConfig& config) {
    if (config.horizon_days <= 0) {
        return detail::reject(OPTRISK_MODULE_MONTE_CARLO, ValidationErrorCode::InvalidHorizon,
                              static_cast<double>(config.horizon_days));
    }
    if (config.n_sims <= 0) {
        return detail::reject(OPTRISK_MODULE_MONTE_CARLO,
                              ValidationErrorCode::InvalidSimulationCount,
                              static_cast<double>(config.n_sims));
    }
    const double sigma = config.vol.value_or(market.volatility);
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        return detail::reject(OPTRISK_MODULE_MONTE_CARLO, ValidationErrorCode::InvalidVolatility,
                              sigma);
    }
    const double mu = config.drift.value_or(market.rate - market.dividend_yield);
    if (!std::isfinite(mu)) {
        return detail::reject(OPTRISK_MODULE_MONTE_CARLO, ValidationErrorCode::InvalidRate, mu);
    }
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_MONTE_CARLO, positions, market); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_MC_START(config.n_sims, config.horizon_days, sigma, mu);

    const size_t n = static_cast<size_t>(config.n_sims);
    const double T = static_cast<double>(config.horizon_days) / 365.0;
    const CalendarDate horizon_date = today.add_days(config.horizon_days);
    const double s0 = market.spot;
    const double drift_term = (mu - 0.5 * sigma * sigma) * T;
    const double diffusion = sigma * std::sqrt(T);

    // Sequential draws keep a seeded run independent of the thread count
    std::mt19937_64 rng = make_generator(config.seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> terminal_spots(n);
    for (size_t i = 0; i < n; ++i) {
        terminal_spots[i] = s0 * std::exp(drift_term + diffusion * normal(rng));
    }

    const MarketSnapshot horizon_market =
        market.with_volatility(sigma).with_timestamp(horizon_date.to_string());

    std::vector<double> values(n);
    OPTRISK_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < n; ++i) {
        const MarketSnapshot m = horizon_market.with_spot(terminal_spots[i]);
        values[i] = portfolio_price(positions, m, horizon_date);
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    MonteCarloResult result;
    result.assumptions = MonteCarloAssumptions{
        .spot = s0,
        .volatility = sigma,
        .drift = mu,
        .horizon_days = config.horizon_days,
        .n_simulations = config.n_sims,
        .risk_free_rate = market.rate,
        .dividend_yield = market.dividend_yield,
        .horizon_date = horizon_date,
    };
    result.summary = DistributionSummary{
        .mean = sample_mean(values),
        .std = population_stddev(values),
    };
    result.percentiles = DistributionPercentiles{
        .p01 = percentile_sorted(sorted, 1.0),
        .p05 = percentile_sorted(sorted, 5.0),
        .p10 = percentile_sorted(sorted, 10.0),
        .p25 = percentile_sorted(sorted, 25.0),
        .p50 = percentile_sorted(sorted, 50.0),
        .p75 = percentile_sorted(sorted, 75.0),
        .p90 = percentile_sorted(sorted, 90.0),
        .p95 = percentile_sorted(sorted, 95.0),
        .p99 = percentile_sorted(sorted, 99.0),
    };
    result.tail_risk = TailRisk{
        .var_95 = result.percentiles.p05,
        .var_99 = result.percentiles.p01,
        .cvar_95 = tail_mean(values, result.percentiles.p05),
        .cvar_99 = tail_mean(values, result.percentiles.p01),
    };
    if (config.return_samples) {
        result.samples = std::move(values);
    }

    OPTRISK_TRACE_MC_COMPLETE(config.n_sims, result.summary.mean, result.summary.std);
    return result;
}

}  // namespace optrisk
