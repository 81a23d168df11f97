// SPDX-License-Identifier: MIT
/**
 * @file payoff.hpp
 * @brief Payoff-at-expiry and value-today curves over a spot grid
 */

#pragma once

#include "optrisk/portfolio/position.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace optrisk {

/// Smallest spot accepted on a payoff grid
inline constexpr double kMinPayoffSpot = 0.01;

/**
 * @brief Payoff curve request
 *
 * Volatility, rate and dividend yield come from the market snapshot passed
 * alongside (flat-vol assumption).
 */
struct PayoffConfig {
    CalendarDate expiry_date;            ///< Date the payoff curve is valued at
    std::vector<double> spots;           ///< Spot grid, any order, each >= kMinPayoffSpot
    bool include_value_today = true;
    bool include_greeks_today = false;
};

/// Greeks along the spot grid, index-aligned with PayoffResult::spots
struct GreekCurves {
    std::vector<double> delta;
    std::vector<double> gamma;
    std::vector<double> vega;
    std::vector<double> theta;
    std::vector<double> rho;
};

/// Market and dates a payoff curve was built under
struct PayoffMetadata {
    CalendarDate today;
    CalendarDate expiry_date;
    double rate = 0.0;
    double dividend_yield = 0.0;
    double volatility = 0.0;
    std::string vol_model = "flat";
};

struct PayoffResult {
    std::vector<double> spots;                   ///< Sorted ascending
    std::vector<double> payoff_at_expiry;
    std::optional<std::vector<double>> value_today;
    std::optional<GreekCurves> greeks_today;
    PayoffMetadata metadata;
};

/**
 * @brief Evenly spaced spot grid around a center
 *
 * Points run from max(min_spot, center·(1 − pct_range)) to
 * center·(1 + pct_range); point i is lo + i·step.
 *
 * @return Grid, or InvalidSpotPrice (center <= 0), InvalidGridRange
 *         (pct_range <= 0 or empty interval), InvalidGridSize (n < 2)
 */
std::expected<std::vector<double>, ValidationError>
make_spot_grid(double spot_center, double pct_range = 0.5, int n = 101,
               double min_spot = kMinPayoffSpot);

/// Portfolio value at expiry, and optionally today, along a sorted spot grid
std::expected<PayoffResult, ValidationError>
payoff_scenario(std::span<const Position> positions, const MarketSnapshot& market,
                const CalendarDate& today, const PayoffConfig& config);

}  // namespace optrisk
