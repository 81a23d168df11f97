// SPDX-License-Identifier: MIT
/**
 * @file scenarios.hpp
 * @brief One-axis deterministic sweeps: spot, volatility, time and crash shocks
 *
 * Each sweep derives a new market snapshot (or valuation date) per point,
 * holds everything else fixed and re-runs the portfolio aggregation.
 * Results come back in the caller's order.
 */

#pragma once

#include "optrisk/option/greek_types.hpp"
#include "optrisk/portfolio/position.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <expected>
#include <span>
#include <vector>

namespace optrisk {

/// Portfolio value and Greeks at one point of a spot or volatility sweep
struct ScenarioPoint {
    double swept_value;   ///< Spot or volatility, verbatim from the input
    double value;
    Greeks greeks;
};

/// Portfolio value and Greeks after advancing the valuation date
struct TimeScenarioPoint {
    int days_forward;
    CalendarDate date;    ///< valuation_date + days_forward
    double value;
    Greeks greeks;
};

/// Portfolio value and Greeks after an instantaneous spot crash
struct CrashPoint {
    double crash_pct;     ///< Negative fraction, e.g. -0.25
    double spot;          ///< spot × (1 + crash_pct)
    double value;
    Greeks greeks;
};

/// Sweep the spot; every spot must be positive
std::expected<std::vector<ScenarioPoint>, ValidationError>
spot_scenario(std::span<const Position> positions, const MarketSnapshot& market,
              const CalendarDate& valuation_date, std::span<const double> spots);

/// Sweep the flat volatility; 0 is allowed (degenerate pricing), negatives are not
std::expected<std::vector<ScenarioPoint>, ValidationError>
vol_scenario(std::span<const Position> positions, const MarketSnapshot& market,
             const CalendarDate& valuation_date, std::span<const double> vols);

/// Advance the valuation date by calendar days with the market unchanged
///
/// Contracts that expire along the way collapse to intrinsic value and
/// step-function Greeks rather than failing.
std::expected<std::vector<TimeScenarioPoint>, ValidationError>
time_scenario(std::span<const Position> positions, const MarketSnapshot& market,
              const CalendarDate& valuation_date, std::span<const int> days_forward);

/// Shock the spot down by each crash fraction
///
/// Every fraction must lie in (-1, 0); the whole list is checked before the
/// first evaluation.
std::expected<std::vector<CrashPoint>, ValidationError>
crash_scenario(std::span<const Position> positions, const MarketSnapshot& market,
               const CalendarDate& valuation_date, std::span<const double> crashes);

}  // namespace optrisk
