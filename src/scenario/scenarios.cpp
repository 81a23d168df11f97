// SPDX-License-Identifier: MIT
#include "optrisk/scenario/scenarios.hpp"
#include "optrisk/scenario/sweep_validation.hpp"
#include "optrisk/support/optrisk_trace.h"
#include <cmath>

namespace optrisk {

std::expected<std::vector<ScenarioPoint>, ValidationError>
spot_scenario(std::span<const Position> positions, const MarketSnapshot& market,
              const CalendarDate& valuation_date, std::span<const double> spots) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SCENARIO, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::validate_spot_axis(OPTRISK_MODULE_SCENARIO, spots); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SCENARIO, spots.size(), positions.size(), 1);

    std::vector<ScenarioPoint> results;
    results.reserve(spots.size());
    for (double s : spots) {
        MarketSnapshot m = market.with_spot(s);
        results.push_back(ScenarioPoint{
            .swept_value = s,
            .value = portfolio_price(positions, m, valuation_date),
            .greeks = portfolio_greeks(positions, m, valuation_date)
        });
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SCENARIO, results.size(), 1);
    return results;
}

std::expected<std::vector<ScenarioPoint>, ValidationError>
vol_scenario(std::span<const Position> positions, const MarketSnapshot& market,
             const CalendarDate& valuation_date, std::span<const double> vols) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SCENARIO, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::validate_vol_axis(OPTRISK_MODULE_SCENARIO, vols); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SCENARIO, vols.size(), positions.size(), 2);

    std::vector<ScenarioPoint> results;
    results.reserve(vols.size());
    for (double v : vols) {
        MarketSnapshot m = market.with_volatility(v);
        results.push_back(ScenarioPoint{
            .swept_value = v,
            .value = portfolio_price(positions, m, valuation_date),
            .greeks = portfolio_greeks(positions, m, valuation_date)
        });
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SCENARIO, results.size(), 2);
    return results;
}

std::expected<std::vector<TimeScenarioPoint>, ValidationError>
time_scenario(std::span<const Position> positions, const MarketSnapshot& market,
              const CalendarDate& valuation_date, std::span<const int> days_forward) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SCENARIO, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::require_non_empty(OPTRISK_MODULE_SCENARIO, days_forward); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SCENARIO, days_forward.size(), positions.size(), 3);

    std::vector<TimeScenarioPoint> results;
    results.reserve(days_forward.size());
    for (int d : days_forward) {
        CalendarDate t = valuation_date.add_days(d);
        results.push_back(TimeScenarioPoint{
            .days_forward = d,
            .date = t,
            .value = portfolio_price(positions, market, t),
            .greeks = portfolio_greeks(positions, market, t)
        });
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SCENARIO, results.size(), 3);
    return results;
}

std::expected<std::vector<CrashPoint>, ValidationError>
crash_scenario(std::span<const Position> positions, const MarketSnapshot& market,
               const CalendarDate& valuation_date, std::span<const double> crashes) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SCENARIO, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::require_non_empty(OPTRISK_MODULE_SCENARIO, crashes); !ok) {
        return std::unexpected(ok.error());
    }

    // Crashes are negative fractions; -1 or below would leave no positive spot
    for (size_t i = 0; i < crashes.size(); ++i) {
        const double c = crashes[i];
        if (!std::isfinite(c) || c >= 0.0 || c <= -1.0) {
            return detail::reject(OPTRISK_MODULE_SCENARIO,
                                  ValidationErrorCode::InvalidCrashFraction, c, i);
        }
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SCENARIO, crashes.size(), positions.size(), 4);

    std::vector<CrashPoint> results;
    results.reserve(crashes.size());
    for (double c : crashes) {
        const double shocked_spot = market.spot * (1.0 + c);
        MarketSnapshot m = market.with_spot(shocked_spot);
        results.push_back(CrashPoint{
            .crash_pct = c,
            .spot = shocked_spot,
            .value = portfolio_price(positions, m, valuation_date),
            .greeks = portfolio_greeks(positions, m, valuation_date)
        });
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SCENARIO, results.size(), 4);
    return results;
}

}  // namespace optrisk
