// SPDX-License-Identifier: MIT
#include "optrisk/scenario/payoff.hpp"
#include "optrisk/scenario/sweep_validation.hpp"
#include "optrisk/support/optrisk_trace.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace optrisk {

std::expected<std::vector<double>, ValidationError>
make_spot_grid(double spot_center, double pct_range, int n, double min_spot) {
    if (!std::isfinite(spot_center) || spot_center <= 0.0) {
        return detail::reject(OPTRISK_MODULE_PAYOFF, ValidationErrorCode::InvalidSpotPrice,
                              spot_center);
    }
    if (!std::isfinite(pct_range) || pct_range <= 0.0) {
        return detail::reject(OPTRISK_MODULE_PAYOFF, ValidationErrorCode::InvalidGridRange,
                              pct_range);
    }
    if (n < 2) {
        return detail::reject(OPTRISK_MODULE_PAYOFF, ValidationErrorCode::InvalidGridSize,
                              static_cast<double>(n));
    }

    const double lo = std::max(min_spot, spot_center * (1.0 - pct_range));
    const double hi = spot_center * (1.0 + pct_range);
    if (!(hi > lo)) {
        return detail::reject(OPTRISK_MODULE_PAYOFF, ValidationErrorCode::InvalidGridRange, lo);
    }

    const double step = (hi - lo) / static_cast<double>(n - 1);
    std::vector<double> grid(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        grid[static_cast<size_t>(i)] = lo + i * step;
    }
    return grid;
}

std::expected<PayoffResult, ValidationError>
payoff_scenario(std::span<const Position> positions, const MarketSnapshot& market,
                const CalendarDate& today, const PayoffConfig& config) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_PAYOFF, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::require_non_empty(OPTRISK_MODULE_PAYOFF,
                                            std::span<const double>(config.spots)); !ok) {
        return std::unexpected(ok.error());
    }
    for (size_t i = 0; i < config.spots.size(); ++i) {
        const double s = config.spots[i];
        if (!std::isfinite(s) || s < kMinPayoffSpot) {
            return detail::reject(OPTRISK_MODULE_PAYOFF, ValidationErrorCode::InvalidSpotPrice,
                                  s, i);
        }
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_PAYOFF, config.spots.size(), positions.size(),
                             config.include_greeks_today ? 1 : 0);

    PayoffResult result;
    result.spots = config.spots;
    std::sort(result.spots.begin(), result.spots.end());
    result.metadata = PayoffMetadata{
        .today = today,
        .expiry_date = config.expiry_date,
        .rate = market.rate,
        .dividend_yield = market.dividend_yield,
        .volatility = market.volatility,
    };

    const size_t n = result.spots.size();
    const std::string expiry_label = config.expiry_date.to_string();
    const std::string today_label = today.to_string();

    result.payoff_at_expiry.reserve(n);
    for (double s : result.spots) {
        const MarketSnapshot m = market.with_spot(s).with_timestamp(expiry_label);
        result.payoff_at_expiry.push_back(portfolio_price(positions, m, config.expiry_date));
    }

    if (config.include_value_today) {
        std::vector<double> curve;
        curve.reserve(n);
        for (double s : result.spots) {
            const MarketSnapshot m = market.with_spot(s).with_timestamp(today_label);
            curve.push_back(portfolio_price(positions, m, today));
        }
        result.value_today = std::move(curve);
    }

    if (config.include_greeks_today) {
        GreekCurves curves;
        curves.delta.reserve(n);
        curves.gamma.reserve(n);
        curves.vega.reserve(n);
        curves.theta.reserve(n);
        curves.rho.reserve(n);
        for (double s : result.spots) {
            const MarketSnapshot m = market.with_spot(s).with_timestamp(today_label);
            const Greeks g = portfolio_greeks(positions, m, today);
            curves.delta.push_back(g.delta);
            curves.gamma.push_back(g.gamma);
            curves.vega.push_back(g.vega);
            curves.theta.push_back(g.theta);
            curves.rho.push_back(g.rho);
        }
        result.greeks_today = std::move(curves);
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_PAYOFF, n, 0);
    return result;
}

}  // namespace optrisk
