// SPDX-License-Identifier: MIT
#include "optrisk/scenario/surfaces.hpp"
#include "optrisk/scenario/sweep_validation.hpp"
#include "optrisk/support/optrisk_trace.h"
#include <string>

namespace optrisk {

std::expected<SpotVolSurface, ValidationError>
spot_vol_surface(std::span<const Position> positions, const MarketSnapshot& market,
                 const CalendarDate& valuation_date,
                 std::span<const double> spots, std::span<const double> vols) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SURFACE, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::validate_spot_axis(OPTRISK_MODULE_SURFACE, spots); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::validate_vol_axis(OPTRISK_MODULE_SURFACE, vols); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SURFACE, spots.size(), vols.size(), positions.size());

    SpotVolSurface surface{
        .spots = std::vector<double>(spots.begin(), spots.end()),
        .vols = std::vector<double>(vols.begin(), vols.end()),
        .grids = SurfaceGrids(spots.size(), vols.size())
    };

    for (size_t i = 0; i < spots.size(); ++i) {
        const MarketSnapshot at_spot = market.with_spot(spots[i]);
        for (size_t j = 0; j < vols.size(); ++j) {
            const MarketSnapshot m = at_spot.with_volatility(vols[j]);
            surface.grids.set(i, j,
                              portfolio_price(positions, m, valuation_date),
                              portfolio_greeks(positions, m, valuation_date));
        }
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SURFACE, spots.size() * vols.size(), 0);
    return surface;
}

std::expected<SpotTimeSurface, ValidationError>
spot_time_surface(std::span<const Position> positions, const MarketSnapshot& market,
                  const CalendarDate& valuation_date,
                  std::span<const double> spots, std::span<const int> days_forward) {
    if (auto ok = detail::validate_inputs(OPTRISK_MODULE_SURFACE, positions, market); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::validate_spot_axis(OPTRISK_MODULE_SURFACE, spots); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = detail::require_non_empty(OPTRISK_MODULE_SURFACE, days_forward); !ok) {
        return std::unexpected(ok.error());
    }

    OPTRISK_TRACE_ALGO_START(OPTRISK_MODULE_SURFACE, spots.size(), days_forward.size(),
                             positions.size());

    SpotTimeSurface surface{
        .spots = std::vector<double>(spots.begin(), spots.end()),
        .days_forward = std::vector<int>(days_forward.begin(), days_forward.end()),
        .grids = SurfaceGrids(spots.size(), days_forward.size())
    };

    // Dates and labels depend only on the column
    std::vector<CalendarDate> dates;
    std::vector<std::string> labels;
    dates.reserve(days_forward.size());
    labels.reserve(days_forward.size());
    for (int d : days_forward) {
        dates.push_back(valuation_date.add_days(d));
        labels.push_back(dates.back().to_string());
    }

    for (size_t i = 0; i < spots.size(); ++i) {
        const MarketSnapshot at_spot = market.with_spot(spots[i]);
        for (size_t j = 0; j < dates.size(); ++j) {
            const MarketSnapshot m = at_spot.with_timestamp(labels[j]);
            surface.grids.set(i, j,
                              portfolio_price(positions, m, dates[j]),
                              portfolio_greeks(positions, m, dates[j]));
        }
    }

    OPTRISK_TRACE_ALGO_COMPLETE(OPTRISK_MODULE_SURFACE, spots.size() * days_forward.size(), 0);
    return surface;
}

}  // namespace optrisk
