// SPDX-License-Identifier: MIT
/**
 * @file surfaces.hpp
 * @brief Two-axis sweeps producing value and Greek grids
 *
 * Rows index spots, columns index the second axis (volatility or days
 * forward). Axis vectors are stored verbatim so a caller can label plots
 * without re-deriving them.
 */

#pragma once

#include "optrisk/option/greek_types.hpp"
#include "optrisk/portfolio/position.hpp"
#include "optrisk/scenario/grid2d.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <expected>
#include <span>
#include <vector>

namespace optrisk {

/// Value and the five Greeks on one (spots × second axis) grid shape
struct SurfaceGrids {
    Grid2D value;
    Grid2D delta;
    Grid2D gamma;
    Grid2D vega;
    Grid2D theta;
    Grid2D rho;

    SurfaceGrids() = default;
    SurfaceGrids(size_t rows, size_t cols)
        : value(rows, cols), delta(rows, cols), gamma(rows, cols),
          vega(rows, cols), theta(rows, cols), rho(rows, cols) {}

    const Grid2D& greek(Greek g) const {
        switch (g) {
            case Greek::Delta: return delta;
            case Greek::Gamma: return gamma;
            case Greek::Vega:  return vega;
            case Greek::Theta: return theta;
            case Greek::Rho:   return rho;
        }
        return delta;
    }

    /// Store one evaluation at (i, j)
    void set(size_t i, size_t j, double v, const Greeks& g) {
        value(i, j) = v;
        delta(i, j) = g.delta;
        gamma(i, j) = g.gamma;
        vega(i, j) = g.vega;
        theta(i, j) = g.theta;
        rho(i, j) = g.rho;
    }
};

struct SpotVolSurface {
    std::vector<double> spots;
    std::vector<double> vols;
    SurfaceGrids grids;
};

struct SpotTimeSurface {
    std::vector<double> spots;
    std::vector<int> days_forward;
    SurfaceGrids grids;
};

/// Portfolio value and Greeks over spots × volatilities at a fixed date
std::expected<SpotVolSurface, ValidationError>
spot_vol_surface(std::span<const Position> positions, const MarketSnapshot& market,
                 const CalendarDate& valuation_date,
                 std::span<const double> spots, std::span<const double> vols);

/// Portfolio value and Greeks over spots × days forward
///
/// Column j is evaluated at valuation_date + days_forward[j], with the
/// market timestamp label set to that date.
std::expected<SpotTimeSurface, ValidationError>
spot_time_surface(std::span<const Position> positions, const MarketSnapshot& market,
                  const CalendarDate& valuation_date,
                  std::span<const double> spots, std::span<const int> days_forward);

}  // namespace optrisk
