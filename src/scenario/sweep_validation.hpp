// SPDX-License-Identifier: MIT
/**
 * @file sweep_validation.hpp
 * @brief Up-front checks shared by the scenario, surface and payoff evaluators
 *
 * Every evaluator validates all of its inputs before the first pricing call
 * so a rejected request never produces partial output.
 */

#pragma once

#include "optrisk/portfolio/position.hpp"
#include "optrisk/support/error_types.hpp"
#include "optrisk/support/optrisk_trace.h"
#include <cmath>
#include <expected>
#include <span>

namespace optrisk::detail {

inline std::unexpected<ValidationError> reject(int module_id, ValidationErrorCode code,
                                               double value = 0.0, size_t index = 0) {
    OPTRISK_TRACE_VALIDATION_ERROR(module_id, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

template <typename T>
std::expected<void, ValidationError> require_non_empty(int module_id, std::span<const T> axis) {
    if (axis.empty()) {
        return reject(module_id, ValidationErrorCode::EmptyGrid);
    }
    return {};
}

/// Spot axis: non-empty, every value finite and above `floor`
inline std::expected<void, ValidationError> validate_spot_axis(int module_id,
                                                               std::span<const double> spots,
                                                               double floor = 0.0) {
    auto non_empty = require_non_empty(module_id, spots);
    if (!non_empty) return non_empty;

    for (size_t i = 0; i < spots.size(); ++i) {
        if (!std::isfinite(spots[i]) || spots[i] <= floor) {
            return reject(module_id, ValidationErrorCode::InvalidSpotPrice, spots[i], i);
        }
    }
    return {};
}

/// Volatility axis: non-empty, every value finite and >= 0
inline std::expected<void, ValidationError> validate_vol_axis(int module_id,
                                                              std::span<const double> vols) {
    auto non_empty = require_non_empty(module_id, vols);
    if (!non_empty) return non_empty;

    for (size_t i = 0; i < vols.size(); ++i) {
        if (!std::isfinite(vols[i]) || vols[i] < 0.0) {
            return reject(module_id, ValidationErrorCode::InvalidVolatility, vols[i], i);
        }
    }
    return {};
}

/// Portfolio and market check tagged with the caller's module id
inline std::expected<void, ValidationError> validate_inputs(int module_id,
                                                            std::span<const Position> positions,
                                                            const MarketSnapshot& market) {
    auto ok = validate_portfolio(positions, market);
    if (!ok) {
        OPTRISK_TRACE_VALIDATION_ERROR(module_id, static_cast<int>(ok.error().code),
                                       ok.error().value, ok.error().index);
    }
    return ok;
}

}  // namespace optrisk::detail
