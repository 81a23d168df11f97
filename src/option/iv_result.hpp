// SPDX-License-Identifier: MIT
/**
 * @file iv_result.hpp
 * @brief IV solver result types for std::expected API
 */

#pragma once

#include <cstddef>
#include <expected>
#include <vector>
#include "optrisk/support/error_types.hpp"

namespace optrisk {

/// Root-finding phase that produced an implied volatility
enum class IVMethod {
    Newton,
    Bisection
};

/// Success result from IV solver
struct IVSuccess {
    double implied_vol;      ///< Solved implied volatility
    size_t iterations;       ///< Newton + bisection iterations taken
    double final_error;      ///< |Price(σ) - Market_Price|
    IVMethod method;         ///< Phase that converged
    double vega;             ///< Vega at the solution, per 1.00 of vol
};

/// Batch IV solver result
struct BatchIVResult {
    std::vector<std::expected<IVSuccess, IVError>> results;  ///< Individual results
    size_t failed_count;                                      ///< Number of failures

    /// Check if all results succeeded
    bool all_succeeded() const {
        return failed_count == 0;
    }
};

}  // namespace optrisk
