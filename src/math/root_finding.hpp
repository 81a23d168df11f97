// SPDX-License-Identifier: MIT
#pragma once

#include "optrisk/support/optrisk_trace.h"
#include <cmath>
#include <concepts>
#include <cstddef>
#include <expected>
#include <limits>

namespace optrisk {

/// Configuration for the scalar root finders
///
/// Each method uses only its relevant parameters.
struct RootFindingConfig {
    /// Maximum iterations for any method
    size_t max_iter = 100;

    /// Absolute tolerance on |f(x)|
    double tolerance = 1e-6;

    // Newton-specific parameters
    double min_derivative = 1e-8;  ///< Leave Newton when f'(x) falls below this
};

/// Success result from any root-finding method
struct RootFindingSuccess {
    double root;          ///< x with |f(x)| < tolerance
    size_t iterations;    ///< Function evaluations performed
    double final_error;   ///< |f(root)|
};

/// Why a root finder gave up
enum class RootFindingErrorCode {
    MaxIterationsExceeded,
    FlatDerivative,      ///< Newton derivative below min_derivative
    LeftDomain,          ///< Newton step landed at or below the lower bound
    NonFiniteValue       ///< f or f' returned NaN/Inf
};

/// Failure result with the last iterate for diagnostics
struct RootFindingError {
    RootFindingErrorCode code;
    size_t iterations = 0;
    double final_error = std::numeric_limits<double>::quiet_NaN();
    double last_x = std::numeric_limits<double>::quiet_NaN();
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for derivative functions (scalar functions df: R -> R)
template<typename DF>
concept DerivativeFunction = requires(DF df, double x) {
    { df(x) } -> std::convertible_to<double>;
};

/// Find root using Newton-Raphson with an open lower bound
///
/// Update rule: x_{n+1} = x_n - f(x_n)/f'(x_n). No clamping: a step that
/// lands at or below x_min, or a derivative below config.min_derivative,
/// ends the search with an error so the caller can fall back to a
/// bracketing method.
///
/// @param f Function to find root of (finds x where f(x) = 0)
/// @param df Derivative of f
/// @param x0 Initial guess
/// @param x_min Exclusive lower bound of the domain
/// @param config Uses max_iter, tolerance, min_derivative
/// @return Root on convergence, RootFindingError otherwise
template<ObjectiveFunction F, DerivativeFunction DF>
std::expected<RootFindingSuccess, RootFindingError>
newton_find_root(F&& f, DF&& df, double x0, double x_min, const RootFindingConfig& config) {
    double x = x0;
    double error_abs = std::numeric_limits<double>::quiet_NaN();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double fx = f(x);
        if (!std::isfinite(fx)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFiniteValue,
                .iterations = iter + 1,
                .last_x = x
            });
        }

        error_abs = std::abs(fx);
        OPTRISK_TRACE_CONVERGENCE_ITER(OPTRISK_MODULE_ROOT_FINDING, 1, iter, error_abs,
                                       config.tolerance);

        if (error_abs < config.tolerance) {
            return RootFindingSuccess{
                .root = x,
                .iterations = iter + 1,
                .final_error = error_abs
            };
        }

        const double dfx = df(x);
        if (!std::isfinite(dfx) || dfx < config.min_derivative) {
            return std::unexpected(RootFindingError{
                .code = std::isfinite(dfx) ? RootFindingErrorCode::FlatDerivative
                                           : RootFindingErrorCode::NonFiniteValue,
                .iterations = iter + 1,
                .final_error = error_abs,
                .last_x = x
            });
        }

        x -= fx / dfx;

        if (x <= x_min) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::LeftDomain,
                .iterations = iter + 1,
                .final_error = error_abs,
                .last_x = x
            });
        }
    }

    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::MaxIterationsExceeded,
        .iterations = config.max_iter,
        .final_error = error_abs,
        .last_x = x
    });
}

/// Find root of an increasing function by bisection on [lo, hi]
///
/// Each step evaluates the midpoint; |f(mid)| < tolerance converges,
/// f(mid) > 0 moves hi down, otherwise lo moves up. Monotonic objectives
/// (price in volatility) always make progress; convergence still requires
/// the root to lie inside the bracket.
///
/// @param f Increasing function to find root of
/// @param lo Lower end of the bracket
/// @param hi Upper end of the bracket
/// @param config Uses max_iter and tolerance
/// @return Root on convergence, RootFindingError otherwise
template<ObjectiveFunction F>
std::expected<RootFindingSuccess, RootFindingError>
bisection_find_root(F&& f, double lo, double hi, const RootFindingConfig& config) {
    double mid = 0.5 * (lo + hi);
    double error_abs = std::numeric_limits<double>::quiet_NaN();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        mid = 0.5 * (lo + hi);
        const double fm = f(mid);
        if (!std::isfinite(fm)) {
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFiniteValue,
                .iterations = iter + 1,
                .last_x = mid
            });
        }

        error_abs = std::abs(fm);
        OPTRISK_TRACE_CONVERGENCE_ITER(OPTRISK_MODULE_ROOT_FINDING, 2, iter, error_abs,
                                       config.tolerance);

        if (error_abs < config.tolerance) {
            return RootFindingSuccess{
                .root = mid,
                .iterations = iter + 1,
                .final_error = error_abs
            };
        }

        if (fm > 0.0) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::MaxIterationsExceeded,
        .iterations = config.max_iter,
        .final_error = error_abs,
        .last_x = mid
    });
}

}  // namespace optrisk
