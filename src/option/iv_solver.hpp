// SPDX-License-Identifier: MIT
/**
 * @file iv_solver.hpp
 * @brief Implied volatility solver for the closed-form European model
 *
 * Newton-Raphson on the analytical vega first, bisection on a fixed
 * volatility bracket when Newton stalls (flat vega, a step below zero, or
 * iteration budget exhausted).
 *
 * Example:
 * @code
 * IVSolver solver(IVConfig{.tolerance = 1e-8});
 * auto result = solver.solve(IVQuery{
 *     .market_price = 12.5, .contract = call, .market = market, .valuation_date = today});
 *
 * if (result.has_value()) {
 *     std::cout << "IV: " << result->implied_vol << "\n";
 * } else if (is_convergence_failure(result.error().code)) {
 *     std::cerr << "no convergence: " << result.error() << "\n";
 * }
 * @endcode
 */

#pragma once

#include "optrisk/option/iv_result.hpp"
#include "optrisk/option/option_spec.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>

namespace optrisk {

/// Solver tuning
struct IVConfig {
    double initial_guess = 0.2;       ///< Newton starting point (floored at 1e-4)
    double tolerance = 1e-6;          ///< Absolute price tolerance for both phases
    size_t max_iter = 50;             ///< Newton iteration budget
    double bisection_low = 1e-6;      ///< Bisection bracket, lower volatility
    double bisection_high = 5.0;      ///< Bisection bracket, upper volatility
    size_t bisection_max_iter = 100;  ///< Bisection iteration budget
};

/// Observed option price plus everything needed to invert it
struct IVQuery {
    double market_price = 0.0;
    OptionContract contract;
    MarketSnapshot market;           ///< Volatility field is ignored
    CalendarDate valuation_date;
};

/// Implied volatility solver
///
/// Stateless apart from its configuration; solve() may be called
/// concurrently from multiple threads.
class IVSolver {
public:
    explicit IVSolver(const IVConfig& config = {});

    /// Solve one query
    ///
    /// Validation errors (NonPositiveMarketPrice, ExpiredOption) are returned
    /// before any pricing. MaxIterationsExceeded means both phases ran and
    /// neither reached the tolerance.
    std::expected<IVSuccess, IVError> solve(const IVQuery& query) const;

    /// Solve independent queries in parallel
    BatchIVResult solve_batch(std::span<const IVQuery> queries) const;

    const IVConfig& config() const { return config_; }

private:
    IVConfig config_;
};

/// Convenience wrapper around IVSolver::solve
std::expected<IVSuccess, IVError> implied_vol(double market_price,
                                              const OptionContract& contract,
                                              const MarketSnapshot& market,
                                              const CalendarDate& valuation_date,
                                              const IVConfig& config = {});

}  // namespace optrisk
