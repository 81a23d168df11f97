// SPDX-License-Identifier: MIT
#include "optrisk/option/iv_solver.hpp"
#include "optrisk/math/black_scholes_analytics.hpp"
#include "optrisk/math/root_finding.hpp"
#include "optrisk/support/optrisk_trace.h"
#include "optrisk/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace optrisk {

namespace {

constexpr double kMinInitialGuess = 1e-4;

}  // namespace

IVSolver::IVSolver(const IVConfig& config)
    : config_(config)
{}

std::expected<IVSuccess, IVError> IVSolver::solve(const IVQuery& query) const {
    const double tau = year_fraction(query.valuation_date, query.contract.expiry);
    const MarketSnapshot& m = query.market;
    const OptionContract& c = query.contract;

    OPTRISK_TRACE_IV_START(m.spot, c.strike, tau, query.market_price);

    if (!(query.market_price > 0.0) || !std::isfinite(query.market_price)) {
        OPTRISK_TRACE_VALIDATION_ERROR(OPTRISK_MODULE_IMPLIED_VOL,
            static_cast<int>(IVErrorCode::NonPositiveMarketPrice), query.market_price, 0);
        return std::unexpected(IVError{.code = IVErrorCode::NonPositiveMarketPrice});
    }

    // The snapshot's volatility is the unknown, so it is not checked
    auto inputs_ok = validate_contract(c);
    if (inputs_ok.has_value()) {
        inputs_ok = validate_market(m.with_volatility(0.0));
    }
    if (!inputs_ok.has_value()) {
        OPTRISK_TRACE_VALIDATION_ERROR(OPTRISK_MODULE_IMPLIED_VOL,
            static_cast<int>(IVErrorCode::InvalidInput), inputs_ok.error().value, 0);
        return std::unexpected(IVError{.code = IVErrorCode::InvalidInput,
                                       .cause = inputs_ok.error()});
    }

    if (tau <= 0.0) {
        OPTRISK_TRACE_VALIDATION_ERROR(OPTRISK_MODULE_IMPLIED_VOL,
            static_cast<int>(IVErrorCode::ExpiredOption), tau, 0);
        return std::unexpected(IVError{.code = IVErrorCode::ExpiredOption});
    }

    // Objective: V(σ) - V_market, increasing in σ
    auto objective = [&](double sigma) {
        return bs_price(m.spot, c.strike, tau, sigma, m.rate, m.dividend_yield, c.type) -
               query.market_price;
    };
    auto vega = [&](double sigma) {
        return bs_vega(m.spot, c.strike, tau, sigma, m.rate, m.dividend_yield);
    };

    // Phase 1: Newton-Raphson
    RootFindingConfig newton_config{
        .max_iter = config_.max_iter,
        .tolerance = config_.tolerance,
    };
    const double sigma0 = std::max(config_.initial_guess, kMinInitialGuess);
    auto newton = newton_find_root(objective, vega, sigma0, 0.0, newton_config);

    if (newton.has_value()) {
        OPTRISK_TRACE_CONVERGENCE_SUCCESS(OPTRISK_MODULE_IMPLIED_VOL, OPTRISK_IV_METHOD_NEWTON,
                                          newton->iterations, newton->final_error);
        OPTRISK_TRACE_IV_COMPLETE(newton->root, newton->iterations, OPTRISK_IV_METHOD_NEWTON);
        return IVSuccess{
            .implied_vol = newton->root,
            .iterations = newton->iterations,
            .final_error = newton->final_error,
            .method = IVMethod::Newton,
            .vega = vega(newton->root)
        };
    }

    // Phase 2: bisection over the configured bracket
    const size_t newton_iterations = newton.error().iterations;
    RootFindingConfig bisection_config{
        .max_iter = config_.bisection_max_iter,
        .tolerance = config_.tolerance,
    };
    auto bisection = bisection_find_root(objective, config_.bisection_low,
                                         config_.bisection_high, bisection_config);

    if (bisection.has_value()) {
        const size_t total = newton_iterations + bisection->iterations;
        OPTRISK_TRACE_CONVERGENCE_SUCCESS(OPTRISK_MODULE_IMPLIED_VOL, OPTRISK_IV_METHOD_BISECTION,
                                          total, bisection->final_error);
        OPTRISK_TRACE_IV_COMPLETE(bisection->root, total, OPTRISK_IV_METHOD_BISECTION);
        return IVSuccess{
            .implied_vol = bisection->root,
            .iterations = total,
            .final_error = bisection->final_error,
            .method = IVMethod::Bisection,
            .vega = vega(bisection->root)
        };
    }

    const RootFindingError& err = bisection.error();
    const size_t total = newton_iterations + err.iterations;
    OPTRISK_TRACE_CONVERGENCE_FAILED(OPTRISK_MODULE_IMPLIED_VOL, OPTRISK_IV_METHOD_BISECTION,
                                     total, err.final_error);
    OPTRISK_TRACE_IV_COMPLETE(0.0, total, OPTRISK_IV_METHOD_NONE);
    return std::unexpected(IVError{
        .code = IVErrorCode::MaxIterationsExceeded,
        .iterations = total,
        .final_error = err.final_error,
        .last_vol = err.last_x
    });
}

BatchIVResult IVSolver::solve_batch(std::span<const IVQuery> queries) const {
    std::vector<std::expected<IVSuccess, IVError>> results(
        queries.size(), std::unexpected(IVError{.code = IVErrorCode::MaxIterationsExceeded}));

    OPTRISK_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < queries.size(); ++i) {
        results[i] = solve(queries[i]);
    }

    size_t failed = static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const auto& r) { return !r.has_value(); }));

    return BatchIVResult{
        .results = std::move(results),
        .failed_count = failed
    };
}

std::expected<IVSuccess, IVError> implied_vol(double market_price,
                                              const OptionContract& contract,
                                              const MarketSnapshot& market,
                                              const CalendarDate& valuation_date,
                                              const IVConfig& config) {
    return IVSolver(config).solve(IVQuery{
        .market_price = market_price,
        .contract = contract,
        .market = market,
        .valuation_date = valuation_date
    });
}

}  // namespace optrisk
