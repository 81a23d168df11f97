// SPDX-License-Identifier: MIT
/**
 * @file example_portfolio_risk.cc
 * @brief Risk report for a small option book
 *
 * Demonstrates:
 * - Building positions from wire-format fields
 * - Portfolio value, Greeks and the delta hedge
 * - Crash stress test and payoff curve
 * - Monte Carlo distribution of value at a 30-day horizon
 */

#include "optrisk/portfolio/position.hpp"
#include "optrisk/scenario/monte_carlo.hpp"
#include "optrisk/scenario/payoff.hpp"
#include "optrisk/scenario/scenarios.hpp"
#include "optrisk/simple/pricing.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace optrisk;

    std::cout << "=== Portfolio Risk Example ===\n\n";

    auto today = CalendarDate::parse("2026-01-22");
    auto long_call = simple::make_position("AAPL", "call", 180.0, "2026-06-19", 1.0);
    auto short_put = simple::make_position("AAPL", "put", 160.0, "2026-06-19", -1.0);
    if (!today || !long_call || !short_put) {
        std::cerr << "Failed to build positions\n";
        return 1;
    }

    const std::vector<Position> book{*long_call, *short_put};
    const MarketSnapshot market{.spot = 185.0, .rate = 0.03, .dividend_yield = 0.005,
                                .volatility = 0.25, .timestamp = "2026-01-22"};

    if (auto ok = validate_portfolio(book, market); !ok) {
        std::cerr << "Invalid portfolio: " << ok.error() << "\n";
        return 1;
    }

    const Greeks g = portfolio_greeks(book, market, *today);
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Value:  " << portfolio_price(book, market, *today) << "\n";
    std::cout << "Delta:  " << g.delta << "\n";
    std::cout << "Gamma:  " << g.gamma << "\n";
    std::cout << "Vega:   " << g.vega << "\n";
    std::cout << "Theta:  " << g.theta << " per day\n";
    std::cout << "Rho:    " << g.rho << "\n";
    std::cout << "Hedge:  " << delta_hedge_shares(book, market, *today) << " shares\n\n";

    // Crash stress
    const std::vector<double> crashes{-0.15, -0.25, -0.50};
    auto crash = crash_scenario(book, market, *today, crashes);
    if (!crash) {
        std::cerr << "Crash scenario failed: " << crash.error() << "\n";
        return 1;
    }
    std::cout << "Crash scenarios\n" << std::string(40, '-') << "\n";
    for (const auto& pt : *crash) {
        std::cout << std::setw(8) << pt.crash_pct * 100.0 << "%"
                  << std::setw(12) << pt.spot
                  << std::setw(12) << pt.value << "\n";
    }

    // Payoff curve
    auto grid = make_spot_grid(market.spot, 0.3, 7);
    if (!grid) {
        std::cerr << "Spot grid failed: " << grid.error() << "\n";
        return 1;
    }
    auto payoff = payoff_scenario(book, market, *today,
                                  PayoffConfig{.expiry_date = book[0].contract.expiry,
                                               .spots = *grid});
    if (!payoff) {
        std::cerr << "Payoff scenario failed: " << payoff.error() << "\n";
        return 1;
    }
    std::cout << "\nPayoff curve\n" << std::string(40, '-') << "\n";
    for (size_t i = 0; i < payoff->spots.size(); ++i) {
        std::cout << std::setw(10) << payoff->spots[i]
                  << std::setw(12) << payoff->payoff_at_expiry[i]
                  << std::setw(12) << (*payoff->value_today)[i] << "\n";
    }

    // Monte Carlo
    auto mc = monte_carlo_scenario(book, market, *today,
                                   MonteCarloConfig{.horizon_days = 30, .seed = 42});
    if (!mc) {
        std::cerr << "Monte Carlo failed: " << mc.error() << "\n";
        return 1;
    }
    std::cout << "\nMonte Carlo (" << mc->assumptions.n_simulations << " paths, "
              << mc->assumptions.horizon_days << " days)\n" << std::string(40, '-') << "\n";
    std::cout << "Mean:    " << mc->summary.mean << "\n";
    std::cout << "Std:     " << mc->summary.std << "\n";
    std::cout << "VaR 95:  " << mc->tail_risk.var_95 << "\n";
    std::cout << "CVaR 95: " << mc->tail_risk.cvar_95 << "\n";
    std::cout << "VaR 99:  " << mc->tail_risk.var_99 << "\n";
    std::cout << "CVaR 99: " << mc->tail_risk.cvar_99 << "\n";

    return 0;
}
