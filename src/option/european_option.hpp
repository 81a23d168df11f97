// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option valuation and Greeks with closed-form Black-Scholes formulas
 *
 * Provides EuropeanOptionResult for analytical pricing at a fixed set of
 * parameters, plus the contract/market/date entry points price() and
 * greeks() used by every aggregation and scenario layer.
 */

#pragma once

#include "optrisk/option/greek_types.hpp"
#include "optrisk/option/option_spec.hpp"
#include "optrisk/support/calendar_date.hpp"
#include <utility>

namespace optrisk {

/**
 * @brief Flat pricing parameters for one contract under one market
 *
 * All parameters are in consistent units:
 * - Prices in currency units
 * - Time in years (actual/365)
 * - Rates and volatility as decimals
 */
struct PricingParams {
    double spot = 0.0;
    double strike = 0.0;
    double maturity = 0.0;         ///< Time to expiry in years, clamped at 0
    double rate = 0.0;
    double dividend_yield = 0.0;
    double volatility = 0.0;
    OptionType type = OptionType::CALL;

    PricingParams() = default;

    PricingParams(double spot_, double strike_, double maturity_, double rate_,
                  double dividend_yield_, double volatility_, OptionType type_)
        : spot(spot_), strike(strike_), maturity(maturity_), rate(rate_)
        , dividend_yield(dividend_yield_), volatility(volatility_), type(type_)
    {}

    /// Resolve a contract against a market on a valuation date
    PricingParams(const OptionContract& contract, const MarketSnapshot& market,
                  const CalendarDate& valuation_date);
};

/**
 * @brief European option pricing result with closed-form Greeks
 *
 * Three regimes:
 * - maturity <= 0: intrinsic value; delta is a step with 0.5 weight at S == K
 * - volatility <= 0: discounted forward intrinsic; delta and rho are steps on
 *   the sign of the discounted forward, 0.5 weight at exact equality
 * - otherwise: Black-Scholes with continuous dividend yield
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class EuropeanOptionResult {
public:
    explicit EuropeanOptionResult(const PricingParams& params);

    /// Option value at current spot
    double value() const;

    /// Option value at arbitrary spot price
    double value_at(double S) const;

    /// Delta: dV/dS
    double delta() const;

    /// Gamma: d²V/dS²
    double gamma() const;

    /// Vega: dV/dσ per 1.00 of volatility
    double vega() const;

    /// Theta: dV/dt per calendar day (annual theta / 365)
    double theta() const;

    /// Rho: dV/dr per 1.00 of rate
    double rho() const;

    /// All sensitivities at once, with d1/d2 in the regular regime
    Greeks greeks() const;

    // Parameter accessors
    double spot() const { return params_.spot; }
    double strike() const { return params_.strike; }
    double maturity() const { return params_.maturity; }
    double volatility() const { return params_.volatility; }
    OptionType option_type() const { return params_.type; }

private:
    /// True when neither expiry nor zero-vol limits apply
    bool regular() const;

    /// Compute d1, d2 at current spot
    std::pair<double, double> compute_d1_d2() const;

    /// Discounted forward S·e^(-qτ) - K·e^(-rτ)
    double discounted_forward() const;

    PricingParams params_;
};

/// Fair value of one contract (unit quantity) under a market on a date
double price(const OptionContract& contract, const MarketSnapshot& market,
             const CalendarDate& valuation_date);

/// Analytical Greeks of one contract (unit quantity)
Greeks greeks(const OptionContract& contract, const MarketSnapshot& market,
              const CalendarDate& valuation_date);

}  // namespace optrisk
