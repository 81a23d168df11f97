// SPDX-License-Identifier: MIT
#include "optrisk/option/european_option.hpp"
#include "optrisk/math/black_scholes_analytics.hpp"
#include <cmath>

namespace optrisk {

namespace {

constexpr double kDaysPerYear = 365.0;

}  // namespace

PricingParams::PricingParams(const OptionContract& contract, const MarketSnapshot& market,
                             const CalendarDate& valuation_date)
    : spot(market.spot)
    , strike(contract.strike)
    , maturity(year_fraction(valuation_date, contract.expiry))
    , rate(market.rate)
    , dividend_yield(market.dividend_yield)
    , volatility(market.volatility)
    , type(contract.type)
{}

// ===========================================================================
// EuropeanOptionResult
// ===========================================================================

EuropeanOptionResult::EuropeanOptionResult(const PricingParams& params)
    : params_(params)
{}

bool EuropeanOptionResult::regular() const {
    return params_.maturity > 0.0 && params_.volatility > 0.0;
}

std::pair<double, double> EuropeanOptionResult::compute_d1_d2() const {
    double tau = params_.maturity;
    double sigma = params_.volatility;
    double d1 = bs_d1(params_.spot, params_.strike, tau, sigma, params_.rate,
                      params_.dividend_yield);
    double d2 = d1 - sigma * std::sqrt(tau);
    return {d1, d2};
}

double EuropeanOptionResult::discounted_forward() const {
    double tau = params_.maturity;
    return params_.spot * std::exp(-params_.dividend_yield * tau) -
           params_.strike * std::exp(-params_.rate * tau);
}

double EuropeanOptionResult::value() const {
    return value_at(params_.spot);
}

double EuropeanOptionResult::value_at(double S) const {
    return bs_price(S, params_.strike, params_.maturity, params_.volatility,
                    params_.rate, params_.dividend_yield, params_.type);
}

double EuropeanOptionResult::delta() const {
    const double S = params_.spot;
    const double K = params_.strike;
    const bool is_put = params_.type == OptionType::PUT;

    // At expiry: step in S - K, half weight on the strike
    if (params_.maturity <= 0.0) {
        if (is_put) {
            return S < K ? -1.0 : (S > K ? 0.0 : -0.5);
        }
        return S > K ? 1.0 : (S < K ? 0.0 : 0.5);
    }

    const double exp_qt = std::exp(-params_.dividend_yield * params_.maturity);

    // Zero vol: step in the discounted forward, half weight at equality
    if (params_.volatility <= 0.0) {
        const double fwd = discounted_forward();
        if (is_put) {
            return fwd < 0.0 ? -exp_qt : (fwd > 0.0 ? 0.0 : -0.5 * exp_qt);
        }
        return fwd > 0.0 ? exp_qt : (fwd < 0.0 ? 0.0 : 0.5 * exp_qt);
    }

    auto [d1, d2] = compute_d1_d2();
    if (is_put) {
        return exp_qt * (norm_cdf(d1) - 1.0);
    }
    return exp_qt * norm_cdf(d1);
}

double EuropeanOptionResult::gamma() const {
    if (!regular()) {
        return 0.0;
    }

    const double tau = params_.maturity;
    const double sigma = params_.volatility;
    const double S = params_.spot;

    auto [d1, d2] = compute_d1_d2();
    const double exp_qt = std::exp(-params_.dividend_yield * tau);
    return exp_qt * norm_pdf(d1) / (S * sigma * std::sqrt(tau));
}

double EuropeanOptionResult::vega() const {
    return bs_vega(params_.spot, params_.strike, params_.maturity,
                   params_.volatility, params_.rate, params_.dividend_yield);
}

double EuropeanOptionResult::theta() const {
    if (!regular()) {
        return 0.0;
    }

    const double tau = params_.maturity;
    const double sigma = params_.volatility;
    const double S = params_.spot;
    const double K = params_.strike;
    const double r = params_.rate;
    const double q = params_.dividend_yield;

    auto [d1, d2] = compute_d1_d2();
    const double sqrt_tau = std::sqrt(tau);
    const double exp_qt = std::exp(-q * tau);
    const double exp_rt = std::exp(-r * tau);

    // Common term: -S·e^(-qτ)·φ(d1)·σ/(2√τ)
    const double common = -S * exp_qt * norm_pdf(d1) * sigma / (2.0 * sqrt_tau);

    double theta_year;
    if (params_.type == OptionType::PUT) {
        theta_year = common + r * K * exp_rt * norm_cdf(-d2) - q * S * exp_qt * norm_cdf(-d1);
    } else {
        theta_year = common - r * K * exp_rt * norm_cdf(d2) + q * S * exp_qt * norm_cdf(d1);
    }
    return theta_year / kDaysPerYear;
}

double EuropeanOptionResult::rho() const {
    const double tau = params_.maturity;
    if (tau <= 0.0) {
        return 0.0;
    }

    const double K = params_.strike;
    const double exp_rt = std::exp(-params_.rate * tau);
    const bool is_put = params_.type == OptionType::PUT;

    // Zero vol: the discounted strike leg is either fully in or fully out
    if (params_.volatility <= 0.0) {
        const double fwd = discounted_forward();
        if (is_put) {
            return fwd < 0.0 ? -tau * K * exp_rt : 0.0;
        }
        return fwd > 0.0 ? tau * K * exp_rt : 0.0;
    }

    auto [d1, d2] = compute_d1_d2();
    if (is_put) {
        return -K * tau * exp_rt * norm_cdf(-d2);
    }
    return K * tau * exp_rt * norm_cdf(d2);
}

Greeks EuropeanOptionResult::greeks() const {
    Greeks g{
        .delta = delta(),
        .gamma = gamma(),
        .vega = vega(),
        .theta = theta(),
        .rho = rho(),
    };
    if (regular()) {
        auto [d1, d2] = compute_d1_d2();
        g.d1 = d1;
        g.d2 = d2;
    }
    return g;
}

// ===========================================================================
// Contract-level entry points
// ===========================================================================

double price(const OptionContract& contract, const MarketSnapshot& market,
             const CalendarDate& valuation_date) {
    return EuropeanOptionResult(PricingParams(contract, market, valuation_date)).value();
}

Greeks greeks(const OptionContract& contract, const MarketSnapshot& market,
              const CalendarDate& valuation_date) {
    return EuropeanOptionResult(PricingParams(contract, market, valuation_date)).greeks();
}

}  // namespace optrisk
