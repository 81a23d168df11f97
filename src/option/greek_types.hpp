// SPDX-License-Identifier: MIT
#pragma once

#include <optional>

namespace optrisk {

/// First- and second-order sensitivities of an option or portfolio value.
///
/// Units: delta per 1.00 of spot, gamma per 1.00 of spot squared, vega per
/// 1.00 (not 1%) of volatility, theta per calendar day, rho per 1.00 of
/// rate. d1/d2 are diagnostics set only for a single contract priced with
/// positive time and volatility; aggregation drops them.
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double vega = 0.0;
    double theta = 0.0;
    double rho = 0.0;
    std::optional<double> d1;
    std::optional<double> d2;

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        vega += other.vega;
        theta += other.theta;
        rho += other.rho;
        d1.reset();
        d2.reset();
        return *this;
    }
};

inline Greeks operator+(Greeks lhs, const Greeks& rhs) {
    lhs += rhs;
    return lhs;
}

/// Scale every sensitivity by a position size; drops d1/d2
inline Greeks operator*(double scale, const Greeks& g) {
    return Greeks{
        .delta = scale * g.delta,
        .gamma = scale * g.gamma,
        .vega = scale * g.vega,
        .theta = scale * g.theta,
        .rho = scale * g.rho,
    };
}

/// Which sensitivity a surface grid or benchmark refers to
enum class Greek { Delta, Gamma, Vega, Theta, Rho };

}  // namespace optrisk
