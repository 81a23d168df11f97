// SPDX-License-Identifier: MIT
#include "optrisk/math/sample_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace optrisk {

double sample_mean(std::span<const double> values) {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double population_stddev(std::span<const double> values) {
    const double mean = sample_mean(values);
    if (std::isnan(mean)) {
        return mean;
    }
    double ss = 0.0;
    for (double v : values) {
        const double d = v - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(values.size()));
}

double percentile_sorted(std::span<const double> sorted, double pct) {
    if (sorted.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double clamped = std::clamp(pct, 0.0, 100.0);
    const double rank = clamped / 100.0 * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

double tail_mean(std::span<const double> values, double threshold) {
    double sum = 0.0;
    size_t count = 0;
    for (double v : values) {
        if (v <= threshold) {
            sum += v;
            ++count;
        }
    }
    if (count == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sum / static_cast<double>(count);
}

}  // namespace optrisk
