// SPDX-License-Identifier: MIT
/**
 * @file sample_statistics.hpp
 * @brief Descriptive statistics over a sample of simulated outcomes
 */

#pragma once

#include <span>

namespace optrisk {

/// Arithmetic mean (NaN for an empty sample)
double sample_mean(std::span<const double> values);

/// Population standard deviation, divisor n (NaN for an empty sample)
double population_stddev(std::span<const double> values);

/**
 * @brief Percentile of a sorted sample with linear interpolation
 *
 * Rank r = p/100 · (n − 1); the result interpolates between the order
 * statistics at floor(r) and ceil(r).
 *
 * @param sorted Sample sorted ascending
 * @param pct Percentile in [0, 100]
 * @return Interpolated value (NaN for an empty sample)
 */
double percentile_sorted(std::span<const double> sorted, double pct);

/// Mean of every value <= threshold (NaN when none qualifies)
double tail_mean(std::span<const double> values, double threshold);

}  // namespace optrisk
