// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "optrisk/math/sample_statistics.hpp"
#include <cmath>
#include <vector>

namespace optrisk {
namespace {

TEST(SampleStatisticsTest, MeanAndPopulationStd) {
    const std::vector<double> x{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(sample_mean(x), 5.0);
    EXPECT_DOUBLE_EQ(population_stddev(x), 2.0);
}

TEST(SampleStatisticsTest, PercentileInterpolatesLinearly) {
    const std::vector<double> sorted{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(percentile_sorted(sorted, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile_sorted(sorted, 100.0), 4.0);
    EXPECT_DOUBLE_EQ(percentile_sorted(sorted, 50.0), 2.5);
    // rank = 0.25 · 3 = 0.75
    EXPECT_DOUBLE_EQ(percentile_sorted(sorted, 25.0), 1.75);
}

TEST(SampleStatisticsTest, PercentileOfSingleValue) {
    const std::vector<double> one{42.0};
    EXPECT_DOUBLE_EQ(percentile_sorted(one, 1.0), 42.0);
    EXPECT_DOUBLE_EQ(percentile_sorted(one, 99.0), 42.0);
}

TEST(SampleStatisticsTest, TailMeanIncludesThreshold) {
    const std::vector<double> x{5.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(tail_mean(x, 2.0), 1.5);
    EXPECT_DOUBLE_EQ(tail_mean(x, 10.0), 2.75);
    EXPECT_TRUE(std::isnan(tail_mean(x, 0.5)));
}

TEST(SampleStatisticsTest, EmptySampleIsNaN) {
    const std::vector<double> none;
    EXPECT_TRUE(std::isnan(sample_mean(none)));
    EXPECT_TRUE(std::isnan(population_stddev(none)));
    EXPECT_TRUE(std::isnan(percentile_sorted(none, 50.0)));
}

}  // namespace
}  // namespace optrisk
