// SPDX-License-Identifier: MIT
#include "optrisk/math/root_finding.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

TEST(RootFindingConfigTest, DefaultValues) {
    optrisk::RootFindingConfig config;

    EXPECT_EQ(config.max_iter, 100u);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(config.min_derivative, 1e-8);
}

TEST(NewtonRootTest, ConvergesOnSquareRoot) {
    auto f = [](double x) { return x * x - 2.0; };
    auto df = [](double x) { return 2.0 * x; };

    optrisk::RootFindingConfig config{.max_iter = 50, .tolerance = 1e-12};
    auto result = optrisk::newton_find_root(f, df, 1.0, 0.0, config);

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->root, std::sqrt(2.0), 1e-10);
    EXPECT_LT(result->iterations, 10u);
    EXPECT_LT(result->final_error, 1e-12);
}

TEST(NewtonRootTest, ImmediateConvergenceCountsOneIteration) {
    auto f = [](double x) { return x - 3.0; };
    auto df = [](double) { return 1.0; };

    auto result = optrisk::newton_find_root(f, df, 3.0, 0.0, optrisk::RootFindingConfig{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 1u);
    EXPECT_DOUBLE_EQ(result->root, 3.0);
}

TEST(NewtonRootTest, FlatDerivativeStopsSearch) {
    auto f = [](double x) { return x * x * x + 1.0; };
    auto df = [](double x) { return 3.0 * x * x; };

    auto result = optrisk::newton_find_root(f, df, 0.0, -10.0, optrisk::RootFindingConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, optrisk::RootFindingErrorCode::FlatDerivative);
    EXPECT_DOUBLE_EQ(result.error().last_x, 0.0);
}

TEST(NewtonRootTest, LeavingDomainIsReported) {
    // From x0 = 3, one step of x - 1 lands at 1; x_min = 2 rejects it
    auto f = [](double x) { return x - 1.0; };
    auto df = [](double) { return 1.0; };

    auto result = optrisk::newton_find_root(f, df, 3.0, 2.0, optrisk::RootFindingConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, optrisk::RootFindingErrorCode::LeftDomain);
    EXPECT_DOUBLE_EQ(result.error().last_x, 1.0);
}

TEST(NewtonRootTest, IterationBudgetExhausted) {
    // Oscillates between 0 and 1 forever
    auto f = [](double x) { return x * x * x - 2.0 * x + 2.0; };
    auto df = [](double x) { return 3.0 * x * x - 2.0; };

    optrisk::RootFindingConfig config{.max_iter = 20, .min_derivative = -1e9};
    auto result = optrisk::newton_find_root(f, df, 0.0, -100.0, config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, optrisk::RootFindingErrorCode::MaxIterationsExceeded);
    EXPECT_EQ(result.error().iterations, 20u);
}

TEST(BisectionRootTest, ConvergesInsideBracket) {
    auto f = [](double x) { return std::exp(x) - 5.0; };

    optrisk::RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    auto result = optrisk::bisection_find_root(f, 0.0, 4.0, config);

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->root, std::log(5.0), 1e-9);
}

TEST(BisectionRootTest, RootOutsideBracketFails) {
    auto f = [](double x) { return x - 10.0; };

    optrisk::RootFindingConfig config{.max_iter = 60, .tolerance = 1e-8};
    auto result = optrisk::bisection_find_root(f, 0.0, 1.0, config);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, optrisk::RootFindingErrorCode::MaxIterationsExceeded);
    EXPECT_NEAR(result.error().last_x, 1.0, 1e-6);
}

TEST(BisectionRootTest, NonFiniteObjectiveIsReported) {
    auto f = [](double x) { return x > 0.5 ? std::numeric_limits<double>::infinity() : -1.0; };

    auto result = optrisk::bisection_find_root(f, 0.0, 2.0, optrisk::RootFindingConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, optrisk::RootFindingErrorCode::NonFiniteValue);
}
