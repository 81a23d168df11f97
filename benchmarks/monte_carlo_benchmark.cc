// SPDX-License-Identifier: MIT
/// @file monte_carlo_benchmark.cc
/// @brief Throughput of Monte Carlo portfolio revaluation
///
/// With OPTRISK_USE_OPENMP the revaluation loop runs in parallel; set
/// OMP_NUM_THREADS to compare thread counts.

#include "optrisk/scenario/monte_carlo.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>
#include <vector>

using namespace optrisk;

static void BM_MonteCarlo(benchmark::State& state) {
    const CalendarDate today = *CalendarDate::parse("2026-01-22");
    const CalendarDate expiry = today.add_days(148);
    const MarketSnapshot market{.spot = 185.0, .rate = 0.03, .dividend_yield = 0.005,
                                .volatility = 0.25};

    // Iron condor: four legs
    std::vector<Position> book{
        {.contract = {.type = OptionType::PUT, .strike = 150.0, .expiry = expiry}, .quantity = 1.0},
        {.contract = {.type = OptionType::PUT, .strike = 165.0, .expiry = expiry}, .quantity = -1.0},
        {.contract = {.type = OptionType::CALL, .strike = 205.0, .expiry = expiry}, .quantity = -1.0},
        {.contract = {.type = OptionType::CALL, .strike = 220.0, .expiry = expiry}, .quantity = 1.0},
    };

    const MonteCarloConfig config{
        .horizon_days = 30,
        .n_sims = static_cast<int>(state.range(0)),
        .seed = 1234,
    };

    for (auto _ : state) {
        auto r = monte_carlo_scenario(book, market, today, config);
        if (!r) throw std::runtime_error("monte_carlo_scenario failed");
        benchmark::DoNotOptimize(r->summary.mean);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_MonteCarlo)->Arg(1000)->Arg(10000)->Arg(100000)->Unit(benchmark::kMillisecond);
