// SPDX-License-Identifier: MIT
/// @file greeks_benchmark.cc
/// @brief Latency benchmark: per-query time for price, Greeks, implied vol and
///        portfolio surfaces
///
/// Usage:
///   ./greeks_benchmark --benchmark_filter=BM_Greeks

#include "optrisk/option/european_option.hpp"
#include "optrisk/option/iv_solver.hpp"
#include "optrisk/scenario/surfaces.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>
#include <vector>

using namespace optrisk;

namespace {

auto linspace(double lo, double hi, int n) {
    std::vector<double> v(n);
    for (int i = 0; i < n; ++i)
        v[i] = lo + (hi - lo) * i / (n - 1);
    return v;
}

const CalendarDate& Today() {
    static const CalendarDate d = *CalendarDate::parse("2026-01-22");
    return d;
}

OptionContract MakeContract(OptionType type, double strike) {
    return OptionContract{.symbol = "BENCH", .type = type, .strike = strike,
                          .expiry = Today().add_days(148)};
}

const MarketSnapshot kMarket{.spot = 185.0, .rate = 0.03, .dividend_yield = 0.005,
                             .volatility = 0.25};

}  // namespace

static void BM_Price(benchmark::State& state) {
    const OptionContract c = MakeContract(OptionType::CALL, 180.0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(price(c, kMarket, Today()));
    }
}
BENCHMARK(BM_Price);

static void BM_Greeks(benchmark::State& state) {
    const OptionContract c = MakeContract(OptionType::PUT, 180.0);
    for (auto _ : state) {
        Greeks g = greeks(c, kMarket, Today());
        benchmark::DoNotOptimize(g);
    }
}
BENCHMARK(BM_Greeks);

static void BM_ImpliedVol(benchmark::State& state) {
    const OptionContract c = MakeContract(OptionType::CALL, 180.0);
    const double p = price(c, kMarket, Today());
    for (auto _ : state) {
        auto r = implied_vol(p, c, kMarket, Today());
        if (!r) throw std::runtime_error("implied_vol failed");
        benchmark::DoNotOptimize(r->implied_vol);
    }
}
BENCHMARK(BM_ImpliedVol);

static void BM_ImpliedVolBatch(benchmark::State& state) {
    const auto strikes = linspace(150.0, 220.0, static_cast<int>(state.range(0)));
    std::vector<IVQuery> queries;
    for (double k : strikes) {
        const OptionContract c = MakeContract(OptionType::PUT, k);
        queries.push_back(IVQuery{.market_price = price(c, kMarket, Today()),
                                  .contract = c, .market = kMarket,
                                  .valuation_date = Today()});
    }
    IVSolver solver;
    for (auto _ : state) {
        BatchIVResult r = solver.solve_batch(queries);
        benchmark::DoNotOptimize(r.failed_count);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(queries.size()));
}
BENCHMARK(BM_ImpliedVolBatch)->Arg(64)->Arg(512);

static void BM_SpotVolSurface(benchmark::State& state) {
    std::vector<Position> book{
        {.contract = MakeContract(OptionType::CALL, 180.0), .quantity = 1.0},
        {.contract = MakeContract(OptionType::PUT, 160.0), .quantity = -1.0},
    };
    const auto spots = linspace(120.0, 250.0, static_cast<int>(state.range(0)));
    const auto vols = linspace(0.05, 0.80, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = spot_vol_surface(book, kMarket, Today(), spots, vols);
        if (!s) throw std::runtime_error("spot_vol_surface failed");
        benchmark::DoNotOptimize(s->grids.value.data().data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(0));
}
BENCHMARK(BM_SpotVolSurface)->Arg(25)->Arg(50);
