/**
 * @file  bench/bench_bootstrap.cpp
 * @brief Google Benchmark suite for curve bootstrapping and spread evaluation.
 *
 * Benchmarks
 * ----------
 *   BM_Bootstrap_Government   par → zero on an N-point semiannual grid
 *   BM_Bootstrap_Swap         G10 swap curve, annual fixed leg
 *   BM_Spread_GovVsBund       one issuer against the Bund
 *   BM_Engine_Refresh         full refresh over ten issuers
 *
 * Build (CMake):
 *   cmake --build build --target bench_bootstrap
 *   ./build/bench_bootstrap --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "rvcurve/curve.hpp"
#include "rvcurve/data_loader.hpp"
#include "rvcurve/engine.hpp"
#include "rvcurve/spread.hpp"

#include <cstddef>
#include <string>
#include <vector>

using namespace rvcurve;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Upward-sloping par curve with `n` points from 6M out to 30Y.
static curve::YieldCurve make_par_curve(std::size_t n, const std::string& id = "France") {
    std::vector<double> tenors(n);
    std::vector<double> rates(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        tenors[i] = 0.5 + 29.5 * x;
        rates[i]  = 2.5 + 1.2 * x - 0.3 * x * x;
    }
    return *curve::YieldCurve::make(curve::CurveDefinition{
        .identifier = id, .tenors = tenors, .rates = rates});
}

// ── Bootstrap benchmarks ──────────────────────────────────────────────────────

static void BM_Bootstrap_Government(benchmark::State& state) {
    const auto par = make_par_curve(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto zero = curve::CurveBootstrapper::bootstrap(par);
        benchmark::DoNotOptimize(zero);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Bootstrap_Government)->RangeMultiplier(2)->Range(4, 64)->Unit(benchmark::kMicrosecond);

static void BM_Bootstrap_Swap(benchmark::State& state) {
    const core::StaticSwapQuoteProvider swaps;
    const auto quotes = swaps.quotes("EUR");
    const auto par = *curve::YieldCurve::from_quotes("EUR", quotes);
    const auto conventions = curve::SwapConventions::g10_defaults();
    for (auto _ : state) {
        auto zero = curve::SwapCurveBootstrapper::bootstrap(par, conventions);
        benchmark::DoNotOptimize(zero);
    }
}
BENCHMARK(BM_Bootstrap_Swap)->Unit(benchmark::kMicrosecond);

// ── Spread benchmarks ─────────────────────────────────────────────────────────

static void BM_Spread_GovVsBund(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    spread::CurveSet curves;
    curves.insert(make_par_curve(n, "Germany"));
    const auto france = make_par_curve(n, "France").shifted(0.5);
    for (auto _ : state) {
        auto s = spread::SpreadCalculator::compute(france, spread::GovVsBund{}, curves);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Spread_GovVsBund)->RangeMultiplier(4)->Range(4, 256);

// ── End-to-end ────────────────────────────────────────────────────────────────

static void BM_Engine_Refresh(benchmark::State& state) {
    std::string csv = "country,tenor,yield\n";
    const char* issuers[] = {"Germany", "France", "Italy", "United States", "Canada",
                             "United Kingdom", "Japan", "Australia", "New Zealand", "Sweden"};
    const char* tenors[]  = {"2Y", "5Y", "10Y", "30Y"};
    double level = 2.0;
    for (const char* issuer : issuers) {
        double rate = level;
        for (const char* tenor : tenors) {
            csv += std::string(issuer) + "," + tenor + "," + std::to_string(rate) + "\n";
            rate += 0.3;
        }
        level += 0.15;
    }
    const core::InMemoryQuoteProvider bonds(core::QuoteLoader::parse_csv_string(csv));
    const core::StaticSwapQuoteProvider swaps;
    const core::Engine engine;

    for (auto _ : state) {
        auto result = engine.run(bonds, swaps);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Engine_Refresh)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
