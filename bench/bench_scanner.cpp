/**
 * @file  bench/bench_scanner.cpp
 * @brief Google Benchmark suite for the harmonic scan pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_PivotFinder_Find        - pivot extraction over N samples
 *   BM_Scanner_SingleTemplate  - one template over P pivots (the O(P⁴) loop)
 *   BM_Engine_Scan             - full scan, all eight templates
 *   BM_Engine_ScanPivotCap     - full scan as the pivot cap grows
 *
 * Build (CMake):
 *   cmake -DFIBSCAN_BENCH=ON ..
 *   cmake --build build --target bench_scanner
 *   ./build/bench_scanner --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "fibscan/engine.hpp"
#include "fibscan/pivots.hpp"
#include "fibscan/scanner.hpp"
#include "fibscan/templates.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N samples of a multi-frequency wave with plenty of swing pivots.
static std::vector<double> make_prices(std::size_t n) {
    std::vector<double> p(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        p[i] = 100.0 + 12.0 * std::sin(t * 0.07) + 6.0 * std::sin(t * 0.19 + 0.5)
                     + 2.5 * std::cos(t * 0.47);
    }
    return p;
}

static std::vector<double> make_timestamps(std::size_t n) {
    std::vector<double> ts(n);
    for (std::size_t i = 0; i < n; ++i) ts[i] = static_cast<double>(i);
    return ts;
}

// ── PivotFinder ───────────────────────────────────────────────────────────────

static void BM_PivotFinder_Find(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const auto ts     = make_timestamps(n);
    for (auto _ : state) {
        auto pivots = fibscan::pivots::PivotFinder::find(prices, ts);
        benchmark::DoNotOptimize(pivots);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_PivotFinder_Find)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── PatternScanner ────────────────────────────────────────────────────────────

static void BM_Scanner_SingleTemplate(benchmark::State& state) {
    const auto prices = make_prices(4096);
    const auto ts     = make_timestamps(prices.size());
    const auto pivots = fibscan::pivots::PivotFinder::find(prices, ts);
    if (!pivots) {
        state.SkipWithError("pivot extraction failed");
        return;
    }

    fibscan::scanner::ScannerConfig cfg;
    cfg.max_pivots = static_cast<std::size_t>(state.range(0));
    const fibscan::scanner::PatternScanner scanner(cfg);
    const fibscan::templates::TemplateRegistry registry;
    const auto& tmpl = registry.get(fibscan::PatternType::Gartley, fibscan::Direction::Bullish);

    for (auto _ : state) {
        auto found = scanner.scan(*pivots, tmpl);
        benchmark::DoNotOptimize(found.data());
        benchmark::ClobberMemory();
    }
    state.counters["pivots"] = static_cast<double>(std::min(pivots->size(), cfg.max_pivots));
}
BENCHMARK(BM_Scanner_SingleTemplate)->RangeMultiplier(2)->Range(16, 128)->Unit(benchmark::kMicrosecond);

// ── Engine ────────────────────────────────────────────────────────────────────

static void BM_Engine_Scan(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const auto ts     = make_timestamps(n);
    const fibscan::core::Engine engine;

    for (auto _ : state) {
        auto scan = engine.scan(prices, ts);
        benchmark::DoNotOptimize(scan);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Engine_Scan)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

static void BM_Engine_ScanPivotCap(benchmark::State& state) {
    const auto prices = make_prices(4096);
    const auto ts     = make_timestamps(prices.size());

    fibscan::core::EngineConfig cfg;
    cfg.scanner.max_pivots = static_cast<std::size_t>(state.range(0));
    const fibscan::core::Engine engine(cfg);

    for (auto _ : state) {
        auto scan = engine.scan(prices, ts);
        benchmark::DoNotOptimize(scan);
    }
}
BENCHMARK(BM_Engine_ScanPivotCap)->Arg(25)->Arg(50)->Arg(100)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
