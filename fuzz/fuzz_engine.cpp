/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full scan pipeline (CSV text → PatternScan)
 *
 * Build:
 *   cmake -DFIBSCAN_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed sample has a positive finite price and timestamps never
 *      run backwards.
 *   3. If a scan is returned:
 *      a. complete + potential == all patterns
 *      b. X < A < B < C, and D > C when present
 *      c. validation_score ∈ (0.6, 1]
 *      d. risk:reward is positive and finite
 *   4. Inputs shorter than the minimum series length always yield nullopt.
 *
 * Fuzzer strategy:
 *   Input is treated as CSV text.  DataLoader must cope with binary
 *   garbage, "nan"/"inf" tokens, partial OHLCV rows, CR/LF mixes and
 *   exponent notation; anything it accepts is scanned with a small
 *   min_bars so short inputs still reach the scanner.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "fibscan/data_loader.hpp"
#include "fibscan/engine.hpp"

using namespace fibscan;
using namespace fibscan::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    const auto samples = DataLoader::parse_csv_string(input);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        assert(std::isfinite(samples[i].price));
        assert(samples[i].price > 0.0);
        assert(std::isfinite(samples[i].timestamp));
        if (i > 0) assert(samples[i - 1].timestamp <= samples[i].timestamp);
    }

    EngineConfig cfg;
    cfg.pivot_strength   = 1;
    cfg.scanner.min_bars = 2;
    cfg.scanner.max_bars = 40;
    const Engine engine(cfg);

    const auto scan = engine.scan(samples);

    if (samples.size() < engine.min_series_length()) {
        assert(!scan.has_value());
        return 0;
    }
    assert(scan.has_value());

    assert(scan->completed_patterns.size() + scan->potential_patterns.size()
           == scan->patterns.size());

    for (const auto& p : scan->patterns) {
        assert(p.points.x.index < p.points.a.index);
        assert(p.points.a.index < p.points.b.index);
        assert(p.points.b.index < p.points.c.index);
        if (p.points.d) assert(p.points.d->index > p.points.c.index);

        assert(p.completion.validation_score > cfg.scanner.min_validation_score);
        assert(p.completion.validation_score <= 1.0 + 1e-12);

        assert(std::isfinite(p.levels.risk_reward_ratio));
        assert(p.levels.risk_reward_ratio > 0.0);
    }

    return 0;
}
