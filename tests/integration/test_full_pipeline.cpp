/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full scan pipeline.
///
/// These tests exercise the complete path:
///   prices → PivotFinder → PatternScanner × 8 templates → ScanAggregator
/// on synthetic zigzag series whose vertices are placed on exact Fibonacci
/// ratios, plus the forecast path through Engine::predict_completion.

#include "fibscan/engine.hpp"
#include "fibscan/data_loader.hpp"
#include "fibscan/constants.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace fibscan;
using namespace fibscan::core;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

using Vertex = std::pair<std::size_t, double>;

/// Piecewise-linear series through (index, price) vertices. Interior
/// vertices are strict pivots for any window narrower than a segment.
std::vector<double> zigzag(const std::vector<Vertex>& v) {
    std::vector<double> out;
    for (std::size_t k = 0; k + 1 < v.size(); ++k) {
        const auto [i0, p0] = v[k];
        const auto [i1, p1] = v[k + 1];
        for (std::size_t i = i0; i < i1; ++i) {
            const double t = static_cast<double>(i - i0) / static_cast<double>(i1 - i0);
            out.push_back(p0 + (p1 - p0) * t);
        }
    }
    out.push_back(v.back().second);
    return out;
}

std::vector<double> timestamps_for(std::size_t n) {
    std::vector<double> ts(n);
    for (std::size_t i = 0; i < n; ++i) ts[i] = 1.7e9 + 3600.0 * static_cast<double>(i);
    return ts;
}

/// Bullish Gartley XABC with AB/XA = BC/AB = 0.618 and no pivot near D.
const std::vector<Vertex> POTENTIAL_BULLISH{
    {0, 90.0}, {10, 100.0}, {40, 50.0}, {70, 80.9}, {100, 61.8038}, {130, 75.0}, {160, 65.0},
};

/// Same XABC, then a bounce and a low exactly on the projected D.
const std::vector<Vertex> COMPLETE_BULLISH{
    {0, 90.0}, {10, 100.0}, {40, 50.0}, {70, 80.9}, {100, 61.8038},
    {115, 70.0}, {135, 37.5134}, {165, 50.0},
};

/// Deep XA leg with Gartley ratios. The Crab's 2.618 CD extension projects
/// D below zero.
const std::vector<Vertex> DEEP_BULLISH{
    {0, 90.0}, {10, 100.0}, {40, 20.0}, {70, 69.44}, {100, 38.8861}, {130, 50.0}, {160, 45.0},
};

constexpr double BULLISH_D = 37.5134;
constexpr double BEARISH_D = 162.4866;

std::vector<Vertex> mirrored(const std::vector<Vertex>& v) {
    std::vector<Vertex> out;
    for (const auto& [i, p] : v) out.emplace_back(i, 200.0 - p);
    return out;
}

const HarmonicPattern* find_pattern(const aggregator::PatternScan& scan,
                                    PatternType type, Direction dir) {
    for (const auto& p : scan.patterns) {
        if (p.type == type && p.direction == dir) return &p;
    }
    return nullptr;
}

/// A wavy series with many pivots for invariant checks.
std::vector<double> wave_series(std::size_t n) {
    std::vector<double> p(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        p[i] = 100.0 + 12.0 * std::sin(t * 0.09) + 5.0 * std::sin(t * 0.23 + 1.0)
                     + 2.0 * std::cos(t * 0.51);
    }
    return p;
}

}  // namespace

// ─── Synthetic patterns ───────────────────────────────────────────────────────

TEST(FullPipeline, DetectsPotentialBullishGartley) {
    const auto prices = zigzag(POTENTIAL_BULLISH);
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto scan = engine.scan(prices, ts);
    ASSERT_TRUE(scan.has_value());

    const auto* g = find_pattern(*scan, PatternType::Gartley, Direction::Bullish);
    ASSERT_NE(g, nullptr);
    EXPECT_FALSE(g->completion.is_complete);
    EXPECT_GT(g->completion.validation_score, 0.9);
    ASSERT_TRUE(g->completion.projected_d.has_value());
    EXPECT_NEAR(*g->completion.projected_d, BULLISH_D, 1e-3);
    EXPECT_EQ(g->points.x.index, 10u);
    EXPECT_EQ(g->points.a.index, 40u);
    EXPECT_EQ(g->points.b.index, 70u);
    EXPECT_EQ(g->points.c.index, 100u);
    EXPECT_NEAR(g->levels.stop_loss, 100.0 - 0.236 * 50.0, 1e-9);
}

TEST(FullPipeline, DetectsPotentialBearishGartley) {
    const auto prices = zigzag(mirrored(POTENTIAL_BULLISH));
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto scan = engine.scan(prices, ts);
    ASSERT_TRUE(scan.has_value());

    const auto* g = find_pattern(*scan, PatternType::Gartley, Direction::Bearish);
    ASSERT_NE(g, nullptr);
    EXPECT_FALSE(g->completion.is_complete);
    EXPECT_GT(g->completion.validation_score, 0.9);
    EXPECT_NEAR(*g->completion.projected_d, BEARISH_D, 1e-3);
    EXPECT_GT(g->levels.stop_loss, g->points.x.price);
    EXPECT_EQ(find_pattern(*scan, PatternType::Gartley, Direction::Bullish), nullptr);
}

TEST(FullPipeline, CrabProjectedBelowZeroIsStillReported) {
    const auto prices = zigzag(DEEP_BULLISH);
    const Engine engine;
    auto scan = engine.scan(prices, timestamps_for(prices.size()));
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ(scan->patterns.size(), 2u);

    const auto* crab = find_pattern(*scan, PatternType::Crab, Direction::Bullish);
    ASSERT_NE(crab, nullptr);
    EXPECT_FALSE(crab->completion.is_complete);
    ASSERT_TRUE(crab->completion.projected_d.has_value());
    EXPECT_LT(*crab->completion.projected_d, 0.0);
    EXPECT_DOUBLE_EQ(crab->levels.entry, *crab->completion.projected_d);
    EXPECT_LT(crab->levels.stop_loss, crab->points.x.price);
    EXPECT_GT(crab->levels.risk_reward_ratio, 0.0);

    ASSERT_NE(find_pattern(*scan, PatternType::Gartley, Direction::Bullish), nullptr);
    EXPECT_EQ(scan->patterns.front().type, PatternType::Crab);
}

TEST(FullPipeline, SharedRatiosRankHigherReliabilityFirst) {
    // Crab shares Gartley's AB/XA and BC/AB ideals, so both score the same.
    const auto prices = zigzag(POTENTIAL_BULLISH);
    const Engine engine;

    auto scan = engine.scan(prices, timestamps_for(prices.size()));
    ASSERT_TRUE(scan.has_value());
    ASSERT_EQ(scan->patterns.size(), 2u);
    EXPECT_EQ(scan->patterns[0].type, PatternType::Crab);
    EXPECT_EQ(scan->patterns[1].type, PatternType::Gartley);
    EXPECT_NEAR(scan->patterns[0].completion.validation_score,
                scan->patterns[1].completion.validation_score, 1e-12);
}

TEST(FullPipeline, DetectsCompleteBullishGartley) {
    const auto prices = zigzag(COMPLETE_BULLISH);
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto scan = engine.scan(prices, ts);
    ASSERT_TRUE(scan.has_value());
    ASSERT_EQ(scan->completed_patterns.size(), 1u);

    const auto& g = scan->completed_patterns.front();
    EXPECT_EQ(g.type, PatternType::Gartley);
    EXPECT_EQ(g.direction, Direction::Bullish);
    ASSERT_TRUE(g.points.d.has_value());
    EXPECT_EQ(g.points.d->index, 135u);
    EXPECT_DOUBLE_EQ(g.points.d->timestamp, ts[135]);
    EXPECT_NEAR(g.completion.validation_score, 0.75, 0.01);
    EXPECT_DOUBLE_EQ(g.completion.confidence_score, 75.0);
    EXPECT_DOUBLE_EQ(g.levels.entry, g.points.d->price);
}

// ─── Empty and rejected input ─────────────────────────────────────────────────

TEST(FullPipeline, StraightLineFindsNothing) {
    std::vector<double> prices(120);
    for (std::size_t i = 0; i < prices.size(); ++i) prices[i] = 50.0 + 0.5 * static_cast<double>(i);
    const Engine engine;

    auto scan = engine.scan(prices, timestamps_for(prices.size()));
    ASSERT_TRUE(scan.has_value());
    EXPECT_TRUE(scan->patterns.empty());
    EXPECT_TRUE(scan->completed_patterns.empty());
    EXPECT_TRUE(scan->potential_patterns.empty());
    EXPECT_DOUBLE_EQ(scan->quality.average_reliability, 0.0);
    EXPECT_DOUBLE_EQ(scan->quality.fibonacci_accuracy, 0.0);
    EXPECT_DOUBLE_EQ(scan->quality.pattern_density, 0.0);
}

TEST(FullPipeline, ShortSeriesIsInsufficientData) {
    const std::vector<double> prices{100, 101, 99, 102, 98, 103, 97, 104, 96, 105};
    const auto ts = timestamps_for(prices.size());
    const Engine engine;
    EXPECT_FALSE(engine.scan(prices, ts).has_value());
    EXPECT_EQ(engine.check_input(prices, ts), InputStatus::InsufficientData);
    EXPECT_EQ(engine.min_series_length(), 4 * constants::MIN_PATTERN_BARS);
}

TEST(FullPipeline, ShortAndInvalidSeriesReportsInsufficientData) {
    const std::vector<double> prices{100, 101, -99, 102, 98};
    const Engine engine;
    EXPECT_EQ(engine.check_input(prices, timestamps_for(prices.size())),
              InputStatus::InsufficientData);
}

TEST(FullPipeline, CheckInputAcceptsValidSeries) {
    const auto prices = zigzag(POTENTIAL_BULLISH);
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;
    EXPECT_EQ(engine.check_input(prices, ts), InputStatus::Ok);
    EXPECT_TRUE(engine.scan(prices, ts).has_value());
}

TEST(FullPipeline, ContractViolationsRejected) {
    auto prices = zigzag(POTENTIAL_BULLISH);
    auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto bad_price = prices;
    bad_price[50] = -1.0;
    EXPECT_FALSE(engine.scan(bad_price, ts).has_value());
    EXPECT_EQ(engine.check_input(bad_price, ts), InputStatus::InvalidInput);

    auto bad_ts = ts;
    bad_ts[60] = bad_ts[59] - 10.0;
    EXPECT_FALSE(engine.scan(prices, bad_ts).has_value());
    EXPECT_EQ(engine.check_input(prices, bad_ts), InputStatus::InvalidInput);

    ts.pop_back();
    EXPECT_FALSE(engine.scan(prices, ts).has_value());
    EXPECT_EQ(engine.check_input(prices, ts), InputStatus::InvalidInput);
}

// ─── Determinism and invariants ───────────────────────────────────────────────

TEST(FullPipeline, RepeatedScansAreIdentical) {
    const auto prices = wave_series(400);
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto first  = engine.scan(prices, ts);
    auto second = engine.scan(prices, ts);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->to_string(), second->to_string());
}

TEST(FullPipeline, EveryReportedPatternHonoursInvariants) {
    const Engine engine;
    const auto& cfg = engine.config().scanner;

    for (const auto& prices : {wave_series(400), zigzag(POTENTIAL_BULLISH),
                               zigzag(COMPLETE_BULLISH), zigzag(mirrored(COMPLETE_BULLISH)),
                               zigzag(DEEP_BULLISH)}) {
        auto scan = engine.scan(prices, timestamps_for(prices.size()));
        ASSERT_TRUE(scan.has_value());
        EXPECT_EQ(scan->completed_patterns.size() + scan->potential_patterns.size(),
                  scan->patterns.size());

        for (const auto& p : scan->patterns) {
            const auto& pt = p.points;
            EXPECT_LT(pt.x.index, pt.a.index);
            EXPECT_LT(pt.a.index, pt.b.index);
            EXPECT_LT(pt.b.index, pt.c.index);
            EXPECT_GE(pt.a.index - pt.x.index, cfg.min_bars);
            EXPECT_GE(pt.b.index - pt.a.index, cfg.min_bars);
            EXPECT_GE(pt.c.index - pt.b.index, cfg.min_bars);
            EXPECT_LE(pt.c.index - pt.x.index, cfg.max_bars);

            if (p.direction == Direction::Bullish) {
                EXPECT_GT(pt.x.price, pt.a.price);
                EXPECT_GT(pt.b.price, pt.a.price);
                EXPECT_LT(pt.c.price, pt.b.price);
                EXPECT_LT(p.levels.stop_loss, pt.x.price);
            } else {
                EXPECT_LT(pt.x.price, pt.a.price);
                EXPECT_LT(pt.b.price, pt.a.price);
                EXPECT_GT(pt.c.price, pt.b.price);
                EXPECT_GT(p.levels.stop_loss, pt.x.price);
            }

            EXPECT_EQ(p.completion.is_complete, pt.d.has_value());
            if (pt.d) EXPECT_GT(pt.d->index, pt.c.index);

            EXPECT_GT(p.completion.validation_score, cfg.min_validation_score);
            EXPECT_LE(p.completion.validation_score, 1.0 + 1e-12);
            EXPECT_GE(p.completion.confidence_score, 0.0);
            EXPECT_LE(p.completion.confidence_score, 100.0);
            EXPECT_GT(p.levels.risk_reward_ratio, 0.0);
            EXPECT_EQ(p.levels.targets.size(), constants::TARGET_COUNT);
        }

        for (std::size_t i = 1; i < scan->patterns.size(); ++i) {
            EXPECT_GE(scan->patterns[i - 1].completion.validation_score,
                      scan->patterns[i].completion.validation_score);
        }
    }
}

// ─── Scan type filters ────────────────────────────────────────────────────────

TEST(FullPipeline, ScanTypeFilters) {
    const auto prices = zigzag(COMPLETE_BULLISH);
    const auto ts     = timestamps_for(prices.size());
    const Engine engine;

    auto all       = engine.scan(prices, ts, ScanType::All);
    auto complete  = engine.scan(prices, ts, ScanType::Complete);
    auto potential = engine.scan(prices, ts, ScanType::Potential);
    ASSERT_TRUE(all && complete && potential);

    EXPECT_EQ(complete->patterns.size(), all->completed_patterns.size());
    EXPECT_TRUE(complete->potential_patterns.empty());
    EXPECT_EQ(potential->patterns.size(), all->potential_patterns.size());
    EXPECT_TRUE(potential->completed_patterns.empty());
    EXPECT_GE(all->completed_patterns.size(), 1u);
    EXPECT_GE(all->potential_patterns.size(), 1u);
}

// ─── Forecast and loader paths ────────────────────────────────────────────────

TEST(FullPipeline, ForecastForPotentialPattern) {
    const auto prices = zigzag(POTENTIAL_BULLISH);
    const Engine engine;

    auto scan = engine.scan(prices, timestamps_for(prices.size()), ScanType::Potential);
    ASSERT_TRUE(scan.has_value());
    const auto* g = find_pattern(*scan, PatternType::Gartley, Direction::Bullish);
    ASSERT_NE(g, nullptr);

    auto f = engine.predict_completion(*g, prices.back());
    ASSERT_TRUE(f.has_value());
    EXPECT_NEAR(f->projected_completion, BULLISH_D, 1e-3);
    EXPECT_NEAR(f->time_estimate, 30.0 * constants::TIME_PROJECTION_FACTOR, 1e-9);
    EXPECT_EQ(f->plan.timeframe, "4h-1d");  // C − X = 90 bars
    EXPECT_FALSE(f->plan.should_enter);     // price far from D, R:R ≈ 0.09
    EXPECT_GT(f->probability, 0.0);
    EXPECT_LE(f->probability, 100.0);
}

TEST(FullPipeline, CsvSamplesMatchRawScan) {
    const auto prices = zigzag(POTENTIAL_BULLISH);
    const auto ts     = timestamps_for(prices.size());

    std::string csv = "timestamp,price\n";
    for (std::size_t i = 0; i < prices.size(); ++i) {
        csv += std::to_string(ts[i]) + "," + std::to_string(prices[i]) + "\n";
    }
    const auto samples = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(samples.size(), prices.size());

    const Engine engine;
    auto from_csv = engine.scan(samples);
    ASSERT_TRUE(from_csv.has_value());
    EXPECT_NE(find_pattern(*from_csv, PatternType::Gartley, Direction::Bullish), nullptr);
}

TEST(FullPipeline, VerboseDoesNotChangeResults) {
    const auto prices = zigzag(COMPLETE_BULLISH);
    const auto ts     = timestamps_for(prices.size());

    const Engine quiet;
    const Engine loud(EngineConfig{.verbose = true});
    auto a = quiet.scan(prices, ts);
    auto b = loud.scan(prices, ts);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->to_string(), b->to_string());
}

TEST(FullPipeline, ZeroStrengthAndBarsAreClamped) {
    EngineConfig cfg;
    cfg.pivot_strength   = 0;
    cfg.scanner.min_bars = 0;
    const Engine engine(cfg);
    EXPECT_EQ(engine.config().pivot_strength, 1u);
    EXPECT_EQ(engine.config().scanner.min_bars, 1u);
    EXPECT_EQ(engine.min_series_length(), 4u);
}
