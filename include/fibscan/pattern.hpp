#pragma once

/// @file include/fibscan/pattern.hpp
/// @brief HarmonicPattern and its component value types.
///
/// A HarmonicPattern is one detected (complete) or candidate (potential)
/// XABC(D) structure. Potential patterns have no D point; complete patterns
/// carry the matched pivot as D.

#include "fibscan/fibonacci.hpp"
#include "fibscan/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fibscan {

/// The five labelled points of a pattern. D is absent until completion.
struct PatternPoints {
    PricePoint                x;
    PricePoint                a;
    PricePoint                b;
    PricePoint                c;
    std::optional<PricePoint> d;
};

/// Per-leg validation results. CD/BC and AD/XA exist only once D does.
struct RatioSet {
    fibonacci::FibonacciRatio                ab_xa;
    fibonacci::FibonacciRatio                bc_ab;
    std::optional<fibonacci::FibonacciRatio> cd_bc;
    std::optional<fibonacci::FibonacciRatio> ad_xa;

    /// Number of ratios evaluated (2 or 4).
    [[nodiscard]] std::size_t evaluated() const noexcept;

    /// Number of evaluated ratios that passed.
    [[nodiscard]] std::size_t valid() const noexcept;
};

struct CompletionStatus {
    bool                  is_complete;
    std::optional<double> projected_d;       ///< Theoretical D price
    double                confidence_score;  ///< 100 × valid / evaluated
    double                validation_score;  ///< Σ(1 − deviation) over valid / evaluated
};

struct TradingLevels {
    double              entry;
    double              stop_loss;
    std::vector<double> targets;            ///< Fibonacci ladder, nearest first
    double              risk_reward_ratio;  ///< |targets[0] − entry| / |entry − stop_loss|
};

/// One detected or candidate harmonic pattern.
struct HarmonicPattern {
    PatternType      type;
    Direction        direction;
    PatternPoints    points;
    RatioSet         ratios;
    CompletionStatus completion;
    TradingLevels    levels;
    double           reliability;  ///< Baseline reliability of the template

    /// One-line summary, e.g. "bullish gartley [potential] X@10 … score=0.998".
    [[nodiscard]] std::string to_string() const;
};

} // namespace fibscan
