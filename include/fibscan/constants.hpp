#pragma once

#include <array>
#include <cstddef>

/// @file include/fibscan/constants.hpp
/// @brief Fibonacci and scan constants for the fibscan engine.
///
/// Every threshold used by the scanner, projector and level calculator is
/// declared here so that config structs can default to it and tests can
/// refer to it by name.

namespace fibscan::constants {

// ─── Pattern Geometry ─────────────────────────────────────────────────────────

/// Fractional tolerance applied to every template ideal ratio (5%).
static constexpr double FIBONACCI_TOLERANCE = 0.05;

/// Minimum number of bars between consecutive pattern points.
static constexpr std::size_t MIN_PATTERN_BARS = 20;

/// Maximum number of bars spanned by X → C.
static constexpr std::size_t MAX_PATTERN_BARS = 200;

/// Half-width of the pivot window (bars before and after).
static constexpr std::size_t PIVOT_STRENGTH = 3;

/// A series must hold at least this many × MIN_PATTERN_BARS samples.
static constexpr std::size_t MIN_SERIES_MULTIPLIER = 4;

/// Most recent pivots kept before the O(p⁴) enumeration.
static constexpr std::size_t MAX_SCAN_PIVOTS = 50;

// ─── Completion & Scoring ─────────────────────────────────────────────────────

/// A later pivot matches the projected D when within this fraction of it.
static constexpr double PIVOT_MATCH_TOLERANCE = 0.02;

/// Candidates with validation score at or below this are discarded.
static constexpr double MIN_VALIDATION_SCORE = 0.6;

/// Fibonacci factor applied to the mean leg duration for time estimates.
static constexpr double TIME_PROJECTION_FACTOR = 0.618;

/// Weights of price proximity and validation score in completion probability.
static constexpr double PROXIMITY_WEIGHT  = 0.6;
static constexpr double VALIDATION_WEIGHT = 0.4;

// ─── Entry Rules ──────────────────────────────────────────────────────────────

/// Price must be within this fraction of the projected D to enter.
static constexpr double ENTRY_DISTANCE_TOLERANCE = 0.02;

/// Minimum projected risk/reward to enter (exclusive).
static constexpr double ENTRY_MIN_RISK_REWARD = 1.5;

/// Minimum validation score to enter (exclusive).
static constexpr double ENTRY_MIN_VALIDATION_SCORE = 0.7;

// ─── Trading Levels ───────────────────────────────────────────────────────────

/// Stop-loss buffer beyond X, as a fraction of |A − X|.
static constexpr double STOP_LOSS_BUFFER = 0.236;

/// Number of profit targets produced per pattern.
static constexpr std::size_t TARGET_COUNT = 5;

/// Fibonacci multiples of |A − D| used for the target ladder.
static constexpr std::array<double, TARGET_COUNT> TARGET_LEVELS = {
    0.382, 0.618, 0.786, 1.0, 1.272,
};

/// Pattern span (C − X, bars) thresholds for the recommended timeframe.
static constexpr std::size_t SHORT_TIMEFRAME_BARS  = 50;
static constexpr std::size_t MEDIUM_TIMEFRAME_BARS = 100;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Absolute slack on the ratio band comparison (deviation ≤ tol + ε).
static constexpr double RATIO_EPSILON = 1e-12;

/// Price legs shorter than this are treated as zero-length.
static constexpr double MIN_LEG_LENGTH = 1e-12;

} // namespace fibscan::constants
