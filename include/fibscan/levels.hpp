#pragma once

/// @file include/fibscan/levels.hpp
/// @brief Trading Level Calculator public API.
///
/// # Module: Trading Levels
///
/// ## Formulas
/// With D the completion price (actual or projected):
///
///     entry     = D
///     stop_loss = X − 0.236·|A − X|    (bullish)
///               = X + 0.236·|A − X|    (bearish)
///     target_k  = D ± |A − D| · f_k,   f ∈ {0.382, 0.618, 0.786, 1.0, 1.272}
///                 (+ bullish, − bearish: opposite of the X → A leg)
///     R:R       = |target_1 − entry| / |entry − stop_loss|
///
/// ## Failure Modes
/// - No D available (neither actual nor projected): `nullopt`
///   (missing completion point; the scanner drops the candidate)
/// - D non-finite, zero risk (D on the stop) or zero reward (D on A): `nullopt`
/// - A projected D at or below zero is priced like any other D

#include "fibscan/pattern.hpp"
#include "fibscan/types.hpp"

#include <optional>

namespace fibscan::levels {

class TradingLevelCalculator {
public:
    TradingLevelCalculator() = delete;

    /// Levels for `pattern`, using its actual D when present and
    /// `projected_d` otherwise.
    [[nodiscard]] static std::optional<TradingLevels>
    calculate(const HarmonicPattern& pattern,
              std::optional<double> projected_d = std::nullopt) noexcept;

    /// Levels for an XABC structure completed at `d_price`.
    [[nodiscard]] static std::optional<TradingLevels>
    at_completion(const PatternPoints& points,
                  Direction direction,
                  double d_price) noexcept;
};

} // namespace fibscan::levels
