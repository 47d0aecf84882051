#pragma once

/// @file include/fibscan/fibonacci.hpp
/// @brief Fibonacci Ratio Validator public API.
///
/// # Module: Fibonacci Ratio Validator
///
/// ## Responsibility
/// Turn two price legs into a ratio and classify that ratio against a
/// template's ideal value:
///
///     deviation = |actual − target| / target
///     is_valid  = deviation ≤ tolerance
///
/// ## Degenerate Legs
/// A zero-length denominator leg makes the ratio undefined. `leg_ratio`
/// reports it as `nullopt` so the scanner can skip the candidate instead of
/// carrying NaN or ∞ into the scores.
///
/// ## Guarantees
/// - Pure functions, no state, `noexcept`
/// - `deviation` is always ≥ 0 and finite in a returned result

#include "fibscan/constants.hpp"

#include <optional>

namespace fibscan::fibonacci {

/// Validation result for one geometric ratio of a pattern.
struct FibonacciRatio {
    double target;     ///< Template ideal ratio (> 0)
    double tolerance;  ///< Fractional tolerance, e.g. 0.05
    double actual;     ///< Measured leg ratio
    double deviation;  ///< |actual − target| / target
    bool   is_valid;   ///< deviation ≤ tolerance
};

/// Stateless ratio computation and classification.
class RatioValidator {
public:
    RatioValidator() = delete;

    /// Classify `actual` against `target` with fractional `tolerance`.
    ///
    /// # Returns
    /// `nullopt` if `target` is not a positive finite number, `tolerance` is
    /// negative or non-finite, or `actual` is non-finite.
    [[nodiscard]] static std::optional<FibonacciRatio>
    validate(double actual, double target, double tolerance) noexcept;

    /// Ratio of two leg lengths, |numerator| / |denominator|.
    ///
    /// # Returns
    /// `nullopt` if the denominator is shorter than `MIN_LEG_LENGTH` or
    /// either leg is non-finite.
    [[nodiscard]] static std::optional<double>
    leg_ratio(double numerator, double denominator) noexcept;

    /// `leg_ratio` followed by `validate`.
    [[nodiscard]] static std::optional<FibonacciRatio>
    validate_legs(double numerator,
                  double denominator,
                  double target,
                  double tolerance = constants::FIBONACCI_TOLERANCE) noexcept;
};

} // namespace fibscan::fibonacci
