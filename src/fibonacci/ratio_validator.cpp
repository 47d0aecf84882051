/// @file src/fibonacci/ratio_validator.cpp
/// @brief RatioValidator: leg ratios and tolerance-band classification.

#include "fibscan/fibonacci.hpp"
#include "fibscan/constants.hpp"

#include <cmath>

namespace fibscan::fibonacci {

// ─── RatioValidator::validate ─────────────────────────────────────────────────

std::optional<FibonacciRatio>
RatioValidator::validate(double actual, double target, double tolerance) noexcept {
    if (!std::isfinite(target) || target <= 0.0)       return std::nullopt;
    if (!std::isfinite(tolerance) || tolerance < 0.0)  return std::nullopt;
    if (!std::isfinite(actual))                         return std::nullopt;

    const double deviation = std::abs(actual - target) / target;

    return FibonacciRatio{
        .target    = target,
        .tolerance = tolerance,
        .actual    = actual,
        .deviation = deviation,
        .is_valid  = deviation <= tolerance + constants::RATIO_EPSILON,
    };
}

// ─── RatioValidator::leg_ratio ────────────────────────────────────────────────

std::optional<double>
RatioValidator::leg_ratio(double numerator, double denominator) noexcept {
    if (!std::isfinite(numerator) || !std::isfinite(denominator)) {
        return std::nullopt;
    }

    const double den = std::abs(denominator);
    if (den < constants::MIN_LEG_LENGTH) {
        return std::nullopt;  // zero-length leg: ratio undefined
    }
    return std::abs(numerator) / den;
}

// ─── RatioValidator::validate_legs ────────────────────────────────────────────

std::optional<FibonacciRatio>
RatioValidator::validate_legs(double numerator,
                              double denominator,
                              double target,
                              double tolerance) noexcept {
    auto r = leg_ratio(numerator, denominator);
    if (!r) {
        return std::nullopt;
    }
    return validate(*r, target, tolerance);
}

} // namespace fibscan::fibonacci
