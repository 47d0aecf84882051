#pragma once

/// @file include/fibscan/scanner.hpp
/// @brief Combinatorial Pattern Scanner public API.
///
/// # Module: Pattern Scanner
///
/// ## Responsibility
/// Enumerate every strictly increasing pivot quadruple (X, A, B, C) and keep
/// those that fit one pattern template:
///   1. Direction - bullish X > A, B > A, C < B; bearish mirrored
///   2. Spacing   - each consecutive gap ≥ min_bars, C − X ≤ max_bars
///   3. AB/XA and BC/AB both within tolerance of the template ideals
///   4. Completion - projected D matched to a later pivot (complete) or not
///      (potential); complete patterns are revalidated on all four ratios
///   5. Scoring - validation_score > min_validation_score survives
///   6. Trading levels at the actual or projected D
///
/// ## Cost
/// O(p⁴) in the pivot count p. The scanner keeps only the most recent
/// `max_pivots` pivots, and stops each loop as soon as C − X exceeds
/// `max_bars` (pivots are index-ordered, so no later candidate can fit).
///
/// ## Guarantees
/// - Deterministic: identical input yields identical output order
/// - Degenerate legs and candidates without levels are skipped, never fatal
/// - Const member functions only; safe to share across threads

#include "fibscan/constants.hpp"
#include "fibscan/pattern.hpp"
#include "fibscan/projection.hpp"
#include "fibscan/templates.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace fibscan::scanner {

struct ScannerConfig {
    std::size_t min_bars             = constants::MIN_PATTERN_BARS;
    std::size_t max_bars             = constants::MAX_PATTERN_BARS;
    double      fibonacci_tolerance  = constants::FIBONACCI_TOLERANCE;
    double      min_validation_score = constants::MIN_VALIDATION_SCORE;
    std::size_t max_pivots           = constants::MAX_SCAN_PIVOTS;

    /// Forwarded to the CompletionProjector.
    projection::ProjectionConfig projection{};
};

class PatternScanner {
public:
    explicit PatternScanner(ScannerConfig config = ScannerConfig{}) noexcept;

    /// All patterns matching `tmpl` among `pivots`.
    [[nodiscard]] std::vector<HarmonicPattern>
    scan(std::span<const PricePoint> pivots,
         const templates::PatternTemplate& tmpl) const;

    /// Alternating high/low ordering check for `direction`.
    [[nodiscard]] static bool
    matches_direction(const PricePoint& x, const PricePoint& a,
                      const PricePoint& b, const PricePoint& c,
                      Direction direction) noexcept;

    /// Bar-spacing check against `min_bars` / `max_bars`.
    [[nodiscard]] bool
    within_spacing(const PricePoint& x, const PricePoint& a,
                   const PricePoint& b, const PricePoint& c) const noexcept;

    /// Validate AB/XA and BC/AB, plus CD/BC and AD/XA when `points.d` is set.
    ///
    /// # Returns
    /// `nullopt` if any leg used as a denominator has zero length.
    [[nodiscard]] static std::optional<RatioSet>
    validate_ratios(const PatternPoints& points,
                    const templates::PatternTemplate& tmpl,
                    double tolerance = constants::FIBONACCI_TOLERANCE) noexcept;

    /// Σ(1 − deviation) over valid ratios ÷ ratios evaluated.
    [[nodiscard]] static double validation_score(const RatioSet& ratios) noexcept;

    /// 100 × valid ratios ÷ ratios evaluated.
    [[nodiscard]] static double confidence_score(const RatioSet& ratios) noexcept;

    [[nodiscard]] const ScannerConfig& config() const noexcept { return config_; }

private:
    /// Steps 3–6 for one quadruple that already passed direction and spacing.
    [[nodiscard]] std::optional<HarmonicPattern>
    evaluate(std::span<const PricePoint> pivots,
             const PatternPoints& xabc,
             const templates::PatternTemplate& tmpl) const;

    ScannerConfig                   config_;
    projection::CompletionProjector projector_;
};

} // namespace fibscan::scanner
