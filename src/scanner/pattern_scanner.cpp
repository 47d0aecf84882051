/// @file src/scanner/pattern_scanner.cpp
/// @brief PatternScanner: XABC enumeration, validation and scoring.

#include "fibscan/scanner.hpp"
#include "fibscan/fibonacci.hpp"
#include "fibscan/levels.hpp"

#include <cmath>
#include <utility>

namespace fibscan::scanner {

using fibonacci::RatioValidator;

// ─── Constructor ──────────────────────────────────────────────────────────────

PatternScanner::PatternScanner(ScannerConfig config) noexcept
    : config_(config)
    , projector_(config.projection)
{}

// ─── PatternScanner::matches_direction ────────────────────────────────────────

bool PatternScanner::matches_direction(const PricePoint& x, const PricePoint& a,
                                       const PricePoint& b, const PricePoint& c,
                                       Direction direction) noexcept {
    if (direction == Direction::Bullish) {
        // X high, A low, B high, C low
        return x.price > a.price && b.price > a.price && c.price < b.price;
    }
    // X low, A high, B low, C high
    return x.price < a.price && b.price < a.price && c.price > b.price;
}

// ─── PatternScanner::within_spacing ───────────────────────────────────────────

bool PatternScanner::within_spacing(const PricePoint& x, const PricePoint& a,
                                    const PricePoint& b, const PricePoint& c) const noexcept {
    if (a.index <= x.index || b.index <= a.index || c.index <= b.index) {
        return false;
    }
    return a.index - x.index >= config_.min_bars
        && b.index - a.index >= config_.min_bars
        && c.index - b.index >= config_.min_bars
        && c.index - x.index <= config_.max_bars;
}

// ─── PatternScanner::validate_ratios ──────────────────────────────────────────

std::optional<RatioSet>
PatternScanner::validate_ratios(const PatternPoints& points,
                                const templates::PatternTemplate& tmpl,
                                double tolerance) noexcept {
    const double xa = points.a.price - points.x.price;
    const double ab = points.b.price - points.a.price;
    const double bc = points.c.price - points.b.price;

    auto ab_xa = RatioValidator::validate_legs(ab, xa, tmpl.ab_xa.ideal, tolerance);
    auto bc_ab = RatioValidator::validate_legs(bc, ab, tmpl.bc_ab.ideal, tolerance);
    if (!ab_xa || !bc_ab) {
        return std::nullopt;
    }

    RatioSet set{
        .ab_xa = *ab_xa,
        .bc_ab = *bc_ab,
        .cd_bc = std::nullopt,
        .ad_xa = std::nullopt,
    };

    if (points.d) {
        const double cd = points.d->price - points.c.price;
        const double ad = points.d->price - points.a.price;

        set.cd_bc = RatioValidator::validate_legs(cd, bc, tmpl.cd_bc.ideal, tolerance);
        set.ad_xa = RatioValidator::validate_legs(ad, xa, tmpl.ad_xa.ideal, tolerance);
        if (!set.cd_bc || !set.ad_xa) {
            return std::nullopt;
        }
    }

    return set;
}

// ─── PatternScanner::validation_score / confidence_score ──────────────────────

double PatternScanner::validation_score(const RatioSet& ratios) noexcept {
    double sum = 0.0;
    const auto add = [&sum](const fibonacci::FibonacciRatio& r) {
        if (r.is_valid) sum += 1.0 - r.deviation;
    };

    add(ratios.ab_xa);
    add(ratios.bc_ab);
    if (ratios.cd_bc) add(*ratios.cd_bc);
    if (ratios.ad_xa) add(*ratios.ad_xa);

    return sum / static_cast<double>(ratios.evaluated());
}

double PatternScanner::confidence_score(const RatioSet& ratios) noexcept {
    return 100.0 * static_cast<double>(ratios.valid())
                 / static_cast<double>(ratios.evaluated());
}

// ─── PatternScanner::evaluate ─────────────────────────────────────────────────

std::optional<HarmonicPattern>
PatternScanner::evaluate(std::span<const PricePoint> pivots,
                         const PatternPoints& xabc,
                         const templates::PatternTemplate& tmpl) const {
    // Step 3: both partial ratios must pass before D is considered.
    auto partial = validate_ratios(xabc, tmpl, config_.fibonacci_tolerance);
    if (!partial || !partial->ab_xa.is_valid || !partial->bc_ab.is_valid) {
        return std::nullopt;
    }

    // Step 4: project D and look for a later pivot near it.
    const double projected_d = projection::CompletionProjector::project_d(
        xabc, tmpl.direction, tmpl);
    const auto actual_d = projector_.find_nearest_pivot(pivots, projected_d, xabc.c.index);

    PatternPoints points = xabc;
    RatioSet ratios = *partial;
    if (actual_d) {
        points.d = *actual_d;
        auto full = validate_ratios(points, tmpl, config_.fibonacci_tolerance);
        if (!full) {
            return std::nullopt;
        }
        ratios = *full;
    }

    // Step 5: score.
    const double score = validation_score(ratios);
    if (score <= config_.min_validation_score) {
        return std::nullopt;
    }

    // Step 6: levels at the actual D, else the projection.
    auto levels = levels::TradingLevelCalculator::at_completion(
        points, tmpl.direction, actual_d ? actual_d->price : projected_d);
    if (!levels) {
        return std::nullopt;
    }

    return HarmonicPattern{
        .type       = tmpl.type,
        .direction  = tmpl.direction,
        .points     = points,
        .ratios     = ratios,
        .completion = CompletionStatus{
            .is_complete      = actual_d.has_value(),
            .projected_d      = projected_d,
            .confidence_score = confidence_score(ratios),
            .validation_score = score,
        },
        .levels      = std::move(*levels),
        .reliability = tmpl.reliability,
    };
}

// ─── PatternScanner::scan ─────────────────────────────────────────────────────

std::vector<HarmonicPattern>
PatternScanner::scan(std::span<const PricePoint> pivots,
                     const templates::PatternTemplate& tmpl) const {
    std::vector<HarmonicPattern> out;

    // Bound the O(p⁴) search to the most recent pivots.
    if (config_.max_pivots > 0 && pivots.size() > config_.max_pivots) {
        pivots = pivots.last(config_.max_pivots);
    }

    const std::size_t n = pivots.size();
    if (n < 4) {
        return out;
    }

    // Pivots are index-ordered, so once C − X (or a partial span) exceeds
    // max_bars every later candidate in that loop exceeds it too.
    const auto too_wide = [this](const PricePoint& from, const PricePoint& to) {
        return to.index - from.index > config_.max_bars;
    };

    for (std::size_t x = 0; x + 3 < n; ++x) {
        for (std::size_t a = x + 1; a + 2 < n; ++a) {
            if (too_wide(pivots[x], pivots[a])) break;
            for (std::size_t b = a + 1; b + 1 < n; ++b) {
                if (too_wide(pivots[x], pivots[b])) break;
                for (std::size_t c = b + 1; c < n; ++c) {
                    if (too_wide(pivots[x], pivots[c])) break;

                    const auto& px = pivots[x];
                    const auto& pa = pivots[a];
                    const auto& pb = pivots[b];
                    const auto& pc = pivots[c];

                    if (!matches_direction(px, pa, pb, pc, tmpl.direction)) continue;
                    if (!within_spacing(px, pa, pb, pc))                    continue;

                    const PatternPoints xabc{
                        .x = px, .a = pa, .b = pb, .c = pc, .d = std::nullopt,
                    };
                    auto pattern = evaluate(pivots, xabc, tmpl);
                    if (pattern) {
                        out.push_back(std::move(*pattern));
                    }
                }
            }
        }
    }

    return out;
}

} // namespace fibscan::scanner
