/// @file src/projection/completion_projector.cpp
/// @brief CompletionProjector: D projection, pivot matching, forecasts.

#include "fibscan/projection.hpp"
#include "fibscan/levels.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fibscan::projection {

// ─── Constructor ──────────────────────────────────────────────────────────────

CompletionProjector::CompletionProjector(ProjectionConfig config) noexcept
    : config_(config)
{}

// ─── CompletionProjector::project_d ───────────────────────────────────────────

double CompletionProjector::project_d(const PatternPoints& points,
                                      Direction direction,
                                      const templates::PatternTemplate& tmpl) noexcept {
    const double cd = std::abs(points.c.price - points.b.price) * tmpl.cd_bc.ideal;
    // Bullish completes below C, bearish above.
    return direction == Direction::Bullish ? points.c.price - cd
                                           : points.c.price + cd;
}

// ─── CompletionProjector::find_nearest_pivot ──────────────────────────────────

std::optional<PricePoint>
CompletionProjector::find_nearest_pivot(std::span<const PricePoint> pivots,
                                        double projected_price,
                                        std::size_t after_index) const noexcept {
    if (!std::isfinite(projected_price)) {
        return std::nullopt;
    }

    const double band = std::abs(projected_price) * config_.pivot_match_tolerance;
    for (const auto& p : pivots) {
        if (p.index <= after_index) {
            continue;
        }
        if (std::abs(p.price - projected_price) <= band) {
            return p;
        }
    }
    return std::nullopt;
}

// ─── CompletionProjector::time_estimate ───────────────────────────────────────

double CompletionProjector::time_estimate(const PatternPoints& points) noexcept {
    const auto xa = static_cast<double>(points.a.index - points.x.index);
    const auto ab = static_cast<double>(points.b.index - points.a.index);
    const auto bc = static_cast<double>(points.c.index - points.b.index);
    return (xa + ab + bc) / 3.0 * constants::TIME_PROJECTION_FACTOR;
}

// ─── CompletionProjector::completion_probability ──────────────────────────────

double CompletionProjector::completion_probability(const HarmonicPattern& pattern,
                                                   double current_price) noexcept {
    if (!pattern.completion.projected_d || !std::isfinite(current_price)) {
        return 0.0;
    }

    const double distance   = std::abs(current_price - *pattern.completion.projected_d);
    const double total_move = std::abs(pattern.points.c.price - pattern.points.a.price);

    double proximity = 0.0;
    if (total_move >= constants::MIN_LEG_LENGTH) {
        proximity = std::max(0.0, 1.0 - distance / total_move);
    }

    return (proximity * constants::PROXIMITY_WEIGHT
          + pattern.completion.validation_score * constants::VALIDATION_WEIGHT) * 100.0;
}

// ─── CompletionProjector::recommended_timeframe ───────────────────────────────

const char* CompletionProjector::recommended_timeframe(const PatternPoints& points) noexcept {
    const std::size_t span = points.c.index - points.x.index;
    if (span < constants::SHORT_TIMEFRAME_BARS)  return "1h-4h";
    if (span < constants::MEDIUM_TIMEFRAME_BARS) return "4h-1d";
    return "1d-1w";
}

// ─── CompletionProjector::predict_completion ──────────────────────────────────

std::optional<CompletionForecast>
CompletionProjector::predict_completion(const HarmonicPattern& pattern,
                                        const templates::PatternTemplate& tmpl,
                                        double current_price) const {
    if (!std::isfinite(current_price) || current_price <= 0.0) {
        return std::nullopt;
    }

    const double projected_d = project_d(pattern.points, pattern.direction, tmpl);

    // The plan is always priced at the projection, even for a matched D.
    auto levels = levels::TradingLevelCalculator::at_completion(
        pattern.points, pattern.direction, projected_d);
    if (!levels) {
        return std::nullopt;
    }

    const double distance_to_entry = std::abs(current_price - projected_d) / current_price;
    const bool should_enter =
        distance_to_entry < config_.entry_distance_tolerance &&
        levels->risk_reward_ratio > config_.entry_min_risk_reward &&
        pattern.completion.validation_score > config_.entry_min_validation_score;

    return CompletionForecast{
        .projected_completion = projected_d,
        .time_estimate        = time_estimate(pattern.points),
        .probability          = completion_probability(pattern, current_price),
        .plan = TradingPlan{
            .should_enter = should_enter,
            .entry_price  = levels->entry,
            .stop_loss    = levels->stop_loss,
            .targets      = std::move(levels->targets),
            .timeframe    = recommended_timeframe(pattern.points),
        },
    };
}

} // namespace fibscan::projection
