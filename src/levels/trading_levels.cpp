/// @file src/levels/trading_levels.cpp
/// @brief TradingLevelCalculator: entry, stop and Fibonacci target ladder.

#include "fibscan/levels.hpp"
#include "fibscan/constants.hpp"

#include <cmath>

namespace fibscan::levels {

// ─── TradingLevelCalculator::at_completion ────────────────────────────────────

std::optional<TradingLevels>
TradingLevelCalculator::at_completion(const PatternPoints& points,
                                      Direction direction,
                                      double d_price) noexcept {
    // A deep projection may sit at or below zero; its levels are still
    // reported.
    if (!std::isfinite(d_price)) {
        return std::nullopt;
    }

    const bool bullish = direction == Direction::Bullish;

    // Stop sits beyond X by 23.6% of the XA leg.
    const double buffer    = std::abs(points.a.price - points.x.price)
                           * constants::STOP_LOSS_BUFFER;
    const double stop_loss = bullish ? points.x.price - buffer
                                     : points.x.price + buffer;

    // Targets run from D against the X → A leg.
    const double ad_move = std::abs(d_price - points.a.price);
    std::vector<double> targets;
    targets.reserve(constants::TARGET_COUNT);
    for (double level : constants::TARGET_LEVELS) {
        targets.push_back(bullish ? d_price + ad_move * level
                                  : d_price - ad_move * level);
    }

    const double risk   = std::abs(d_price - stop_loss);
    const double reward = std::abs(targets.front() - d_price);
    if (risk < constants::MIN_LEG_LENGTH || reward < constants::MIN_LEG_LENGTH) {
        return std::nullopt;  // R:R undefined or zero
    }

    const double rr = reward / risk;
    if (!std::isfinite(rr)) {
        return std::nullopt;
    }

    return TradingLevels{
        .entry             = d_price,
        .stop_loss         = stop_loss,
        .targets           = std::move(targets),
        .risk_reward_ratio = rr,
    };
}

// ─── TradingLevelCalculator::calculate ────────────────────────────────────────

std::optional<TradingLevels>
TradingLevelCalculator::calculate(const HarmonicPattern& pattern,
                                  std::optional<double> projected_d) noexcept {
    std::optional<double> d_price;
    if (pattern.points.d) {
        d_price = pattern.points.d->price;
    } else if (projected_d) {
        d_price = projected_d;
    }

    if (!d_price) {
        return std::nullopt;  // missing completion point
    }
    return at_completion(pattern.points, pattern.direction, *d_price);
}

} // namespace fibscan::levels
