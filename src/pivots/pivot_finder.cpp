/// @file src/pivots/pivot_finder.cpp
/// @brief PivotFinder: strict local extrema over a symmetric window.

#include "fibscan/pivots.hpp"

#include <cmath>

namespace fibscan::pivots {

// ─── PivotFinder::valid_input ─────────────────────────────────────────────────

bool PivotFinder::valid_input(std::span<const double> prices,
                              std::span<const double> timestamps) noexcept {
    if (prices.size() != timestamps.size()) {
        return false;
    }

    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (!std::isfinite(prices[i]) || prices[i] <= 0.0) return false;
        if (!std::isfinite(timestamps[i]))                  return false;
        if (i > 0 && timestamps[i] < timestamps[i - 1])     return false;
    }
    return true;
}

// ─── PivotFinder::is_high_pivot / is_low_pivot ────────────────────────────────

bool PivotFinder::is_high_pivot(std::span<const double> prices,
                                std::size_t i,
                                std::size_t strength) noexcept {
    if (i < strength || i + strength >= prices.size()) {
        return false;
    }

    const double p = prices[i];
    for (std::size_t j = i - strength; j <= i + strength; ++j) {
        if (j != i && prices[j] >= p) {
            return false;
        }
    }
    return true;
}

bool PivotFinder::is_low_pivot(std::span<const double> prices,
                               std::size_t i,
                               std::size_t strength) noexcept {
    if (i < strength || i + strength >= prices.size()) {
        return false;
    }

    const double p = prices[i];
    for (std::size_t j = i - strength; j <= i + strength; ++j) {
        if (j != i && prices[j] <= p) {
            return false;
        }
    }
    return true;
}

// ─── PivotFinder::find ────────────────────────────────────────────────────────

std::optional<std::vector<PricePoint>>
PivotFinder::find(std::span<const double> prices,
                  std::span<const double> timestamps,
                  std::size_t strength,
                  std::size_t min_pattern_bars) noexcept {
    if (prices.size() < min_series_length(min_pattern_bars)) {
        return std::nullopt;  // insufficient data
    }
    if (!valid_input(prices, timestamps)) {
        return std::nullopt;
    }

    std::vector<PricePoint> pivots;
    if (prices.size() <= 2 * strength) {
        return pivots;
    }

    for (std::size_t i = strength; i + strength < prices.size(); ++i) {
        // A strict high cannot also be a strict low when strength > 0.
        if (is_high_pivot(prices, i, strength) || is_low_pivot(prices, i, strength)) {
            pivots.push_back(PricePoint{
                .timestamp = timestamps[i],
                .price     = prices[i],
                .index     = i,
            });
        }
    }

    return pivots;
}

} // namespace fibscan::pivots
