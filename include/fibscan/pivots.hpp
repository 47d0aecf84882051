#pragma once

/// @file include/fibscan/pivots.hpp
/// @brief Pivot Finder public API.
///
/// # Module: Pivot Finder
///
/// ## Responsibility
/// Reduce a raw price series to the sparse, chronologically ordered list of
/// local extrema that the pattern scanner enumerates.
///
/// ## Pivot Rule
/// With window half-width w, sample i (w ≤ i < n − w) is
///   - a high pivot if prices[i] > prices[j] for every j ≠ i in [i − w, i + w]
///   - a low pivot  if prices[i] < prices[j] for every j ≠ i in [i − w, i + w]
///
/// Ties disqualify a sample, so a flat top or bottom produces no pivot.
///
/// ## Input Contract
/// - prices and timestamps have equal length
/// - prices are finite and > 0, timestamps finite and non-decreasing
/// - n ≥ MIN_SERIES_MULTIPLIER × min_pattern_bars, otherwise no four-point
///   pattern can be spaced out and the call reports insufficient data
///
/// ## Guarantees
/// - `noexcept`; violations of the contract return `nullopt`
/// - Output is sorted by ascending index

#include "fibscan/constants.hpp"
#include "fibscan/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace fibscan::pivots {

class PivotFinder {
public:
    PivotFinder() = delete;

    /// Find all high and low pivots in `prices`.
    ///
    /// # Arguments
    /// * `prices`           - Price series
    /// * `timestamps`       - One timestamp per price
    /// * `strength`         - Window half-width w (default 3)
    /// * `min_pattern_bars` - Minimum bars between pattern points; the series
    ///                        must hold at least 4× this many samples
    ///
    /// # Returns
    /// - `nullopt` on insufficient data or an input contract violation
    /// - Otherwise the pivots in chronological order (possibly empty)
    [[nodiscard]] static std::optional<std::vector<PricePoint>>
    find(std::span<const double> prices,
         std::span<const double> timestamps,
         std::size_t strength         = constants::PIVOT_STRENGTH,
         std::size_t min_pattern_bars = constants::MIN_PATTERN_BARS) noexcept;

    /// Minimum series length accepted by `find` for the given bar spacing.
    [[nodiscard]] static constexpr std::size_t
    min_series_length(std::size_t min_pattern_bars) noexcept {
        return constants::MIN_SERIES_MULTIPLIER * min_pattern_bars;
    }

    /// True if prices[i] is strictly greater than every other sample in
    /// [i − strength, i + strength]. False when the window leaves the series.
    [[nodiscard]] static bool
    is_high_pivot(std::span<const double> prices,
                  std::size_t i,
                  std::size_t strength) noexcept;

    /// True if prices[i] is strictly less than every other sample in
    /// [i − strength, i + strength]. False when the window leaves the series.
    [[nodiscard]] static bool
    is_low_pivot(std::span<const double> prices,
                 std::size_t i,
                 std::size_t strength) noexcept;

    /// Check the input contract: equal lengths, finite positive prices,
    /// finite non-decreasing timestamps.
    [[nodiscard]] static bool
    valid_input(std::span<const double> prices,
                std::span<const double> timestamps) noexcept;
};

} // namespace fibscan::pivots
