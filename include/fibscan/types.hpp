#pragma once

/// @file include/fibscan/types.hpp
/// @brief Shared value types for the fibscan harmonic pattern engine.
///
/// All modules include this file. It defines price observations and the
/// closed enumerations that key the template registry.

#include <cstddef>
#include <optional>
#include <string_view>

namespace fibscan {

// ─── Price Observations ───────────────────────────────────────────────────────

/// One loaded row of input: a timestamp and a price.
struct PriceSample {
    double timestamp;
    double price;
};

/// A pivot: one sample of the source series together with its offset.
struct PricePoint {
    double      timestamp;  ///< Caller-supplied timestamp (non-decreasing)
    double      price;      ///< Sample price (> 0)
    std::size_t index;      ///< Offset in the input series, used for spacing
};

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Expected reversal direction of a pattern.
///
/// Bullish patterns run X high, A low, B high, C low; bearish ones mirror it.
enum class Direction {
    Bullish,
    Bearish,
};

/// Harmonic pattern shapes known to the template registry.
enum class PatternType {
    Gartley,
    Butterfly,
    Bat,
    Crab,
};

/// Number of PatternType enumerators.
static constexpr std::size_t PATTERN_TYPE_COUNT = 4;

/// Which subset of a scan the caller wants back.
enum class ScanType {
    All,
    Complete,
    Potential,
};

/// Why a series was or was not accepted for scanning.
enum class InputStatus {
    Ok,
    InsufficientData,  ///< fewer samples than the minimum series length
    InvalidInput,      ///< prices and timestamps break the input contract
};

[[nodiscard]] const char* to_string(Direction d) noexcept;
[[nodiscard]] const char* to_string(PatternType t) noexcept;
[[nodiscard]] const char* to_string(ScanType s) noexcept;
[[nodiscard]] const char* to_string(InputStatus s) noexcept;

/// Parse "all" | "complete" | "potential". Returns `nullopt` otherwise.
[[nodiscard]] std::optional<ScanType> parse_scan_type(std::string_view s) noexcept;

} // namespace fibscan
