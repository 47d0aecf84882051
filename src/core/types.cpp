/// @file src/core/types.cpp
/// @brief String conversions for the shared enumerations.

#include "fibscan/types.hpp"

namespace fibscan {

const char* to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Bullish: return "bullish";
        case Direction::Bearish: return "bearish";
    }
    return "unknown";
}

const char* to_string(PatternType t) noexcept {
    switch (t) {
        case PatternType::Gartley:   return "gartley";
        case PatternType::Butterfly: return "butterfly";
        case PatternType::Bat:       return "bat";
        case PatternType::Crab:      return "crab";
    }
    return "unknown";
}

const char* to_string(ScanType s) noexcept {
    switch (s) {
        case ScanType::All:       return "all";
        case ScanType::Complete:  return "complete";
        case ScanType::Potential: return "potential";
    }
    return "unknown";
}

const char* to_string(InputStatus s) noexcept {
    switch (s) {
        case InputStatus::Ok:               return "ok";
        case InputStatus::InsufficientData: return "insufficient data";
        case InputStatus::InvalidInput:     return "invalid input";
    }
    return "unknown";
}

std::optional<ScanType> parse_scan_type(std::string_view s) noexcept {
    if (s == "all")       return ScanType::All;
    if (s == "complete")  return ScanType::Complete;
    if (s == "potential") return ScanType::Potential;
    return std::nullopt;
}

} // namespace fibscan
