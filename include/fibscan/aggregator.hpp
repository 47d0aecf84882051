#pragma once

/// @file include/fibscan/aggregator.hpp
/// @brief Scan Aggregator public API.
///
/// # Module: Scan Aggregator
///
/// ## Responsibility
/// Collect the per-template scanner output into one ranked PatternScan:
///   1. Keep only the subset named by the ScanType
///   2. Rank: validation_score ↓, reliability ↓, confidence_score ↓ (stable)
///   3. Partition into potential (no D) and completed (D present)
///   4. Quality metrics over the kept patterns
///
/// ## Invariant
/// potential_patterns ∪ completed_patterns == patterns, and the two are
/// disjoint. An empty input yields an empty scan with all-zero metrics.

#include "fibscan/pattern.hpp"
#include "fibscan/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace fibscan::aggregator {

struct QualityMetrics {
    double average_reliability;  ///< Mean template reliability
    double fibonacci_accuracy;   ///< Mean validation score
    double pattern_density;      ///< Pattern count (caller normalises by window)
};

/// Result of one full scan. Owned by the caller.
struct PatternScan {
    std::vector<HarmonicPattern> patterns;
    std::vector<HarmonicPattern> potential_patterns;
    std::vector<HarmonicPattern> completed_patterns;
    QualityMetrics               quality{};

    /// Multi-line report: metrics header followed by one line per pattern.
    [[nodiscard]] std::string to_string() const;
};

class ScanAggregator {
public:
    ScanAggregator() = delete;

    [[nodiscard]] static PatternScan
    aggregate(std::vector<HarmonicPattern> patterns,
              ScanType scan_type = ScanType::All);

    /// Stable ranking used by `aggregate`.
    static void rank(std::vector<HarmonicPattern>& patterns);

    /// Metrics over `patterns`; all zero when empty.
    [[nodiscard]] static QualityMetrics
    quality_metrics(std::span<const HarmonicPattern> patterns) noexcept;
};

} // namespace fibscan::aggregator
