/// @file src/aggregator/scan_aggregator.cpp
/// @brief ScanAggregator: filtering, ranking, partition and quality metrics.

#include "fibscan/aggregator.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fibscan::aggregator {

// ─── ScanAggregator::rank ─────────────────────────────────────────────────────

void ScanAggregator::rank(std::vector<HarmonicPattern>& patterns) {
    std::stable_sort(patterns.begin(), patterns.end(),
        [](const HarmonicPattern& lhs, const HarmonicPattern& rhs) {
            if (lhs.completion.validation_score != rhs.completion.validation_score) {
                return lhs.completion.validation_score > rhs.completion.validation_score;
            }
            if (lhs.reliability != rhs.reliability) {
                return lhs.reliability > rhs.reliability;
            }
            return lhs.completion.confidence_score > rhs.completion.confidence_score;
        });
}

// ─── ScanAggregator::quality_metrics ──────────────────────────────────────────

QualityMetrics
ScanAggregator::quality_metrics(std::span<const HarmonicPattern> patterns) noexcept {
    if (patterns.empty()) {
        return QualityMetrics{0.0, 0.0, 0.0};
    }

    double reliability_sum = 0.0;
    double score_sum       = 0.0;
    for (const auto& p : patterns) {
        reliability_sum += p.reliability;
        score_sum       += p.completion.validation_score;
    }

    const auto n = static_cast<double>(patterns.size());
    return QualityMetrics{
        .average_reliability = reliability_sum / n,
        .fibonacci_accuracy  = score_sum / n,
        .pattern_density     = n,
    };
}

// ─── ScanAggregator::aggregate ────────────────────────────────────────────────

PatternScan ScanAggregator::aggregate(std::vector<HarmonicPattern> patterns,
                                      ScanType scan_type) {
    if (scan_type != ScanType::All) {
        const bool want_complete = scan_type == ScanType::Complete;
        std::erase_if(patterns, [want_complete](const HarmonicPattern& p) {
            return p.completion.is_complete != want_complete;
        });
    }

    rank(patterns);

    PatternScan scan;
    for (const auto& p : patterns) {
        if (p.completion.is_complete) {
            scan.completed_patterns.push_back(p);
        } else {
            scan.potential_patterns.push_back(p);
        }
    }
    scan.quality  = quality_metrics(patterns);
    scan.patterns = std::move(patterns);
    return scan;
}

// ─── PatternScan::to_string ───────────────────────────────────────────────────

std::string PatternScan::to_string() const {
    std::string out = fmt::format(
        "Patterns: {} ({} complete, {} potential)  "
        "AvgReliability={:.2f}  FibAccuracy={:.4f}  Density={:.0f}\n",
        patterns.size(), completed_patterns.size(), potential_patterns.size(),
        quality.average_reliability, quality.fibonacci_accuracy,
        quality.pattern_density);

    for (std::size_t i = 0; i < patterns.size(); ++i) {
        out += fmt::format("{:3d}. {}\n", i + 1, patterns[i].to_string());
    }
    return out;
}

} // namespace fibscan::aggregator
