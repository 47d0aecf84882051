#pragma once

/// @file include/fibscan/engine.hpp
/// @brief Harmonic scan engine public API.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate one harmonic scan:
///   prices → PivotFinder → pivots → PatternScanner × every template →
///   ScanAggregator → PatternScan
///
/// ## Usage
/// ```cpp
/// fibscan::core::Engine engine;
/// auto series = DataLoader::load_csv("prices.csv");
/// if (series) {
///     auto scan = engine.scan(*series, fibscan::ScanType::All);
///     if (scan) fmt::print("{}\n", scan->to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Explicitly constructed; no process-wide detector instance
/// - `scan` is const and deterministic; engines may be used concurrently
/// - Fallible paths return `std::optional`

#include "fibscan/aggregator.hpp"
#include "fibscan/constants.hpp"
#include "fibscan/pattern.hpp"
#include "fibscan/projection.hpp"
#include "fibscan/scanner.hpp"
#include "fibscan/templates.hpp"
#include "fibscan/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace fibscan::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Pivot window half-width.
    std::size_t pivot_strength = constants::PIVOT_STRENGTH;

    /// Spacing, tolerance, scoring and projection thresholds.
    scanner::ScannerConfig scanner{};

    /// If true, emit per-template diagnostics to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Scan a price series for every registered pattern template.
    ///
    /// # Returns
    /// `nullopt` if the series is shorter than `min_series_length()` or
    /// violates the input contract (length mismatch, non-finite or
    /// non-positive price, decreasing timestamps). A scan that finds nothing
    /// is an empty PatternScan, not `nullopt`. Call `check_input` to tell
    /// the two rejections apart.
    [[nodiscard]] std::optional<aggregator::PatternScan>
    scan(std::span<const double> prices,
         std::span<const double> timestamps,
         ScanType scan_type = ScanType::All) const;

    /// Convenience overload for loaded samples.
    [[nodiscard]] std::optional<aggregator::PatternScan>
    scan(std::span<const PriceSample> series,
         ScanType scan_type = ScanType::All) const;

    /// Pivots of the series under this engine's configuration.
    [[nodiscard]] std::optional<std::vector<PricePoint>>
    find_pivots(std::span<const double> prices,
                std::span<const double> timestamps) const noexcept;

    /// Completion forecast for `pattern` using this engine's template.
    [[nodiscard]] std::optional<projection::CompletionForecast>
    predict_completion(const HarmonicPattern& pattern,
                       double current_price) const;

    /// Classify a series the way `scan` would. `scan` returns a value
    /// exactly when this is `InputStatus::Ok`.
    [[nodiscard]] InputStatus check_input(std::span<const double> prices,
                                          std::span<const double> timestamps) const noexcept;

    /// Shortest series `scan` accepts.
    [[nodiscard]] std::size_t min_series_length() const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const templates::TemplateRegistry& registry() const noexcept { return registry_; }

private:
    EngineConfig                    config_;
    templates::TemplateRegistry     registry_;
    scanner::PatternScanner         scanner_;
    projection::CompletionProjector projector_;
};

}  // namespace fibscan::core
