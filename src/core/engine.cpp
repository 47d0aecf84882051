/// @file src/core/engine.cpp
/// @brief Harmonic scan engine.

#include "fibscan/engine.hpp"
#include "fibscan/data_loader.hpp"
#include "fibscan/pivots.hpp"

#include <fmt/core.h>

#include <utility>

namespace fibscan::core {

namespace {

/// A zero-width window would report every sample as a pivot.
EngineConfig sanitise(EngineConfig config) noexcept {
    if (config.pivot_strength < 1) {
        config.pivot_strength = 1;
    }
    if (config.scanner.min_bars < 1) {
        config.scanner.min_bars = 1;
    }
    return config;
}

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(sanitise(std::move(config)))
    , registry_()
    , scanner_(config_.scanner)
    , projector_(config_.scanner.projection)
{}

// ─── Engine::min_series_length ────────────────────────────────────────────────

std::size_t Engine::min_series_length() const noexcept {
    return pivots::PivotFinder::min_series_length(config_.scanner.min_bars);
}

// ─── Engine::check_input ──────────────────────────────────────────────────────

InputStatus Engine::check_input(std::span<const double> prices,
                                std::span<const double> timestamps) const noexcept {
    if (prices.size() < min_series_length()) {
        return InputStatus::InsufficientData;
    }
    if (!pivots::PivotFinder::valid_input(prices, timestamps)) {
        return InputStatus::InvalidInput;
    }
    return InputStatus::Ok;
}

// ─── Engine::find_pivots ──────────────────────────────────────────────────────

std::optional<std::vector<PricePoint>>
Engine::find_pivots(std::span<const double> prices,
                    std::span<const double> timestamps) const noexcept {
    return pivots::PivotFinder::find(prices, timestamps,
                                     config_.pivot_strength,
                                     config_.scanner.min_bars);
}

// ─── Engine::scan ─────────────────────────────────────────────────────────────

std::optional<aggregator::PatternScan>
Engine::scan(std::span<const double> prices,
             std::span<const double> timestamps,
             ScanType scan_type) const {
    auto pivots = find_pivots(prices, timestamps);
    if (!pivots) {
        if (config_.verbose) {
            fmt::print(stderr,
                "[fibscan] rejected series ({}): {} samples ({} required, {} timestamps)\n",
                to_string(check_input(prices, timestamps)),
                prices.size(), min_series_length(), timestamps.size());
        }
        return std::nullopt;
    }

    if (config_.verbose) {
        fmt::print(stderr, "[fibscan] {} samples, {} pivots (cap {})\n",
                   prices.size(), pivots->size(), config_.scanner.max_pivots);
    }

    std::vector<HarmonicPattern> found;
    for (const auto& tmpl : registry_.all()) {
        auto patterns = scanner_.scan(*pivots, tmpl);
        if (config_.verbose) {
            fmt::print(stderr, "[fibscan] {:<9} {:<7} {} candidates\n",
                       to_string(tmpl.type), to_string(tmpl.direction),
                       patterns.size());
        }
        for (auto& p : patterns) {
            found.push_back(std::move(p));
        }
    }

    return aggregator::ScanAggregator::aggregate(std::move(found), scan_type);
}

std::optional<aggregator::PatternScan>
Engine::scan(std::span<const PriceSample> series, ScanType scan_type) const {
    std::vector<double> prices;
    std::vector<double> timestamps;
    DataLoader::split(series, prices, timestamps);
    return scan(prices, timestamps, scan_type);
}

// ─── Engine::predict_completion ───────────────────────────────────────────────

std::optional<projection::CompletionForecast>
Engine::predict_completion(const HarmonicPattern& pattern,
                           double current_price) const {
    const auto& tmpl = registry_.get(pattern.type, pattern.direction);
    return projector_.predict_completion(pattern, tmpl, current_price);
}

}  // namespace fibscan::core
