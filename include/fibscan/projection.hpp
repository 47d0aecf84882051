#pragma once

/// @file include/fibscan/projection.hpp
/// @brief Completion Projector public API.
///
/// # Module: Completion Projector
///
/// ## Responsibility
/// - Project the theoretical D of an XABC structure from the template's
///   ideal CD/BC ratio:  D = C ∓ |C − B| · CD/BC   (− bullish, + bearish)
/// - Match the projection to an actual later pivot within a price band
/// - Forecast completion of a potential pattern: time to D, probability,
///   and a trading plan at the projected D
///
/// ## Completion Probability
///     proximity   = max(0, 1 − |price − D_proj| / |C − A|)
///     probability = (0.6 · proximity + 0.4 · validation_score) · 100
///
/// ## Entry Rule
/// Enter only when |price − D_proj| / price < 0.02, projected R:R > 1.5 and
/// validation_score > 0.7. All three thresholds live in ProjectionConfig.

#include "fibscan/constants.hpp"
#include "fibscan/pattern.hpp"
#include "fibscan/templates.hpp"
#include "fibscan/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fibscan::projection {

/// Tunable thresholds for D matching and entry decisions.
struct ProjectionConfig {
    /// A pivot matches D_proj when |price − D_proj| ≤ this × |D_proj|.
    double pivot_match_tolerance = constants::PIVOT_MATCH_TOLERANCE;

    /// Maximum relative distance between price and D_proj to enter.
    double entry_distance_tolerance = constants::ENTRY_DISTANCE_TOLERANCE;

    /// Projected R:R must exceed this to enter.
    double entry_min_risk_reward = constants::ENTRY_MIN_RISK_REWARD;

    /// Validation score must exceed this to enter.
    double entry_min_validation_score = constants::ENTRY_MIN_VALIDATION_SCORE;
};

struct TradingPlan {
    bool                should_enter;
    double              entry_price;
    double              stop_loss;
    std::vector<double> targets;
    std::string         timeframe;  ///< "1h-4h", "4h-1d" or "1d-1w"
};

struct CompletionForecast {
    double      projected_completion;  ///< D_proj
    double      time_estimate;         ///< Bars until D (mean leg span × 0.618)
    double      probability;           ///< 0–100
    TradingPlan plan;
};

class CompletionProjector {
public:
    explicit CompletionProjector(ProjectionConfig config = ProjectionConfig{}) noexcept;

    /// Theoretical D price for an XABC structure under `tmpl`.
    [[nodiscard]] static double
    project_d(const PatternPoints& points,
              Direction direction,
              const templates::PatternTemplate& tmpl) noexcept;

    /// First pivot with index > `after_index` whose price lies within the
    /// match tolerance of `projected_price`.
    [[nodiscard]] std::optional<PricePoint>
    find_nearest_pivot(std::span<const PricePoint> pivots,
                       double projected_price,
                       std::size_t after_index) const noexcept;

    /// Forecast completion of `pattern` given the latest traded price.
    ///
    /// # Returns
    /// `nullopt` if `current_price` is not a positive finite number or no
    /// trading levels exist at the projected D.
    [[nodiscard]] std::optional<CompletionForecast>
    predict_completion(const HarmonicPattern& pattern,
                       const templates::PatternTemplate& tmpl,
                       double current_price) const;

    /// Mean of the XA, AB and BC bar spans × TIME_PROJECTION_FACTOR.
    [[nodiscard]] static double time_estimate(const PatternPoints& points) noexcept;

    /// Completion probability in [0, 100]; 0 when the pattern has no
    /// projected D.
    [[nodiscard]] static double
    completion_probability(const HarmonicPattern& pattern,
                           double current_price) noexcept;

    /// Chart timeframe suited to the X → C span of the pattern.
    [[nodiscard]] static const char*
    recommended_timeframe(const PatternPoints& points) noexcept;

    [[nodiscard]] const ProjectionConfig& config() const noexcept { return config_; }

private:
    ProjectionConfig config_;
};

} // namespace fibscan::projection
