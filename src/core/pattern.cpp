/// @file src/core/pattern.cpp
/// @brief RatioSet counters and HarmonicPattern formatting.

#include "fibscan/pattern.hpp"

#include <fmt/format.h>

namespace fibscan {

// ─── RatioSet ─────────────────────────────────────────────────────────────────

std::size_t RatioSet::evaluated() const noexcept {
    std::size_t n = 2;
    if (cd_bc) ++n;
    if (ad_xa) ++n;
    return n;
}

std::size_t RatioSet::valid() const noexcept {
    std::size_t n = 0;
    if (ab_xa.is_valid)            ++n;
    if (bc_ab.is_valid)            ++n;
    if (cd_bc && cd_bc->is_valid)  ++n;
    if (ad_xa && ad_xa->is_valid)  ++n;
    return n;
}

// ─── HarmonicPattern::to_string ───────────────────────────────────────────────

std::string HarmonicPattern::to_string() const {
    const double d_price = points.d ? points.d->price
                                    : completion.projected_d.value_or(0.0);
    const std::size_t d_index = points.d ? points.d->index : 0;

    return fmt::format(
        "{} {} [{}] X@{}={:.4f} A@{}={:.4f} B@{}={:.4f} C@{}={:.4f} D{}={:.4f}  "
        "score={:.3f} conf={:.0f}% rel={:.0f}  entry={:.4f} stop={:.4f} R:R={:.2f}",
        fibscan::to_string(direction), fibscan::to_string(type),
        completion.is_complete ? "complete" : "potential",
        points.x.index, points.x.price,
        points.a.index, points.a.price,
        points.b.index, points.b.price,
        points.c.index, points.c.price,
        points.d ? fmt::format("@{}", d_index) : std::string("~"), d_price,
        completion.validation_score, completion.confidence_score, reliability,
        levels.entry, levels.stop_loss, levels.risk_reward_ratio);
}

} // namespace fibscan
