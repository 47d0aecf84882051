/// @file src/templates/template_registry.cpp
/// @brief Standard harmonic template table.

#include "fibscan/templates.hpp"

namespace fibscan::templates {

namespace {

// Bands shared by both directions of a shape.
struct Shape {
    PatternType type;
    RatioBand   ab_xa;
    RatioBand   bc_ab;
    RatioBand   cd_bc;
    RatioBand   ad_xa;
    const char* bullish_description;
    const char* bearish_description;
    double      reliability;
};

constexpr Shape SHAPES[PATTERN_TYPE_COUNT] = {
    {
        PatternType::Gartley,
        {0.568, 0.618, 0.618},
        {0.382, 0.886, 0.618},
        {1.13,  1.618, 1.272},
        {0.786, 0.786, 0.786},
        "Bullish Gartley 222 Pattern",
        "Bearish Gartley 222 Pattern",
        75.0,
    },
    {
        PatternType::Butterfly,
        {0.786, 0.786, 0.786},
        {0.382, 0.886, 0.618},
        {1.618, 2.618, 1.618},
        {1.27,  1.618, 1.27},
        "Bullish Butterfly Pattern",
        "Bearish Butterfly Pattern",
        70.0,
    },
    {
        PatternType::Bat,
        {0.382, 0.5,   0.382},
        {0.382, 0.886, 0.618},
        {1.618, 2.618, 1.618},
        {0.886, 0.886, 0.886},
        "Bullish Bat Pattern",
        "Bearish Bat Pattern",
        80.0,
    },
    {
        PatternType::Crab,
        {0.382, 0.618, 0.618},
        {0.382, 0.886, 0.618},
        {2.24,  3.618, 2.618},
        {1.618, 1.618, 1.618},
        "Bullish Crab Pattern",
        "Bearish Crab Pattern",
        85.0,
    },
};

constexpr PatternTemplate make(const Shape& s, Direction dir) noexcept {
    return PatternTemplate{
        .type        = s.type,
        .direction   = dir,
        .ab_xa       = s.ab_xa,
        .bc_ab       = s.bc_ab,
        .cd_bc       = s.cd_bc,
        .ad_xa       = s.ad_xa,
        .description = dir == Direction::Bullish ? s.bullish_description
                                                 : s.bearish_description,
        .reliability = s.reliability,
    };
}

}  // namespace

// ─── TemplateRegistry ─────────────────────────────────────────────────────────

TemplateRegistry::TemplateRegistry() noexcept
    : templates_{
          make(SHAPES[0], Direction::Bullish), make(SHAPES[0], Direction::Bearish),
          make(SHAPES[1], Direction::Bullish), make(SHAPES[1], Direction::Bearish),
          make(SHAPES[2], Direction::Bullish), make(SHAPES[2], Direction::Bearish),
          make(SHAPES[3], Direction::Bullish), make(SHAPES[3], Direction::Bearish),
      }
{}

const PatternTemplate&
TemplateRegistry::get(PatternType type, Direction direction) const noexcept {
    return templates_[slot(type, direction)];
}

std::span<const PatternTemplate> TemplateRegistry::all() const noexcept {
    return templates_;
}

std::vector<PatternType> TemplateRegistry::available_types() const {
    std::vector<PatternType> types;
    types.reserve(PATTERN_TYPE_COUNT);
    for (const auto& t : templates_) {
        if (types.empty() || types.back() != t.type) {
            types.push_back(t.type);
        }
    }
    return types;
}

} // namespace fibscan::templates
