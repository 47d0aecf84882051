#pragma once

/// @file include/fibscan/templates.hpp
/// @brief Pattern Template Registry public API.
///
/// # Module: Template Registry
///
/// ## Responsibility
/// Hold the fixed table of harmonic pattern shapes. Each (PatternType,
/// Direction) pair has exactly one PatternTemplate describing its four
/// Fibonacci ratio bands:
///
///   | Pattern   | AB/XA | BC/AB | CD/BC | AD/XA | Reliability |
///   |-----------|-------|-------|-------|-------|-------------|
///   | Gartley   | 0.618 | 0.618 | 1.272 | 0.786 | 75          |
///   | Butterfly | 0.786 | 0.618 | 1.618 | 1.27  | 70          |
///   | Bat       | 0.382 | 0.618 | 1.618 | 0.886 | 80          |
///   | Crab      | 0.618 | 0.618 | 2.618 | 1.618 | 85          |
///
/// Only the ideal value of a band takes part in validation; min/max are
/// carried as reference data.
///
/// ## Guarantees
/// - Immutable after construction; safe to share across threads
/// - Cheap to copy (a fixed array of trivially copyable records)
/// - Lookup is an array index, never a string key

#include "fibscan/types.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <vector>

namespace fibscan::templates {

/// Acceptable range and ideal value of one leg ratio.
struct RatioBand {
    double min;
    double max;
    double ideal;
};

/// Immutable description of one harmonic shape in one direction.
struct PatternTemplate {
    PatternType type;
    Direction   direction;
    RatioBand   ab_xa;        ///< AB leg over XA leg
    RatioBand   bc_ab;        ///< BC leg over AB leg
    RatioBand   cd_bc;        ///< CD leg over BC leg
    RatioBand   ad_xa;        ///< AD leg over XA leg
    const char* description;
    double      reliability;  ///< Baseline reliability, 0–100
};

/// Number of templates in the standard registry (4 types × 2 directions).
static constexpr std::size_t TEMPLATE_COUNT = PATTERN_TYPE_COUNT * 2;

/// Read-only table of every known pattern template.
class TemplateRegistry {
public:
    /// Build the standard Gartley / Butterfly / Bat / Crab table.
    TemplateRegistry() noexcept;

    /// Template for a (type, direction) pair.
    [[nodiscard]] const PatternTemplate&
    get(PatternType type, Direction direction) const noexcept;

    /// All templates, grouped by type, bullish before bearish.
    [[nodiscard]] std::span<const PatternTemplate> all() const noexcept;

    /// Distinct pattern types in registry order.
    [[nodiscard]] std::vector<PatternType> available_types() const;

    [[nodiscard]] std::size_t size() const noexcept { return templates_.size(); }

private:
    [[nodiscard]] static constexpr std::size_t
    slot(PatternType type, Direction direction) noexcept {
        return static_cast<std::size_t>(type) * 2
             + (direction == Direction::Bullish ? 0 : 1);
    }

    std::array<PatternTemplate, TEMPLATE_COUNT> templates_;
};

} // namespace fibscan::templates
