#pragma once

/// @file components.hpp
/// @brief Plain data components read by the AI layer.
///
/// GridPosition (grid_types.hpp) doubles as the position component;
/// AIController lives in ai_components.hpp.

#include <algorithm>
#include <cstdint>

namespace npc::game {

/// Hit points.  Setter clamps to [0, max].
struct Health {
    int32_t current = 0;
    int32_t max = 0;

    void Set(int32_t value) noexcept {
        current = std::clamp(value, static_cast<int32_t>(0), max);
    }

    /// current / max, or 0 for a zero max.
    [[nodiscard]] float Fraction() const noexcept {
        return max > 0 ? static_cast<float>(current) / static_cast<float>(max) : 0.0f;
    }
};

}  // namespace npc::game
