#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// An entity is a 32-bit handle combining a 24-bit index with an 8-bit
/// version counter so that recycled indices do not alias stale handles.

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace npc::ecs {

/// Compact entity handle: 24-bit index + 8-bit version packed into 32 bits.
struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;          // 0x00FFFFFF
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace npc::ecs

// Hash support for unordered containers.
template <>
struct std::hash<npc::ecs::Entity> {
    std::size_t operator()(const npc::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
