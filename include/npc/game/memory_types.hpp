#pragma once

/// @file memory_types.hpp
/// @brief Records held by an entity's long-term memory.

#include "npc/ecs/entity.hpp"
#include "npc/foundation/types.hpp"
#include "npc/game/grid_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace npc::game {

struct MemoryIdTag {};

/// Identifier of a record, unique within one MemorySystem.
using MemoryId = foundation::StrongId<MemoryIdTag>;

/// Discrete simulation step used for memory aging (not a frame).
using Turn = uint64_t;

/// Ordinal importance tier.  Higher tiers decay later and slower.
enum class MemoryImportance : uint8_t {
    Trivial,
    Low,
    Normal,
    High,
    Critical
};

constexpr std::size_t kImportanceTierCount = 5;

enum class MemoryKind : uint8_t {
    Entity,
    Location,
    Event
};

constexpr std::size_t kMemoryKindCount = 3;

/// How the observer regards a remembered entity.
enum class Relationship : uint8_t {
    Hostile,
    Neutral,
    Friendly,
    Afraid,
    Curious,
    Allied
};

constexpr std::string_view importanceName(MemoryImportance importance) {
    switch (importance) {
        case MemoryImportance::Trivial:  return "trivial";
        case MemoryImportance::Low:      return "low";
        case MemoryImportance::Normal:   return "normal";
        case MemoryImportance::High:     return "high";
        case MemoryImportance::Critical: return "critical";
    }
    return "unknown";
}

constexpr std::string_view memoryKindName(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Entity:   return "entity";
        case MemoryKind::Location: return "location";
        case MemoryKind::Event:    return "event";
    }
    return "unknown";
}

constexpr std::string_view relationshipName(Relationship rel) {
    switch (rel) {
        case Relationship::Hostile:  return "hostile";
        case Relationship::Neutral:  return "neutral";
        case Relationship::Friendly: return "friendly";
        case Relationship::Afraid:   return "afraid";
        case Relationship::Curious:  return "curious";
        case Relationship::Allied:   return "allied";
    }
    return "unknown";
}

/// One tier up, saturating at Critical.
constexpr MemoryImportance raiseImportance(MemoryImportance importance) {
    return importance == MemoryImportance::Critical
               ? MemoryImportance::Critical
               : static_cast<MemoryImportance>(static_cast<uint8_t>(importance) + 1);
}

struct EntityMemoryData {
    ecs::Entity target;
    Relationship relationship = Relationship::Neutral;
    std::optional<GridPosition> lastKnownPosition;
    std::optional<int32_t> lastKnownHealth;
    bool isVisible = false;
    float threatLevel = 0.0f;
    uint32_t timesEncountered = 0;

    bool operator==(const EntityMemoryData&) const = default;
};

struct LocationMemoryData {
    int32_t x = 0;
    int32_t y = 0;
    std::string description;
    std::vector<std::string> tags;
    uint32_t timesVisited = 0;
    bool isExplored = false;

    bool operator==(const LocationMemoryData&) const = default;
};

struct EventMemoryData {
    std::string eventType;
    std::string description;
    std::vector<ecs::Entity> participants;
    std::optional<GridPosition> location;
    std::string outcome = "unknown";

    bool operator==(const EventMemoryData&) const = default;
};

/// Alternative index matches MemoryKind.
using MemoryData = std::variant<EntityMemoryData, LocationMemoryData, EventMemoryData>;

/// One durable fact.
///
/// `confidence` is the strength after the last decay sweep.
/// `anchorConfidence` is the strength as of `lastAccessTurn`; decay is
/// computed from it in closed form, so a sweep repeated at the same turn
/// gives the same result.
struct MemoryRecord {
    MemoryId id;
    MemoryData data;
    Turn createdTurn = 0;
    Turn lastAccessTurn = 0;
    float confidence = 1.0f;
    float anchorConfidence = 1.0f;
    MemoryImportance importance = MemoryImportance::Normal;

    [[nodiscard]] MemoryKind kind() const noexcept {
        return static_cast<MemoryKind>(data.index());
    }

    [[nodiscard]] const EntityMemoryData* AsEntity() const { return std::get_if<EntityMemoryData>(&data); }
    [[nodiscard]] EntityMemoryData* AsEntity() { return std::get_if<EntityMemoryData>(&data); }
    [[nodiscard]] const LocationMemoryData* AsLocation() const { return std::get_if<LocationMemoryData>(&data); }
    [[nodiscard]] LocationMemoryData* AsLocation() { return std::get_if<LocationMemoryData>(&data); }
    [[nodiscard]] const EventMemoryData* AsEvent() const { return std::get_if<EventMemoryData>(&data); }
    [[nodiscard]] EventMemoryData* AsEvent() { return std::get_if<EventMemoryData>(&data); }

    bool operator==(const MemoryRecord&) const = default;
};

// Optional inputs of the Remember* operations.

struct EntityMemoryOptions {
    std::optional<GridPosition> position;
    std::optional<int32_t> health;
    std::optional<float> threatLevel;
    std::optional<MemoryImportance> importance;
};

struct LocationMemoryOptions {
    std::vector<std::string> tags;
    std::optional<bool> explored;
    std::optional<MemoryImportance> importance;
};

struct EventMemoryOptions {
    std::vector<ecs::Entity> participants;
    std::optional<GridPosition> location;
    std::optional<std::string> outcome;
    std::optional<MemoryImportance> importance;
};

}  // namespace npc::game
