#pragma once

/// @file ai_events.hpp
/// @brief Observability events published by AISystem on the EventBus.
///
/// Events are one-way: nothing in the AI layer reads handler results.

#include "npc/ecs/entity.hpp"
#include "npc/game/ai_types.hpp"

#include <string_view>

namespace npc::game {

/// An AI entity joined the system and received its memory.
struct AIEntityAddedEvent {
    static constexpr std::string_view kName = "ai:entityAdded";
    ecs::Entity entity;
};

/// An AI entity left the system; its memory has been released.
struct AIEntityRemovedEvent {
    static constexpr std::string_view kName = "ai:entityRemoved";
    ecs::Entity entity;
};

/// One tree tick finished with @p status.
struct AITickEvent {
    static constexpr std::string_view kName = "ai:tick";
    ecs::Entity entity;
    BTStatus status = BTStatus::Failure;
};

}  // namespace npc::game
