#pragma once

/// @file ai_components.hpp
/// @brief AI ECS component: AIController.

#include "npc/game/behavior_tree.hpp"

#include <memory>

namespace npc::game {

class MemorySystem;

/// Marks an entity as AI-driven and owns its behavior tree.
///
/// AISystem only drives entities that carry both an AIController and a
/// GridPosition.  `memory` is filled in by AISystem::OnEntityAdded and
/// points into the system's MemoryManager.
struct AIController {
    /// Tree ticked every frame (none: the entity idles).
    std::unique_ptr<BehaviorTree> behaviorTree;

    /// Non-owning; null until the entity is added to the AI system.
    MemorySystem* memory = nullptr;
};

}  // namespace npc::game
