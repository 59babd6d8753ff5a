#pragma once

/// @file ai_system.hpp
/// @brief AISystem: per-frame behavior tree ticking and per-turn memory upkeep.
///
/// Drives every entity carrying both an AIController and a GridPosition.
/// Register it ahead of the movement system in the same stage so the
/// moves requested by a tree resolve in the frame they were decided:
/// @code
///   scheduler.Register<AISystem>(controllers, positions, healths, movement, pathfinder, bus);
///   scheduler.Register<MovementSystem>(...);
///   scheduler.AddDependency<AISystem, MovementSystem>();
/// @endcode

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "npc/ecs/component_storage.hpp"
#include "npc/ecs/system_scheduler.hpp"
#include "npc/foundation/event_bus.hpp"
#include "npc/game/ai_components.hpp"
#include "npc/game/ai_tasks.hpp"
#include "npc/game/capabilities.hpp"
#include "npc/game/components.hpp"
#include "npc/game/memory_manager.hpp"

namespace npc::game {

/// Builds a fresh tree for an entity; may return nullptr on failure.
using BehaviorFactory = std::function<std::unique_ptr<BehaviorTree>(ecs::Entity)>;

/// Names of the behaviors installed by RegisterDefaultBehaviors().
namespace behaviors {
inline constexpr std::string_view kWander = "wander";    ///< Random steps with pauses.
inline constexpr std::string_view kHunter = "hunter";    ///< Chase and attack hostiles.
inline constexpr std::string_view kPatrol = "patrol";    ///< Walk "patrolPoints".
inline constexpr std::string_view kCoward = "coward";    ///< Flee any visible hostile.
inline constexpr std::string_view kNeutral = "neutral";  ///< Wander, flee when hurt.
}  // namespace behaviors

/// Pause between random steps of the wander behavior, in milliseconds.
constexpr float kWanderPauseMs = 500.0f;

/// Coordinator tying AI entities to their trees and memories.
class AISystem final : public ecs::ISystem {
public:
    AISystem(ecs::ComponentStorage<AIController>& controllers,
             ecs::ComponentStorage<GridPosition>& positions,
             ecs::ComponentStorage<Health>& healths,
             IMovement& movement,
             IPathfinder& pathfinder,
             foundation::EventBus& events,
             DecayPolicy policy = {},
             uint32_t seed = std::mt19937::default_seed);

    /// Tick every AI entity, in component storage order.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "AISystem";
    }

    // ── Behavior registry ────────────────────────────────────────────

    /// Register (or replace) a named behavior.
    void RegisterBehavior(std::string_view name, BehaviorFactory factory);

    /// Factory registered under @p name, or nullptr.
    [[nodiscard]] const BehaviorFactory* GetBehavior(std::string_view name) const;

    /// Install the wander, hunter, patrol, coward and neutral behaviors.
    void RegisterDefaultBehaviors();

    /// Build behavior @p name for @p entity and attach it.
    ///
    /// @return false if the name is unknown, the entity has no
    ///         AIController, or the factory produced no tree.
    bool AssignBehavior(ecs::Entity entity, std::string_view name);

    /// Attach @p tree directly (nullptr detaches).
    /// @return false if the entity has no AIController.
    bool SetBehaviorTree(ecs::Entity entity, std::unique_ptr<BehaviorTree> tree);

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Give a newly spawned AI entity its memory and announce it.
    void OnEntityAdded(ecs::Entity entity);

    /// Release the memory of a despawned entity and announce it.
    void OnEntityRemoved(ecs::Entity entity);

    // ── Ticking ──────────────────────────────────────────────────────

    /// Tick the trees of @p entities, in the given order.
    void Update(std::span<const ecs::Entity> entities, float deltaTime);

    /// Advance every memory to @p turn.  Call once per world turn.
    void SetGlobalTurn(Turn turn);

    /// Decay sweep over all memories.  Call once per world turn.
    /// @return Records forgotten.
    std::size_t ProcessMemoryDecay();

    // ── Memory access ────────────────────────────────────────────────

    /// Memory of @p entity, or nullptr if it has none.
    [[nodiscard]] MemorySystem* GetMemorySystem(ecs::Entity entity) const;

    /// Record in @p observer's memory that it saw @p target.
    ///
    /// The target's current position and health fill in when
    /// @p options carries none.  @return false for a target without a position.
    bool RememberEntity(ecs::Entity observer, ecs::Entity target, Relationship relationship,
                        EntityMemoryOptions options = {});

    [[nodiscard]] MemoryManager& GetMemoryManager() noexcept { return memory_; }
    [[nodiscard]] AITaskFactory& GetTaskFactory() noexcept { return tasks_; }

    /// Drop every memory and registered behavior.
    void Clear();

private:
    void AttachMemory(AIController& controller, MemorySystem* memory);

    std::unique_ptr<BehaviorTree> BuildTree(std::unique_ptr<BTNode> root,
                                            ecs::Entity entity,
                                            std::string_view behavior);

    ecs::ComponentStorage<AIController>& controllers_;
    ecs::ComponentStorage<GridPosition>& positions_;
    ecs::ComponentStorage<Health>& healths_;
    IMovement& movement_;
    foundation::EventBus& events_;

    MemoryManager memory_;
    AITaskFactory tasks_;
    std::unordered_map<std::string, BehaviorFactory> behaviors_;
};

} // namespace npc::game
