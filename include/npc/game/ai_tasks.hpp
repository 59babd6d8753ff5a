#pragma once

/// @file ai_tasks.hpp
/// @brief Built-in behavior tree leaves for movement, combat and sensing.
///
/// Every task reads and writes the well-known keys in `bbkeys`.  A task
/// whose inputs are missing (no key, no component, no memory, no
/// movement capability) returns Failure; none of them throws.

#include "npc/ecs/component_storage.hpp"
#include "npc/game/behavior_tree.hpp"
#include "npc/game/capabilities.hpp"
#include "npc/game/components.hpp"
#include "npc/game/grid_types.hpp"
#include "npc/game/memory_types.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>

namespace npc::game {

/// Builds task nodes bound to the position/health storages and the
/// pathfinder.
///
/// Nodes keep references to the factory's collaborators and random
/// generator, so the factory must outlive every node it creates.
class AITaskFactory {
public:
    AITaskFactory(ecs::ComponentStorage<GridPosition>& positions,
                  ecs::ComponentStorage<Health>& healths,
                  IPathfinder& pathfinder,
                  uint32_t seed = std::mt19937::default_seed);

    AITaskFactory(const AITaskFactory&) = delete;
    AITaskFactory& operator=(const AITaskFactory&) = delete;

    // ── Movement ─────────────────────────────────────────────────────

    /// Step one tile in a random direction.
    /// Success if the move happened, Failure if it was blocked.
    [[nodiscard]] std::unique_ptr<BTNode> CreateMoveRandomTask();

    /// Follow a path to "targetPosition", planning one when needed.
    ///
    /// Stores the plan in "currentPath"/"pathIndex".  Running while
    /// moving, Success on arrival, Failure when no route exists or after
    /// kDefaultStuckLimit consecutive blocked moves (the path is dropped
    /// so the next tick replans).
    [[nodiscard]] std::unique_ptr<BTNode> CreateMoveToTargetTask();

    /// Walk "patrolPoints" back and forth.
    ///
    /// Publishes the current point as "targetPosition" and advances when
    /// the entity stands on it.  Always Running; pair it with
    /// MoveToTarget under a RequireOne Parallel.
    [[nodiscard]] std::unique_ptr<BTNode> CreatePatrolTask();

    /// Step away from "targetPosition", trying the best cardinal first and
    /// the other cardinals in random order.
    [[nodiscard]] std::unique_ptr<BTNode> CreateMoveAwayTask();

    // ── Combat ───────────────────────────────────────────────────────

    /// Success when "targetEntity" is alive and within melee range.
    /// Out of range it records the target's tile as "targetPosition"
    /// and fails so a following MoveToTarget can close in.
    [[nodiscard]] std::unique_ptr<BTNode> CreateAttackTask();

    /// Condition: "targetEntity" within melee range.
    [[nodiscard]] std::unique_ptr<BTNode> CreateCanAttackCondition();

    // ── Sensing ──────────────────────────────────────────────────────

    /// Condition: memory holds a visible hostile.
    [[nodiscard]] std::unique_ptr<BTNode> CreateCanSeeHostileCondition();

    /// Condition: health fraction below @p threshold.
    [[nodiscard]] std::unique_ptr<BTNode> CreateIsHealthLowCondition(
        float threshold = kDefaultLowHealthThreshold);

    [[nodiscard]] std::unique_ptr<BTNode> CreateHasTargetCondition();

    /// Condition: standing on "targetPosition".
    [[nodiscard]] std::unique_ptr<BTNode> CreateIsAtTargetCondition();

    /// Pick the closest visible remembered entity of @p relationship as
    /// "targetEntity" / "targetPosition".
    [[nodiscard]] std::unique_ptr<BTNode> CreateUpdateTargetFromMemoryTask(
        Relationship relationship = Relationship::Hostile);

    // ── Blackboard utilities ─────────────────────────────────────────

    [[nodiscard]] std::unique_ptr<BTNode> CreateClearPathTask();
    [[nodiscard]] std::unique_ptr<BTNode> CreateClearTargetTask();

    /// Write @p value under @p key and succeed.
    [[nodiscard]] std::unique_ptr<BTNode> CreateSetValueTask(std::string_view key,
                                                             BlackboardValue value);

private:
    ecs::ComponentStorage<GridPosition>& positions_;
    ecs::ComponentStorage<Health>& healths_;
    IPathfinder& pathfinder_;
    std::mt19937 rng_;
};

}  // namespace npc::game
