/// @file ai_tasks.cpp
/// @brief Built-in task factories.

#include "npc/game/ai_tasks.hpp"

#include "npc/game/memory_system.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <limits>

namespace npc::game {

namespace {

void dropPath(Blackboard& bb) {
    bb.Erase(bbkeys::kCurrentPath);
    bb.Erase(bbkeys::kPathIndex);
    bb.Erase(bbkeys::kStuckCounter);
}

/// Best cardinal step that increases the distance from @p threat.
Direction awayFrom(GridPosition pos, GridPosition threat) {
    const int32_t dx = pos.x - threat.x;
    const int32_t dy = pos.y - threat.y;
    if (std::abs(dx) > std::abs(dy)) {
        return dx > 0 ? Direction::East : Direction::West;
    }
    return dy > 0 ? Direction::South : Direction::North;
}

}  // namespace

AITaskFactory::AITaskFactory(ecs::ComponentStorage<GridPosition>& positions,
                             ecs::ComponentStorage<Health>& healths,
                             IPathfinder& pathfinder,
                             uint32_t seed)
    : positions_(positions), healths_(healths), pathfinder_(pathfinder), rng_(seed) {}

// ── Movement ────────────────────────────────────────────────────────────

std::unique_ptr<BTNode> AITaskFactory::CreateMoveRandomTask() {
    auto& rng = rng_;

    return std::make_unique<BTAction>([&rng](BTContext& ctx) -> BTStatus {
        if (!ctx.movement) {
            return BTStatus::Failure;
        }
        std::uniform_int_distribution<std::size_t> pick(0, kAllDirections.size() - 1);
        auto dir = kAllDirections[pick(rng)];
        return ctx.movement->MoveEntity(ctx.entity, dir) ? BTStatus::Success : BTStatus::Failure;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateMoveToTargetTask() {
    auto& positions = positions_;
    auto& pathfinder = pathfinder_;

    return std::make_unique<BTAction>([&positions, &pathfinder](BTContext& ctx) -> BTStatus {
        if (!ctx.blackboard || !ctx.movement) {
            return BTStatus::Failure;
        }
        auto& bb = *ctx.blackboard;

        const auto* target = bb.Get<GridPosition>(bbkeys::kTargetPosition);
        const auto* pos = positions.TryGet(ctx.entity);
        if (!target || !pos) {
            return BTStatus::Failure;
        }

        if (*pos == *target) {
            dropPath(bb);
            return BTStatus::Success;
        }

        const auto* path = bb.Get<Path>(bbkeys::kCurrentPath);
        if (!path || path->steps.empty()) {
            auto steps = pathfinder.FindPath(pos->x, pos->y, target->x, target->y);
            if (!steps || steps->empty()) {
                return BTStatus::Failure;
            }
            bb.Set(bbkeys::kCurrentPath, Path{std::move(*steps)});
            bb.Set<int32_t>(bbkeys::kPathIndex, 0);
            bb.Set<int32_t>(bbkeys::kStuckCounter, 0);
            path = bb.Get<Path>(bbkeys::kCurrentPath);
        }

        const auto index = bb.GetOrDefault<int32_t>(bbkeys::kPathIndex, 0);
        if (index < 0 || static_cast<std::size_t>(index) >= path->steps.size()) {
            // Ran off the end without arriving; replan next tick.
            dropPath(bb);
            return BTStatus::Failure;
        }

        auto dir = stepDirection(*pos, path->steps[static_cast<std::size_t>(index)]);
        if (!dir) {
            // Knocked off the route.
            dropPath(bb);
            return BTStatus::Failure;
        }

        if (ctx.movement->MoveEntity(ctx.entity, *dir)) {
            bb.Set<int32_t>(bbkeys::kPathIndex, index + 1);
            bb.Set<int32_t>(bbkeys::kStuckCounter, 0);
            return BTStatus::Running;
        }

        const auto stuck = bb.GetOrDefault<int32_t>(bbkeys::kStuckCounter, 0) + 1;
        if (stuck >= kDefaultStuckLimit) {
            dropPath(bb);
            return BTStatus::Failure;
        }
        bb.Set<int32_t>(bbkeys::kStuckCounter, stuck);
        return BTStatus::Running;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreatePatrolTask() {
    auto& positions = positions_;

    return std::make_unique<BTAction>([&positions](BTContext& ctx) -> BTStatus {
        if (!ctx.blackboard) {
            return BTStatus::Failure;
        }
        auto& bb = *ctx.blackboard;

        const auto* points = bb.Get<PositionList>(bbkeys::kPatrolPoints);
        const auto* pos = positions.TryGet(ctx.entity);
        if (!points || points->empty() || !pos) {
            return BTStatus::Failure;
        }

        const auto count = static_cast<int32_t>(points->size());
        auto index = bb.GetOrDefault<int32_t>(bbkeys::kPatrolIndex, 0);
        auto direction = bb.GetOrDefault<int32_t>(bbkeys::kPatrolDirection, 1);
        if (index < 0 || index >= count) {
            index = 0;
        }

        if (*pos == (*points)[static_cast<std::size_t>(index)]) {
            index += direction;
            if (index >= count) {
                index = std::max(count - 2, 0);
                direction = -1;
            } else if (index < 0) {
                index = std::min(1, count - 1);
                direction = 1;
            }
            bb.Erase(bbkeys::kCurrentPath);
            bb.Erase(bbkeys::kPathIndex);
        }

        bb.Set<int32_t>(bbkeys::kPatrolIndex, index);
        bb.Set<int32_t>(bbkeys::kPatrolDirection, direction);
        bb.Set(bbkeys::kTargetPosition, (*points)[static_cast<std::size_t>(index)]);
        return BTStatus::Running;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateMoveAwayTask() {
    auto& positions = positions_;
    auto& rng = rng_;

    return std::make_unique<BTAction>([&positions, &rng](BTContext& ctx) -> BTStatus {
        if (!ctx.blackboard || !ctx.movement) {
            return BTStatus::Failure;
        }

        const auto* threat = ctx.blackboard->Get<GridPosition>(bbkeys::kTargetPosition);
        const auto* pos = positions.TryGet(ctx.entity);
        if (!threat || !pos) {
            return BTStatus::Failure;
        }

        auto best = awayFrom(*pos, *threat);
        if (ctx.movement->MoveEntity(ctx.entity, best)) {
            return BTStatus::Success;
        }

        auto fallbacks = kCardinalDirections;
        std::shuffle(fallbacks.begin(), fallbacks.end(), rng);
        for (auto dir : fallbacks) {
            if (dir != best && ctx.movement->MoveEntity(ctx.entity, dir)) {
                return BTStatus::Success;
            }
        }
        return BTStatus::Failure;
    });
}

// ── Combat ──────────────────────────────────────────────────────────────

std::unique_ptr<BTNode> AITaskFactory::CreateAttackTask() {
    auto& positions = positions_;
    auto& healths = healths_;

    return std::make_unique<BTAction>([&positions, &healths](BTContext& ctx) -> BTStatus {
        if (!ctx.blackboard) {
            return BTStatus::Failure;
        }
        auto& bb = *ctx.blackboard;

        const auto* targetPtr = bb.Get<ecs::Entity>(bbkeys::kTargetEntity);
        if (!targetPtr || !targetPtr->isValid()) {
            return BTStatus::Failure;
        }
        auto target = *targetPtr;

        const auto* myPos = positions.TryGet(ctx.entity);
        const auto* targetPos = positions.TryGet(target);
        if (!myPos || !targetPos) {
            return BTStatus::Failure;
        }

        // Check if target is alive.
        if (const auto* health = healths.TryGet(target); health && health->current <= 0) {
            return BTStatus::Failure;
        }

        if (manhattanDistance(*myPos, *targetPos) > kMeleeRange) {
            bb.Set(bbkeys::kTargetPosition, *targetPos);
            return BTStatus::Failure;
        }

        // In range: damage resolution belongs to the combat layer.
        bb.Set(bbkeys::kInCombat, true);
        return BTStatus::Success;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateCanAttackCondition() {
    auto& positions = positions_;

    return std::make_unique<BTCondition>([&positions](BTContext& ctx) {
        if (!ctx.blackboard) {
            return false;
        }
        const auto* target = ctx.blackboard->Get<ecs::Entity>(bbkeys::kTargetEntity);
        if (!target) {
            return false;
        }
        const auto* myPos = positions.TryGet(ctx.entity);
        const auto* targetPos = positions.TryGet(*target);
        return myPos && targetPos && manhattanDistance(*myPos, *targetPos) <= kMeleeRange;
    });
}

// ── Sensing ─────────────────────────────────────────────────────────────

std::unique_ptr<BTNode> AITaskFactory::CreateCanSeeHostileCondition() {
    return std::make_unique<BTCondition>([](BTContext& ctx) {
        if (!ctx.blackboard) {
            return false;
        }
        auto* const* memory = ctx.blackboard->Get<MemorySystem*>(bbkeys::kMemorySystem);
        if (!memory || !*memory) {
            return false;
        }
        auto hostiles = (*memory)->GetHostileEntities();
        return std::any_of(hostiles.begin(), hostiles.end(), [](const MemoryRecord& record) {
            return record.AsEntity()->isVisible;
        });
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateIsHealthLowCondition(float threshold) {
    auto& healths = healths_;

    return std::make_unique<BTCondition>([&healths, threshold](BTContext& ctx) {
        const auto* health = healths.TryGet(ctx.entity);
        if (!health || health->max <= 0) {
            return false;
        }
        return health->Fraction() < threshold;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateHasTargetCondition() {
    return std::make_unique<BTCondition>([](BTContext& ctx) {
        return ctx.blackboard && ctx.blackboard->Has(bbkeys::kTargetEntity);
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateIsAtTargetCondition() {
    auto& positions = positions_;

    return std::make_unique<BTCondition>([&positions](BTContext& ctx) {
        if (!ctx.blackboard) {
            return false;
        }
        const auto* target = ctx.blackboard->Get<GridPosition>(bbkeys::kTargetPosition);
        const auto* pos = positions.TryGet(ctx.entity);
        return target && pos && *pos == *target;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateUpdateTargetFromMemoryTask(Relationship relationship) {
    auto& positions = positions_;

    return std::make_unique<BTAction>([&positions, relationship](BTContext& ctx) -> BTStatus {
        if (!ctx.blackboard) {
            return BTStatus::Failure;
        }
        auto& bb = *ctx.blackboard;

        auto* const* memory = bb.Get<MemorySystem*>(bbkeys::kMemorySystem);
        const auto* myPos = positions.TryGet(ctx.entity);
        if (!memory || !*memory || !myPos) {
            return BTStatus::Failure;
        }

        const EntityMemoryData* closest = nullptr;
        int32_t closestDist = std::numeric_limits<int32_t>::max();

        auto candidates = (*memory)->GetMemoriesByRelationship(relationship);
        for (const auto& record : candidates) {
            const auto* data = record.AsEntity();
            if (!data->isVisible || !data->lastKnownPosition) {
                continue;
            }
            auto dist = manhattanDistance(*myPos, *data->lastKnownPosition);
            if (dist < closestDist) {
                closestDist = dist;
                closest = data;
            }
        }

        if (!closest) {
            return BTStatus::Failure;
        }

        bb.Set(bbkeys::kTargetEntity, closest->target);
        bb.Set(bbkeys::kTargetPosition, *closest->lastKnownPosition);
        return BTStatus::Success;
    });
}

// ── Blackboard utilities ────────────────────────────────────────────────

std::unique_ptr<BTNode> AITaskFactory::CreateClearPathTask() {
    return std::make_unique<BTAction>([](BTContext& ctx) -> BTStatus {
        if (ctx.blackboard) {
            dropPath(*ctx.blackboard);
        }
        return BTStatus::Success;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateClearTargetTask() {
    return std::make_unique<BTAction>([](BTContext& ctx) -> BTStatus {
        if (ctx.blackboard) {
            ctx.blackboard->Erase(bbkeys::kTargetEntity);
            ctx.blackboard->Erase(bbkeys::kTargetPosition);
        }
        return BTStatus::Success;
    });
}

std::unique_ptr<BTNode> AITaskFactory::CreateSetValueTask(std::string_view key,
                                                          BlackboardValue value) {
    return std::make_unique<BTAction>(
        [key = std::string(key), value = std::move(value)](BTContext& ctx) -> BTStatus {
            if (!ctx.blackboard) {
                return BTStatus::Failure;
            }
            ctx.blackboard->SetValue(key, value);
            return BTStatus::Success;
        });
}

}  // namespace npc::game
