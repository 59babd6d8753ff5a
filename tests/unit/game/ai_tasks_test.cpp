/// @file ai_tasks_test.cpp
/// @brief Unit tests for the built-in movement, combat and sensing tasks.

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <vector>

#include "npc/ecs/component_storage.hpp"
#include "npc/game/ai_tasks.hpp"
#include "npc/game/memory_system.hpp"

using namespace npc::ecs;
using namespace npc::game;

namespace {

/// Moves entities in the position storage unless the destination is blocked.
class GridMovement final : public IMovement {
public:
    explicit GridMovement(ComponentStorage<GridPosition>& positions) : positions_(positions) {}

    bool MoveEntity(Entity entity, Direction direction) override {
        ++calls;
        auto* pos = positions_.TryGet(entity);
        if (!pos) {
            return false;
        }
        auto off = directionOffset(direction);
        GridPosition next{pos->x + off.x, pos->y + off.y};
        if (blocked.contains(next)) {
            return false;
        }
        *pos = next;
        return true;
    }

    std::set<GridPosition> blocked;
    int calls = 0;

private:
    ComponentStorage<GridPosition>& positions_;
};

/// Walks along x first, then along y.
class StraightPathfinder final : public IPathfinder {
public:
    std::optional<std::vector<GridPosition>> FindPath(int32_t x0, int32_t y0,
                                                      int32_t x1, int32_t y1) override {
        ++calls;
        if (!reachable) {
            return std::nullopt;
        }
        std::vector<GridPosition> steps;
        int32_t x = x0;
        int32_t y = y0;
        while (x != x1) {
            x += x1 > x ? 1 : -1;
            steps.push_back({x, y});
        }
        while (y != y1) {
            y += y1 > y ? 1 : -1;
            steps.push_back({x, y});
        }
        return steps;
    }

    bool reachable = true;
    int calls = 0;
};

}  // namespace

class AITasksTest : public ::testing::Test {
protected:
    void SetUp() override {
        positions_.Add(self_, 0, 0);
    }

    BTContext MakeContext() {
        BTContext ctx;
        ctx.entity = self_;
        ctx.deltaTime = 16.0f;
        ctx.blackboard = &bb_;
        ctx.movement = &movement_;
        return ctx;
    }

    BTStatus TickOnce(BTNode& node) {
        auto ctx = MakeContext();
        return node.Tick(ctx);
    }

    GridPosition SelfPosition() const { return positions_.Get(self_); }

    void PlaceSelf(GridPosition pos) { positions_.Get(self_) = pos; }

    const Entity self_{1, 0};
    const Entity other_{2, 0};

    ComponentStorage<GridPosition> positions_;
    ComponentStorage<Health> healths_;
    GridMovement movement_{positions_};
    StraightPathfinder pathfinder_;
    AITaskFactory factory_{positions_, healths_, pathfinder_, 7};
    Blackboard bb_{self_};
    MemorySystem memory_{self_};
};

// ═══════════════════════════════════════════════════════════════════════════
// MoveRandom
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, MoveRandomStepsToNeighbour) {
    auto task = factory_.CreateMoveRandomTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Success);

    auto pos = SelfPosition();
    EXPECT_TRUE(stepDirection(GridPosition{0, 0}, pos).has_value());
    EXPECT_EQ(movement_.calls, 1);
}

TEST_F(AITasksTest, MoveRandomFailsWhenBlocked) {
    for (auto dir : kAllDirections) {
        movement_.blocked.insert(directionOffset(dir));
    }
    auto task = factory_.CreateMoveRandomTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_EQ(SelfPosition(), (GridPosition{0, 0}));
}

TEST_F(AITasksTest, MoveRandomFailsWithoutMovement) {
    auto task = factory_.CreateMoveRandomTask();
    auto ctx = MakeContext();
    ctx.movement = nullptr;
    EXPECT_EQ(task->Tick(ctx), BTStatus::Failure);
}

// ═══════════════════════════════════════════════════════════════════════════
// MoveToTarget
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, MoveToTargetFollowsPathAndArrives) {
    bb_.Set(bbkeys::kTargetPosition, GridPosition{3, 0});
    auto task = factory_.CreateMoveToTargetTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(SelfPosition(), (GridPosition{1, 0}));
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kPathIndex, -1), 1);

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(SelfPosition(), (GridPosition{3, 0}));

    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));
    EXPECT_FALSE(bb_.Has(bbkeys::kPathIndex));
    EXPECT_EQ(pathfinder_.calls, 1);
}

TEST_F(AITasksTest, MoveToTargetSucceedsWhenAlreadyThere) {
    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 0});
    auto task = factory_.CreateMoveToTargetTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_EQ(pathfinder_.calls, 0);
}

TEST_F(AITasksTest, MoveToTargetFailsWithoutTarget) {
    auto task = factory_.CreateMoveToTargetTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_EQ(movement_.calls, 0);
}

TEST_F(AITasksTest, MoveToTargetFailsWithoutRoute) {
    pathfinder_.reachable = false;
    bb_.Set(bbkeys::kTargetPosition, GridPosition{4, 4});
    auto task = factory_.CreateMoveToTargetTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));
}

TEST_F(AITasksTest, MoveToTargetAbandonsPathAfterStuckLimit) {
    movement_.blocked.insert(GridPosition{1, 0});
    bb_.Set(bbkeys::kTargetPosition, GridPosition{3, 0});
    auto task = factory_.CreateMoveToTargetTask();

    for (int32_t i = 1; i < kDefaultStuckLimit; ++i) {
        EXPECT_EQ(TickOnce(*task), BTStatus::Running);
        EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kStuckCounter, 0), i);
    }
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));
    EXPECT_FALSE(bb_.Has(bbkeys::kStuckCounter));

    // Next attempt plans again.
    TickOnce(*task);
    EXPECT_EQ(pathfinder_.calls, 2);
}

TEST_F(AITasksTest, MoveToTargetProgressResetsStuckCounter) {
    movement_.blocked.insert(GridPosition{1, 0});
    bb_.Set(bbkeys::kTargetPosition, GridPosition{3, 0});
    auto task = factory_.CreateMoveToTargetTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kStuckCounter, 0), 1);

    movement_.blocked.clear();
    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kStuckCounter, -1), 0);
    EXPECT_EQ(SelfPosition(), (GridPosition{1, 0}));
}

TEST_F(AITasksTest, MoveToTargetDropsPathWhenKnockedOffRoute) {
    bb_.Set(bbkeys::kTargetPosition, GridPosition{3, 0});
    auto task = factory_.CreateMoveToTargetTask();
    TickOnce(*task);

    PlaceSelf({0, 5});
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(pathfinder_.calls, 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Patrol
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, PatrolPublishesCurrentPoint) {
    PlaceSelf({2, 0});
    bb_.Set(bbkeys::kPatrolPoints, PositionList{{0, 0}, {4, 0}});
    auto task = factory_.CreatePatrolTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetPosition, GridPosition{-1, -1}), (GridPosition{0, 0}));
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kPatrolIndex, -1), 0);
}

TEST_F(AITasksTest, PatrolWalksBackAndForth) {
    bb_.Set(bbkeys::kPatrolPoints, PositionList{{0, 0}, {2, 0}, {4, 0}});
    auto task = factory_.CreatePatrolTask();

    auto visit = [&](GridPosition at) {
        PlaceSelf(at);
        EXPECT_EQ(TickOnce(*task), BTStatus::Running);
        return bb_.GetOrDefault<int32_t>(bbkeys::kPatrolIndex, -1);
    };

    EXPECT_EQ(visit({0, 0}), 1);
    EXPECT_EQ(visit({2, 0}), 2);
    EXPECT_EQ(visit({4, 0}), 1);
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kPatrolDirection, 0), -1);
    EXPECT_EQ(visit({2, 0}), 0);
    EXPECT_EQ(visit({0, 0}), 1);
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kPatrolDirection, 0), 1);
}

TEST_F(AITasksTest, PatrolArrivalClearsPath) {
    bb_.Set(bbkeys::kPatrolPoints, PositionList{{0, 0}, {3, 0}});
    bb_.Set(bbkeys::kCurrentPath, Path{{{1, 0}}});
    bb_.Set<int32_t>(bbkeys::kPathIndex, 1);
    auto task = factory_.CreatePatrolTask();

    TickOnce(*task);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));
    EXPECT_FALSE(bb_.Has(bbkeys::kPathIndex));
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetPosition, GridPosition{-1, -1}), (GridPosition{3, 0}));
}

TEST_F(AITasksTest, PatrolSinglePointStaysPut) {
    bb_.Set(bbkeys::kPatrolPoints, PositionList{{0, 0}});
    auto task = factory_.CreatePatrolTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Running);
    EXPECT_EQ(bb_.GetOrDefault<int32_t>(bbkeys::kPatrolIndex, -1), 0);
}

TEST_F(AITasksTest, PatrolFailsWithoutPoints) {
    auto task = factory_.CreatePatrolTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);

    bb_.Set(bbkeys::kPatrolPoints, PositionList{});
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
}

// ═══════════════════════════════════════════════════════════════════════════
// MoveAway
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, MoveAwayTakesBestCardinal) {
    PlaceSelf({2, 2});
    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 2});
    auto task = factory_.CreateMoveAwayTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_EQ(SelfPosition(), (GridPosition{3, 2}));
}

TEST_F(AITasksTest, MoveAwayFallsBackToOtherCardinals) {
    PlaceSelf({2, 2});
    movement_.blocked.insert(GridPosition{3, 2});
    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 2});
    auto task = factory_.CreateMoveAwayTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    auto pos = SelfPosition();
    EXPECT_NE(pos, (GridPosition{3, 2}));
    EXPECT_EQ(manhattanDistance(pos, GridPosition{2, 2}), 1);
}

TEST_F(AITasksTest, MoveAwayFailsWhenBoxedIn) {
    PlaceSelf({2, 2});
    for (auto dir : kCardinalDirections) {
        auto off = directionOffset(dir);
        movement_.blocked.insert(GridPosition{2 + off.x, 2 + off.y});
    }
    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 2});
    auto task = factory_.CreateMoveAwayTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_EQ(movement_.calls, 4);
}

TEST_F(AITasksTest, MoveAwayFailsWithoutThreat) {
    auto task = factory_.CreateMoveAwayTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
}

// ═══════════════════════════════════════════════════════════════════════════
// Combat
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, AttackInRangeSucceeds) {
    positions_.Add(other_, 1, 0);
    healths_.Add(other_, 10, 10);
    bb_.Set(bbkeys::kTargetEntity, other_);
    auto task = factory_.CreateAttackTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_TRUE(bb_.GetOrDefault(bbkeys::kInCombat, false));
}

TEST_F(AITasksTest, AttackOutOfRangeMarksTargetPosition) {
    positions_.Add(other_, 5, 0);
    bb_.Set(bbkeys::kTargetEntity, other_);
    auto task = factory_.CreateAttackTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetPosition, GridPosition{-1, -1}), (GridPosition{5, 0}));
    EXPECT_FALSE(bb_.Has(bbkeys::kInCombat));
}

TEST_F(AITasksTest, AttackFailsOnDeadTarget) {
    positions_.Add(other_, 1, 0);
    healths_.Add(other_, 0, 10);
    bb_.Set(bbkeys::kTargetEntity, other_);
    auto task = factory_.CreateAttackTask();

    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
}

TEST_F(AITasksTest, AttackFailsWithoutTarget) {
    auto task = factory_.CreateAttackTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);

    bb_.Set(bbkeys::kTargetEntity, Entity::invalid());
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
}

TEST_F(AITasksTest, CanAttackChecksMeleeRange) {
    positions_.Add(other_, 0, 1);
    bb_.Set(bbkeys::kTargetEntity, other_);
    auto condition = factory_.CreateCanAttackCondition();

    EXPECT_EQ(TickOnce(*condition), BTStatus::Success);
    positions_.Get(other_) = {1, 1};
    EXPECT_EQ(TickOnce(*condition), BTStatus::Failure);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sensing
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, CanSeeHostileNeedsVisibleHostile) {
    auto condition = factory_.CreateCanSeeHostileCondition();
    EXPECT_EQ(TickOnce(*condition), BTStatus::Failure);

    bb_.Set<MemorySystem*>(bbkeys::kMemorySystem, &memory_);
    EXPECT_EQ(TickOnce(*condition), BTStatus::Failure);

    memory_.RememberEntity(other_, Relationship::Hostile);
    EXPECT_EQ(TickOnce(*condition), BTStatus::Success);

    memory_.LoseSightOf(other_);
    EXPECT_EQ(TickOnce(*condition), BTStatus::Failure);
}

TEST_F(AITasksTest, CanSeeHostileIgnoresFriends) {
    bb_.Set<MemorySystem*>(bbkeys::kMemorySystem, &memory_);
    memory_.RememberEntity(other_, Relationship::Friendly);

    auto condition = factory_.CreateCanSeeHostileCondition();
    EXPECT_EQ(TickOnce(*condition), BTStatus::Failure);
}

TEST_F(AITasksTest, IsHealthLowUsesThreshold) {
    healths_.Add(self_, 2, 10);
    auto low = factory_.CreateIsHealthLowCondition();
    EXPECT_EQ(TickOnce(*low), BTStatus::Success);

    healths_.Get(self_).Set(5);
    EXPECT_EQ(TickOnce(*low), BTStatus::Failure);

    auto cautious = factory_.CreateIsHealthLowCondition(0.6f);
    EXPECT_EQ(TickOnce(*cautious), BTStatus::Success);
}

TEST_F(AITasksTest, IsHealthLowFailsWithoutHealth) {
    auto low = factory_.CreateIsHealthLowCondition();
    EXPECT_EQ(TickOnce(*low), BTStatus::Failure);
}

TEST_F(AITasksTest, HasTargetAndIsAtTarget) {
    auto hasTarget = factory_.CreateHasTargetCondition();
    auto atTarget = factory_.CreateIsAtTargetCondition();
    EXPECT_EQ(TickOnce(*hasTarget), BTStatus::Failure);
    EXPECT_EQ(TickOnce(*atTarget), BTStatus::Failure);

    bb_.Set(bbkeys::kTargetEntity, other_);
    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 0});
    EXPECT_EQ(TickOnce(*hasTarget), BTStatus::Success);
    EXPECT_EQ(TickOnce(*atTarget), BTStatus::Success);

    bb_.Set(bbkeys::kTargetPosition, GridPosition{0, 1});
    EXPECT_EQ(TickOnce(*atTarget), BTStatus::Failure);
}

TEST_F(AITasksTest, UpdateTargetPicksClosestVisible) {
    const Entity distant{3, 0};
    const Entity nearby{4, 0};
    const Entity hidden{5, 0};
    const Entity friendly{6, 0};

    memory_.RememberEntity(distant, Relationship::Hostile, {GridPosition{10, 0}, {}, {}, {}});
    memory_.RememberEntity(nearby, Relationship::Hostile, {GridPosition{3, 0}, {}, {}, {}});
    memory_.RememberEntity(hidden, Relationship::Hostile, {GridPosition{1, 0}, {}, {}, {}});
    memory_.LoseSightOf(hidden);
    memory_.RememberEntity(friendly, Relationship::Friendly, {GridPosition{0, 1}, {}, {}, {}});
    bb_.Set<MemorySystem*>(bbkeys::kMemorySystem, &memory_);

    auto task = factory_.CreateUpdateTargetFromMemoryTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetEntity, Entity::invalid()), nearby);
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetPosition, GridPosition{-1, -1}), (GridPosition{3, 0}));

    auto friends = factory_.CreateUpdateTargetFromMemoryTask(Relationship::Friendly);
    EXPECT_EQ(TickOnce(*friends), BTStatus::Success);
    EXPECT_EQ(bb_.GetOrDefault(bbkeys::kTargetEntity, Entity::invalid()), friendly);
}

TEST_F(AITasksTest, UpdateTargetSkipsUnknownPositions) {
    memory_.RememberEntity(other_, Relationship::Hostile);
    bb_.Set<MemorySystem*>(bbkeys::kMemorySystem, &memory_);

    auto task = factory_.CreateUpdateTargetFromMemoryTask();
    EXPECT_EQ(TickOnce(*task), BTStatus::Failure);
    EXPECT_FALSE(bb_.Has(bbkeys::kTargetEntity));
}

// ═══════════════════════════════════════════════════════════════════════════
// Blackboard utilities
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AITasksTest, ClearPathAndTarget) {
    bb_.Set(bbkeys::kCurrentPath, Path{{{1, 0}}});
    bb_.Set<int32_t>(bbkeys::kPathIndex, 0);
    bb_.Set<int32_t>(bbkeys::kStuckCounter, 2);
    bb_.Set(bbkeys::kTargetEntity, other_);
    bb_.Set(bbkeys::kTargetPosition, GridPosition{1, 0});

    EXPECT_EQ(TickOnce(*factory_.CreateClearPathTask()), BTStatus::Success);
    EXPECT_FALSE(bb_.Has(bbkeys::kCurrentPath));
    EXPECT_FALSE(bb_.Has(bbkeys::kPathIndex));
    EXPECT_FALSE(bb_.Has(bbkeys::kStuckCounter));
    EXPECT_TRUE(bb_.Has(bbkeys::kTargetEntity));

    EXPECT_EQ(TickOnce(*factory_.CreateClearTargetTask()), BTStatus::Success);
    EXPECT_EQ(bb_.Size(), 0u);
}

TEST_F(AITasksTest, SetValueWritesKey) {
    auto task = factory_.CreateSetValueTask(bbkeys::kShouldFlee, BlackboardValue{true});
    EXPECT_EQ(TickOnce(*task), BTStatus::Success);
    EXPECT_TRUE(bb_.IsConditionMet(bbkeys::kShouldFlee, BlackboardValue{true}));
}

TEST_F(AITasksTest, TasksFailWithoutBlackboard) {
    auto ctx = MakeContext();
    ctx.blackboard = nullptr;

    EXPECT_EQ(factory_.CreateMoveToTargetTask()->Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(factory_.CreatePatrolTask()->Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(factory_.CreateAttackTask()->Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(factory_.CreateSetValueTask("k", BlackboardValue{1})->Tick(ctx), BTStatus::Failure);
}
