/// @file behavior_tree_test.cpp
/// @brief Unit tests for behavior tree nodes and the BehaviorTree wrapper.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <type_traits>
#include <vector>

#include "npc/foundation/error_code.hpp"
#include "npc/game/behavior_tree.hpp"

using namespace npc::game;
using npc::ecs::Entity;
using npc::foundation::ErrorCode;

namespace {

std::unique_ptr<BTNode> Succeed() {
    return std::make_unique<BTAction>([](BTContext&) { return BTStatus::Success; });
}

std::unique_ptr<BTNode> Fail() {
    return std::make_unique<BTAction>([](BTContext&) { return BTStatus::Failure; });
}

std::unique_ptr<BTNode> Run() {
    return std::make_unique<BTAction>([](BTContext&) { return BTStatus::Running; });
}

/// Action that counts its ticks and returns a fixed status.
std::unique_ptr<BTNode> Counting(int& counter, BTStatus status) {
    return std::make_unique<BTAction>([&counter, status](BTContext&) {
        ++counter;
        return status;
    });
}

/// Action that replays a scripted list of statuses, then repeats the last.
std::unique_ptr<BTNode> Scripted(std::vector<BTStatus> script) {
    auto index = std::make_shared<std::size_t>(0);
    return std::make_unique<BTAction>([script = std::move(script), index](BTContext&) {
        auto status = script[std::min(*index, script.size() - 1)];
        ++*index;
        return status;
    });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Leaf nodes
// ═══════════════════════════════════════════════════════════════════════════

TEST(BTConditionTest, TruePredicateReturnsSuccess) {
    BTCondition node([](BTContext&) { return true; });
    BTContext ctx;
    EXPECT_EQ(node.Tick(ctx), BTStatus::Success);
}

TEST(BTConditionTest, FalsePredicateReturnsFailure) {
    BTCondition node([](BTContext&) { return false; });
    BTContext ctx;
    EXPECT_EQ(node.Tick(ctx), BTStatus::Failure);
}

TEST(BTConditionTest, EmptyPredicateFailsValidation) {
    BTCondition node(nullptr);
    auto result = node.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidTreeStructure);

    BTContext ctx;
    EXPECT_EQ(node.Tick(ctx), BTStatus::Failure);
}

TEST(BTActionTest, ReturnsActionResult) {
    BTContext ctx;
    EXPECT_EQ(Succeed()->Tick(ctx), BTStatus::Success);
    EXPECT_EQ(Fail()->Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(::Run()->Tick(ctx), BTStatus::Running);
}

TEST(BTActionTest, AccessesBlackboard) {
    BTAction action([](BTContext& ctx) -> BTStatus {
        auto* val = ctx.blackboard->Get<int32_t>("counter");
        if (!val) {
            return BTStatus::Failure;
        }
        ctx.blackboard->Set<int32_t>("counter", *val + 1);
        return BTStatus::Success;
    });

    Blackboard bb;
    bb.Set<int32_t>("counter", 0);
    BTContext ctx;
    ctx.blackboard = &bb;

    EXPECT_EQ(action.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(bb.GetOrDefault<int32_t>("counter", -1), 1);
}

TEST(BTActionTest, ResetHookRuns) {
    int resets = 0;
    BTAction action([](BTContext&) { return BTStatus::Running; }, [&] { ++resets; });
    action.Reset();
    EXPECT_EQ(resets, 1);
}

TEST(BTWaitTest, RunsUntilDurationElapsed) {
    BTWait wait(100.0f);
    BTContext ctx;
    ctx.deltaTime = 50.0f;

    EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
    EXPECT_FLOAT_EQ(wait.Elapsed(), 50.0f);
    EXPECT_EQ(wait.Tick(ctx), BTStatus::Success);
    EXPECT_FLOAT_EQ(wait.Elapsed(), 0.0f);
}

TEST(BTWaitTest, RestartsAfterCompletion) {
    BTWait wait(100.0f);
    BTContext ctx;
    ctx.deltaTime = 60.0f;

    EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(wait.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
}

TEST(BTWaitTest, ZeroDurationWaitsIndefinitely) {
    BTWait wait(0.0f);
    BTContext ctx;
    ctx.deltaTime = 10000.0f;
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
    }
}

TEST(BTWaitTest, NegativeDurationNeverCompletes) {
    BTWait wait(-1.0f);
    BTContext ctx;
    ctx.deltaTime = 10000.0f;
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
    }
}

TEST(BTWaitTest, DefaultWaitsIndefinitely) {
    BTWait wait;
    BTContext ctx;
    ctx.deltaTime = 10000.0f;
    EXPECT_LT(wait.Duration(), 0.0f);
    EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
}

TEST(BTWaitTest, ResetClearsElapsed) {
    BTWait wait(100.0f);
    BTContext ctx;
    ctx.deltaTime = 70.0f;
    wait.Tick(ctx);
    wait.Reset();

    EXPECT_EQ(wait.Tick(ctx), BTStatus::Running);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sequence
// ═══════════════════════════════════════════════════════════════════════════

TEST(BTSequenceTest, EmptySequenceSucceeds) {
    BTSequence seq;
    BTContext ctx;
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Success);
}

TEST(BTSequenceTest, FailureStopsExecution) {
    int calls = 0;
    BTSequence seq;
    seq.AddChild(Counting(calls, BTStatus::Success));
    seq.AddChild(Counting(calls, BTStatus::Failure));
    seq.AddChild(Counting(calls, BTStatus::Success));

    BTContext ctx;
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(calls, 2);
}

TEST(BTSequenceTest, ResumesFromRunningChild) {
    int first = 0;
    BTSequence seq;
    seq.AddChild(Counting(first, BTStatus::Success));
    seq.AddChild(Scripted({BTStatus::Running, BTStatus::Success}));

    BTContext ctx;
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Success);
    // The first child is not re-ticked while the second is running.
    EXPECT_EQ(first, 1);
}

TEST(BTSequenceTest, RestartsAfterCompletion) {
    int first = 0;
    BTSequence seq;
    seq.AddChild(Counting(first, BTStatus::Success));
    seq.AddChild(Succeed());

    BTContext ctx;
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(first, 2);
}

TEST(BTSequenceTest, ResetRewindsToFirstChild) {
    int first = 0;
    BTSequence seq;
    seq.AddChild(Counting(first, BTStatus::Success));
    seq.AddChild(::Run());

    BTContext ctx;
    seq.Tick(ctx);
    seq.Reset();
    seq.Tick(ctx);
    EXPECT_EQ(first, 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Selector
// ═══════════════════════════════════════════════════════════════════════════

TEST(BTSelectorTest, EmptySelectorFails) {
    BTSelector sel;
    BTContext ctx;
    EXPECT_EQ(sel.Tick(ctx), BTStatus::Failure);
}

TEST(BTSelectorTest, FirstSuccessStopsExecution) {
    int calls = 0;
    BTSelector sel;
    sel.AddChild(Counting(calls, BTStatus::Failure));
    sel.AddChild(Counting(calls, BTStatus::Success));
    sel.AddChild(Counting(calls, BTStatus::Success));

    BTContext ctx;
    EXPECT_EQ(sel.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(calls, 2);
}

TEST(BTSelectorTest, AllFailReturnsFailure) {
    BTSelector sel;
    sel.AddChild(Fail());
    sel.AddChild(Fail());

    BTContext ctx;
    EXPECT_EQ(sel.Tick(ctx), BTStatus::Failure);
}

TEST(BTSelectorTest, ResumesFromRunningChild) {
    int first = 0;
    BTSelector sel;
    sel.AddChild(Counting(first, BTStatus::Failure));
    sel.AddChild(Scripted({BTStatus::Running, BTStatus::Success}));

    BTContext ctx;
    EXPECT_EQ(sel.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(sel.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(first, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Parallel
// ═══════════════════════════════════════════════════════════════════════════

TEST(BTParallelTest, RequireAllSucceeds) {
    BTParallel par(BTParallelPolicy::RequireAll);
    par.AddChild(Succeed());
    par.AddChild(Succeed());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Success);
}

TEST(BTParallelTest, RequireAllFailsOnAnyFailure) {
    BTParallel par(BTParallelPolicy::RequireAll);
    par.AddChild(::Run());
    par.AddChild(Fail());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Failure);
}

TEST(BTParallelTest, RequireAllRunningWhenNotAllDone) {
    BTParallel par(BTParallelPolicy::RequireAll);
    par.AddChild(Succeed());
    par.AddChild(::Run());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Running);
}

TEST(BTParallelTest, RequireOneSucceedsOnAnySuccess) {
    BTParallel par(BTParallelPolicy::RequireOne);
    par.AddChild(Fail());
    par.AddChild(::Run());
    par.AddChild(Succeed());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Success);
}

TEST(BTParallelTest, RequireOneFailsWhenAllFail) {
    BTParallel par(BTParallelPolicy::RequireOne);
    par.AddChild(Fail());
    par.AddChild(Fail());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Failure);
}

TEST(BTParallelTest, RequireOneRunningWhileUndecided) {
    BTParallel par(BTParallelPolicy::RequireOne);
    par.AddChild(Fail());
    par.AddChild(::Run());

    BTContext ctx;
    EXPECT_EQ(par.Tick(ctx), BTStatus::Running);
}

TEST(BTParallelTest, TicksFinishedChildrenEveryCall) {
    int done = 0;
    BTParallel par(BTParallelPolicy::RequireAll);
    par.AddChild(Counting(done, BTStatus::Success));
    par.AddChild(::Run());

    BTContext ctx;
    par.Tick(ctx);
    par.Tick(ctx);
    par.Tick(ctx);
    EXPECT_EQ(done, 3);
}

TEST(BTParallelTest, PolicyAccessor) {
    BTParallel par(BTParallelPolicy::RequireOne);
    EXPECT_EQ(par.GetPolicy(), BTParallelPolicy::RequireOne);
}

// ═══════════════════════════════════════════════════════════════════════════
// Decorators
// ═══════════════════════════════════════════════════════════════════════════

TEST(BTInverterTest, InvertsResults) {
    BTContext ctx;
    EXPECT_EQ(BTInverter(Succeed()).Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(BTInverter(Fail()).Tick(ctx), BTStatus::Success);
    EXPECT_EQ(BTInverter(::Run()).Tick(ctx), BTStatus::Running);
}

TEST(BTSucceederTest, FinishedResultBecomesSuccess) {
    BTContext ctx;
    EXPECT_EQ(BTSucceeder(Fail()).Tick(ctx), BTStatus::Success);
    EXPECT_EQ(BTSucceeder(Succeed()).Tick(ctx), BTStatus::Success);
    EXPECT_EQ(BTSucceeder(::Run()).Tick(ctx), BTStatus::Running);
}

TEST(BTFailerTest, FinishedResultBecomesFailure) {
    BTContext ctx;
    EXPECT_EQ(BTFailer(Succeed()).Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(BTFailer(Fail()).Tick(ctx), BTStatus::Failure);
    EXPECT_EQ(BTFailer(::Run()).Tick(ctx), BTStatus::Running);
}

TEST(BTRepeaterTest, FiniteRepeatCompletesAfterN) {
    int calls = 0;
    BTRepeater rep(Counting(calls, BTStatus::Success), 3);

    BTContext ctx;
    EXPECT_EQ(rep.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(rep.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(rep.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(rep.CurrentCount(), 0u);
}

TEST(BTRepeaterTest, CountsFailuresAsIterations) {
    BTRepeater rep(Fail(), 2);
    BTContext ctx;
    EXPECT_EQ(rep.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(rep.Tick(ctx), BTStatus::Success);
}

TEST(BTRepeaterTest, ZeroRepeatsRunsForever) {
    BTRepeater rep(Succeed(), 0);
    BTContext ctx;
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(rep.Tick(ctx), BTStatus::Running);
    }
    EXPECT_EQ(rep.CurrentCount(), 10u);
}

TEST(BTRepeaterTest, RunningChildDoesNotCount) {
    BTRepeater rep(::Run(), 2);
    BTContext ctx;
    rep.Tick(ctx);
    EXPECT_EQ(rep.CurrentCount(), 0u);
}

TEST(BTRepeaterTest, ResetClearsCount) {
    BTRepeater rep(Succeed(), 5);
    BTContext ctx;
    rep.Tick(ctx);
    rep.Tick(ctx);
    rep.Reset();
    EXPECT_EQ(rep.CurrentCount(), 0u);
    EXPECT_EQ(rep.MaxRepeats(), 5u);
}

TEST(BTUntilFailTest, RunsUntilChildFails) {
    BTUntilFail node(Scripted({BTStatus::Success, BTStatus::Running, BTStatus::Failure}));
    BTContext ctx;
    EXPECT_EQ(node.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(node.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(node.Tick(ctx), BTStatus::Success);
}

TEST(BTDecoratorTest, ChildlessDecoratorFailsValidation) {
    BTInverter inverter(nullptr);
    auto result = inverter.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidTreeStructure);
    ASSERT_NE(result.error().context<std::string>(), nullptr);
    EXPECT_EQ(*result.error().context<std::string>(), "Inverter");

    BTContext ctx;
    EXPECT_EQ(inverter.Tick(ctx), BTStatus::Failure);
}

TEST(BTDecoratorTest, ValidationRecursesThroughComposites) {
    BTSequence seq;
    seq.AddChild(Succeed());
    auto sel = std::make_unique<BTSelector>();
    sel->AddChild(std::make_unique<BTRepeater>(nullptr, 2));
    seq.AddChild(std::move(sel));

    auto result = seq.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*result.error().context<std::string>(), "Repeater");
}

TEST(BTCompositeTest, NullChildFailsValidation) {
    BTSelector sel;
    sel.AddChild(nullptr);
    EXPECT_TRUE(sel.Validate().hasError());
    EXPECT_EQ(sel.ChildCount(), 1u);
}

TEST(BTCompositeTest, GetChildrenListsInOrder) {
    BTSequence seq;
    seq.AddChild(Succeed());
    seq.AddChild(Fail());
    auto* second = seq.GetChildren()[1].get();

    ASSERT_EQ(seq.GetChildren().size(), 2u);
    BTContext ctx;
    EXPECT_EQ(second->Tick(ctx), BTStatus::Failure);
}

TEST(BTCompositeTest, RemoveChildRewindsResumeState) {
    int first = 0;
    int last = 0;
    BTSequence seq;
    seq.AddChild(Counting(first, BTStatus::Success));
    seq.AddChild(::Run());
    seq.AddChild(Counting(last, BTStatus::Success));
    BTContext ctx;

    EXPECT_EQ(seq.Tick(ctx), BTStatus::Running);
    EXPECT_EQ(first, 1);

    ASSERT_TRUE(seq.RemoveChild(seq.GetChildren()[1].get()));
    EXPECT_EQ(seq.ChildCount(), 2u);

    // Restarts from the first child instead of resuming at a stale index.
    EXPECT_EQ(seq.Tick(ctx), BTStatus::Success);
    EXPECT_EQ(first, 2);
    EXPECT_EQ(last, 1);
}

TEST(BTCompositeTest, RemoveUnknownChildIsRejected) {
    BTSelector sel;
    sel.AddChild(Succeed());
    auto stranger = Succeed();

    EXPECT_FALSE(sel.RemoveChild(stranger.get()));
    EXPECT_FALSE(sel.RemoveChild(nullptr));
    EXPECT_EQ(sel.ChildCount(), 1u);
}

static_assert(!std::is_constructible_v<BehaviorTree, std::unique_ptr<BTNode>, Entity>,
              "trees are built through BehaviorTree::Create");
static_assert(!std::is_copy_constructible_v<BehaviorTree>);

// ═══════════════════════════════════════════════════════════════════════════
// BehaviorTree
// ═══════════════════════════════════════════════════════════════════════════

TEST(BehaviorTreeTest, CreateRejectsNullRoot) {
    auto result = BehaviorTree::Create(nullptr, Entity(1, 0));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingRoot);
}

TEST(BehaviorTreeTest, CreateRejectsDefectiveSubtree) {
    auto root = std::make_unique<BTSequence>();
    root->AddChild(std::make_unique<BTSucceeder>(nullptr));

    auto result = BehaviorTree::Create(std::move(root), Entity(1, 0));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidTreeStructure);
}

TEST(BehaviorTreeTest, BlackboardBoundToEntity) {
    auto tree = BehaviorTree::Create(Succeed(), Entity(7, 2));
    ASSERT_TRUE(tree.hasValue());
    EXPECT_EQ(tree.value()->GetEntity(), Entity(7, 2));
    EXPECT_EQ(tree.value()->GetBlackboard().GetEntity(), Entity(7, 2));
}

TEST(BehaviorTreeTest, TickFillsContext) {
    Entity seen;
    float dt = 0.0f;
    Blackboard* board = nullptr;
    auto root = std::make_unique<BTAction>([&](BTContext& ctx) {
        seen = ctx.entity;
        dt = ctx.deltaTime;
        board = ctx.blackboard;
        return BTStatus::Success;
    });

    auto tree = std::move(BehaviorTree::Create(std::move(root), Entity(3, 0))).value();
    EXPECT_EQ(tree->Tick(BTTickParams{nullptr, 16.0f}), BTStatus::Success);
    EXPECT_EQ(seen, Entity(3, 0));
    EXPECT_FLOAT_EQ(dt, 16.0f);
    EXPECT_EQ(board, &tree->GetBlackboard());
}

TEST(BehaviorTreeTest, BlackboardPersistsAcrossTicks) {
    auto root = std::make_unique<BTAction>([](BTContext& ctx) {
        auto count = ctx.blackboard->GetOrDefault<int32_t>("ticks", 0);
        ctx.blackboard->Set<int32_t>("ticks", count + 1);
        return BTStatus::Success;
    });
    auto tree = std::move(BehaviorTree::Create(std::move(root), Entity(1, 0))).value();

    tree->Tick({});
    tree->Tick({});
    EXPECT_EQ(tree->GetBlackboard().GetOrDefault<int32_t>("ticks", 0), 2);
}

TEST(BehaviorTreeTest, SetRootKeepsOldRootOnError) {
    auto tree = std::move(BehaviorTree::Create(Fail(), Entity(1, 0))).value();
    auto* original = tree->GetRoot();

    auto bad = tree->SetRoot(std::make_unique<BTInverter>(nullptr));
    EXPECT_TRUE(bad.hasError());
    EXPECT_EQ(tree->GetRoot(), original);

    auto good = tree->SetRoot(Succeed());
    EXPECT_TRUE(good.hasValue());
    EXPECT_EQ(tree->Tick({}), BTStatus::Success);
}

TEST(BehaviorTreeTest, SetRootKeepsBlackboard) {
    auto tree = std::move(BehaviorTree::Create(Fail(), Entity(1, 0))).value();
    tree->GetBlackboard().Set(bbkeys::kInCombat, true);

    ASSERT_TRUE(tree->SetRoot(Succeed()).hasValue());
    EXPECT_TRUE(tree->GetBlackboard().GetOrDefault(bbkeys::kInCombat, false));
}

TEST(BehaviorTreeTest, ResetRewindsRunningNodes) {
    int first = 0;
    auto root = std::make_unique<BTSequence>();
    root->AddChild(Counting(first, BTStatus::Success));
    root->AddChild(::Run());
    auto tree = std::move(BehaviorTree::Create(std::move(root), Entity(1, 0))).value();

    tree->Tick({});
    tree->Tick({});
    EXPECT_EQ(first, 1);

    tree->Reset();
    tree->Tick({});
    EXPECT_EQ(first, 2);
}

TEST(BTStatusTest, Names) {
    EXPECT_EQ(btStatusName(BTStatus::Success), "success");
    EXPECT_EQ(btStatusName(BTStatus::Failure), "failure");
    EXPECT_EQ(btStatusName(BTStatus::Running), "running");
}
