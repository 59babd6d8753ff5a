#pragma once

/// @file behavior_tree.hpp
/// @brief Behavior Tree framework: nodes, execution context and the tree.
///
/// Polymorphic nodes for runtime composition.  Composite nodes
/// (Sequence, Selector, Parallel), decorator nodes (Inverter, Succeeder,
/// Failer, Repeater, UntilFail) and leaf nodes (Action, Condition, Wait)
/// form a tree that is ticked each AI update.  A node returning Running
/// keeps its resume state and continues from there on the next tick.

#include "npc/ecs/entity.hpp"
#include "npc/foundation/npc_result.hpp"
#include "npc/game/ai_types.hpp"
#include "npc/game/blackboard.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace npc::game {

class IMovement;

// ═══════════════════════════════════════════════════════════════════════════
// BTContext
// ═══════════════════════════════════════════════════════════════════════════

/// Execution context passed to every BT node during a tick.
struct BTContext {
    ecs::Entity entity;
    float deltaTime = 0.0f;  ///< Milliseconds since the previous tick.
    Blackboard* blackboard = nullptr;
    IMovement* movement = nullptr;
};

/// Caller-supplied part of a context; the tree adds entity and blackboard.
struct BTTickParams {
    IMovement* movement = nullptr;
    float deltaTime = 0.0f;
};

// ═══════════════════════════════════════════════════════════════════════════
// BTNode base class
// ═══════════════════════════════════════════════════════════════════════════

/// Abstract base for all Behavior Tree nodes.
class BTNode {
public:
    virtual ~BTNode() = default;

    /// Execute this node for one tick.  Never throws; domain failure is
    /// reported as BTStatus::Failure.
    virtual BTStatus Tick(BTContext& context) = 0;

    /// Reset node state (called when parent interrupts/restarts).
    virtual void Reset() {}

    /// Check the subtree rooted here for structural defects.
    [[nodiscard]] virtual foundation::NpcResult<void> Validate() const {
        return foundation::NpcResult<void>::ok();
    }

    [[nodiscard]] virtual std::string_view Name() const { return "Node"; }

protected:
    static foundation::NpcResult<void> StructureError(std::string_view node,
                                                      std::string_view problem) {
        return foundation::NpcResult<void>::err(foundation::NpcError(
            foundation::ErrorCode::InvalidTreeStructure,
            std::string(node) + ": " + std::string(problem), std::string(node)));
    }

    /// Tick a possibly-null child; a missing child fails.
    static BTStatus TickChild(BTNode* child, BTContext& context) {
        return child ? child->Tick(context) : BTStatus::Failure;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Composite nodes
// ═══════════════════════════════════════════════════════════════════════════

/// Common child ownership for Sequence, Selector and Parallel.
class BTComposite : public BTNode {
public:
    void AddChild(std::unique_ptr<BTNode> child) { children_.push_back(std::move(child)); }

    /// Detach and destroy @p child, rewinding this node's resume state.
    /// @return false if @p child is not a direct child.
    bool RemoveChild(const BTNode* child) {
        auto it = std::find_if(children_.begin(), children_.end(),
                               [child](const auto& owned) { return owned.get() == child; });
        if (it == children_.end()) {
            return false;
        }
        children_.erase(it);
        Reset();
        return true;
    }

    [[nodiscard]] std::size_t ChildCount() const { return children_.size(); }

    [[nodiscard]] const std::vector<std::unique_ptr<BTNode>>& GetChildren() const {
        return children_;
    }

    void Reset() override {
        for (auto& child : children_) {
            if (child) {
                child->Reset();
            }
        }
    }

    [[nodiscard]] foundation::NpcResult<void> Validate() const override {
        for (const auto& child : children_) {
            if (!child) {
                return StructureError(Name(), "null child");
            }
            auto result = child->Validate();
            if (!result) {
                return result;
            }
        }
        return foundation::NpcResult<void>::ok();
    }

protected:
    std::vector<std::unique_ptr<BTNode>> children_;
};

/// Sequence: runs children left-to-right.
/// Succeeds when ALL children succeed (an empty sequence succeeds).
/// Fails immediately on the first child failure.
/// Returns Running when a child returns Running (resumes from that child).
class BTSequence : public BTComposite {
public:
    BTStatus Tick(BTContext& context) override {
        while (currentChild_ < children_.size()) {
            auto status = TickChild(children_[currentChild_].get(), context);
            if (status == BTStatus::Running) {
                return BTStatus::Running;
            }
            if (status == BTStatus::Failure) {
                currentChild_ = 0;
                return BTStatus::Failure;
            }
            ++currentChild_;
        }
        currentChild_ = 0;
        return BTStatus::Success;
    }

    void Reset() override {
        currentChild_ = 0;
        BTComposite::Reset();
    }

    [[nodiscard]] std::string_view Name() const override { return "Sequence"; }

private:
    std::size_t currentChild_ = 0;
};

/// Selector: tries children left-to-right.
/// Succeeds immediately on the first child success.
/// Fails when ALL children fail (an empty selector fails).
/// Returns Running when a child returns Running (resumes from that child).
class BTSelector : public BTComposite {
public:
    BTStatus Tick(BTContext& context) override {
        while (currentChild_ < children_.size()) {
            auto status = TickChild(children_[currentChild_].get(), context);
            if (status == BTStatus::Running) {
                return BTStatus::Running;
            }
            if (status == BTStatus::Success) {
                currentChild_ = 0;
                return BTStatus::Success;
            }
            ++currentChild_;
        }
        currentChild_ = 0;
        return BTStatus::Failure;
    }

    void Reset() override {
        currentChild_ = 0;
        BTComposite::Reset();
    }

    [[nodiscard]] std::string_view Name() const override { return "Selector"; }

private:
    std::size_t currentChild_ = 0;
};

/// Parallel: ticks ALL children every call, including children that
/// finished on an earlier call.
/// Result depends on the configured policy:
///   RequireAll: Failure if any child failed, Success if all succeeded.
///   RequireOne: Success if any child succeeded, Failure if all failed.
///   Otherwise Running.
class BTParallel : public BTComposite {
public:
    explicit BTParallel(BTParallelPolicy policy = BTParallelPolicy::RequireAll) : policy_(policy) {}

    BTStatus Tick(BTContext& context) override {
        std::size_t successCount = 0;
        std::size_t failureCount = 0;

        for (auto& child : children_) {
            auto status = TickChild(child.get(), context);
            if (status == BTStatus::Success) {
                ++successCount;
            } else if (status == BTStatus::Failure) {
                ++failureCount;
            }
        }

        if (policy_ == BTParallelPolicy::RequireAll) {
            if (failureCount > 0) {
                return BTStatus::Failure;
            }
            if (successCount == children_.size()) {
                return BTStatus::Success;
            }
        } else {
            if (successCount > 0) {
                return BTStatus::Success;
            }
            if (failureCount == children_.size()) {
                return BTStatus::Failure;
            }
        }

        return BTStatus::Running;
    }

    [[nodiscard]] BTParallelPolicy GetPolicy() const { return policy_; }

    [[nodiscard]] std::string_view Name() const override { return "Parallel"; }

private:
    BTParallelPolicy policy_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Decorator nodes
// ═══════════════════════════════════════════════════════════════════════════

/// Single-child ownership shared by all decorators.
class BTDecorator : public BTNode {
public:
    explicit BTDecorator(std::unique_ptr<BTNode> child) : child_(std::move(child)) {}

    void Reset() override {
        if (child_) {
            child_->Reset();
        }
    }

    [[nodiscard]] foundation::NpcResult<void> Validate() const override {
        if (!child_) {
            return StructureError(Name(), "decorator has no child");
        }
        return child_->Validate();
    }

    [[nodiscard]] const BTNode* GetChild() const { return child_.get(); }

protected:
    std::unique_ptr<BTNode> child_;
};

/// Inverter: inverts the child result (Success <-> Failure).
/// Running passes through unchanged.
class BTInverter : public BTDecorator {
public:
    using BTDecorator::BTDecorator;

    BTStatus Tick(BTContext& context) override {
        if (!child_) {
            return BTStatus::Failure;
        }
        auto status = child_->Tick(context);
        if (status == BTStatus::Success) {
            return BTStatus::Failure;
        }
        if (status == BTStatus::Failure) {
            return BTStatus::Success;
        }
        return BTStatus::Running;
    }

    [[nodiscard]] std::string_view Name() const override { return "Inverter"; }
};

/// Succeeder: any finished child result becomes Success.
class BTSucceeder : public BTDecorator {
public:
    using BTDecorator::BTDecorator;

    BTStatus Tick(BTContext& context) override {
        if (!child_) {
            return BTStatus::Failure;
        }
        return child_->Tick(context) == BTStatus::Running ? BTStatus::Running : BTStatus::Success;
    }

    [[nodiscard]] std::string_view Name() const override { return "Succeeder"; }
};

/// Failer: any finished child result becomes Failure.
class BTFailer : public BTDecorator {
public:
    using BTDecorator::BTDecorator;

    BTStatus Tick(BTContext& context) override {
        if (!child_) {
            return BTStatus::Failure;
        }
        return child_->Tick(context) == BTStatus::Running ? BTStatus::Running : BTStatus::Failure;
    }

    [[nodiscard]] std::string_view Name() const override { return "Failer"; }
};

/// Repeater: repeats child execution up to maxRepeats times, one child
/// tick per call.
/// Returns Running while repetitions remain.
/// Returns Success once maxRepeats runs have completed (either result).
/// If maxRepeats is 0, repeats indefinitely (always returns Running).
class BTRepeater : public BTDecorator {
public:
    explicit BTRepeater(std::unique_ptr<BTNode> child, uint32_t maxRepeats = 0)
        : BTDecorator(std::move(child)), maxRepeats_(maxRepeats) {}

    BTStatus Tick(BTContext& context) override {
        if (!child_) {
            return BTStatus::Failure;
        }
        auto status = child_->Tick(context);
        if (status == BTStatus::Running) {
            return BTStatus::Running;
        }

        // Child finished (success or failure). Count the iteration.
        ++currentCount_;
        child_->Reset();

        if (maxRepeats_ > 0 && currentCount_ >= maxRepeats_) {
            currentCount_ = 0;
            return BTStatus::Success;
        }

        return BTStatus::Running;
    }

    void Reset() override {
        currentCount_ = 0;
        BTDecorator::Reset();
    }

    [[nodiscard]] uint32_t MaxRepeats() const { return maxRepeats_; }
    [[nodiscard]] uint32_t CurrentCount() const { return currentCount_; }

    [[nodiscard]] std::string_view Name() const override { return "Repeater"; }

private:
    uint32_t maxRepeats_ = 0;
    uint32_t currentCount_ = 0;
};

/// UntilFail: re-runs the child until it fails, then succeeds.
class BTUntilFail : public BTDecorator {
public:
    using BTDecorator::BTDecorator;

    BTStatus Tick(BTContext& context) override {
        if (!child_) {
            return BTStatus::Failure;
        }
        auto status = child_->Tick(context);
        if (status == BTStatus::Failure) {
            child_->Reset();
            return BTStatus::Success;
        }
        if (status == BTStatus::Success) {
            child_->Reset();
        }
        return BTStatus::Running;
    }

    [[nodiscard]] std::string_view Name() const override { return "UntilFail"; }
};

// ═══════════════════════════════════════════════════════════════════════════
// Leaf nodes
// ═══════════════════════════════════════════════════════════════════════════

/// Condition: evaluates a predicate and returns Success or Failure.
///
/// Never returns Running: conditions are instantaneous checks.
class BTCondition : public BTNode {
public:
    using Predicate = std::function<bool(BTContext&)>;

    explicit BTCondition(Predicate predicate) : predicate_(std::move(predicate)) {}

    BTStatus Tick(BTContext& context) override {
        if (!predicate_) {
            return BTStatus::Failure;
        }
        return predicate_(context) ? BTStatus::Success : BTStatus::Failure;
    }

    [[nodiscard]] foundation::NpcResult<void> Validate() const override {
        if (!predicate_) {
            return StructureError(Name(), "condition has no predicate");
        }
        return foundation::NpcResult<void>::ok();
    }

    [[nodiscard]] std::string_view Name() const override { return "Condition"; }

private:
    Predicate predicate_;
};

/// Action: performs a game action and returns the result.
///
/// Actions may return Running to indicate multi-tick operations.  The
/// optional reset hook runs when the tree rewinds the action.
class BTAction : public BTNode {
public:
    using ActionFunc = std::function<BTStatus(BTContext&)>;
    using ResetFunc = std::function<void()>;

    explicit BTAction(ActionFunc action, ResetFunc onReset = {})
        : action_(std::move(action)), onReset_(std::move(onReset)) {}

    BTStatus Tick(BTContext& context) override {
        if (!action_) {
            return BTStatus::Failure;
        }
        return action_(context);
    }

    void Reset() override {
        if (onReset_) {
            onReset_();
        }
    }

    [[nodiscard]] foundation::NpcResult<void> Validate() const override {
        if (!action_) {
            return StructureError(Name(), "action has no body");
        }
        return foundation::NpcResult<void>::ok();
    }

    [[nodiscard]] std::string_view Name() const override { return "Action"; }

private:
    ActionFunc action_;
    ResetFunc onReset_;
};

/// Wait: Running until @p durationMs of accumulated deltaTime has
/// elapsed, then Success (and the timer restarts).  A duration of zero
/// or less waits until the tree is reset or its branch is abandoned.
class BTWait : public BTNode {
public:
    explicit BTWait(float durationMs = -1.0f) : duration_(durationMs) {}

    BTStatus Tick(BTContext& context) override {
        if (duration_ <= 0.0f) {
            return BTStatus::Running;
        }
        elapsed_ += context.deltaTime;
        if (elapsed_ >= duration_) {
            elapsed_ = 0.0f;
            return BTStatus::Success;
        }
        return BTStatus::Running;
    }

    void Reset() override { elapsed_ = 0.0f; }

    [[nodiscard]] float Duration() const { return duration_; }
    [[nodiscard]] float Elapsed() const { return elapsed_; }

    [[nodiscard]] std::string_view Name() const override { return "Wait"; }

private:
    float duration_;
    float elapsed_ = 0.0f;
};

// ═══════════════════════════════════════════════════════════════════════════
// BehaviorTree
// ═══════════════════════════════════════════════════════════════════════════

/// Binds one root node and one blackboard to one entity.
class BehaviorTree {
    /// Restricts construction to Create() while keeping make_unique usable.
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    BehaviorTree(CreateKey, std::unique_ptr<BTNode> root, ecs::Entity entity);

    /// Validate @p root and build a tree for @p entity.
    /// @return MissingRoot for a null root, InvalidTreeStructure for a
    ///         defective subtree.
    static foundation::NpcResult<std::unique_ptr<BehaviorTree>> Create(
        std::unique_ptr<BTNode> root, ecs::Entity entity);

    BehaviorTree(const BehaviorTree&) = delete;
    BehaviorTree& operator=(const BehaviorTree&) = delete;

    /// Tick the root once with the bound entity and blackboard.
    BTStatus Tick(const BTTickParams& params);

    /// Replace the root.  Resume state of the old tree is discarded; the
    /// blackboard is kept.  On error the current root stays in place.
    foundation::NpcResult<void> SetRoot(std::unique_ptr<BTNode> root);

    /// Rewind every node to its initial state.
    void Reset();

    [[nodiscard]] Blackboard& GetBlackboard() noexcept { return blackboard_; }
    [[nodiscard]] const Blackboard& GetBlackboard() const noexcept { return blackboard_; }

    [[nodiscard]] BTNode* GetRoot() const noexcept { return root_.get(); }
    [[nodiscard]] ecs::Entity GetEntity() const noexcept { return entity_; }

private:
    static foundation::NpcResult<void> ValidateRoot(const BTNode* root);

    std::unique_ptr<BTNode> root_;
    ecs::Entity entity_;
    Blackboard blackboard_;
};

}  // namespace npc::game
