/// @file behavior_tree.cpp
/// @brief BehaviorTree construction, validation and ticking.

#include "npc/game/behavior_tree.hpp"

namespace npc::game {

using foundation::ErrorCode;
using foundation::NpcError;
using foundation::NpcResult;

BehaviorTree::BehaviorTree(CreateKey, std::unique_ptr<BTNode> root, ecs::Entity entity)
    : root_(std::move(root)), entity_(entity), blackboard_(entity) {}

NpcResult<void> BehaviorTree::ValidateRoot(const BTNode* root) {
    if (!root) {
        return NpcResult<void>::err(
            NpcError(ErrorCode::MissingRoot, "behavior tree requires a root node"));
    }
    return root->Validate();
}

NpcResult<std::unique_ptr<BehaviorTree>> BehaviorTree::Create(std::unique_ptr<BTNode> root,
                                                              ecs::Entity entity) {
    auto valid = ValidateRoot(root.get());
    if (!valid) {
        return NpcResult<std::unique_ptr<BehaviorTree>>::err(valid.error());
    }
    return NpcResult<std::unique_ptr<BehaviorTree>>::ok(
        std::make_unique<BehaviorTree>(CreateKey{}, std::move(root), entity));
}

BTStatus BehaviorTree::Tick(const BTTickParams& params) {
    if (!root_) {
        return BTStatus::Failure;
    }

    BTContext context;
    context.entity = entity_;
    context.deltaTime = params.deltaTime;
    context.blackboard = &blackboard_;
    context.movement = params.movement;

    return root_->Tick(context);
}

NpcResult<void> BehaviorTree::SetRoot(std::unique_ptr<BTNode> root) {
    auto valid = ValidateRoot(root.get());
    if (!valid) {
        return valid;
    }
    root_ = std::move(root);
    return NpcResult<void>::ok();
}

void BehaviorTree::Reset() {
    if (root_) {
        root_->Reset();
    }
}

}  // namespace npc::game
