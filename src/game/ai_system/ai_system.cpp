/// @file ai_system.cpp
/// @brief AISystem implementation.
///
/// Ticks behavior trees for AI entities, owns their memories and the
/// named behavior registry.  The default behaviors are assembled from
/// the built-in tasks of AITaskFactory.

#include "npc/game/ai_system.hpp"

#include "npc/foundation/npc_logger.hpp"
#include "npc/game/ai_events.hpp"

#include <vector>

namespace npc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::NpcLogger;

AISystem::AISystem(ecs::ComponentStorage<AIController>& controllers,
                   ecs::ComponentStorage<GridPosition>& positions,
                   ecs::ComponentStorage<Health>& healths,
                   IMovement& movement,
                   IPathfinder& pathfinder,
                   foundation::EventBus& events,
                   DecayPolicy policy,
                   uint32_t seed)
    : controllers_(controllers),
      positions_(positions),
      healths_(healths),
      movement_(movement),
      events_(events),
      memory_(std::move(policy)),
      tasks_(positions, healths, pathfinder, seed) {}

void AISystem::Execute(float deltaTime) {
    // Collect first: a tick may add or remove components.
    std::vector<ecs::Entity> entities;
    entities.reserve(controllers_.Size());
    for (std::size_t i = 0; i < controllers_.Size(); ++i) {
        auto entity = controllers_.EntityAt(i);
        if (positions_.Has(entity)) {
            entities.push_back(entity);
        }
    }

    Update(entities, deltaTime);
}

// ── Behavior registry ───────────────────────────────────────────────────

void AISystem::RegisterBehavior(std::string_view name, BehaviorFactory factory) {
    behaviors_.insert_or_assign(std::string(name), std::move(factory));
}

const BehaviorFactory* AISystem::GetBehavior(std::string_view name) const {
    auto it = behaviors_.find(std::string(name));
    return it == behaviors_.end() ? nullptr : &it->second;
}

std::unique_ptr<BehaviorTree> AISystem::BuildTree(std::unique_ptr<BTNode> root,
                                                  ecs::Entity entity,
                                                  std::string_view behavior) {
    auto tree = BehaviorTree::Create(std::move(root), entity);
    if (!tree) {
        NPC_LOG_ERROR(LogCategory::AI, "behavior '" + std::string(behavior) +
                                           "' produced an invalid tree: " +
                                           std::string(tree.error().message()));
        return nullptr;
    }
    return std::move(tree).value();
}

void AISystem::RegisterDefaultBehaviors() {
    auto wanderNode = [this]() -> std::unique_ptr<BTNode> {
        auto seq = std::make_unique<BTSequence>();
        seq->AddChild(tasks_.CreateMoveRandomTask());
        seq->AddChild(std::make_unique<BTWait>(kWanderPauseMs));
        return seq;
    };

    RegisterBehavior(behaviors::kWander, [this, wanderNode](ecs::Entity entity) {
        return BuildTree(wanderNode(), entity, behaviors::kWander);
    });

    RegisterBehavior(behaviors::kHunter, [this, wanderNode](ecs::Entity entity) {
        auto strike = std::make_unique<BTSequence>();
        strike->AddChild(tasks_.CreateCanAttackCondition());
        strike->AddChild(tasks_.CreateAttackTask());

        auto engage = std::make_unique<BTSelector>();
        engage->AddChild(std::move(strike));
        engage->AddChild(tasks_.CreateMoveToTargetTask());

        auto hunt = std::make_unique<BTSequence>();
        hunt->AddChild(tasks_.CreateUpdateTargetFromMemoryTask(Relationship::Hostile));
        hunt->AddChild(std::move(engage));

        auto root = std::make_unique<BTSelector>();
        root->AddChild(std::move(hunt));
        root->AddChild(wanderNode());
        return BuildTree(std::move(root), entity, behaviors::kHunter);
    });

    RegisterBehavior(behaviors::kPatrol, [this](ecs::Entity entity) {
        auto root = std::make_unique<BTParallel>(BTParallelPolicy::RequireOne);
        root->AddChild(tasks_.CreatePatrolTask());
        root->AddChild(tasks_.CreateMoveToTargetTask());
        return BuildTree(std::move(root), entity, behaviors::kPatrol);
    });

    RegisterBehavior(behaviors::kCoward, [this, wanderNode](ecs::Entity entity) {
        auto flee = std::make_unique<BTSequence>();
        flee->AddChild(tasks_.CreateCanSeeHostileCondition());
        flee->AddChild(tasks_.CreateUpdateTargetFromMemoryTask(Relationship::Hostile));
        flee->AddChild(tasks_.CreateMoveAwayTask());

        auto root = std::make_unique<BTSelector>();
        root->AddChild(std::move(flee));
        root->AddChild(wanderNode());
        return BuildTree(std::move(root), entity, behaviors::kCoward);
    });

    RegisterBehavior(behaviors::kNeutral, [this, wanderNode](ecs::Entity entity) {
        auto flee = std::make_unique<BTSequence>();
        flee->AddChild(tasks_.CreateIsHealthLowCondition());
        flee->AddChild(tasks_.CreateCanSeeHostileCondition());
        flee->AddChild(tasks_.CreateUpdateTargetFromMemoryTask(Relationship::Hostile));
        flee->AddChild(tasks_.CreateMoveAwayTask());

        auto root = std::make_unique<BTSelector>();
        root->AddChild(std::move(flee));
        root->AddChild(wanderNode());
        return BuildTree(std::move(root), entity, behaviors::kNeutral);
    });
}

bool AISystem::AssignBehavior(ecs::Entity entity, std::string_view name) {
    const auto* factory = GetBehavior(name);
    if (!factory) {
        NPC_LOG_WARN(LogCategory::AI, "unknown behavior '" + std::string(name) + "'");
        return false;
    }

    auto* controller = controllers_.TryGet(entity);
    if (!controller) {
        return false;
    }

    auto tree = (*factory)(entity);
    if (!tree) {
        return false;
    }

    controller->behaviorTree = std::move(tree);
    AttachMemory(*controller, memory_.FindSystem(entity));

    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.extra["behavior"] = std::string(name);
    NpcLogger::instance().logWithContext(LogLevel::Info, LogCategory::AI, "behavior assigned", ctx);
    return true;
}

bool AISystem::SetBehaviorTree(ecs::Entity entity, std::unique_ptr<BehaviorTree> tree) {
    auto* controller = controllers_.TryGet(entity);
    if (!controller) {
        return false;
    }
    controller->behaviorTree = std::move(tree);
    AttachMemory(*controller, memory_.FindSystem(entity));
    return true;
}

void AISystem::AttachMemory(AIController& controller, MemorySystem* memory) {
    controller.memory = memory;
    if (!controller.behaviorTree) {
        return;
    }
    auto& bb = controller.behaviorTree->GetBlackboard();
    if (memory) {
        bb.Set(bbkeys::kMemorySystem, memory);
    } else {
        bb.Erase(bbkeys::kMemorySystem);
    }
}

// ── Entity lifecycle ────────────────────────────────────────────────────

void AISystem::OnEntityAdded(ecs::Entity entity) {
    auto* controller = controllers_.TryGet(entity);
    if (!controller) {
        return;
    }

    AttachMemory(*controller, &memory_.GetSystem(entity));
    events_.Publish(AIEntityAddedEvent{entity});

    LogContext ctx;
    ctx.entityId = entity.id();
    ctx.turn = memory_.GetGlobalTurn();
    NpcLogger::instance().logWithContext(LogLevel::Debug, LogCategory::AI, "entity added", ctx);
}

void AISystem::OnEntityRemoved(ecs::Entity entity) {
    if (auto* controller = controllers_.TryGet(entity)) {
        AttachMemory(*controller, nullptr);
    }
    memory_.RemoveSystem(entity);
    events_.Publish(AIEntityRemovedEvent{entity});

    LogContext ctx;
    ctx.entityId = entity.id();
    NpcLogger::instance().logWithContext(LogLevel::Debug, LogCategory::AI, "entity removed", ctx);
}

// ── Ticking ─────────────────────────────────────────────────────────────

void AISystem::Update(std::span<const ecs::Entity> entities, float deltaTime) {
    for (auto entity : entities) {
        auto* controller = controllers_.TryGet(entity);
        if (!controller || !controller->behaviorTree) {
            continue;
        }

        auto status = controller->behaviorTree->Tick(BTTickParams{&movement_, deltaTime});
        events_.Publish(AITickEvent{entity, status});
    }
}

void AISystem::SetGlobalTurn(Turn turn) {
    memory_.SetGlobalTurn(turn);
}

std::size_t AISystem::ProcessMemoryDecay() {
    return memory_.ProcessAllDecay();
}

// ── Memory access ───────────────────────────────────────────────────────

MemorySystem* AISystem::GetMemorySystem(ecs::Entity entity) const {
    return memory_.FindSystem(entity);
}

bool AISystem::RememberEntity(ecs::Entity observer, ecs::Entity target,
                              Relationship relationship, EntityMemoryOptions options) {
    const auto* position = positions_.TryGet(target);
    if (!position) {
        return false;
    }
    if (!options.position) {
        options.position = *position;
    }
    if (!options.health) {
        if (const auto* health = healths_.TryGet(target)) {
            options.health = health->current;
        }
    }
    memory_.GetSystem(observer).RememberEntity(target, relationship, options);
    return true;
}

void AISystem::Clear() {
    for (std::size_t i = 0; i < controllers_.Size(); ++i) {
        AttachMemory(controllers_.Get(controllers_.EntityAt(i)), nullptr);
    }
    memory_.Clear();
    behaviors_.clear();
}

}  // namespace npc::game
