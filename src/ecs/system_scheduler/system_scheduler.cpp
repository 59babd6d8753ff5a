/// @file system_scheduler.cpp
/// @brief Staged execution with Kahn's-algorithm ordering.
///
/// Circular dependencies are reported with the names of the systems
/// that could not be ordered.

#include "npc/ecs/system_scheduler.hpp"

#include "npc/foundation/npc_logger.hpp"

#include <queue>
#include <sstream>

namespace npc::ecs {

using foundation::ErrorCode;
using foundation::NpcError;
using foundation::NpcResult;

const std::vector<SystemTypeId> SystemScheduler::kEmptyOrder_;

// ── Dependencies ────────────────────────────────────────────────────────

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = systems_.find(before);
    auto itAfter = systems_.find(after);

    if (itBefore == systems_.end() || itAfter == systems_.end()) {
        return false;
    }

    // Stage ordering is already implicit across stages.
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    dependencies_[before].insert(after);
    reverseDeps_[after].insert(before);

    built_ = false;
    return true;
}

// ── Enable / disable ────────────────────────────────────────────────────

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    if (auto it = systems_.find(system); it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    if (auto it = systems_.find(system); it != systems_.end()) {
        return it->second.enabled;
    }
    return false;
}

// ── Build ───────────────────────────────────────────────────────────────

NpcResult<void> SystemScheduler::Build() {
    executionOrder_.clear();

    for (const auto& [stage, ids] : stageGroups_) {
        std::vector<SystemTypeId> sorted;
        std::string error;
        if (!topologicalSort(ids, sorted, error)) {
            built_ = false;
            return NpcResult<void>::err(NpcError(ErrorCode::CircularDependency, error));
        }
        executionOrder_[stage] = std::move(sorted);
    }

    built_ = true;
    return NpcResult<void>::ok();
}

bool SystemScheduler::topologicalSort(const std::vector<SystemTypeId>& ids,
                                      std::vector<SystemTypeId>& sorted,
                                      std::string& error) const {
    std::unordered_set<SystemTypeId> stageSet(ids.begin(), ids.end());

    std::unordered_map<SystemTypeId, uint32_t> inDegree;
    for (auto id : ids) {
        inDegree[id] = 0;
    }
    for (auto id : ids) {
        if (auto it = reverseDeps_.find(id); it != reverseDeps_.end()) {
            for (auto dep : it->second) {
                if (stageSet.contains(dep)) {
                    ++inDegree[id];
                }
            }
        }
    }

    // Seed in registration order so independent systems keep it.
    std::queue<SystemTypeId> ready;
    for (auto id : ids) {
        if (inDegree[id] == 0) {
            ready.push(id);
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());

    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        sorted.push_back(current);

        auto it = dependencies_.find(current);
        if (it == dependencies_.end()) {
            continue;
        }
        // Release successors in registration order, not hash order.
        for (auto candidate : ids) {
            if (!it->second.contains(candidate)) {
                continue;
            }
            if (--inDegree[candidate] == 0) {
                ready.push(candidate);
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (inDegree[id] != 0) {
                if (!first) {
                    oss << ", ";
                }
                oss << systems_.at(id).instance->GetName();
                first = false;
            }
        }
        oss << "]";
        error = oss.str();
        return false;
    }

    return true;
}

// ── Execution ───────────────────────────────────────────────────────────

void SystemScheduler::Execute(float deltaTime) {
    if (!built_) {
        auto result = Build();
        if (!result) {
            NPC_LOG_ERROR(foundation::LogCategory::ECS, std::string(result.error().message()));
            return;
        }
    }

    static constexpr SystemStage kStages[] = {
        SystemStage::PreUpdate,
        SystemStage::Update,
        SystemStage::PostUpdate,
    };

    for (auto stage : kStages) {
        auto it = executionOrder_.find(stage);
        if (it == executionOrder_.end()) {
            continue;
        }
        for (auto typeId : it->second) {
            auto& entry = systems_.at(typeId);
            if (entry.enabled) {
                entry.instance->Execute(deltaTime);
            }
        }
    }
}

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    auto it = executionOrder_.find(stage);
    if (it != executionOrder_.end()) {
        return it->second;
    }
    return kEmptyOrder_;
}

}  // namespace npc::ecs
