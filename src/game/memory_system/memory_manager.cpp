/// @file memory_manager.cpp
/// @brief MemoryManager registry and turn fan-out.

#include "npc/game/memory_manager.hpp"

#include "npc/foundation/npc_logger.hpp"

#include <string>

namespace npc::game {

MemorySystem& MemoryManager::GetSystem(ecs::Entity entity) {
    auto it = systems_.find(entity);
    if (it == systems_.end()) {
        it = systems_
                 .emplace(entity, std::make_unique<MemorySystem>(entity, policy_, globalTurn_))
                 .first;
    }
    return *it->second;
}

MemorySystem* MemoryManager::FindSystem(ecs::Entity entity) const {
    auto it = systems_.find(entity);
    return it == systems_.end() ? nullptr : it->second.get();
}

bool MemoryManager::RemoveSystem(ecs::Entity entity) {
    return systems_.erase(entity) > 0;
}

void MemoryManager::SetGlobalTurn(Turn turn) {
    globalTurn_ = turn;
    for (auto& [_, system] : systems_) {
        system->SetTurn(turn);
    }
}

std::size_t MemoryManager::ProcessAllDecay() {
    std::size_t forgotten = 0;
    for (auto& [_, system] : systems_) {
        forgotten += system->ProcessDecay();
    }
    if (forgotten > 0) {
        NPC_LOG_DEBUG(foundation::LogCategory::Memory,
                      "turn " + std::to_string(globalTurn_) + ": forgot " +
                          std::to_string(forgotten) + " records across " +
                          std::to_string(systems_.size()) + " memories");
    }
    return forgotten;
}

void MemoryManager::SetPolicy(const DecayPolicy& policy) {
    policy_ = policy;
    for (auto& [_, system] : systems_) {
        system->SetPolicy(policy);
    }
}

}  // namespace npc::game
