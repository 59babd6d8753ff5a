#pragma once

/// @file memory_manager.hpp
/// @brief Owns one MemorySystem per agent entity and fans out turn ticks.

#include "npc/ecs/entity.hpp"
#include "npc/game/decay_policy.hpp"
#include "npc/game/memory_system.hpp"

#include <memory>
#include <unordered_map>

namespace npc::game {

/// Registry of per-entity memories.
///
/// Systems are created lazily on first GetSystem() and live until
/// RemoveSystem() or Clear().  A system's address is stable for its
/// whole lifetime, so a blackboard may hold a pointer to it.
class MemoryManager {
public:
    explicit MemoryManager(DecayPolicy policy = {}) : policy_(std::move(policy)) {}

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    /// The memory of @p entity, created at the current global turn if
    /// it does not exist yet.
    MemorySystem& GetSystem(ecs::Entity entity);

    /// Existing memory of @p entity, or nullptr.
    [[nodiscard]] MemorySystem* FindSystem(ecs::Entity entity) const;

    /// Destroy the memory of @p entity.  @return false if none existed.
    bool RemoveSystem(ecs::Entity entity);

    /// Advance every memory's clock to @p turn.
    void SetGlobalTurn(Turn turn);
    [[nodiscard]] Turn GetGlobalTurn() const noexcept { return globalTurn_; }

    /// Run a decay sweep on every memory.
    /// @return Total number of records forgotten.
    std::size_t ProcessAllDecay();

    void Clear() { systems_.clear(); }

    [[nodiscard]] std::size_t Size() const noexcept { return systems_.size(); }

    [[nodiscard]] const DecayPolicy& GetPolicy() const noexcept { return policy_; }

    /// Replace the policy for existing and future memories.
    void SetPolicy(const DecayPolicy& policy);

private:
    DecayPolicy policy_;
    Turn globalTurn_ = 0;
    std::unordered_map<ecs::Entity, std::unique_ptr<MemorySystem>> systems_;
};

}  // namespace npc::game
