#pragma once

/// @file memory_system.hpp
/// @brief One entity's long-term memory: sightings, places and events.

#include "npc/ecs/entity.hpp"
#include "npc/game/decay_policy.hpp"
#include "npc/game/memory_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace npc::game {

/// Durable memory of one observer entity.
///
/// Holds at most one Entity record per target and one Location record
/// per tile; events always append.  Confidence decays as the local turn
/// advances and records are forgotten by ProcessDecay().
///
/// Query results are copies: callers never hold references into the
/// store across a decay sweep.  Lookups that return a pointer are valid
/// until the next mutating call.
class MemorySystem {
public:
    explicit MemorySystem(ecs::Entity observer, DecayPolicy policy = {}, Turn turn = 0);

    MemorySystem(const MemorySystem&) = delete;
    MemorySystem& operator=(const MemorySystem&) = delete;

    [[nodiscard]] ecs::Entity GetObserver() const noexcept { return observer_; }

    // ── Clock ─────────────────────────────────────────────────────────

    void SetTurn(Turn turn) noexcept { currentTurn_ = turn; }
    [[nodiscard]] Turn GetTurn() const noexcept { return currentTurn_; }

    // ── Recording ─────────────────────────────────────────────────────

    /// Record a sighting of @p target (creates or updates its record).
    /// A repeat sighting adds the reinforce step to the confidence held
    /// at the current turn; importance is left alone.
    const MemoryRecord& RememberEntity(ecs::Entity target, Relationship relationship,
                                       const EntityMemoryOptions& options = {});

    /// Mark @p target as out of sight, keeping what is known about it.
    /// @return false if @p target is not remembered.
    bool LoseSightOf(ecs::Entity target);

    /// Set visibility (and optionally position) of a remembered target.
    /// @return false if @p target is not remembered.
    bool UpdateEntityVisibility(ecs::Entity target, bool visible,
                                std::optional<GridPosition> position = std::nullopt);

    /// Record a visit to tile (x, y), merging tags into an existing record.
    const MemoryRecord& RememberLocation(int32_t x, int32_t y, std::string_view description,
                                         const LocationMemoryOptions& options = {});

    /// Append a new event record.
    const MemoryRecord& RememberEvent(std::string_view eventType, std::string_view description,
                                      const EventMemoryOptions& options = {});

    /// Raise the confidence held at the current turn by the policy's
    /// reinforce step and importance by one tier.  Unknown ids are ignored.
    void ReinforceMemory(MemoryId id);

    // ── Queries ───────────────────────────────────────────────────────

    [[nodiscard]] const MemoryRecord* GetMemory(MemoryId id) const;
    [[nodiscard]] const MemoryRecord* GetMemoryForEntity(ecs::Entity target) const;
    [[nodiscard]] bool HasMemoryOfEntity(ecs::Entity target) const;

    [[nodiscard]] std::vector<MemoryRecord> GetAllMemories() const;
    [[nodiscard]] std::vector<MemoryRecord> GetMemoriesByKind(MemoryKind kind) const;
    [[nodiscard]] std::vector<MemoryRecord> GetMemoriesByRelationship(Relationship rel) const;
    [[nodiscard]] std::vector<MemoryRecord> GetHostileEntities() const;
    [[nodiscard]] std::vector<MemoryRecord> GetFriendlyEntities() const;

    /// Up to @p count records, most recently accessed first.
    [[nodiscard]] std::vector<MemoryRecord> GetRecentMemories(std::size_t count) const;

    /// Up to @p count records, highest importance first, ties by recency.
    [[nodiscard]] std::vector<MemoryRecord> GetImportantMemories(std::size_t count) const;

    // ── Maintenance ───────────────────────────────────────────────────

    /// Apply decay at the current turn and drop forgotten records.
    /// @return Number of records forgotten.
    std::size_t ProcessDecay();

    bool RemoveMemory(MemoryId id);
    void Clear();

    [[nodiscard]] std::size_t Size() const noexcept { return records_.size(); }

    [[nodiscard]] const DecayPolicy& GetPolicy() const noexcept { return policy_; }
    void SetPolicy(const DecayPolicy& policy) { policy_ = policy; }

    // ── Persistence hooks ─────────────────────────────────────────────

    /// Copy of every record, ordered by id.
    [[nodiscard]] std::vector<MemoryRecord> Snapshot() const { return GetAllMemories(); }

    /// Replace the store with @p records.  Ids are kept; later records
    /// get ids above the highest restored one.  Confidences are clamped
    /// to [0, 1].  Of records sharing an id, a target or a tile only the
    /// most recently accessed is kept.
    /// @return Records dropped as duplicates.
    std::size_t Restore(const std::vector<MemoryRecord>& records);

private:
    MemoryRecord& Insert(MemoryData data, MemoryImportance importance);
    MemoryRecord* FindMutable(MemoryId id);
    void Settle(MemoryRecord& record) const;
    void Anchor(MemoryRecord& record) const;
    void Touch(MemoryRecord& record) const;
    std::optional<MemoryId> IndexedId(const MemoryRecord& record) const;
    void Index(const MemoryRecord& record);

    ecs::Entity observer_;
    DecayPolicy policy_;
    Turn currentTurn_ = 0;
    uint64_t nextId_ = 1;

    std::map<MemoryId, MemoryRecord> records_;
    std::unordered_map<ecs::Entity, MemoryId> entityIndex_;
    std::map<GridPosition, MemoryId> locationIndex_;
};

}  // namespace npc::game
