/// @file memory_system.cpp
/// @brief MemorySystem recording, queries and decay sweeps.

#include "npc/game/memory_system.hpp"

#include "npc/foundation/npc_logger.hpp"

#include <algorithm>

namespace npc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::NpcLogger;

namespace {

/// Most recently touched first, then newest, then highest id.
bool moreRecent(const MemoryRecord& a, const MemoryRecord& b) {
    if (a.lastAccessTurn != b.lastAccessTurn) {
        return a.lastAccessTurn > b.lastAccessTurn;
    }
    if (a.createdTurn != b.createdTurn) {
        return a.createdTurn > b.createdTurn;
    }
    return a.id > b.id;
}

std::vector<MemoryRecord> takeFirst(std::vector<MemoryRecord> records, std::size_t count) {
    if (records.size() > count) {
        records.resize(count);
    }
    return records;
}

}  // namespace

MemorySystem::MemorySystem(ecs::Entity observer, DecayPolicy policy, Turn turn)
    : observer_(observer), policy_(std::move(policy)), currentTurn_(turn) {}

// ═══════════════════════════════════════════════════════════════════════════
// Recording
// ═══════════════════════════════════════════════════════════════════════════

MemoryRecord& MemorySystem::Insert(MemoryData data, MemoryImportance importance) {
    MemoryRecord record;
    record.id = MemoryId(nextId_++);
    record.data = std::move(data);
    record.createdTurn = currentTurn_;
    record.lastAccessTurn = currentTurn_;
    record.confidence = 1.0f;
    record.anchorConfidence = 1.0f;
    record.importance = importance;

    auto [it, _] = records_.emplace(record.id, std::move(record));
    return it->second;
}

MemoryRecord* MemorySystem::FindMutable(MemoryId id) {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

/// Bring the stored confidence up to date with the current turn.
void MemorySystem::Settle(MemoryRecord& record) const {
    record.confidence = policy_.RetainedConfidence(record, currentTurn_);
}

/// Restart the decay curve from the stored confidence.
void MemorySystem::Anchor(MemoryRecord& record) const {
    record.lastAccessTurn = currentTurn_;
    record.anchorConfidence = record.confidence;
}

void MemorySystem::Touch(MemoryRecord& record) const {
    Settle(record);
    Anchor(record);
}

const MemoryRecord& MemorySystem::RememberEntity(ecs::Entity target, Relationship relationship,
                                                 const EntityMemoryOptions& options) {
    if (auto idx = entityIndex_.find(target); idx != entityIndex_.end()) {
        auto& record = records_.at(idx->second);
        auto& data = *record.AsEntity();
        data.relationship = relationship;
        data.isVisible = true;
        ++data.timesEncountered;
        if (options.position) {
            data.lastKnownPosition = options.position;
        }
        if (options.health) {
            data.lastKnownHealth = options.health;
        }
        if (options.threatLevel) {
            data.threatLevel = std::clamp(*options.threatLevel, 0.0f, 1.0f);
        }
        Settle(record);
        record.confidence = std::min(1.0f, record.confidence + policy_.ReinforceStep());
        Anchor(record);
        return record;
    }

    EntityMemoryData data;
    data.target = target;
    data.relationship = relationship;
    data.lastKnownPosition = options.position;
    data.lastKnownHealth = options.health;
    data.isVisible = true;
    data.threatLevel = std::clamp(options.threatLevel.value_or(0.0f), 0.0f, 1.0f);
    data.timesEncountered = 1;

    auto& record = Insert(std::move(data), options.importance.value_or(MemoryImportance::Normal));
    entityIndex_.emplace(target, record.id);
    return record;
}

bool MemorySystem::LoseSightOf(ecs::Entity target) {
    return UpdateEntityVisibility(target, false);
}

bool MemorySystem::UpdateEntityVisibility(ecs::Entity target, bool visible,
                                          std::optional<GridPosition> position) {
    auto idx = entityIndex_.find(target);
    if (idx == entityIndex_.end()) {
        return false;
    }
    auto& data = *records_.at(idx->second).AsEntity();
    data.isVisible = visible;
    if (position) {
        data.lastKnownPosition = position;
    }
    return true;
}

const MemoryRecord& MemorySystem::RememberLocation(int32_t x, int32_t y,
                                                   std::string_view description,
                                                   const LocationMemoryOptions& options) {
    const GridPosition tile{x, y};

    if (auto idx = locationIndex_.find(tile); idx != locationIndex_.end()) {
        auto& record = records_.at(idx->second);
        auto& data = *record.AsLocation();
        if (!description.empty()) {
            data.description = std::string(description);
        }
        for (const auto& tag : options.tags) {
            if (std::find(data.tags.begin(), data.tags.end(), tag) == data.tags.end()) {
                data.tags.push_back(tag);
            }
        }
        if (options.explored) {
            data.isExplored = *options.explored;
        }
        ++data.timesVisited;
        Touch(record);
        return record;
    }

    LocationMemoryData data;
    data.x = x;
    data.y = y;
    data.description = std::string(description);
    for (const auto& tag : options.tags) {
        if (std::find(data.tags.begin(), data.tags.end(), tag) == data.tags.end()) {
            data.tags.push_back(tag);
        }
    }
    data.timesVisited = 1;
    data.isExplored = options.explored.value_or(false);

    auto& record = Insert(std::move(data), options.importance.value_or(MemoryImportance::Low));
    locationIndex_.emplace(tile, record.id);
    return record;
}

const MemoryRecord& MemorySystem::RememberEvent(std::string_view eventType,
                                                std::string_view description,
                                                const EventMemoryOptions& options) {
    EventMemoryData data;
    data.eventType = std::string(eventType);
    data.description = std::string(description);
    data.participants = options.participants;
    data.location = options.location;
    if (options.outcome) {
        data.outcome = *options.outcome;
    }

    return Insert(std::move(data), options.importance.value_or(MemoryImportance::Normal));
}

void MemorySystem::ReinforceMemory(MemoryId id) {
    auto* record = FindMutable(id);
    if (!record) {
        return;
    }
    Settle(*record);
    record->confidence = std::min(1.0f, record->confidence + policy_.ReinforceStep());
    record->importance = raiseImportance(record->importance);
    Anchor(*record);
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

const MemoryRecord* MemorySystem::GetMemory(MemoryId id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

const MemoryRecord* MemorySystem::GetMemoryForEntity(ecs::Entity target) const {
    auto idx = entityIndex_.find(target);
    return idx == entityIndex_.end() ? nullptr : GetMemory(idx->second);
}

bool MemorySystem::HasMemoryOfEntity(ecs::Entity target) const {
    return entityIndex_.contains(target);
}

std::vector<MemoryRecord> MemorySystem::GetAllMemories() const {
    std::vector<MemoryRecord> result;
    result.reserve(records_.size());
    for (const auto& [_, record] : records_) {
        result.push_back(record);
    }
    return result;
}

std::vector<MemoryRecord> MemorySystem::GetMemoriesByKind(MemoryKind kind) const {
    std::vector<MemoryRecord> result;
    for (const auto& [_, record] : records_) {
        if (record.kind() == kind) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<MemoryRecord> MemorySystem::GetMemoriesByRelationship(Relationship rel) const {
    std::vector<MemoryRecord> result;
    for (const auto& [_, record] : records_) {
        const auto* data = record.AsEntity();
        if (data && data->relationship == rel) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<MemoryRecord> MemorySystem::GetHostileEntities() const {
    return GetMemoriesByRelationship(Relationship::Hostile);
}

std::vector<MemoryRecord> MemorySystem::GetFriendlyEntities() const {
    return GetMemoriesByRelationship(Relationship::Friendly);
}

std::vector<MemoryRecord> MemorySystem::GetRecentMemories(std::size_t count) const {
    auto all = GetAllMemories();
    std::sort(all.begin(), all.end(), moreRecent);
    return takeFirst(std::move(all), count);
}

std::vector<MemoryRecord> MemorySystem::GetImportantMemories(std::size_t count) const {
    auto all = GetAllMemories();
    std::sort(all.begin(), all.end(), [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.importance != b.importance) {
            return a.importance > b.importance;
        }
        return moreRecent(a, b);
    });
    return takeFirst(std::move(all), count);
}

// ═══════════════════════════════════════════════════════════════════════════
// Maintenance
// ═══════════════════════════════════════════════════════════════════════════

std::size_t MemorySystem::ProcessDecay() {
    std::size_t forgotten = 0;

    for (auto it = records_.begin(); it != records_.end();) {
        auto& record = it->second;
        record.confidence = policy_.RetainedConfidence(record, currentTurn_);

        if (policy_.ShouldForget(record.importance, record.confidence)) {
            if (const auto* entityData = record.AsEntity()) {
                entityIndex_.erase(entityData->target);
            } else if (const auto* locationData = record.AsLocation()) {
                locationIndex_.erase(GridPosition{locationData->x, locationData->y});
            }
            it = records_.erase(it);
            ++forgotten;
        } else {
            ++it;
        }
    }

    if (forgotten > 0) {
        LogContext ctx;
        ctx.entityId = observer_.id();
        ctx.turn = currentTurn_;
        ctx.extra["forgotten"] = std::to_string(forgotten);
        ctx.extra["remaining"] = std::to_string(records_.size());
        NpcLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Memory,
                                             "decay sweep forgot records", ctx);
    }

    return forgotten;
}

bool MemorySystem::RemoveMemory(MemoryId id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    if (const auto* entityData = it->second.AsEntity()) {
        entityIndex_.erase(entityData->target);
    } else if (const auto* locationData = it->second.AsLocation()) {
        locationIndex_.erase(GridPosition{locationData->x, locationData->y});
    }
    records_.erase(it);
    return true;
}

void MemorySystem::Clear() {
    records_.clear();
    entityIndex_.clear();
    locationIndex_.clear();
}

std::size_t MemorySystem::Restore(const std::vector<MemoryRecord>& records) {
    Clear();
    nextId_ = 1;

    std::size_t dropped = 0;
    for (auto record : records) {
        record.confidence = std::clamp(record.confidence, 0.0f, 1.0f);
        record.anchorConfidence = std::clamp(record.anchorConfidence, 0.0f, 1.0f);
        nextId_ = std::max(nextId_, record.id.value() + 1);

        if (auto it = records_.find(record.id); it != records_.end()) {
            if (!moreRecent(record, it->second)) {
                ++dropped;
                continue;
            }
            RemoveMemory(record.id);
            ++dropped;
        }
        if (auto existing = IndexedId(record)) {
            if (!moreRecent(record, records_.at(*existing))) {
                ++dropped;
                continue;
            }
            RemoveMemory(*existing);
            ++dropped;
        }

        Index(record);
        records_.emplace(record.id, std::move(record));
    }

    if (dropped > 0) {
        LogContext ctx;
        ctx.entityId = observer_.id();
        ctx.extra["dropped"] = std::to_string(dropped);
        NpcLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Memory,
                                             "restore dropped duplicate records", ctx);
    }
    return dropped;
}

std::optional<MemoryId> MemorySystem::IndexedId(const MemoryRecord& record) const {
    if (const auto* entityData = record.AsEntity()) {
        if (auto it = entityIndex_.find(entityData->target); it != entityIndex_.end()) {
            return it->second;
        }
    } else if (const auto* locationData = record.AsLocation()) {
        auto it = locationIndex_.find(GridPosition{locationData->x, locationData->y});
        if (it != locationIndex_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

void MemorySystem::Index(const MemoryRecord& record) {
    if (const auto* entityData = record.AsEntity()) {
        entityIndex_.insert_or_assign(entityData->target, record.id);
    } else if (const auto* locationData = record.AsLocation()) {
        locationIndex_.insert_or_assign(GridPosition{locationData->x, locationData->y}, record.id);
    }
}

}  // namespace npc::game
