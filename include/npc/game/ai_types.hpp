#pragma once

/// @file ai_types.hpp
/// @brief Enumerations, constants and blackboard keys for the AI layer.

#include <cstdint>
#include <string_view>

namespace npc::game {

/// Consecutive blocked moves after which MoveToTarget abandons its path.
constexpr int32_t kDefaultStuckLimit = 3;

/// Melee reach in tiles (Manhattan distance).
constexpr int32_t kMeleeRange = 1;

/// Health fraction below which IsHealthLow succeeds by default.
constexpr float kDefaultLowHealthThreshold = 0.3f;

/// Behavior Tree node tick result.
enum class BTStatus : uint8_t {
    Success,  ///< Node completed successfully.
    Failure,  ///< Node failed.
    Running   ///< Node still in progress (resume next tick).
};

constexpr std::string_view btStatusName(BTStatus status) {
    switch (status) {
        case BTStatus::Success: return "success";
        case BTStatus::Failure: return "failure";
        case BTStatus::Running: return "running";
    }
    return "unknown";
}

/// Parallel node completion policy.
enum class BTParallelPolicy : uint8_t {
    RequireAll,  ///< Succeed only when all children succeed.
    RequireOne   ///< Succeed when at least one child succeeds.
};

/// Well-known blackboard keys shared by the built-in tasks.
namespace bbkeys {

// Targeting
inline constexpr std::string_view kTargetEntity = "targetEntity";      ///< Entity
inline constexpr std::string_view kTargetPosition = "targetPosition";  ///< GridPosition

// Movement
inline constexpr std::string_view kCurrentPath = "currentPath";    ///< Path
inline constexpr std::string_view kPathIndex = "pathIndex";        ///< int32_t
inline constexpr std::string_view kStuckCounter = "stuckCounter";  ///< int32_t

// Memory
inline constexpr std::string_view kMemorySystem = "memorySystem";  ///< MemorySystem*

// Patrol
inline constexpr std::string_view kPatrolPoints = "patrolPoints";        ///< PositionList
inline constexpr std::string_view kPatrolIndex = "patrolIndex";          ///< int32_t
inline constexpr std::string_view kPatrolDirection = "patrolDirection";  ///< int32_t, 1 or -1

// Combat
inline constexpr std::string_view kInCombat = "inCombat";      ///< bool
inline constexpr std::string_view kShouldFlee = "shouldFlee";  ///< bool

}  // namespace bbkeys

}  // namespace npc::game
