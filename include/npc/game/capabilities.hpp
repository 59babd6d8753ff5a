#pragma once

/// @file capabilities.hpp
/// @brief Narrow interfaces to the movement and pathfinding collaborators.
///
/// The decision core never moves entities or searches the map itself;
/// it asks these surfaces and treats a refusal as a normal Failure.

#include "npc/ecs/entity.hpp"
#include "npc/game/grid_types.hpp"

#include <optional>
#include <vector>

namespace npc::game {

/// Executes single-tile moves.
class IMovement {
public:
    virtual ~IMovement() = default;

    /// Try to move @p entity one tile towards @p direction.
    /// @return false when the move is blocked or the entity cannot move.
    virtual bool MoveEntity(ecs::Entity entity, Direction direction) = 0;
};

/// Searches the tile map.
class IPathfinder {
public:
    virtual ~IPathfinder() = default;

    /// Steps from (x0,y0) to (x1,y1), excluding the start tile.
    /// @return nullopt when no route exists.
    virtual std::optional<std::vector<GridPosition>> FindPath(int32_t x0, int32_t y0,
                                                              int32_t x1, int32_t y1) = 0;
};

}  // namespace npc::game
