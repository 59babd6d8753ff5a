#pragma once

/// @file grid_types.hpp
/// @brief Tile-grid positions and the eight movement directions.

#include <array>
#include <compare>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <vector>

namespace npc::game {

/// Integer tile coordinate.  Also used as the position ECS component.
struct GridPosition {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const GridPosition&) const = default;
};

/// A route to follow, as produced by the pathfinder.
struct Path {
    std::vector<GridPosition> steps;

    bool operator==(const Path&) const = default;
};

/// Plain list of positions (patrol points, remembered spots).
using PositionList = std::vector<GridPosition>;

/// Eight-way compass direction on the tile grid (y grows southwards).
enum class Direction : uint8_t {
    North,
    South,
    East,
    West,
    NorthEast,
    NorthWest,
    SouthEast,
    SouthWest
};

inline constexpr std::array<Direction, 8> kAllDirections = {
    Direction::North, Direction::South, Direction::East, Direction::West,
    Direction::NorthEast, Direction::NorthWest, Direction::SouthEast, Direction::SouthWest
};

inline constexpr std::array<Direction, 4> kCardinalDirections = {
    Direction::North, Direction::South, Direction::East, Direction::West
};

constexpr std::string_view directionName(Direction dir) {
    switch (dir) {
        case Direction::North:     return "north";
        case Direction::South:     return "south";
        case Direction::East:      return "east";
        case Direction::West:      return "west";
        case Direction::NorthEast: return "northeast";
        case Direction::NorthWest: return "northwest";
        case Direction::SouthEast: return "southeast";
        case Direction::SouthWest: return "southwest";
    }
    return "unknown";
}

/// Unit tile offset for a direction.
constexpr GridPosition directionOffset(Direction dir) {
    switch (dir) {
        case Direction::North:     return {0, -1};
        case Direction::South:     return {0, 1};
        case Direction::East:      return {1, 0};
        case Direction::West:      return {-1, 0};
        case Direction::NorthEast: return {1, -1};
        case Direction::NorthWest: return {-1, -1};
        case Direction::SouthEast: return {1, 1};
        case Direction::SouthWest: return {-1, 1};
    }
    return {0, 0};
}

/// Direction of a single step from @p from to the adjacent tile @p to,
/// or nullopt when the tiles are not neighbours.
constexpr std::optional<Direction> stepDirection(GridPosition from, GridPosition to) {
    for (auto dir : kAllDirections) {
        auto off = directionOffset(dir);
        if (from.x + off.x == to.x && from.y + off.y == to.y) {
            return dir;
        }
    }
    return std::nullopt;
}

inline int32_t manhattanDistance(GridPosition a, GridPosition b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

}  // namespace npc::game
