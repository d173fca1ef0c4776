#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>

namespace delve {

/// A cell coordinate on the map grid
struct GridPos {
    int x = 0;
    int y = 0;

    GridPos() = default;
    GridPos(int x, int y) : x(x), y(y) {}

    bool operator==(const GridPos& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridPos& other) const { return !(*this == other); }
    GridPos operator+(const GridPos& other) const { return {x + other.x, y + other.y}; }
};

struct GridPosHash {
    std::size_t operator()(const GridPos& pos) const {
        std::size_t h1 = std::hash<int>{}(pos.x);
        std::size_t h2 = std::hash<int>{}(pos.y);
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

/// Movement direction. The first four are cardinal; y grows southward.
enum class Direction : uint8_t {
    North = 0,
    East,
    South,
    West,
    NorthEast,
    SouthEast,
    SouthWest,
    NorthWest
};

constexpr std::array<Direction, 4> CardinalDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West
};

constexpr std::array<Direction, 8> AllDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West,
    Direction::NorthEast, Direction::SouthEast, Direction::SouthWest, Direction::NorthWest
};

inline GridPos offset(Direction dir) {
    switch (dir) {
        case Direction::North:     return {0, -1};
        case Direction::East:      return {1, 0};
        case Direction::South:     return {0, 1};
        case Direction::West:      return {-1, 0};
        case Direction::NorthEast: return {1, -1};
        case Direction::SouthEast: return {1, 1};
        case Direction::SouthWest: return {-1, 1};
        case Direction::NorthWest: return {-1, -1};
    }
    return {0, 0};
}

inline bool isDiagonal(Direction dir) {
    return static_cast<uint8_t>(dir) >= static_cast<uint8_t>(Direction::NorthEast);
}

inline const char* toString(Direction dir) {
    switch (dir) {
        case Direction::North:     return "north";
        case Direction::East:      return "east";
        case Direction::South:     return "south";
        case Direction::West:      return "west";
        case Direction::NorthEast: return "northeast";
        case Direction::SouthEast: return "southeast";
        case Direction::SouthWest: return "southwest";
        case Direction::NorthWest: return "northwest";
    }
    return "none";
}

/// Direction of a single step between two neighbouring cells,
/// or nullopt if `to` is not one step away from `from`.
inline std::optional<Direction> directionBetween(GridPos from, GridPos to) {
    const GridPos delta{to.x - from.x, to.y - from.y};
    for (Direction dir : AllDirections) {
        if (offset(dir) == delta) return dir;
    }
    return std::nullopt;
}

inline int manhattanDistance(GridPos a, GridPos b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline int chebyshevDistance(GridPos a, GridPos b) {
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    return dx > dy ? dx : dy;
}

/// Grid distance under the active movement rule
inline int gridDistance(GridPos a, GridPos b, bool allowDiagonals) {
    return allowDiagonals ? chebyshevDistance(a, b) : manhattanDistance(a, b);
}

} // namespace delve
