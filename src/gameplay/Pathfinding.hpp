#pragma once

#include "engine/Result.hpp"
#include "world/GridMap.hpp"
#include "world/GridPos.hpp"

#include <vector>

namespace delve {

class SpatialIndex;

/// Result of a pathfinding query
struct PathResult {
    bool found = false;
    CoreResult status = CoreResult::NoPathFound;
    std::vector<GridPos> path;      // Start exclusive, goal inclusive
    float cost = 0.0f;              // Sum of the move costs of every cell in `path`
    int nodesExplored = 0;
};

/// A* pathfinder operating on a GridMap.
/// Supports 4-directional and 8-directional movement.
///
/// Entering a cell costs that cell's moveCost, for diagonal steps too, so a
/// path's cost is the sum of the cells it enters. The heuristic is grid
/// distance scaled by the map's cheapest cell, which keeps it admissible
/// and consistent. Queries hold no state between calls; one Pathfinder can
/// serve several threads at once.
class Pathfinder {
public:
    /// Configure whether diagonal movement is allowed
    void setAllowDiagonals(bool allow) { m_allowDiagonals = allow; }
    bool getAllowDiagonals() const { return m_allowDiagonals; }

    /// Set the maximum number of nodes to explore before giving up (0 = unlimited)
    void setMaxNodes(int max) { m_maxNodes = max; }
    int getMaxNodes() const { return m_maxNodes; }

    /// Find a cheapest path from start to goal.
    /// @param map       Terrain passability and costs
    /// @param start     Starting cell (not part of the returned path)
    /// @param goal      Target cell
    /// @param occupancy Optional spatial index; cells holding a blocking
    ///                  entity are impassable unless they are the goal
    PathResult findPath(const GridMap& map, GridPos start, GridPos goal,
                        const SpatialIndex* occupancy = nullptr) const;

private:
    float heuristic(const GridMap& map, GridPos a, GridPos b) const {
        return static_cast<float>(gridDistance(a, b, m_allowDiagonals)) * map.minMoveCost();
    }

    bool m_allowDiagonals = false;
    int m_maxNodes = 0;
};

} // namespace delve
