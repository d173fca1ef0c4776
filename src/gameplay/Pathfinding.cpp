#include "gameplay/Pathfinding.hpp"
#include "world/SpatialIndex.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>

namespace delve {

namespace {

constexpr std::size_t NoParent = std::numeric_limits<std::size_t>::max();

struct OpenNode {
    float fScore;
    uint64_t order;         // Insertion order; earlier wins on equal f
    std::size_t index;

    bool operator>(const OpenNode& other) const {
        if (fScore != other.fScore) return fScore > other.fScore;
        return order > other.order;
    }
};

} // namespace

PathResult Pathfinder::findPath(const GridMap& map, GridPos start, GridPos goal,
                                const SpatialIndex* occupancy) const {
    PathResult result;

    if (!map.inBounds(start) || !map.inBounds(goal)) {
        result.status = CoreResult::OutOfBounds;
        return result;
    }

    if (start == goal) {
        result.found = true;
        result.status = CoreResult::Success;
        return result;
    }

    if (!map.isPassable(goal)) {
        return result;  // Goal is unreachable
    }

    const std::size_t cellCount = map.cellCount();
    const std::size_t startIndex = map.indexOf(start);
    const std::size_t goalIndex = map.indexOf(goal);

    std::vector<float> gScore(cellCount, std::numeric_limits<float>::infinity());
    std::vector<std::size_t> cameFrom(cellCount, NoParent);
    std::vector<bool> closed(cellCount, false);

    std::priority_queue<OpenNode, std::vector<OpenNode>, std::greater<OpenNode>> openSet;
    uint64_t pushed = 0;

    gScore[startIndex] = 0.0f;
    openSet.push({heuristic(map, start, goal), pushed++, startIndex});

    auto walkable = [&](GridPos pos) {
        if (!map.isPassable(pos)) return false;
        // The goal may hold a blocker: that is usually the entity being chased
        if (occupancy && pos != goal && occupancy->isBlocked(pos)) return false;
        return true;
    };

    while (!openSet.empty()) {
        OpenNode current = openSet.top();
        openSet.pop();

        if (closed[current.index]) continue;

        if (current.index == goalIndex) {
            result.found = true;
            result.status = CoreResult::Success;
            result.cost = gScore[goalIndex];

            for (std::size_t at = goalIndex; at != startIndex; at = cameFrom[at]) {
                result.path.push_back(map.posOf(at));
            }
            std::reverse(result.path.begin(), result.path.end());
            return result;
        }

        closed[current.index] = true;
        ++result.nodesExplored;

        if (m_maxNodes > 0 && result.nodesExplored > m_maxNodes) {
            break;  // Exceeded search budget
        }

        const GridPos pos = map.posOf(current.index);
        const std::size_t dirCount = m_allowDiagonals ? AllDirections.size() : CardinalDirections.size();

        for (std::size_t i = 0; i < dirCount; ++i) {
            const Direction dir = AllDirections[i];
            const GridPos step = offset(dir);
            const GridPos neighbor = pos + step;

            if (!walkable(neighbor)) continue;

            const std::size_t neighborIndex = map.indexOf(neighbor);
            if (closed[neighborIndex]) continue;

            // No cutting corners past walls: both cardinal cells must be open terrain
            if (isDiagonal(dir)) {
                if (!map.isPassable({pos.x + step.x, pos.y}) ||
                    !map.isPassable({pos.x, pos.y + step.y})) {
                    continue;
                }
            }

            const float tentativeG = gScore[current.index] + map.moveCost(neighbor);
            if (tentativeG >= gScore[neighborIndex]) continue;

            cameFrom[neighborIndex] = current.index;
            gScore[neighborIndex] = tentativeG;
            openSet.push({tentativeG + heuristic(map, neighbor, goal), pushed++, neighborIndex});
        }
    }

    return result;
}

} // namespace delve
