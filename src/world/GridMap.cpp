#include "world/GridMap.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <limits>

namespace delve {

GridMap::GridMap(int width, int height, MapCell fill)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height)) {
    fill.moveCost = std::max(0.0f, fill.moveCost);
    m_cells.assign(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height), fill);
    recomputeMinCost();
}

void GridMap::setCell(GridPos pos, MapCell cell) {
    if (!inBounds(pos)) return;

    if (cell.moveCost < 0.0f) {
        LOG_WARN("GridMap: negative cost {} at ({}, {}) clamped to 0", cell.moveCost, pos.x, pos.y);
        cell.moveCost = 0.0f;
    }
    MapCell& target = m_cells[indexOf(pos)];
    bool affectsMin = (target.passable && target.moveCost <= m_minMoveCost) ||
                      (cell.passable && cell.moveCost < m_minMoveCost);
    target = cell;

    if (affectsMin) {
        recomputeMinCost();
    }
}

bool GridMap::addSpawnPoint(GridPos pos) {
    if (!isPassable(pos)) {
        return false;
    }
    m_spawnPoints.push_back(pos);
    return true;
}

void GridMap::recomputeMinCost() {
    float best = std::numeric_limits<float>::max();
    for (const auto& c : m_cells) {
        if (c.passable && c.moveCost < best) {
            best = c.moveCost;
        }
    }
    m_minMoveCost = (best == std::numeric_limits<float>::max()) ? 1.0f : best;
}

} // namespace delve
