#pragma once

#include "world/GridPos.hpp"

#include <cstddef>
#include <vector>

namespace delve {

/// One map cell as delivered by a map provider
struct MapCell {
    bool passable = true;
    float moveCost = 1.0f;      ///< Cost to enter this cell (>= 0)

    static MapCell wall() { return {false, 1.0f}; }
    static MapCell floor(float cost = 1.0f) { return {true, cost}; }
};

/// Fixed-size grid of passability / cost data plus valid spawn cells.
/// Built once by a MapProvider and treated as read-only while turns run;
/// the pathfinder and the spatial index reference it, never copy it.
class GridMap {
public:
    GridMap() = default;
    GridMap(int width, int height, MapCell fill = MapCell{});

    int width() const { return m_width; }
    int height() const { return m_height; }
    std::size_t cellCount() const { return m_cells.size(); }

    bool inBounds(GridPos pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < m_width && pos.y < m_height;
    }

    /// False for out-of-bounds coordinates
    bool isPassable(GridPos pos) const {
        return inBounds(pos) && m_cells[indexOf(pos)].passable;
    }

    /// Cost to enter a cell; only meaningful for in-bounds cells
    float moveCost(GridPos pos) const { return m_cells[indexOf(pos)].moveCost; }

    const MapCell& cell(GridPos pos) const { return m_cells[indexOf(pos)]; }

    /// Replace a cell. Negative costs are clamped to zero.
    /// Out-of-bounds writes are ignored.
    void setCell(GridPos pos, MapCell cell);

    /// Cheapest entry cost over all passable cells (1 if none are passable).
    /// Scales the pathfinding heuristic so it never overestimates.
    float minMoveCost() const { return m_minMoveCost; }

    std::size_t indexOf(GridPos pos) const {
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(m_width)
             + static_cast<std::size_t>(pos.x);
    }

    GridPos posOf(std::size_t index) const {
        return {static_cast<int>(index % static_cast<std::size_t>(m_width)),
                static_cast<int>(index / static_cast<std::size_t>(m_width))};
    }

    const std::vector<GridPos>& spawnPoints() const { return m_spawnPoints; }

    /// Register a spawn cell; ignored unless the cell is passable
    bool addSpawnPoint(GridPos pos);

private:
    void recomputeMinCost();

    int m_width = 0;
    int m_height = 0;
    std::vector<MapCell> m_cells;
    std::vector<GridPos> m_spawnPoints;
    float m_minMoveCost = 1.0f;
};

} // namespace delve
