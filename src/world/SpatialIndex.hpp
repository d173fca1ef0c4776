#pragma once

#include "ecs/Entity.hpp"
#include "engine/Result.hpp"
#include "world/GridMap.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace delve {

/// Maps grid cells to the entities standing on them.
///
/// A cell holds at most one blocking entity and any number of non-blocking
/// ones. Terrain is not consulted: a blocker may stand on a wall cell if
/// gameplay code puts it there. The index is a plain value type so the
/// scheduler can copy it at turn start and hand the copy to AI decisions.
class SpatialIndex {
public:
    SpatialIndex() = default;
    explicit SpatialIndex(const GridMap& map);

    /// Add an entity to the index.
    /// OutOfBounds, AlreadyPlaced, or CellOccupied when `blocking` and the
    /// cell already has a blocker.
    [[nodiscard]] CoreResult place(Entity entity, GridPos pos, bool blocking);

    /// Move an entity between cells. Either both the vacate and the occupy
    /// happen, or neither does.
    [[nodiscard]] CoreResult moveEntity(Entity entity, GridPos from, GridPos to);

    /// Remove an entity; returns false if it was not indexed
    bool remove(Entity entity);

    /// All entities at a cell: the blocker first, then non-blocking
    /// entities in placement order. Empty for out-of-bounds cells.
    std::vector<Entity> query(GridPos pos) const;

    /// Blocking entity at a cell, or NullEntity
    Entity blockerAt(GridPos pos) const;

    bool isBlocked(GridPos pos) const { return blockerAt(pos) != NullEntity; }

    std::optional<GridPos> positionOf(Entity entity) const;

    bool contains(Entity entity) const { return m_placements.count(entity) != 0; }

    bool isBlocking(Entity entity) const;

    std::size_t size() const { return m_placements.size(); }

    void clear();

private:
    struct Cell {
        Entity blocker = NullEntity;
        std::vector<Entity> items;
    };

    struct Placement {
        GridPos pos;
        bool blocking = false;
    };

    Cell& cellAt(GridPos pos) { return m_cells[m_map->indexOf(pos)]; }
    const Cell& cellAt(GridPos pos) const { return m_cells[m_map->indexOf(pos)]; }

    void detach(Entity entity, const Placement& placement);
    void attach(Entity entity, const Placement& placement);

    const GridMap* m_map = nullptr;
    std::vector<Cell> m_cells;
    std::unordered_map<Entity, Placement> m_placements;
};

} // namespace delve
