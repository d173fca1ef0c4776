#include "world/SpatialIndex.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

SpatialIndex::SpatialIndex(const GridMap& map)
    : m_map(&map)
    , m_cells(map.cellCount()) {}

CoreResult SpatialIndex::place(Entity entity, GridPos pos, bool blocking) {
    if (!m_map || !m_map->inBounds(pos)) {
        return CoreResult::OutOfBounds;
    }
    if (contains(entity)) {
        return CoreResult::AlreadyPlaced;
    }
    if (blocking && cellAt(pos).blocker != NullEntity) {
        return CoreResult::CellOccupied;
    }

    Placement placement{pos, blocking};
    attach(entity, placement);
    m_placements.emplace(entity, placement);
    return CoreResult::Success;
}

CoreResult SpatialIndex::moveEntity(Entity entity, GridPos from, GridPos to) {
    auto it = m_placements.find(entity);
    if (it == m_placements.end() || it->second.pos != from) {
        return CoreResult::PositionMismatch;
    }
    if (!m_map->inBounds(to)) {
        return CoreResult::OutOfBounds;
    }
    if (from == to) {
        return CoreResult::Success;
    }
    if (it->second.blocking && cellAt(to).blocker != NullEntity) {
        return CoreResult::CellOccupied;
    }

    // All checks passed; nothing below can fail
    detach(entity, it->second);
    it->second.pos = to;
    attach(entity, it->second);
    return CoreResult::Success;
}

bool SpatialIndex::remove(Entity entity) {
    auto it = m_placements.find(entity);
    if (it == m_placements.end()) {
        return false;
    }
    detach(entity, it->second);
    m_placements.erase(it);
    return true;
}

std::vector<Entity> SpatialIndex::query(GridPos pos) const {
    std::vector<Entity> result;
    if (!m_map || !m_map->inBounds(pos)) {
        return result;
    }
    const Cell& cell = cellAt(pos);
    result.reserve(cell.items.size() + 1);
    if (cell.blocker != NullEntity) {
        result.push_back(cell.blocker);
    }
    result.insert(result.end(), cell.items.begin(), cell.items.end());
    return result;
}

Entity SpatialIndex::blockerAt(GridPos pos) const {
    if (!m_map || !m_map->inBounds(pos)) {
        return NullEntity;
    }
    return cellAt(pos).blocker;
}

std::optional<GridPos> SpatialIndex::positionOf(Entity entity) const {
    auto it = m_placements.find(entity);
    if (it == m_placements.end()) {
        return std::nullopt;
    }
    return it->second.pos;
}

bool SpatialIndex::isBlocking(Entity entity) const {
    auto it = m_placements.find(entity);
    return it != m_placements.end() && it->second.blocking;
}

void SpatialIndex::clear() {
    for (auto& cell : m_cells) {
        cell.blocker = NullEntity;
        cell.items.clear();
    }
    m_placements.clear();
}

void SpatialIndex::detach(Entity entity, const Placement& placement) {
    Cell& cell = cellAt(placement.pos);
    if (placement.blocking) {
        cell.blocker = NullEntity;
        return;
    }
    auto it = std::find(cell.items.begin(), cell.items.end(), entity);
    if (it != cell.items.end()) {
        cell.items.erase(it);
    } else {
        LOG_WARN("SpatialIndex: entity {} missing from its cell ({}, {})",
                 entityId(entity), placement.pos.x, placement.pos.y);
    }
}

void SpatialIndex::attach(Entity entity, const Placement& placement) {
    Cell& cell = cellAt(placement.pos);
    if (placement.blocking) {
        cell.blocker = entity;
    } else {
        cell.items.push_back(entity);
    }
}

} // namespace delve
