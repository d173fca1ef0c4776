#include "ecs/World.hpp"
#include "engine/Log.hpp"

namespace delve {

World::World(const GridMap& map)
    : m_map(map)
    , m_spatial(map) {
    m_spatialConnection = m_registry.onDestroy().connect<&World::onEntityDestroyed>(*this);
}

CoreResult World::destroy(Entity entity) {
    std::optional<Inventory> inventory = remove<Inventory>(entity);

    CoreResult result = m_registry.destroy(entity);
    if (result != CoreResult::Success || !inventory) {
        return result;
    }

    for (Entity item : inventory->items) {
        if (!isAlive(item)) continue;
        if (destroy(item) != CoreResult::Success) {
            LOG_ERROR("World: failed to destroy item {} of entity {}", entityId(item), entityId(entity));
        }
    }
    return result;
}

CoreResult World::place(Entity entity, GridPos pos) {
    if (!isAlive(entity)) {
        LOG_ERROR("World: place for unknown entity {}", entityId(entity));
        return CoreResult::UnknownEntity;
    }

    CoreResult result = m_spatial.place(entity, pos, has<Blocker>(entity));
    if (result != CoreResult::Success) {
        return result;
    }
    add<Position>(entity, Position{pos});
    return CoreResult::Success;
}

CoreResult World::move(Entity entity, GridPos to) {
    Position* position = get<Position>(entity);
    if (!position) {
        if (!isAlive(entity)) {
            LOG_ERROR("World: move for unknown entity {}", entityId(entity));
            return CoreResult::UnknownEntity;
        }
        return CoreResult::MissingCapability;
    }

    CoreResult result = m_spatial.moveEntity(entity, position->toGridPos(), to);
    if (result == CoreResult::Success) {
        position->x = to.x;
        position->y = to.y;
    }
    return result;
}

void World::onEntityDestroyed(Entity entity) {
    m_spatial.remove(entity);
}

} // namespace delve
