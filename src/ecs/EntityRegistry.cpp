#include "ecs/EntityRegistry.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

EntityRegistry::EntityRegistry(uint32_t maxSlots)
    : m_maxSlots(std::min(maxSlots, MaxSlots)) {}

Entity EntityRegistry::create() {
    if (!m_freeSlots.empty()) {
        uint32_t index = m_freeSlots.back();
        m_freeSlots.pop_back();
        m_alive[index] = true;
        m_capabilities[index].reset();
        ++m_aliveCount;
        return m_slots[index];
    }

    if (m_slots.size() >= m_maxSlots) {
        LOG_ERROR("EntityRegistry: all {} entity slots are in use", m_maxSlots);
        return NullEntity;
    }

    auto index = static_cast<uint32_t>(m_slots.size());
    Entity entity = EntityTraits::construct(static_cast<EntityTraits::entity_type>(index), 0);
    m_slots.push_back(entity);
    m_alive.push_back(true);
    m_capabilities.emplace_back();
    ++m_aliveCount;
    return entity;
}

CoreResult EntityRegistry::destroy(Entity entity) {
    if (!isAlive(entity)) {
        LOG_ERROR("EntityRegistry: destroy on unknown entity {} (index {}, generation {})",
                  entityId(entity), entityIndex(entity), entityGeneration(entity));
        return CoreResult::UnknownEntity;
    }

    // Listeners drop their data while the handle is still valid
    m_onDestroy.publish(entity);

    uint32_t index = entityIndex(entity);
    if (m_capabilities[index].any()) {
        LOG_ERROR("EntityRegistry: entity {} still holds {} component kinds after drop",
                  entityId(entity), m_capabilities[index].count());
        m_capabilities[index].reset();
    }

    m_alive[index] = false;
    m_slots[index] = EntityTraits::next(entity);
    m_freeSlots.push_back(index);
    --m_aliveCount;
    return CoreResult::Success;
}

bool EntityRegistry::isAlive(Entity entity) const {
    if (entity == NullEntity) return false;
    uint32_t index = entityIndex(entity);
    return index < m_slots.size() && m_alive[index] && m_slots[index] == entity;
}

void EntityRegistry::clear() {
    for (Entity entity : aliveEntities()) {
        (void)destroy(entity);
    }
}

std::vector<Entity> EntityRegistry::aliveEntities() const {
    std::vector<Entity> result;
    result.reserve(m_aliveCount);
    eachAlive([&result](Entity entity) { result.push_back(entity); });
    return result;
}

// ---------------------------------------------------------------------------
// Capabilities
// ---------------------------------------------------------------------------

ComponentKind EntityRegistry::registerKind(const std::string& name) {
    if (m_kindNames.size() >= MaxComponentKinds) {
        LOG_ERROR("EntityRegistry: component kind limit ({}) reached, '{}' is untracked",
                  MaxComponentKinds, name);
        return InvalidComponentKind;
    }
    m_kindNames.push_back(name);
    return static_cast<ComponentKind>(m_kindNames.size() - 1);
}

const std::string& EntityRegistry::kindName(ComponentKind kind) const {
    static const std::string empty;
    return kind < m_kindNames.size() ? m_kindNames[kind] : empty;
}

void EntityRegistry::setCapability(Entity entity, ComponentKind kind, bool present) {
    if (kind >= MaxComponentKinds || !isAlive(entity)) return;
    m_capabilities[entityIndex(entity)].set(kind, present);
}

bool EntityRegistry::hasCapability(Entity entity, ComponentKind kind) const {
    if (kind >= MaxComponentKinds || !isAlive(entity)) return false;
    return m_capabilities[entityIndex(entity)].test(kind);
}

std::size_t EntityRegistry::capabilityCount(Entity entity) const {
    return capabilities(entity).count();
}

CapabilitySet EntityRegistry::capabilities(Entity entity) const {
    if (!isAlive(entity)) return {};
    return m_capabilities[entityIndex(entity)];
}

} // namespace delve
