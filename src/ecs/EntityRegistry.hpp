#pragma once

#include "ecs/Entity.hpp"
#include "engine/Result.hpp"

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace delve {

/// Identifier of a component kind ("capability") registered with a registry
using ComponentKind = uint32_t;

constexpr std::size_t MaxComponentKinds = 64;
constexpr ComponentKind InvalidComponentKind = static_cast<ComponentKind>(-1);

using CapabilitySet = std::bitset<MaxComponentKinds>;

/// Owns entity identity: allocates and recycles slots, and tracks which
/// component kinds each live entity holds.
///
/// Destroying an entity publishes a drop notification to every connected
/// listener (component stores, the spatial index) before the slot is
/// freed, so a recycled index never meets stale component data. The
/// recycled handle carries a bumped generation, which makes every older
/// handle to that slot fail isAlive().
class EntityRegistry {
public:
    using DestroySignal = entt::sigh<void(Entity)>;

    /// Largest number of slots an EnTT identifier can address; the all-ones
    /// index is reserved for entt::null
    static constexpr uint32_t MaxSlots = static_cast<uint32_t>(EntityTraits::entity_mask);

    EntityRegistry() = default;

    /// Registry refusing to allocate more than `maxSlots` slots (clamped to MaxSlots)
    explicit EntityRegistry(uint32_t maxSlots);

    // Listeners hold pointers into the signal
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    /// Allocate a fresh slot or recycle a freed one. Returns NullEntity
    /// (and logs an error) once every slot is live.
    Entity create();

    /// Destroy a live entity. Returns UnknownEntity (and logs an error)
    /// for a stale or never-allocated handle.
    [[nodiscard]] CoreResult destroy(Entity entity);

    bool isAlive(Entity entity) const;

    /// Destroy every live entity, in ascending index order
    void clear();

    /// Number of live entities
    std::size_t aliveCount() const { return m_aliveCount; }

    /// Number of slots ever allocated (live + free)
    std::size_t capacity() const { return m_slots.size(); }

    /// Live entities in ascending index order
    std::vector<Entity> aliveEntities() const;

    /// Call `func(Entity)` for each live entity in ascending index order
    template<typename Func>
    void eachAlive(Func&& func) const {
        for (std::size_t i = 0; i < m_slots.size(); ++i) {
            if (m_alive[i]) {
                func(m_slots[i]);
            }
        }
    }

    // --- Capabilities ---

    /// Reserve an id for a new component kind. Returns InvalidComponentKind
    /// once MaxComponentKinds are taken; such a kind is stored but not tracked.
    ComponentKind registerKind(const std::string& name);

    /// Name the kind was registered with (empty for unknown ids)
    const std::string& kindName(ComponentKind kind) const;

    std::size_t kindCount() const { return m_kindNames.size(); }

    /// Record that a live entity gained or lost a component kind.
    /// Ignored for dead entities and untracked kinds.
    void setCapability(Entity entity, ComponentKind kind, bool present);

    bool hasCapability(Entity entity, ComponentKind kind) const;

    /// Number of component kinds a live entity currently holds
    std::size_t capabilityCount(Entity entity) const;

    /// Full capability set of a live entity (empty if dead)
    CapabilitySet capabilities(Entity entity) const;

    /// Sink for destroy notifications; listeners receive the entity while
    /// it is still alive.
    entt::sink<DestroySignal> onDestroy() { return entt::sink<DestroySignal>{m_onDestroy}; }

private:
    std::vector<Entity> m_slots;          ///< Current handle per slot (next handle when free)
    std::vector<bool> m_alive;
    std::vector<CapabilitySet> m_capabilities;
    std::vector<uint32_t> m_freeSlots;    ///< LIFO free list
    std::size_t m_aliveCount = 0;
    uint32_t m_maxSlots = MaxSlots;

    std::vector<std::string> m_kindNames;
    DestroySignal m_onDestroy;
};

} // namespace delve
