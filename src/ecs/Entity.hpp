#pragma once

#include <entt/entt.hpp>

#include <cstdint>

namespace delve {

/// Entity handle - an EnTT identifier carrying a slot index and a
/// generation (EnTT's "version"). Allocation and recycling are done by
/// EntityRegistry, not by an entt::registry.
using Entity = entt::entity;

/// Null entity constant
constexpr Entity NullEntity = entt::null;

using EntityTraits = entt::entt_traits<Entity>;

/// Slot index of an entity; also its ordering key within a turn
inline uint32_t entityIndex(Entity entity) {
    return static_cast<uint32_t>(entt::to_entity(entity));
}

/// Generation counter; bumped every time the slot is recycled
inline uint32_t entityGeneration(Entity entity) {
    return static_cast<uint32_t>(entt::to_version(entity));
}

/// Stable integral form used for logs and serialized turn results
inline uint32_t entityId(Entity entity) {
    return static_cast<uint32_t>(entt::to_integral(entity));
}

/// Orders entities by slot index, then generation. Among live entities
/// (one per slot) this is plain ascending index order.
struct EntityIndexLess {
    bool operator()(Entity a, Entity b) const {
        if (entityIndex(a) != entityIndex(b)) return entityIndex(a) < entityIndex(b);
        return entityGeneration(a) < entityGeneration(b);
    }
};

} // namespace delve
