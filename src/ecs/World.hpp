#pragma once

#include "ecs/ComponentStore.hpp"
#include "ecs/Components.hpp"
#include "ecs/EntityRegistry.hpp"
#include "world/GridMap.hpp"
#include "world/SpatialIndex.hpp"

#include <memory>
#include <tuple>
#include <unordered_map>

namespace delve {

/// The aggregate every system works against: entity registry, one
/// component store per type, the spatial index and the current map.
///
/// Stores are created on first use. Destroying an entity through the
/// registry drops its data from every store and removes it from the
/// spatial index before the slot can be reused. World::destroy also
/// destroys the items the entity carries.
class World {
public:
    explicit World(const GridMap& map);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // --- Entity lifetime ---

    Entity create() { return m_registry.create(); }
    /// Destroy an entity together with everything in its Inventory
    [[nodiscard]] CoreResult destroy(Entity entity);
    bool isAlive(Entity entity) const { return m_registry.isAlive(entity); }

    EntityRegistry& registry() { return m_registry; }
    const EntityRegistry& registry() const { return m_registry; }

    SpatialIndex& spatial() { return m_spatial; }
    const SpatialIndex& spatial() const { return m_spatial; }

    const GridMap& map() const { return m_map; }

    // --- Component access ---

    /// Store for T, created on first use
    template<typename T>
    ComponentStore<T>& store() {
        const auto key = entt::type_id<T>().hash();
        auto it = m_stores.find(key);
        if (it == m_stores.end()) {
            it = m_stores.emplace(key, std::make_unique<ComponentStore<T>>(m_registry)).first;
        }
        return static_cast<ComponentStore<T>&>(*it->second);
    }

    /// Store for T, or nullptr if no T has ever been stored
    template<typename T>
    ComponentStore<T>* findStore() {
        auto it = m_stores.find(entt::type_id<T>().hash());
        return it != m_stores.end() ? static_cast<ComponentStore<T>*>(it->second.get()) : nullptr;
    }

    template<typename T>
    const ComponentStore<T>* findStore() const {
        auto it = m_stores.find(entt::type_id<T>().hash());
        return it != m_stores.end() ? static_cast<const ComponentStore<T>*>(it->second.get()) : nullptr;
    }

    template<typename T>
    T* add(Entity entity, T value) {
        return store<T>().insert(entity, std::move(value));
    }

    template<typename T>
    T* get(Entity entity) {
        auto* s = findStore<T>();
        return s ? s->get(entity) : nullptr;
    }

    template<typename T>
    const T* get(Entity entity) const {
        const auto* s = findStore<T>();
        return s ? s->get(entity) : nullptr;
    }

    template<typename T>
    bool has(Entity entity) const {
        const auto* s = findStore<T>();
        return s && s->contains(entity);
    }

    template<typename T>
    std::optional<T> remove(Entity entity) {
        auto* s = findStore<T>();
        return s ? s->remove(entity) : std::nullopt;
    }

    /// Call `func(Entity, Ts&...)` for every entity holding all of Ts.
    /// Walks the smallest store and probes the others. Entities are
    /// re-checked when reached, so the callback may add or remove
    /// components; entities gaining the full set mid-pass are not visited.
    template<typename... Ts, typename Func>
    void each(Func&& func) {
        static_assert(sizeof...(Ts) > 0, "each() needs at least one component type");
        auto stores = std::make_tuple(findStore<Ts>()...);
        if (((std::get<ComponentStore<Ts>*>(stores) == nullptr) || ...)) {
            return;
        }

        const ComponentStoreBase* smallest = nullptr;
        ((smallest = pickSmaller(smallest, std::get<ComponentStore<Ts>*>(stores))), ...);

        for (Entity entity : smallest->entities()) {
            if ((std::get<ComponentStore<Ts>*>(stores)->contains(entity) && ...)) {
                func(entity, *std::get<ComponentStore<Ts>*>(stores)->get(entity)...);
            }
        }
    }

    template<typename... Ts, typename Func>
    void each(Func&& func) const {
        static_assert(sizeof...(Ts) > 0, "each() needs at least one component type");
        auto stores = std::make_tuple(findStore<Ts>()...);
        if (((std::get<const ComponentStore<Ts>*>(stores) == nullptr) || ...)) {
            return;
        }

        const ComponentStoreBase* smallest = nullptr;
        ((smallest = pickSmaller(smallest, std::get<const ComponentStore<Ts>*>(stores))), ...);

        for (Entity entity : smallest->entities()) {
            if ((std::get<const ComponentStore<Ts>*>(stores)->contains(entity) && ...)) {
                func(entity, *std::get<const ComponentStore<Ts>*>(stores)->get(entity)...);
            }
        }
    }

    /// Number of entities holding all of Ts
    template<typename... Ts>
    std::size_t count() const {
        std::size_t n = 0;
        each<Ts...>([&n](Entity, const Ts&...) { ++n; });
        return n;
    }

    // --- Placement ---

    /// Give an entity a Position and index it at `pos`. Blocking follows the
    /// Blocker component. On failure nothing is changed.
    [[nodiscard]] CoreResult place(Entity entity, GridPos pos);

    /// Move a placed entity, keeping its Position and the spatial index in step
    [[nodiscard]] CoreResult move(Entity entity, GridPos to);

private:
    static const ComponentStoreBase* pickSmaller(const ComponentStoreBase* current,
                                                 const ComponentStoreBase* candidate) {
        return (!current || candidate->size() < current->size()) ? candidate : current;
    }

    void onEntityDestroyed(Entity entity);

    const GridMap& m_map;
    EntityRegistry m_registry;      // Declared before the stores: outlives them
    std::unordered_map<entt::id_type, std::unique_ptr<ComponentStoreBase>> m_stores;
    SpatialIndex m_spatial;
    entt::scoped_connection m_spatialConnection;
};

} // namespace delve
