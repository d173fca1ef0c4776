#pragma once

#include "ecs/EntityRegistry.hpp"
#include "engine/Log.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace delve {

/// Type-erased part of a component store. Registers a component kind with
/// the registry and subscribes to its destroy signal so the store drops an
/// entity's data before the slot is recycled.
class ComponentStoreBase {
public:
    ComponentStoreBase(EntityRegistry& registry, std::string name)
        : m_registry(registry)
        , m_name(std::move(name))
        , m_kind(registry.registerKind(m_name)) {
        m_connection = registry.onDestroy().connect<&ComponentStoreBase::onEntityDestroyed>(*this);
    }

    virtual ~ComponentStoreBase() = default;

    ComponentStoreBase(const ComponentStoreBase&) = delete;
    ComponentStoreBase& operator=(const ComponentStoreBase&) = delete;

    virtual bool contains(Entity entity) const = 0;
    virtual std::size_t size() const = 0;

    /// Entities currently present, in dense order
    virtual std::vector<Entity> entities() const = 0;

    const std::string& name() const { return m_name; }
    ComponentKind kind() const { return m_kind; }

protected:
    /// Remove the entity's value, if any
    virtual void dropEntity(Entity entity) = 0;

    EntityRegistry& m_registry;

private:
    void onEntityDestroyed(Entity entity) { dropEntity(entity); }

    std::string m_name;
    ComponentKind m_kind;
    entt::scoped_connection m_connection;
};

/// Dense storage for one component type.
///
/// Values live contiguously in insertion order; a sparse table maps an
/// entity's slot index to its dense position, and the dense entity array
/// holds the full handle so a stale generation never matches. Removal
/// swaps the last element into the hole, so dense order is not stable
/// across removals.
template<typename T>
class ComponentStore final : public ComponentStoreBase {
    static constexpr uint32_t Tombstone = std::numeric_limits<uint32_t>::max();

    template<bool Const>
    class BasicIterator {
    public:
        using StorePtr = std::conditional_t<Const, const ComponentStore*, ComponentStore*>;
        using Reference = std::conditional_t<Const, const T&, T&>;

        BasicIterator(StorePtr store, std::size_t pos) : m_store(store), m_pos(pos) {}

        std::pair<Entity, Reference> operator*() const {
            return {m_store->m_entities[m_pos], m_store->m_dense[m_pos]};
        }

        BasicIterator& operator++() { ++m_pos; return *this; }

        bool operator==(const BasicIterator& other) const { return m_pos == other.m_pos; }
        bool operator!=(const BasicIterator& other) const { return m_pos != other.m_pos; }

    private:
        StorePtr m_store;
        std::size_t m_pos;
    };

public:
    using iterator = BasicIterator<false>;
    using const_iterator = BasicIterator<true>;

    explicit ComponentStore(EntityRegistry& registry)
        : ComponentStoreBase(registry, std::string(entt::type_id<T>().name())) {}

    ~ComponentStore() override {
        for (Entity entity : m_entities) {
            m_registry.setCapability(entity, kind(), false);
        }
    }

    /// Insert or overwrite the value for a live entity.
    /// Returns nullptr (and logs an error) if the entity is not alive.
    T* insert(Entity entity, T value) {
        return emplace(entity, std::move(value));
    }

    template<typename... Args>
    T* emplace(Entity entity, Args&&... args) {
        if (!m_registry.isAlive(entity)) {
            LOG_ERROR("ComponentStore<{}>: insert for unknown entity {}", name(), entityId(entity));
            return nullptr;
        }

        if (T* existing = get(entity)) {
            *existing = T{std::forward<Args>(args)...};
            return existing;
        }

        uint32_t index = entityIndex(entity);
        if (index >= m_sparse.size()) {
            m_sparse.resize(static_cast<std::size_t>(index) + 1, Tombstone);
        }
        m_sparse[index] = static_cast<uint32_t>(m_dense.size());
        m_dense.push_back(T{std::forward<Args>(args)...});
        m_entities.push_back(entity);
        m_registry.setCapability(entity, kind(), true);
        return &m_dense.back();
    }

    /// Remove and return the entity's value (nullopt if absent)
    std::optional<T> remove(Entity entity) {
        if (!contains(entity)) {
            return std::nullopt;
        }

        uint32_t index = entityIndex(entity);
        uint32_t pos = m_sparse[index];
        std::optional<T> removed(std::move(m_dense[pos]));

        uint32_t last = static_cast<uint32_t>(m_dense.size() - 1);
        if (pos != last) {
            m_dense[pos] = std::move(m_dense[last]);
            m_entities[pos] = m_entities[last];
            m_sparse[entityIndex(m_entities[pos])] = pos;
        }
        m_dense.pop_back();
        m_entities.pop_back();
        m_sparse[index] = Tombstone;

        m_registry.setCapability(entity, kind(), false);
        return removed;
    }

    T* get(Entity entity) {
        return contains(entity) ? &m_dense[m_sparse[entityIndex(entity)]] : nullptr;
    }

    const T* get(Entity entity) const {
        return contains(entity) ? &m_dense[m_sparse[entityIndex(entity)]] : nullptr;
    }

    bool contains(Entity entity) const override {
        if (entity == NullEntity) return false;
        uint32_t index = entityIndex(entity);
        if (index >= m_sparse.size() || m_sparse[index] == Tombstone) return false;
        return m_entities[m_sparse[index]] == entity;
    }

    std::size_t size() const override { return m_dense.size(); }
    bool empty() const { return m_dense.empty(); }

    std::vector<Entity> entities() const override { return m_entities; }

    // Lazy range over (Entity, T&) in dense order. Must not be used while
    // the store is being modified; use each() for that.
    iterator begin() { return iterator(this, 0); }
    iterator end() { return iterator(this, m_dense.size()); }
    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, m_dense.size()); }

    /// Call `func(Entity, T&)` for every entity present when the pass starts.
    /// The callback may insert or remove components: entities removed before
    /// they are reached are skipped, entities added during the pass are not
    /// visited.
    template<typename Func>
    void each(Func&& func) {
        const std::vector<Entity> snapshot = m_entities;
        for (Entity entity : snapshot) {
            if (T* value = get(entity)) {
                func(entity, *value);
            }
        }
    }

    template<typename Func>
    void each(Func&& func) const {
        const std::vector<Entity> snapshot = m_entities;
        for (Entity entity : snapshot) {
            if (const T* value = get(entity)) {
                func(entity, *value);
            }
        }
    }

protected:
    void dropEntity(Entity entity) override {
        remove(entity);
    }

private:
    std::vector<T> m_dense;
    std::vector<Entity> m_entities;     ///< Parallel to m_dense
    std::vector<uint32_t> m_sparse;     ///< Slot index -> dense position
};

} // namespace delve
