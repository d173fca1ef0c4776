#pragma once

#include "ecs/World.hpp"
#include "ecs/Components.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace delve {

/// Entity definition loaded from JSON
struct EntityDefinition {
    std::string type;
    std::string name;

    // Optional components (nullopt means not defined)
    std::optional<int> health;
    std::optional<int> maxHealth;
    std::optional<CombatStats> stats;
    std::optional<ActorController> actor;
    std::optional<AIBehavior> behavior;
    std::optional<int> heal;            ///< Consumable

    bool blocking = false;
    bool player = false;

    /// Item types spawned into the entity's inventory
    std::vector<std::string> inventory;
};

/// Creates entities from JSON definitions.
///
/// Definition format:
/// ```json
/// {
///   "type": "goblin",
///   "name": "Goblin",
///   "health": 10,                       // or {"current": 8, "max": 10}
///   "stats": {"attack": 3, "defense": 1, "power": 3},
///   "blocking": true,
///   "actor": "ai",                      // "ai" or "player"
///   "behavior": {"type": "aggressive", "detection_range": 8, "flee_below": 0.25},
///   "player": false,
///   "heal": 10,                         // makes the entity a consumable
///   "inventory": ["potion"]
/// }
/// ```
class EntityFactory {
public:
    EntityFactory() = default;

    /// Register an entity definition
    void registerDefinition(const EntityDefinition& def) {
        m_definitions[def.type] = def;
    }

    /// Register a definition from JSON
    bool registerFromJson(const nlohmann::json& json);

    /// Load definitions from a JSON file (array, {"entities": [...]} or a single object)
    bool loadFromFile(const std::string& path);

    /// Load definitions from a JSON string
    bool loadFromString(const std::string& jsonStr);

    /// Check if a definition exists
    bool hasDefinition(const std::string& type) const {
        return m_definitions.find(type) != m_definitions.end();
    }

    /// Get a definition by type
    const EntityDefinition* getDefinition(const std::string& type) const {
        auto it = m_definitions.find(type);
        return it != m_definitions.end() ? &it->second : nullptr;
    }

    /// Detection range for "aggressive"/"fleeing" behaviors that do not set one
    void setDefaultDetectionRange(int range) { m_defaultDetectionRange = range; }

    /// Spawn an entity at a cell. Returns NullEntity if the type is unknown
    /// or the cell cannot take it (the half-built entity is destroyed).
    Entity spawn(World& world, const std::string& type, GridPos position);

    /// Spawn an entity that is not on the map (carried items)
    Entity spawn(World& world, const std::string& type);

    /// Get all registered definition types, sorted
    std::vector<std::string> getDefinitionTypes() const;

    /// Clear all definitions
    void clear() { m_definitions.clear(); }

private:
    bool loadParsed(const nlohmann::json& json, const std::string& origin);

    /// `chain` holds the types being spawned above this one, outermost first
    Entity spawnItem(World& world, const std::string& type, std::vector<std::string>& chain);

    /// Apply components from a definition to an entity
    void applyDefinition(World& world, Entity entity, const EntityDefinition& def,
                         std::vector<std::string>& chain);

    std::optional<AIBehavior> parseBehavior(const nlohmann::json& json) const;

    std::unordered_map<std::string, EntityDefinition> m_definitions;
    int m_defaultDetectionRange = 8;
};

} // namespace delve
