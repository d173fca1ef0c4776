#include "ecs/EntityFactory.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <fstream>

namespace delve {

bool EntityFactory::registerFromJson(const nlohmann::json& json) {
    try {
        EntityDefinition def;

        // Required fields
        if (!json.contains("type")) {
            LOG_ERROR("Entity definition missing 'type' field");
            return false;
        }
        def.type = json["type"].get<std::string>();
        def.name = json.value("name", def.type);

        // Health settings
        if (json.contains("health")) {
            const auto& hp = json["health"];
            if (hp.is_number()) {
                def.health = hp.get<int>();
                def.maxHealth = hp.get<int>();
            } else if (hp.is_object()) {
                def.maxHealth = hp.value("max", 10);
                def.health = hp.value("current", *def.maxHealth);
            }
        }

        // Combat stats
        if (json.contains("stats")) {
            const auto& st = json["stats"];
            CombatStats stats;
            stats.attack = st.value("attack", 0);
            stats.defense = st.value("defense", 0);
            stats.power = st.value("power", 1);
            def.stats = stats;
        }

        // Actor
        if (json.contains("actor")) {
            std::string controller = json["actor"].get<std::string>();
            if (controller == "player") {
                def.actor = ActorController::Player;
            } else if (controller == "ai") {
                def.actor = ActorController::AI;
            } else {
                LOG_WARN("Entity '{}': unknown actor controller '{}'", def.type, controller);
            }
        }

        if (json.contains("behavior")) {
            def.behavior = parseBehavior(json["behavior"]);
            if (!def.behavior) {
                LOG_WARN("Entity '{}': unknown behavior, using idle", def.type);
                def.behavior = ai::Idle{};
            }
        }

        if (json.contains("heal")) {
            def.heal = json["heal"].get<int>();
        }

        def.blocking = json.value("blocking", false);
        def.player = json.value("player", false);

        if (json.contains("inventory")) {
            for (const auto& item : json["inventory"]) {
                def.inventory.push_back(item.get<std::string>());
            }
        }

        registerDefinition(def);
        LOG_DEBUG("Registered entity definition: {}", def.type);
        return true;

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definition JSON: {}", e.what());
        return false;
    }
}

std::optional<AIBehavior> EntityFactory::parseBehavior(const nlohmann::json& json) const {
    std::string type = json.is_string() ? json.get<std::string>() : json.value("type", "idle");

    if (type == "idle") {
        return ai::Idle{};
    }
    if (type == "aggressive") {
        ai::Aggressive aggressive;
        aggressive.detectionRange = m_defaultDetectionRange;
        if (json.is_object()) {
            aggressive.detectionRange = json.value("detection_range", m_defaultDetectionRange);
            aggressive.fleeBelowHealth = json.value("flee_below", 0.0f);
        }
        return aggressive;
    }
    if (type == "fleeing") {
        ai::Fleeing fleeing;
        fleeing.detectionRange = m_defaultDetectionRange;
        if (json.is_object()) {
            fleeing.detectionRange = json.value("detection_range", m_defaultDetectionRange);
        }
        return fleeing;
    }
    if (type == "patrol") {
        ai::Patrol patrol;
        if (json.is_object() && json.contains("waypoints")) {
            for (const auto& wp : json["waypoints"]) {
                patrol.waypoints.push_back({wp.at(0).get<int>(), wp.at(1).get<int>()});
            }
        }
        return patrol;
    }
    return std::nullopt;
}

bool EntityFactory::loadParsed(const nlohmann::json& json, const std::string& origin) {
    // Handle array of definitions or single definition
    const nlohmann::json* list = nullptr;
    if (json.is_array()) {
        list = &json;
    } else if (json.contains("entities")) {
        list = &json["entities"];
    } else {
        return registerFromJson(json);
    }

    bool ok = true;
    for (const auto& defJson : *list) {
        if (!registerFromJson(defJson)) {
            LOG_WARN("Failed to register entity definition from {}", origin);
            ok = false;
        }
    }
    return ok;
}

bool EntityFactory::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open entity definitions file: {}", path);
        return false;
    }

    try {
        nlohmann::json json;
        file >> json;
        bool ok = loadParsed(json, path);
        LOG_INFO("Loaded {} entity definitions from: {}", m_definitions.size(), path);
        return ok;

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definitions file '{}': {}", path, e.what());
        return false;
    }
}

bool EntityFactory::loadFromString(const std::string& jsonStr) {
    try {
        return loadParsed(nlohmann::json::parse(jsonStr), "string");
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definitions JSON string: {}", e.what());
        return false;
    }
}

Entity EntityFactory::spawn(World& world, const std::string& type, GridPos position) {
    if (!hasDefinition(type)) {
        LOG_WARN("Unknown entity type: {}", type);
        return NullEntity;
    }

    Entity entity = spawn(world, type);
    if (entity == NullEntity) {
        return NullEntity;
    }
    CoreResult placed = world.place(entity, position);
    if (placed != CoreResult::Success) {
        LOG_WARN("Cannot spawn '{}' at ({}, {}): {}", type, position.x, position.y, toString(placed));
        if (world.destroy(entity) != CoreResult::Success) {
            LOG_ERROR("Failed to clean up rejected '{}' entity", type);
        }
        return NullEntity;
    }
    return entity;
}

Entity EntityFactory::spawn(World& world, const std::string& type) {
    std::vector<std::string> chain;
    return spawnItem(world, type, chain);
}

Entity EntityFactory::spawnItem(World& world, const std::string& type, std::vector<std::string>& chain) {
    auto it = m_definitions.find(type);
    if (it == m_definitions.end()) {
        LOG_WARN("Unknown entity type: {}", type);
        return NullEntity;
    }

    Entity entity = world.create();
    if (entity == NullEntity) {
        LOG_ERROR("Cannot spawn '{}': no free entity slots", type);
        return NullEntity;
    }
    world.add<Name>(entity, Name{it->second.name});
    chain.push_back(type);
    applyDefinition(world, entity, it->second, chain);
    chain.pop_back();
    return entity;
}

std::vector<std::string> EntityFactory::getDefinitionTypes() const {
    std::vector<std::string> types;
    types.reserve(m_definitions.size());
    for (const auto& [type, def] : m_definitions) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

void EntityFactory::applyDefinition(World& world, Entity entity, const EntityDefinition& def,
                                    std::vector<std::string>& chain) {
    if (def.health || def.maxHealth) {
        Health health;
        health.max = def.maxHealth.value_or(10);
        health.current = def.health.value_or(health.max);
        world.add<Health>(entity, health);
    }

    if (def.stats) {
        world.add<CombatStats>(entity, *def.stats);
    }

    if (def.blocking) {
        world.add<Blocker>(entity, Blocker{});
    }

    if (def.actor) {
        world.add<Actor>(entity, Actor{*def.actor});
    }

    if (def.behavior) {
        world.add<AIController>(entity, AIController{*def.behavior});
    }

    if (def.player) {
        world.add<PlayerTag>(entity, PlayerTag{});
    }

    if (def.heal) {
        world.add<Consumable>(entity, Consumable{*def.heal});
    }

    if (!def.inventory.empty()) {
        Inventory inventory;
        for (const auto& itemType : def.inventory) {
            if (std::find(chain.begin(), chain.end(), itemType) != chain.end()) {
                LOG_WARN("Entity '{}' carries '{}', which already contains it; skipped",
                         def.type, itemType);
                continue;
            }
            Entity item = spawnItem(world, itemType, chain);
            if (item != NullEntity) {
                inventory.items.push_back(item);
            }
        }
        world.add<Inventory>(entity, std::move(inventory));
    }
}

} // namespace delve
