#pragma once

#include "ecs/Entity.hpp"
#include "gameplay/AIBehavior.hpp"
#include "world/GridPos.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace delve {

/// Position component - the cell an entity stands on.
/// Kept in sync with the World's spatial index by World::place/World::move.
struct Position {
    int x = 0;
    int y = 0;

    Position() = default;
    Position(int x, int y) : x(x), y(y) {}
    Position(GridPos pos) : x(pos.x), y(pos.y) {}

    GridPos toGridPos() const { return {x, y}; }
};

/// Health component
struct Health {
    int current = 10;
    int max = 10;

    Health() = default;
    Health(int hp) : current(hp), max(hp) {}
    Health(int cur, int mx) : current(cur), max(mx) {}

    /// Apply damage and return the amount actually removed
    int takeDamage(int amount) {
        if (amount <= 0) return 0;
        int dealt = std::min(amount, std::max(current, 0));
        current -= amount;
        return dealt;
    }

    /// Restore health up to max, returning the amount actually restored
    int heal(int amount) {
        if (amount <= 0 || current >= max) return 0;
        int before = current;
        current = std::min(current + amount, max);
        return current - before;
    }

    bool isDead() const { return current <= 0; }

    float percentage() const {
        return max > 0 ? static_cast<float>(current) / static_cast<float>(max) : 0.0f;
    }
};

/// Combat numbers read by the CombatResolver
struct CombatStats {
    int attack = 0;     ///< Raises hit chance
    int defense = 0;    ///< Lowers hit chance and incoming damage
    int power = 1;      ///< Base damage
};

/// Who chooses this actor's action each turn
enum class ActorController : uint8_t {
    Player,
    AI
};

/// Actor component - marks an entity that takes a turn
struct Actor {
    ActorController controller = ActorController::AI;
};

/// Tag: a player-controlled entity (target of aggressive AI)
struct PlayerTag {};

/// Display name
struct Name {
    std::string name;

    Name() = default;
    Name(std::string n) : name(std::move(n)) {}
};

/// Tag: occupies its cell exclusively in the spatial index
struct Blocker {};

/// Item that restores health when used; consumed on use
struct Consumable {
    int heal = 0;
};

/// Carried items, referenced by entity
struct Inventory {
    std::vector<Entity> items;

    bool contains(Entity item) const {
        return std::find(items.begin(), items.end(), item) != items.end();
    }

    bool removeItem(Entity item) {
        auto it = std::find(items.begin(), items.end(), item);
        if (it == items.end()) return false;
        items.erase(it);
        return true;
    }
};

} // namespace delve
