#pragma once

#include "ecs/Entity.hpp"
#include "world/GridPos.hpp"

#include <variant>

namespace delve {

/// Do nothing this turn
struct WaitAction {};

/// Step one cell
struct MoveAction {
    Direction direction = Direction::North;
};

/// Melee attack on an adjacent entity
struct AttackAction {
    Entity target = NullEntity;
};

/// Consume an item from the actor's inventory
struct UseItemAction {
    Entity item = NullEntity;
};

/// One actor's choice for a turn. Consumed exactly once by the scheduler.
using Action = std::variant<WaitAction, MoveAction, AttackAction, UseItemAction>;

inline const char* actionName(const Action& action) {
    switch (action.index()) {
        case 0: return "wait";
        case 1: return "move";
        case 2: return "attack";
        case 3: return "use_item";
    }
    return "unknown";
}

} // namespace delve
