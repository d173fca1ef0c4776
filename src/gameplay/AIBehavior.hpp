#pragma once

#include "world/GridPos.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace delve {

/// Built-in AI behaviors. Each alternative carries its own tuning data and
/// has exactly one decision function (see ActionSource.cpp).
///
/// | Behavior   | Description                                          |
/// |------------|------------------------------------------------------|
/// | Idle       | Wait every turn                                      |
/// | Aggressive | Chase the selected target and attack when adjacent   |
/// | Fleeing    | Step away from the nearest threat                    |
/// | Patrol     | Walk a fixed waypoint loop                           |
namespace ai {

struct Idle {};

struct Aggressive {
    int detectionRange = 8;         ///< Grid distance at which a target is noticed
    float fleeBelowHealth = 0.0f;   ///< Health fraction under which the actor flees (0 = never)
};

struct Fleeing {
    int detectionRange = 8;         ///< Threats farther than this are ignored
};

struct Patrol {
    std::vector<GridPos> waypoints;
    std::size_t cursor = 0;         ///< Index of the waypoint being walked to

    /// Waypoint currently targeted (only valid if waypoints is non-empty)
    GridPos current() const { return waypoints[cursor % waypoints.size()]; }
};

} // namespace ai

using AIBehavior = std::variant<ai::Idle, ai::Aggressive, ai::Fleeing, ai::Patrol>;

inline const char* behaviorName(const AIBehavior& behavior) {
    switch (behavior.index()) {
        case 0: return "idle";
        case 1: return "aggressive";
        case 2: return "fleeing";
        case 3: return "patrol";
    }
    return "unknown";
}

/// AIController component - selects the decision function for an AI actor
struct AIController {
    AIBehavior behavior = ai::Idle{};

    AIController() = default;
    AIController(AIBehavior bhv) : behavior(std::move(bhv)) {}
};

} // namespace delve
