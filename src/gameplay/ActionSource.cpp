#include "gameplay/ActionSource.hpp"
#include "engine/Log.hpp"

#include <limits>
#include <random>

namespace delve {

// ============================================================================
// AIActionSource
// ============================================================================

AIActionSource::AIActionSource(const Pathfinder& pathfinder)
    : m_pathfinder(pathfinder) {}

Action AIActionSource::decide(Entity entity, const WorldSnapshot& snapshot) {
    const auto* controller = snapshot.world.get<AIController>(entity);
    const auto* position = snapshot.world.get<Position>(entity);
    if (!controller || !position) {
        return WaitAction{};
    }

    const GridPos pos = position->toGridPos();
    return std::visit([&](const auto& behavior) {
        return decideFor(behavior, entity, pos, snapshot);
    }, controller->behavior);
}

Entity AIActionSource::nearestPlayer(Entity self, GridPos from, int range,
                                     const WorldSnapshot& snapshot, bool allowDiagonals) {
    Entity best = NullEntity;
    int bestDistance = std::numeric_limits<int>::max();

    snapshot.world.each<PlayerTag, Position>([&](Entity player, const PlayerTag&, const Position& p) {
        if (player == self) return;
        int distance = gridDistance(from, p.toGridPos(), allowDiagonals);
        if (distance > range) return;
        if (distance < bestDistance ||
            (distance == bestDistance && entityIndex(player) < entityIndex(best))) {
            best = player;
            bestDistance = distance;
        }
    });
    return best;
}

Entity AIActionSource::selectTarget(Entity self, GridPos from, int range,
                                    const WorldSnapshot& snapshot) const {
    if (m_selectTarget) {
        return m_selectTarget(self, from, range, snapshot);
    }
    return nearestPlayer(self, from, range, snapshot, m_pathfinder.getAllowDiagonals());
}

Action AIActionSource::decideFor(const ai::Idle&, Entity, GridPos, const WorldSnapshot&) const {
    return WaitAction{};
}

Action AIActionSource::decideFor(const ai::Aggressive& behavior, Entity self, GridPos pos,
                                 const WorldSnapshot& snapshot) const {
    if (behavior.fleeBelowHealth > 0.0f) {
        const auto* health = snapshot.world.get<Health>(self);
        if (health && health->percentage() < behavior.fleeBelowHealth) {
            return decideFor(ai::Fleeing{behavior.detectionRange}, self, pos, snapshot);
        }
    }

    Entity target = selectTarget(self, pos, behavior.detectionRange, snapshot);
    const auto* targetPos = target != NullEntity ? snapshot.world.get<Position>(target) : nullptr;
    if (!targetPos) {
        return wander(self, pos, snapshot);
    }

    if (isAdjacent(pos, targetPos->toGridPos())) {
        return AttackAction{target};
    }
    return stepToward(self, pos, targetPos->toGridPos(), snapshot);
}

Action AIActionSource::wander(Entity self, GridPos pos, const WorldSnapshot& snapshot) const {
    if (m_wanderChance <= 0.0f) {
        return WaitAction{};
    }

    std::seed_seq seq{m_wanderSeed,
                      static_cast<uint32_t>(snapshot.turn),
                      static_cast<uint32_t>(snapshot.turn >> 32),
                      entityId(self)};
    std::mt19937 rng(seq);
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    if (roll(rng) >= m_wanderChance) {
        return WaitAction{};
    }

    std::uniform_int_distribution<int> step(-1, 1);
    int dx = step(rng);
    int dy = step(rng);
    if (dx != 0 && dy != 0) {
        // Cardinal only: drop one axis
        if (roll(rng) < 0.5f) dx = 0; else dy = 0;
    }

    auto dir = directionBetween(pos, pos + GridPos{dx, dy});
    if (!dir) {
        return WaitAction{};
    }
    AI_LOG_TRACE("Entity {} wanders {}", entityId(self), static_cast<int>(*dir));
    return MoveAction{*dir};
}

Action AIActionSource::decideFor(const ai::Fleeing& behavior, Entity self, GridPos pos,
                                 const WorldSnapshot& snapshot) const {
    Entity threat = selectTarget(self, pos, behavior.detectionRange, snapshot);
    const auto* threatPos = threat != NullEntity ? snapshot.world.get<Position>(threat) : nullptr;
    if (!threatPos) {
        return WaitAction{};
    }
    return stepAwayFrom(pos, threatPos->toGridPos(), snapshot);
}

Action AIActionSource::decideFor(const ai::Patrol& behavior, Entity self, GridPos pos,
                                 const WorldSnapshot& snapshot) const {
    if (behavior.waypoints.empty()) {
        return WaitAction{};
    }

    // Standing on the current waypoint: the cursor moves on at commit, so
    // head for the one after it already.
    GridPos goal = behavior.current();
    if (goal == pos) {
        goal = behavior.waypoints[(behavior.cursor + 1) % behavior.waypoints.size()];
        if (goal == pos) {
            return WaitAction{};
        }
    }
    return stepToward(self, pos, goal, snapshot);
}

Action AIActionSource::stepToward(Entity self, GridPos pos, GridPos goal,
                                  const WorldSnapshot& snapshot) const {
    PathResult path = m_pathfinder.findPath(snapshot.world.map(), pos, goal, &snapshot.occupancy);
    if (!path.found || path.path.empty()) {
        AI_LOG_DEBUG("Entity {}: no path from ({}, {}) to ({}, {}) [{}], waiting",
                     entityId(self), pos.x, pos.y, goal.x, goal.y, toString(path.status));
        return WaitAction{};
    }

    auto dir = directionBetween(pos, path.path.front());
    if (!dir) {
        AI_LOG_WARN("Entity {}: path step ({}, {}) is not adjacent", entityId(self),
                    path.path.front().x, path.path.front().y);
        return WaitAction{};
    }
    return MoveAction{*dir};
}

Action AIActionSource::stepAwayFrom(GridPos pos, GridPos threat, const WorldSnapshot& snapshot) const {
    const GridMap& map = snapshot.world.map();
    const bool diagonals = m_pathfinder.getAllowDiagonals();
    const std::size_t dirCount = diagonals ? AllDirections.size() : CardinalDirections.size();

    int bestDistance = gridDistance(pos, threat, diagonals);
    std::optional<Direction> bestDir;

    for (std::size_t i = 0; i < dirCount; ++i) {
        const Direction dir = AllDirections[i];
        const GridPos step = offset(dir);
        const GridPos next = pos + step;

        if (!map.isPassable(next) || snapshot.occupancy.isBlocked(next)) continue;
        if (isDiagonal(dir) &&
            (!map.isPassable({pos.x + step.x, pos.y}) || !map.isPassable({pos.x, pos.y + step.y}))) {
            continue;
        }

        int distance = gridDistance(next, threat, diagonals);
        if (distance > bestDistance) {
            bestDistance = distance;
            bestDir = dir;
        }
    }

    if (!bestDir) {
        return WaitAction{};
    }
    return MoveAction{*bestDir};
}

bool AIActionSource::isAdjacent(GridPos a, GridPos b) const {
    return gridDistance(a, b, m_pathfinder.getAllowDiagonals()) == 1;
}

// ============================================================================
// ScriptedActionSource
// ============================================================================

void ScriptedActionSource::push(Entity entity, Action action) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queues[entity].push_back(std::move(action));
}

std::size_t ScriptedActionSource::pending(Entity entity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_queues.find(entity);
    return it != m_queues.end() ? it->second.size() : 0;
}

Action ScriptedActionSource::decide(Entity entity, const WorldSnapshot&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_queues.find(entity);
    if (it == m_queues.end() || it->second.empty()) {
        return WaitAction{};
    }
    Action action = std::move(it->second.front());
    it->second.pop_front();
    return action;
}

} // namespace delve
