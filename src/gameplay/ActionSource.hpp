#pragma once

#include "ecs/World.hpp"
#include "gameplay/Action.hpp"
#include "gameplay/AIBehavior.hpp"
#include "gameplay/Pathfinding.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace delve {

/// What a decision may look at: the world as it stood when the turn's
/// collection started, and the occupancy copied at that moment.
/// Decisions must not modify either.
struct WorldSnapshot {
    const World& world;
    const SpatialIndex& occupancy;
    uint64_t turn = 0;
};

/// Produces one action for an actor. Implementations used as the AI source
/// may be called from several worker threads at once.
class ActionSource {
public:
    virtual ~ActionSource() = default;

    virtual Action decide(Entity entity, const WorldSnapshot& snapshot) = 0;
};

/// Chooses whom an AI actor reacts to.
/// Receives the deciding entity, its cell and its detection range;
/// returns NullEntity when nothing is in range.
using TargetSelector = std::function<Entity(Entity self, GridPos from, int range,
                                            const WorldSnapshot& snapshot)>;

/// Built-in AI: dispatches on the actor's AIController behavior.
/// Holds no per-call state, so concurrent decide() calls are safe.
class AIActionSource : public ActionSource {
public:
    explicit AIActionSource(const Pathfinder& pathfinder);

    Action decide(Entity entity, const WorldSnapshot& snapshot) override;

    void setTargetSelector(TargetSelector selector) { m_selectTarget = std::move(selector); }

    /// Aggressive actors with nothing in range take a random cardinal step
    /// with probability `chance` and wait otherwise. The roll depends only on
    /// seed, turn and entity, so decision order and threading do not matter.
    /// A chance of 0 (the default) disables wandering.
    void setWander(float chance, uint32_t seed) {
        m_wanderChance = chance;
        m_wanderSeed = seed;
    }
    float getWanderChance() const { return m_wanderChance; }

    /// Default selector: nearest PlayerTag entity within range, lower
    /// entity index on ties
    static Entity nearestPlayer(Entity self, GridPos from, int range, const WorldSnapshot& snapshot,
                                bool allowDiagonals);

    // One decision function per behavior
    Action decideFor(const ai::Idle& behavior, Entity self, GridPos pos, const WorldSnapshot& snapshot) const;
    Action decideFor(const ai::Aggressive& behavior, Entity self, GridPos pos, const WorldSnapshot& snapshot) const;
    Action decideFor(const ai::Fleeing& behavior, Entity self, GridPos pos, const WorldSnapshot& snapshot) const;
    Action decideFor(const ai::Patrol& behavior, Entity self, GridPos pos, const WorldSnapshot& snapshot) const;

private:
    Entity selectTarget(Entity self, GridPos from, int range, const WorldSnapshot& snapshot) const;

    /// Next step toward `goal`, or Wait if there is no path
    Action stepToward(Entity self, GridPos pos, GridPos goal, const WorldSnapshot& snapshot) const;

    /// Step that increases distance from `threat` the most, or Wait
    Action stepAwayFrom(GridPos pos, GridPos threat, const WorldSnapshot& snapshot) const;

    /// Random cardinal step or Wait, see setWander()
    Action wander(Entity self, GridPos pos, const WorldSnapshot& snapshot) const;

    bool isAdjacent(GridPos a, GridPos b) const;

    const Pathfinder& m_pathfinder;
    TargetSelector m_selectTarget;
    float m_wanderChance = 0.0f;
    uint32_t m_wanderSeed = 1;
};

/// Adapter for a synchronous decision callback (keyboard, network, test)
class CallbackActionSource : public ActionSource {
public:
    using Callback = std::function<Action(Entity, const WorldSnapshot&)>;

    explicit CallbackActionSource(Callback callback) : m_callback(std::move(callback)) {}

    Action decide(Entity entity, const WorldSnapshot& snapshot) override {
        return m_callback ? m_callback(entity, snapshot) : Action{WaitAction{}};
    }

private:
    Callback m_callback;
};

/// Replays pre-recorded per-entity action queues. An entity with an empty
/// queue waits.
class ScriptedActionSource : public ActionSource {
public:
    void push(Entity entity, Action action);

    std::size_t pending(Entity entity) const;

    Action decide(Entity entity, const WorldSnapshot& snapshot) override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<Entity, std::deque<Action>> m_queues;
};

} // namespace delve
