#pragma once

#include "ecs/World.hpp"
#include "gameplay/Action.hpp"
#include "gameplay/ActionSource.hpp"
#include "gameplay/CombatResolver.hpp"
#include "gameplay/TurnResult.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace delve {

class ThreadPool;

enum class TurnPhase {
    CollectingActions,
    Resolving,
    Committed
};

inline const char* toString(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::CollectingActions: return "CollectingActions";
        case TurnPhase::Resolving:         return "Resolving";
        case TurnPhase::Committed:         return "Committed";
    }
    return "Unknown";
}

/// Runs one game turn at a time, deterministically.
///
/// Turn structure:
///   1. CollectingActions - the first submit() or collect() of the turn
///      copies the spatial index; every decision reads that copy. Actors
///      without a submitted action ask the player source or the AI source.
///   2. Resolving - moves, then attacks, then item uses, each in ascending
///      entity index order. Waits do nothing. Actors killed earlier in the
///      pass do not act.
///   3. Committed - dead entities and used items are destroyed, patrol
///      cursors advance, the TurnResult is published, and the scheduler
///      returns to CollectingActions for the next turn.
///
/// The world is only modified on the calling thread, during resolve().
class TurnScheduler {
public:
    using CommitSignal = entt::sigh<void(const TurnResult&)>;

    TurnScheduler(World& world, CombatResolver& combat);

    TurnScheduler(const TurnScheduler&) = delete;
    TurnScheduler& operator=(const TurnScheduler&) = delete;

    /// Source asked for actors with ActorController::Player (not owned)
    void setPlayerSource(ActionSource* source) { m_playerSource = source; }

    /// Source asked for actors with ActorController::AI (not owned).
    /// Must tolerate concurrent decide() calls when a thread pool is set.
    void setAISource(ActionSource* source) { m_aiSource = source; }

    /// Pool for AI decisions; nullptr decides inline
    void setThreadPool(ThreadPool* pool) { m_pool = pool; }

    void setAllowDiagonals(bool allow) { m_allowDiagonals = allow; }
    bool getAllowDiagonals() const { return m_allowDiagonals; }

    /// Queue an action for this turn.
    /// UnknownEntity for a dead handle, MissingCapability for a non-actor,
    /// DuplicateAction if the entity already has one, InvalidPhase outside
    /// CollectingActions.
    [[nodiscard]] CoreResult submit(Entity entity, Action action);

    /// Ask the action sources for every living actor without an action
    void collect();

    /// Resolve and commit the queued actions.
    /// nullopt (logged) if called outside CollectingActions.
    std::optional<TurnResult> resolve();

    /// collect() + resolve() in one call
    TurnResult advance();

    TurnPhase phase() const { return m_phase; }

    /// Number of the turn being collected; the first turn is 1
    uint64_t turn() const { return m_turn; }

    bool hasPendingAction(Entity entity) const { return m_pending.count(entity) != 0; }
    std::size_t pendingCount() const { return m_pending.size(); }

    /// True while at least one PlayerTag entity is alive
    bool playerAlive() const;

    /// Subscribers receive every TurnResult right after its commit
    entt::sink<CommitSignal> onCommitted() { return entt::sink<CommitSignal>{m_onCommitted}; }

private:
    void ensureSnapshot();
    bool canAct(Entity entity) const;

    void resolveMoves(TurnResult& result);
    void resolveAttacks(TurnResult& result);
    void resolveItems(TurnResult& result);
    void commit(TurnResult& result);

    template<typename A>
    std::vector<std::pair<Entity, A>> pendingOf() const {
        std::vector<std::pair<Entity, A>> out;
        for (const auto& [entity, action] : m_pending) {
            if (const auto* a = std::get_if<A>(&action)) {
                out.emplace_back(entity, *a);
            }
        }
        return out;
    }

    World& m_world;
    CombatResolver& m_combat;
    ActionSource* m_playerSource = nullptr;
    ActionSource* m_aiSource = nullptr;
    ThreadPool* m_pool = nullptr;
    bool m_allowDiagonals = false;

    TurnPhase m_phase = TurnPhase::CollectingActions;
    uint64_t m_turn = 1;
    std::optional<SpatialIndex> m_snapshot;
    std::map<Entity, Action, EntityIndexLess> m_pending;
    std::vector<Entity> m_consumedItems;

    CommitSignal m_onCommitted;
};

} // namespace delve
