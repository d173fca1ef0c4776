#include "gameplay/TurnScheduler.hpp"
#include "engine/Log.hpp"
#include "engine/ThreadPool.hpp"

#include <algorithm>
#include <exception>
#include <future>

namespace delve {

TurnScheduler::TurnScheduler(World& world, CombatResolver& combat)
    : m_world(world)
    , m_combat(combat) {
    // Make sure the loggers exist before any worker thread can log
    Log::getCoreLogger();
    Log::getAILogger();
}

CoreResult TurnScheduler::submit(Entity entity, Action action) {
    if (m_phase != TurnPhase::CollectingActions) {
        LOG_WARN("TurnScheduler: submit during {}", toString(m_phase));
        return CoreResult::InvalidPhase;
    }
    if (!m_world.isAlive(entity)) {
        LOG_ERROR("TurnScheduler: submit for unknown entity {}", entityId(entity));
        return CoreResult::UnknownEntity;
    }
    if (!m_world.has<Actor>(entity)) {
        LOG_DEBUG("TurnScheduler: entity {} is not an actor", entityId(entity));
        return CoreResult::MissingCapability;
    }
    if (hasPendingAction(entity)) {
        return CoreResult::DuplicateAction;
    }

    ensureSnapshot();
    m_pending.emplace(entity, std::move(action));
    return CoreResult::Success;
}

void TurnScheduler::collect() {
    if (m_phase != TurnPhase::CollectingActions) {
        LOG_ERROR("TurnScheduler: collect during {}", toString(m_phase));
        return;
    }
    ensureSnapshot();

    std::vector<Entity> players;
    std::vector<Entity> aiActors;
    m_world.each<Actor>([&](Entity entity, const Actor& actor) {
        if (hasPendingAction(entity) || !canAct(entity)) return;
        (actor.controller == ActorController::Player ? players : aiActors).push_back(entity);
    });
    std::sort(players.begin(), players.end(), EntityIndexLess{});
    std::sort(aiActors.begin(), aiActors.end(), EntityIndexLess{});

    const WorldSnapshot snapshot{m_world, *m_snapshot, m_turn};

    if (m_playerSource) {
        for (Entity entity : players) {
            m_pending.emplace(entity, m_playerSource->decide(entity, snapshot));
        }
    }

    if (!m_aiSource || aiActors.empty()) {
        return;
    }

    if (m_pool && aiActors.size() > 1) {
        ActionSource* source = m_aiSource;
        std::vector<std::future<Action>> decisions;
        decisions.reserve(aiActors.size());
        for (Entity entity : aiActors) {
            decisions.push_back(m_pool->submit([source, entity, &snapshot]() {
                return source->decide(entity, snapshot);
            }));
        }
        // Every task reads `snapshot`; none may outlive this frame
        for (auto& decision : decisions) {
            decision.wait();
        }
        for (std::size_t i = 0; i < aiActors.size(); ++i) {
            try {
                m_pending.emplace(aiActors[i], decisions[i].get());
            } catch (const std::exception& e) {
                AI_LOG_ERROR("Turn {}: decision for entity {} failed: {}",
                             m_turn, entityId(aiActors[i]), e.what());
                m_pending.emplace(aiActors[i], WaitAction{});
            }
        }
    } else {
        for (Entity entity : aiActors) {
            try {
                m_pending.emplace(entity, m_aiSource->decide(entity, snapshot));
            } catch (const std::exception& e) {
                AI_LOG_ERROR("Turn {}: decision for entity {} failed: {}",
                             m_turn, entityId(entity), e.what());
                m_pending.emplace(entity, WaitAction{});
            }
        }
    }

    AI_LOG_TRACE("Turn {}: collected {} player and {} AI decisions",
                 m_turn, players.size(), aiActors.size());
}

std::optional<TurnResult> TurnScheduler::resolve() {
    if (m_phase != TurnPhase::CollectingActions) {
        LOG_ERROR("TurnScheduler: resolve during {}", toString(m_phase));
        return std::nullopt;
    }

    m_phase = TurnPhase::Resolving;
    TurnResult result(m_turn);

    resolveMoves(result);
    resolveAttacks(result);
    resolveItems(result);
    commit(result);

    return result;
}

TurnResult TurnScheduler::advance() {
    collect();
    auto result = resolve();
    return result ? std::move(*result) : TurnResult(m_turn);
}

bool TurnScheduler::playerAlive() const {
    bool alive = false;
    m_world.each<PlayerTag>([&](Entity entity, const PlayerTag&) {
        const auto* health = m_world.get<Health>(entity);
        if (!health || !health->isDead()) alive = true;
    });
    return alive;
}

void TurnScheduler::ensureSnapshot() {
    if (!m_snapshot) {
        m_snapshot = m_world.spatial();
    }
}

bool TurnScheduler::canAct(Entity entity) const {
    if (!m_world.isAlive(entity)) return false;
    const auto* health = m_world.get<Health>(entity);
    return !health || !health->isDead();
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

void TurnScheduler::resolveMoves(TurnResult& result) {
    const GridMap& map = m_world.map();

    for (const auto& [entity, move] : pendingOf<MoveAction>()) {
        if (!canAct(entity)) continue;

        const auto* position = m_world.get<Position>(entity);
        if (!position) {
            LOG_WARN("Turn {}: entity {} cannot move without a Position", m_turn, entityId(entity));
            continue;
        }

        const GridPos from = position->toGridPos();
        const GridPos step = offset(move.direction);
        const GridPos to = from + step;

        bool blocked = !map.isPassable(to);
        if (!blocked && isDiagonal(move.direction)) {
            blocked = !m_allowDiagonals ||
                      !map.isPassable({from.x + step.x, from.y}) ||
                      !map.isPassable({from.x, from.y + step.y});
        }
        if (!blocked) {
            CoreResult moved = m_world.move(entity, to);
            blocked = moved != CoreResult::Success;
            if (blocked && moved != CoreResult::CellOccupied) {
                LOG_WARN("Turn {}: move of entity {} failed: {}", m_turn, entityId(entity), toString(moved));
            }
        }

        if (blocked) {
            result.append(BlockedEvent{entity, to});
        } else {
            result.append(MovedEvent{entity, from, to});
        }
    }
}

void TurnScheduler::resolveAttacks(TurnResult& result) {
    for (const auto& [attacker, attack] : pendingOf<AttackAction>()) {
        if (!canAct(attacker)) continue;

        const Entity target = attack.target;
        if (!canAct(target)) {
            LOG_DEBUG("Turn {}: entity {} attacks missing or dead target {}",
                      m_turn, entityId(attacker), entityId(target));
            continue;
        }

        const auto* attackerPos = m_world.get<Position>(attacker);
        const auto* targetPos = m_world.get<Position>(target);
        if (!attackerPos || !targetPos ||
            gridDistance(attackerPos->toGridPos(), targetPos->toGridPos(), m_allowDiagonals) != 1) {
            LOG_DEBUG("Turn {}: entity {} is not adjacent to target {}",
                      m_turn, entityId(attacker), entityId(target));
            continue;
        }

        Health* health = m_world.get<Health>(target);
        CombatOutcome outcome = m_combat.resolve(m_world.get<CombatStats>(attacker),
                                                 m_world.get<CombatStats>(target), health);
        if (outcome.status != CoreResult::Success) {
            LOG_DEBUG("Turn {}: attack {} -> {} skipped: {}", m_turn, entityId(attacker),
                      entityId(target), toString(outcome.status));
            continue;
        }

        if (!outcome.hit) {
            result.append(MissedEvent{attacker, target});
            continue;
        }

        health->takeDamage(outcome.damage);
        result.append(DamagedEvent{target, outcome.damage, attacker});
        if (health->isDead()) {
            result.append(DiedEvent{target});
        }
    }
}

void TurnScheduler::resolveItems(TurnResult& result) {
    for (const auto& [entity, use] : pendingOf<UseItemAction>()) {
        if (!canAct(entity)) continue;

        auto* inventory = m_world.get<Inventory>(entity);
        const auto* consumable = m_world.get<Consumable>(use.item);
        auto* health = m_world.get<Health>(entity);
        if (!inventory || !inventory->contains(use.item) || !consumable || !health) {
            LOG_DEBUG("Turn {}: entity {} cannot use item {}", m_turn, entityId(entity), entityId(use.item));
            continue;
        }

        int healed = health->heal(consumable->heal);
        inventory->removeItem(use.item);
        m_consumedItems.push_back(use.item);
        result.append(HealedEvent{entity, healed});
    }
}

void TurnScheduler::commit(TurnResult& result) {
    std::vector<Entity> doomed;
    m_world.each<Health>([&](Entity entity, const Health& health) {
        if (health.isDead()) doomed.push_back(entity);
    });
    std::sort(doomed.begin(), doomed.end(), EntityIndexLess{});
    doomed.insert(doomed.end(), m_consumedItems.begin(), m_consumedItems.end());

    for (Entity entity : doomed) {
        if (!m_world.isAlive(entity)) continue;
        CoreResult destroyed = m_world.destroy(entity);
        if (destroyed != CoreResult::Success) {
            LOG_ERROR("Turn {}: cleanup of entity {} failed: {}", m_turn, entityId(entity), toString(destroyed));
        }
    }

    m_world.each<AIController, Position>([](Entity, AIController& controller, const Position& pos) {
        if (auto* patrol = std::get_if<ai::Patrol>(&controller.behavior)) {
            if (!patrol->waypoints.empty() && patrol->current() == pos.toGridPos()) {
                patrol->cursor = (patrol->cursor + 1) % patrol->waypoints.size();
            }
        }
    });

    m_phase = TurnPhase::Committed;
    LOG_DEBUG("Turn {} committed: {} events", m_turn, result.size());
    m_onCommitted.publish(result);

    m_pending.clear();
    m_consumedItems.clear();
    m_snapshot.reset();
    ++m_turn;
    m_phase = TurnPhase::CollectingActions;
}

} // namespace delve
