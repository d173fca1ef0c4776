#pragma once

#include "ecs/Entity.hpp"
#include "world/GridPos.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace delve {

struct MovedEvent {
    Entity entity = NullEntity;
    GridPos from;
    GridPos to;
};

struct DamagedEvent {
    Entity entity = NullEntity;     ///< Who took the damage
    int amount = 0;
    Entity source = NullEntity;     ///< Attacker
};

struct DiedEvent {
    Entity entity = NullEntity;
};

/// A move that could not happen (wall, edge of map, occupied cell)
struct BlockedEvent {
    Entity entity = NullEntity;
    GridPos target;
};

struct MissedEvent {
    Entity attacker = NullEntity;
    Entity target = NullEntity;
};

struct HealedEvent {
    Entity entity = NullEntity;
    int amount = 0;
};

using TurnEvent = std::variant<MovedEvent, DamagedEvent, DiedEvent, BlockedEvent,
                               MissedEvent, HealedEvent>;

class TurnScheduler;

/// Ordered effects of one scheduler pass. Only the scheduler appends;
/// everyone else sees a read-only sequence.
class TurnResult {
public:
    TurnResult() = default;
    explicit TurnResult(uint64_t turn) : m_turn(turn) {}

    uint64_t turn() const { return m_turn; }
    const std::vector<TurnEvent>& events() const { return m_events; }
    bool empty() const { return m_events.empty(); }
    std::size_t size() const { return m_events.size(); }

    /// Number of events of type E
    template<typename E>
    std::size_t count() const {
        std::size_t n = 0;
        for (const auto& event : m_events) {
            if (std::holds_alternative<E>(event)) ++n;
        }
        return n;
    }

    nlohmann::json toJson() const;

    /// Compact JSON text; equal for equal results
    std::string serialize() const { return toJson().dump(); }

private:
    friend class TurnScheduler;

    void append(TurnEvent event) { m_events.push_back(std::move(event)); }

    uint64_t m_turn = 0;
    std::vector<TurnEvent> m_events;
};

void to_json(nlohmann::json& j, const TurnEvent& event);
void to_json(nlohmann::json& j, const TurnResult& result);

} // namespace delve
