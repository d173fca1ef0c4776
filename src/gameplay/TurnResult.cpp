#include "gameplay/TurnResult.hpp"

namespace delve {

namespace {

nlohmann::json posJson(GridPos pos) {
    return nlohmann::json::array({pos.x, pos.y});
}

struct EventWriter {
    nlohmann::json& j;

    void operator()(const MovedEvent& e) const {
        j = {{"type", "moved"}, {"entity", entityId(e.entity)},
             {"from", posJson(e.from)}, {"to", posJson(e.to)}};
    }
    void operator()(const DamagedEvent& e) const {
        j = {{"type", "damaged"}, {"entity", entityId(e.entity)},
             {"amount", e.amount}, {"source", entityId(e.source)}};
    }
    void operator()(const DiedEvent& e) const {
        j = {{"type", "died"}, {"entity", entityId(e.entity)}};
    }
    void operator()(const BlockedEvent& e) const {
        j = {{"type", "blocked"}, {"entity", entityId(e.entity)}, {"target", posJson(e.target)}};
    }
    void operator()(const MissedEvent& e) const {
        j = {{"type", "missed"}, {"attacker", entityId(e.attacker)}, {"target", entityId(e.target)}};
    }
    void operator()(const HealedEvent& e) const {
        j = {{"type", "healed"}, {"entity", entityId(e.entity)}, {"amount", e.amount}};
    }
};

} // namespace

void to_json(nlohmann::json& j, const TurnEvent& event) {
    std::visit(EventWriter{j}, event);
}

void to_json(nlohmann::json& j, const TurnResult& result) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : result.events()) {
        nlohmann::json e;
        to_json(e, event);
        events.push_back(std::move(e));
    }
    j = {{"turn", result.turn()}, {"events", std::move(events)}};
}

nlohmann::json TurnResult::toJson() const {
    nlohmann::json j;
    to_json(j, *this);
    return j;
}

} // namespace delve
