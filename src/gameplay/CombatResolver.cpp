#include "gameplay/CombatResolver.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <memory>
#include <random>

namespace delve {

DamagePolicy DamagePolicy::standard() {
    DamagePolicy policy;
    policy.hitChance = [](const CombatStats& attacker, const CombatStats& defender) {
        float chance = 0.6f + 0.02f * static_cast<float>(attacker.attack)
                            - 0.02f * static_cast<float>(defender.defense);
        return std::clamp(chance, 0.1f, 0.95f);
    };
    policy.damage = [](const CombatStats& attacker, const CombatStats& defender) {
        return std::max(1, attacker.power - defender.defense / 2);
    };
    return policy;
}

DamagePolicy DamagePolicy::alwaysHit() {
    DamagePolicy policy;
    policy.hitChance = [](const CombatStats&, const CombatStats&) { return 1.0f; };
    policy.damage = [](const CombatStats& attacker, const CombatStats&) { return attacker.power; };
    return policy;
}

CombatResolver::CombatResolver(DamagePolicy policy, RandomSource random)
    : m_policy(std::move(policy))
    , m_random(std::move(random)) {}

CombatOutcome CombatResolver::resolve(const CombatStats* attacker, const CombatStats* defender,
                                      const Health* defenderHealth) const {
    CombatOutcome outcome;
    if (!attacker || !defenderHealth) {
        outcome.status = CoreResult::MissingCapability;
        return outcome;
    }

    const CombatStats noStats{0, 0, 0};
    const CombatStats& defense = defender ? *defender : noStats;

    float chance = m_policy.hitChance ? m_policy.hitChance(*attacker, defense) : 1.0f;
    float roll = m_random ? m_random() : 0.0f;
    if (roll >= chance) {
        return outcome;
    }

    outcome.hit = true;
    outcome.damage = m_policy.damage ? std::max(0, m_policy.damage(*attacker, defense)) : 0;
    outcome.defenderDied = defenderHealth->current - outcome.damage <= 0;
    LOG_TRACE("Combat: hit chance {:.2f}, roll {:.2f}, damage {}", chance, roll, outcome.damage);
    return outcome;
}

RandomSource CombatResolver::seededSource(uint32_t seed) {
    auto rng = std::make_shared<std::mt19937>(seed);
    return [rng]() {
        // Top 24 bits give an exact float in [0, 1)
        return static_cast<float>((*rng)() >> 8) / 16777216.0f;
    };
}

} // namespace delve
