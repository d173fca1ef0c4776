#pragma once

#include "ecs/Components.hpp"
#include "engine/Result.hpp"

#include <cstdint>
#include <functional>

namespace delve {

/// Uniform random number in [0, 1)
using RandomSource = std::function<float()>;

/// Hit chance and damage formulas. Both receive the attacker's stats and
/// the defender's stats (all zero when the defender has none).
struct DamagePolicy {
    std::function<float(const CombatStats& attacker, const CombatStats& defender)> hitChance;
    std::function<int(const CombatStats& attacker, const CombatStats& defender)> damage;

    /// hit = clamp(0.6 + 0.02 * attack - 0.02 * defense, 0.1, 0.95),
    /// damage = max(1, power - defense / 2)
    static DamagePolicy standard();

    /// Always hits for exactly `power`. Used for replays and tests.
    static DamagePolicy alwaysHit();
};

/// Outcome of a single attack
struct CombatOutcome {
    CoreResult status = CoreResult::Success;
    bool hit = false;
    int damage = 0;
    bool defenderDied = false;
};

/// Computes attack outcomes. Does not touch the world: the scheduler
/// applies the outcome and emits the events.
class CombatResolver {
public:
    CombatResolver(DamagePolicy policy, RandomSource random);

    /// Resolve one attack.
    /// MissingCapability if the attacker has no CombatStats or the defender
    /// has no Health. A defender without CombatStats defends with zeros.
    CombatOutcome resolve(const CombatStats* attacker, const CombatStats* defender,
                          const Health* defenderHealth) const;

    void setPolicy(DamagePolicy policy) { m_policy = std::move(policy); }
    void setRandomSource(RandomSource random) { m_random = std::move(random); }

    /// mt19937-backed source; same seed, same sequence
    static RandomSource seededSource(uint32_t seed);

private:
    DamagePolicy m_policy;
    RandomSource m_random;
};

} // namespace delve
