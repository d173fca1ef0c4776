#include "engine/Settings.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

CoreSettings CoreSettings::fromConfig(const Config& config) {
    CoreSettings s;

    s.logLevel = config.getString("log.level", s.logLevel);
    s.logFile = config.getString("log.file", s.logFile);

    s.mapWidth = config.getInt("map.width", s.mapWidth);
    s.mapHeight = config.getInt("map.height", s.mapHeight);
    s.mapSeed = static_cast<uint32_t>(config.getInt("map.seed", static_cast<int>(s.mapSeed)));

    s.allowDiagonals = config.getBool("pathfinding.allow_diagonals", s.allowDiagonals);
    s.maxPathNodes = std::max(0, config.getInt("pathfinding.max_nodes", s.maxPathNodes));

    s.aiWorkers = std::max(0, config.getInt("ai.workers", s.aiWorkers));
    s.detectionRange = std::max(0, config.getInt("ai.detection_range", s.detectionRange));
    s.wanderChance = std::clamp(config.getFloat("ai.wander_chance", s.wanderChance), 0.0f, 1.0f);
    s.wanderSeed = static_cast<uint32_t>(config.getInt("ai.wander_seed", static_cast<int>(s.wanderSeed)));

    s.combatSeed = static_cast<uint32_t>(config.getInt("combat.seed", static_cast<int>(s.combatSeed)));
    s.deterministicCombat = config.getBool("combat.deterministic", s.deterministicCombat);

    s.enemyCount = std::max(0, config.getInt("spawn.enemies", s.enemyCount));
    s.entityDefinitions = config.getString("spawn.definitions", s.entityDefinitions);

    s.maxTurns = std::max(0, config.getInt("sim.max_turns", s.maxTurns));

    if (s.mapWidth < 3 || s.mapHeight < 3) {
        LOG_WARN("Settings: map {}x{} too small, using 40x24", s.mapWidth, s.mapHeight);
        s.mapWidth = 40;
        s.mapHeight = 24;
    }

    return s;
}

} // namespace delve
