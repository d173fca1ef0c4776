#pragma once

#include <cstdint>
#include <string>

namespace delve {

class Config;

/// Typed view of the runtime core's configuration keys.
/// Every field has a usable default so an empty config is valid.
struct CoreSettings {
    // log.*
    std::string logLevel = "info";
    std::string logFile;

    // map.*
    int mapWidth = 40;
    int mapHeight = 24;
    uint32_t mapSeed = 1;

    // pathfinding.*
    bool allowDiagonals = false;
    int maxPathNodes = 0;           ///< 0 = unlimited

    // ai.*
    int aiWorkers = 0;              ///< 0 = decide inline on the calling thread
    int detectionRange = 8;
    float wanderChance = 0.3f;      ///< Chance an idle aggressor steps randomly
    uint32_t wanderSeed = 1;

    // combat.*
    uint32_t combatSeed = 1;
    bool deterministicCombat = false;

    // spawn.*
    int enemyCount = 10;
    std::string entityDefinitions = "data/entities.json";

    // sim.*
    int maxTurns = 500;             ///< Demo stops after this many turns (0 = no limit)

    /// Read all known keys, keeping defaults for missing or mistyped ones.
    static CoreSettings fromConfig(const Config& config);
};

} // namespace delve
