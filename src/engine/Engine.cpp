#include "engine/Engine.hpp"
#include "engine/Log.hpp"
#include "world/MapProvider.hpp"

#include <filesystem>
#include <istream>
#include <random>
#include <type_traits>

namespace delve {

Engine::~Engine() {
    shutdown();
}

bool Engine::init(const std::string& configPath) {
    // Load configuration
    bool loaded = m_config.loadFromFile(configPath);

    // config.local.json overrides the shipped config on this machine
    namespace fs = std::filesystem;
    fs::path base(configPath);
    fs::path localFile = base.parent_path()
        / (base.stem().string() + ".local" + base.extension().string());
    bool mergedLocal = m_config.mergeFromFile(localFile.string());

    m_settings = CoreSettings::fromConfig(m_config);
    Log::init(m_settings.logFile, m_settings.logLevel);

    if (loaded) {
        LOG_INFO("Configuration loaded from '{}'", configPath);
    } else {
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    }
    if (mergedLocal) {
        LOG_INFO("Local config merged from '{}'", localFile.string());
    }

    LOG_INFO("Delve core v{} starting...", kEngineVersion);

    RoomMapProvider provider(m_settings.mapWidth, m_settings.mapHeight, m_settings.mapSeed);
    m_map = std::make_unique<GridMap>(provider.generate());
    m_world = std::make_unique<World>(*m_map);

    m_pathfinder.setAllowDiagonals(m_settings.allowDiagonals);
    m_pathfinder.setMaxNodes(m_settings.maxPathNodes);

    m_combat = std::make_unique<CombatResolver>(
        m_settings.deterministicCombat ? DamagePolicy::alwaysHit() : DamagePolicy::standard(),
        CombatResolver::seededSource(m_settings.combatSeed));

    m_aiSource = std::make_unique<AIActionSource>(m_pathfinder);
    m_aiSource->setWander(m_settings.wanderChance, m_settings.wanderSeed);

    m_scheduler = std::make_unique<TurnScheduler>(*m_world, *m_combat);
    m_scheduler->setAISource(m_aiSource.get());
    m_scheduler->setAllowDiagonals(m_settings.allowDiagonals);

    if (m_settings.aiWorkers > 0) {
        m_threadPool = std::make_unique<ThreadPool>(static_cast<std::size_t>(m_settings.aiWorkers));
        m_scheduler->setThreadPool(m_threadPool.get());
        LOG_INFO("AI decisions on {} worker threads", m_threadPool->threadCount());
    }

    m_entityFactory.setDefaultDetectionRange(m_settings.detectionRange);
    if (!m_entityFactory.loadFromFile(m_settings.entityDefinitions)) {
        LOG_CRITICAL("No entity definitions, cannot populate the level");
        return false;
    }

    if (!populate()) {
        return false;
    }

    m_initialized = true;
    LOG_INFO("Level ready: {}x{} map, {} entities", m_map->width(), m_map->height(),
             m_world->registry().aliveCount());
    return true;
}

bool Engine::populate() {
    const auto& spawns = m_map->spawnPoints();
    if (spawns.empty()) {
        LOG_CRITICAL("Map has no spawn points");
        return false;
    }

    std::mt19937 rng(m_settings.mapSeed + 1);
    auto pick = [&]() { return spawns[rng() % spawns.size()]; };

    const GridPos start = pick();
    m_player = m_entityFactory.spawn(*m_world, "player", start);
    if (m_player == NullEntity) {
        LOG_CRITICAL("Failed to spawn the player");
        return false;
    }

    std::vector<std::string> enemyTypes;
    for (const char* type : {"goblin", "orc", "troll"}) {
        if (m_entityFactory.hasDefinition(type)) enemyTypes.emplace_back(type);
    }
    if (enemyTypes.empty()) {
        LOG_WARN("No enemy definitions found");
        return true;
    }

    int spawned = 0;
    int attempts = m_settings.enemyCount * 20;
    while (spawned < m_settings.enemyCount && attempts-- > 0) {
        const GridPos pos = pick();
        if (manhattanDistance(pos, start) < 5 || m_world->spatial().isBlocked(pos)) continue;

        const std::string& type = enemyTypes[rng() % enemyTypes.size()];
        if (m_entityFactory.spawn(*m_world, type, pos) != NullEntity) {
            ++spawned;
        }
    }
    if (spawned < m_settings.enemyCount) {
        LOG_WARN("Spawned {} of {} enemies", spawned, m_settings.enemyCount);
    }
    return true;
}

void Engine::run(std::istream& input) {
    if (!m_initialized) {
        LOG_ERROR("Engine::run called before a successful init");
        return;
    }

    bool inputEnded = false;
    const bool diagonals = m_settings.allowDiagonals;
    CallbackActionSource playerSource([&](Entity player, const WorldSnapshot& snapshot) -> Action {
        std::string line;
        while (std::getline(input, line)) {
            if (line == "x") break;
            if (auto action = parseCommand(line, player, snapshot, diagonals)) {
                return *action;
            }
            LOG_INFO("Unknown command '{}' (w/a/s/d move, . wait, u use item, x quit)", line);
        }
        inputEnded = true;
        return WaitAction{};
    });
    m_scheduler->setPlayerSource(&playerSource);

    while (m_scheduler->playerAlive()) {
        if (m_settings.maxTurns > 0 && m_scheduler->turn() > static_cast<uint64_t>(m_settings.maxTurns)) {
            LOG_INFO("Turn limit reached");
            break;
        }

        TurnResult result = m_scheduler->advance();
        if (inputEnded) {
            LOG_INFO("Input ended, leaving after turn {}", result.turn());
            break;
        }
        logTurn(result);
    }

    if (!m_scheduler->playerAlive()) {
        LOG_INFO("The player has fallen on turn {}", m_scheduler->turn() - 1);
    }
    m_scheduler->setPlayerSource(nullptr);
}

void Engine::shutdown() {
    if (!m_initialized) return;
    m_initialized = false;

    if (m_threadPool) {
        m_threadPool->shutdown();
    }
    LOG_INFO("Shutting down after {} turns", m_scheduler->turn() - 1);
    Log::shutdown();
}

std::optional<Action> Engine::parseCommand(const std::string& line, Entity player,
                                           const WorldSnapshot& snapshot, bool allowDiagonals) {
    if (line.empty()) return std::nullopt;

    std::optional<Direction> dir;
    switch (line[0]) {
        case 'w': dir = Direction::North; break;
        case 'd': dir = Direction::East; break;
        case 's': dir = Direction::South; break;
        case 'a': dir = Direction::West; break;
        case 'e': if (allowDiagonals) dir = Direction::NorthEast; break;
        case 'c': if (allowDiagonals) dir = Direction::SouthEast; break;
        case 'z': if (allowDiagonals) dir = Direction::SouthWest; break;
        case 'q': if (allowDiagonals) dir = Direction::NorthWest; break;
        case '.': return Action{WaitAction{}};
        case 'u': {
            const auto* inventory = snapshot.world.get<Inventory>(player);
            if (!inventory || inventory->items.empty()) return std::nullopt;
            return Action{UseItemAction{inventory->items.front()}};
        }
        default: break;
    }
    if (!dir) return std::nullopt;

    // Bumping into something that can be hurt is an attack
    if (const auto* pos = snapshot.world.get<Position>(player)) {
        Entity occupant = snapshot.occupancy.blockerAt(pos->toGridPos() + offset(*dir));
        if (occupant != NullEntity && snapshot.world.has<Health>(occupant)) {
            return Action{AttackAction{occupant}};
        }
    }
    return Action{MoveAction{*dir}};
}

std::string Engine::describe(Entity entity) const {
    if (const auto* name = m_world->get<Name>(entity)) {
        return fmt::format("{}#{}", name->name, entityIndex(entity));
    }
    return fmt::format("#{}", entityIndex(entity));
}

void Engine::logTurn(const TurnResult& result) const {
    for (const auto& event : result.events()) {
        std::visit([&](const auto& e) {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, MovedEvent>) {
                LOG_DEBUG("[{}] {} moves to ({}, {})", result.turn(), describe(e.entity), e.to.x, e.to.y);
            } else if constexpr (std::is_same_v<E, DamagedEvent>) {
                LOG_INFO("[{}] {} hits {} for {}", result.turn(), describe(e.source), describe(e.entity), e.amount);
            } else if constexpr (std::is_same_v<E, DiedEvent>) {
                LOG_INFO("[{}] {} dies", result.turn(), describe(e.entity));
            } else if constexpr (std::is_same_v<E, BlockedEvent>) {
                LOG_DEBUG("[{}] {} is blocked", result.turn(), describe(e.entity));
            } else if constexpr (std::is_same_v<E, MissedEvent>) {
                LOG_INFO("[{}] {} misses {}", result.turn(), describe(e.attacker), describe(e.target));
            } else if constexpr (std::is_same_v<E, HealedEvent>) {
                LOG_INFO("[{}] {} heals {}", result.turn(), describe(e.entity), e.amount);
            }
        }, event);
    }
}

} // namespace delve
