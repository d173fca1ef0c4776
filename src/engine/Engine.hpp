#pragma once

#include "engine/Config.hpp"
#include "engine/Settings.hpp"
#include "engine/ThreadPool.hpp"
#include "ecs/World.hpp"
#include "ecs/EntityFactory.hpp"
#include "gameplay/ActionSource.hpp"
#include "gameplay/CombatResolver.hpp"
#include "gameplay/Pathfinding.hpp"
#include "gameplay/TurnScheduler.hpp"
#include "world/GridMap.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace delve {

/// Engine version string
inline constexpr const char* kEngineVersion = "0.3.0";

/// Headless driver for the runtime core: reads configuration, builds the
/// map and the world, spawns the player and enemies, then runs turns until
/// the player dies, the input ends or the turn limit is reached.
class Engine {
public:
    Engine() = default;
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Load `configPath` (plus an optional `<name>.local.json` overlay) and
    /// set everything up. Returns false if the level cannot be populated.
    bool init(const std::string& configPath = "config.json");

    /// Run turns, reading player commands from `input`
    void run(std::istream& input);

    void shutdown();

    /// Translate one command line into an action for `player`.
    ///   w/a/s/d  move (q/e/z/c diagonals), bumping into a blocker attacks it
    ///   .        wait
    ///   u        use the first carried item
    /// Returns nullopt for unknown input.
    static std::optional<Action> parseCommand(const std::string& line, Entity player,
                                              const WorldSnapshot& snapshot, bool allowDiagonals);

    const CoreSettings& getSettings() const { return m_settings; }
    Config& getConfig() { return m_config; }
    World* getWorld() { return m_world.get(); }
    TurnScheduler* getScheduler() { return m_scheduler.get(); }
    Entity getPlayer() const { return m_player; }

private:
    bool populate();
    void logTurn(const TurnResult& result) const;
    std::string describe(Entity entity) const;

    Config m_config;
    CoreSettings m_settings;

    std::unique_ptr<GridMap> m_map;
    std::unique_ptr<World> m_world;
    EntityFactory m_entityFactory;
    Pathfinder m_pathfinder;
    std::unique_ptr<CombatResolver> m_combat;
    std::unique_ptr<AIActionSource> m_aiSource;
    std::unique_ptr<ThreadPool> m_threadPool;
    std::unique_ptr<TurnScheduler> m_scheduler;

    Entity m_player = NullEntity;
    bool m_initialized = false;
};

} // namespace delve
