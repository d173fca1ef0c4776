#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace delve {

/// Process-wide loggers for the runtime core.
/// CORE covers the registry, stores, spatial index, scheduler and combat;
/// AI covers decision making and pathfinding fallbacks.
class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// Returns the core logger, creating a console-only default if init()
    /// has not been called yet.
    static std::shared_ptr<spdlog::logger>& getCoreLogger();
    static std::shared_ptr<spdlog::logger>& getAILogger();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_aiLogger;
};

} // namespace delve

// Core logging macros
#define LOG_TRACE(...)    ::delve::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::delve::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::delve::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::delve::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::delve::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::delve::Log::getCoreLogger()->critical(__VA_ARGS__)

// AI logging macros
#define AI_LOG_TRACE(...)    ::delve::Log::getAILogger()->trace(__VA_ARGS__)
#define AI_LOG_DEBUG(...)    ::delve::Log::getAILogger()->debug(__VA_ARGS__)
#define AI_LOG_INFO(...)     ::delve::Log::getAILogger()->info(__VA_ARGS__)
#define AI_LOG_WARN(...)     ::delve::Log::getAILogger()->warn(__VA_ARGS__)
#define AI_LOG_ERROR(...)    ::delve::Log::getAILogger()->error(__VA_ARGS__)
#define AI_LOG_CRITICAL(...) ::delve::Log::getAILogger()->critical(__VA_ARGS__)
