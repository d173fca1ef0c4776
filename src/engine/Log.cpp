#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace delve {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_aiLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-initialising replaces the previous loggers instead of failing
    // on duplicate registration.
    spdlog::drop("CORE");
    spdlog::drop("AI");

    s_coreLogger = std::make_shared<spdlog::logger>("CORE", sinks.begin(), sinks.end());
    s_aiLogger = std::make_shared<spdlog::logger>("AI", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_aiLogger->set_level(spdLevel);

    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_aiLogger);
}

void Log::shutdown() {
    if (s_coreLogger) s_coreLogger->flush();
    if (s_aiLogger) s_aiLogger->flush();
    s_coreLogger.reset();
    s_aiLogger.reset();
    spdlog::shutdown();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger>& Log::getCoreLogger() {
    if (!s_coreLogger) {
        init();
    }
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Log::getAILogger() {
    if (!s_aiLogger) {
        init();
    }
    return s_aiLogger;
}

} // namespace delve
