#include <gtest/gtest.h>
#include "engine/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace delve;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Re-initialize for each test to avoid stale state
        spdlog::drop_all();
    }

    void TearDown() override {
        spdlog::drop_all();
    }
};

TEST_F(LogTest, InitWithDefaults) {
    ASSERT_NO_THROW(Log::init());
    EXPECT_NE(Log::getCoreLogger(), nullptr);
    EXPECT_NE(Log::getAILogger(), nullptr);
}

TEST_F(LogTest, InitWithLogLevel) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getCoreLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getAILogger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, CoreAndAILoggersAreSeparate) {
    Log::init();
    EXPECT_EQ(Log::getCoreLogger()->name(), "CORE");
    EXPECT_EQ(Log::getAILogger()->name(), "AI");
}

TEST_F(LogTest, ReinitReplacesLoggers) {
    Log::init("", "info");
    ASSERT_NO_THROW(Log::init("", "error"));
    EXPECT_EQ(Log::getCoreLogger()->level(), spdlog::level::err);
    EXPECT_EQ(spdlog::get("CORE"), Log::getCoreLogger());
}

TEST_F(LogTest, LazyDefaultAfterShutdown) {
    Log::init();
    Log::shutdown();
    spdlog::drop_all();

    // Logging without init must still work
    EXPECT_NO_THROW(LOG_INFO("lazy core message"));
    EXPECT_NO_THROW(AI_LOG_INFO("lazy ai message"));
    EXPECT_NE(Log::getCoreLogger(), nullptr);
}

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(Log::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Log::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Log::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Log::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Log::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Log::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Log::parseLevel("off"), spdlog::level::off);
    EXPECT_EQ(Log::parseLevel("bogus"), spdlog::level::info);
}

TEST_F(LogTest, ShutdownWithoutInitSafe) {
    EXPECT_NO_THROW(Log::shutdown());
}

TEST_F(LogTest, AllCoreMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(LOG_TRACE("trace message"));
    EXPECT_NO_THROW(LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(LOG_INFO("info message"));
    EXPECT_NO_THROW(LOG_WARN("warn message"));
    EXPECT_NO_THROW(LOG_ERROR("error message"));
    EXPECT_NO_THROW(LOG_CRITICAL("critical message"));
}

TEST_F(LogTest, AllAIMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(AI_LOG_TRACE("trace message"));
    EXPECT_NO_THROW(AI_LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(AI_LOG_INFO("info message"));
    EXPECT_NO_THROW(AI_LOG_WARN("warn message"));
    EXPECT_NO_THROW(AI_LOG_ERROR("error message"));
    EXPECT_NO_THROW(AI_LOG_CRITICAL("critical message"));
}

TEST_F(LogTest, MacrosWithFormatArgs) {
    Log::init();
    EXPECT_NO_THROW(LOG_INFO("Entity {} moved to ({}, {})", 7, 3, 4));
    EXPECT_NO_THROW(AI_LOG_INFO("Entity {} chose {}", 7, "attack"));
}

class LogFileTest : public ::testing::Test {
protected:
    std::string logPath;

    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "delve_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        Log::shutdown();
        spdlog::drop_all();
        std::filesystem::remove(logPath);
    }
};

TEST_F(LogFileTest, FileLogging) {
    Log::init(logPath, "debug");
    LOG_INFO("File log test message");
    Log::getCoreLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good()) << "Log file should have been created";
    std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("File log test message"), std::string::npos);
}
