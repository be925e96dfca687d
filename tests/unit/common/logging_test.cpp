/// @file logging_test.cpp
/// @brief Tests for driftwatch logging utilities

#include <gtest/gtest.h>

#include "common/logging.h"

namespace driftwatch {
namespace {

TEST(LoggingTest, GetLoggerInitializesDefaults) {
    auto logger = GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "driftwatch");
}

TEST(LoggingTest, SetLogLevelAppliesToLogger) {
    InitLogging();

    SetLogLevel(LogLevel::kWarn);
    EXPECT_EQ(GetLogger()->level(), spdlog::level::warn);

    SetLogLevel(LogLevel::kDebug);
    EXPECT_EQ(GetLogger()->level(), spdlog::level::debug);
    for (const auto& sink : GetLogger()->sinks()) {
        EXPECT_EQ(sink->level(), spdlog::level::debug);
    }

    SetLogLevel(LogLevel::kInfo);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    EXPECT_NO_THROW({
        DRIFTWATCH_LOG_TRACE("Trace message: {}", 1);
        DRIFTWATCH_LOG_DEBUG("Debug message: {}", 2);
        DRIFTWATCH_LOG_INFO("Info message: {}", 3);
        DRIFTWATCH_LOG_WARN("Warn message: {}", 4);
        DRIFTWATCH_LOG_ERROR("Error message: {}", 5);
    });
    EXPECT_NO_THROW(FlushLogs());
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(*ParseLogLevel("trace"), LogLevel::kTrace);
    EXPECT_EQ(*ParseLogLevel("debug"), LogLevel::kDebug);
    EXPECT_EQ(*ParseLogLevel("INFO"), LogLevel::kInfo);
    EXPECT_EQ(*ParseLogLevel("warn"), LogLevel::kWarn);
    EXPECT_EQ(*ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(*ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(*ParseLogLevel("critical"), LogLevel::kCritical);
    EXPECT_EQ(*ParseLogLevel("off"), LogLevel::kOff);
}

TEST(LoggingTest, ParseLogLevelRejectsUnknownName) {
    auto level = ParseLogLevel("verbose");
    ASSERT_FALSE(level.ok());
    EXPECT_EQ(level.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(LoggingTest, LoggingWorksAfterShutdown) {
    InitLogging();
    ShutdownLogging();

    // The next use installs a fresh logger
    auto logger = GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_NO_THROW(DRIFTWATCH_LOG_INFO("Logged after shutdown"));
}

}  // namespace
}  // namespace driftwatch
