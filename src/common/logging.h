#pragma once

/// @file logging.h
/// @brief driftwatch logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace driftwatch {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "driftwatch";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Logs go to stderr so the JSON report on stdout stays machine readable
    bool log_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "driftwatch.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
///
/// Has no effect while a logger is installed; ShutdownLogging uninstalls it.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance, initializing defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off")
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define DRIFTWATCH_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_INFO(...) SPDLOG_LOGGER_INFO(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_WARN(...) SPDLOG_LOGGER_WARN(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::driftwatch::GetLogger(), __VA_ARGS__)

}  // namespace driftwatch
