#pragma once

/// @file logging.h
/// @brief DriftGuard logging utilities wrapping spdlog

#include <memory>
#include <string>

#include <absl/strings/string_view.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace driftguard {

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
///
/// Console output goes to stderr; stdout is reserved for reports.
/// The driftguard CLI starts at kInfo. --log-level, logging.level or
/// DRIFTGUARD_LOG_LEVEL change the level, and logging.file (or
/// DRIFTGUARD_LOG_FILE) turns on the rotating file sink.
struct LogConfig {
    std::string name = "driftguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "driftguard.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Parse a level name (trace, debug, info, warn, error, critical, off)
/// @return Parsed level, or kInfo for unrecognized names
LogLevel ParseLogLevel(absl::string_view name);

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
///
/// The CLI calls this before writing its report so the log file is complete
/// when the process exits.
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define DRIFTGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::driftguard::GetLogger(), __VA_ARGS__)
#define DRIFTGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::driftguard::GetLogger(), __VA_ARGS__)
#define DRIFTGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::driftguard::GetLogger(), __VA_ARGS__)
#define DRIFTGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::driftguard::GetLogger(), __VA_ARGS__)
#define DRIFTGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::driftguard::GetLogger(), __VA_ARGS__)
#define DRIFTGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::driftguard::GetLogger(), __VA_ARGS__)

}  // namespace driftguard
