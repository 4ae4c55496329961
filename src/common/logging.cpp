#include "common/logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

namespace driftguard {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

}  // namespace

LogLevel ParseLogLevel(absl::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "trace") {
        return LogLevel::kTrace;
    } else if (lowered == "debug") {
        return LogLevel::kDebug;
    } else if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    } else if (lowered == "error") {
        return LogLevel::kError;
    } else if (lowered == "critical") {
        return LogLevel::kCritical;
    } else if (lowered == "off") {
        return LogLevel::kOff;
    }
    return LogLevel::kInfo;
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always enabled)
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
    sinks.push_back(console_sink);

    // File sink (optional)
    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
    g_logger->set_pattern(config.pattern);

    spdlog::set_default_logger(g_logger);

    // Flush on warn and above
    g_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(static_cast<spdlog::level::level_enum>(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace driftguard
