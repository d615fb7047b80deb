#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace med_classifier::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
    /// Console output goes to stderr so that stdout stays machine readable
    bool consoleToStderr = true;
};

/**
 * @brief Creates named spdlog loggers sharing one configuration
 *
 * Loggers are registered with spdlog, so repeated calls with the same name
 * return the same instance.
 */
class LoggerFactory {
public:
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static void shutdown();

private:
    static LogConfig config_;
};

/// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
[[nodiscard]] std::optional<LogLevel> logLevelFromString(std::string_view name);

[[nodiscard]] std::string_view toString(LogLevel level);

}  // namespace med_classifier::logging
