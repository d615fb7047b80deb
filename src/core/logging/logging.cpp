#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace med_classifier::logging {

LogConfig LoggerFactory::config_ = {};

namespace {

std::mutex& factoryMutex() {
    static std::mutex mutex;
    return mutex;
}

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // anonymous namespace

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    std::lock_guard lock(factoryMutex());

    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    std::vector<spdlog::sink_ptr> sinks;

    spdlog::sink_ptr consoleSink;
    if (config_.consoleToStderr) {
        consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    consoleSink->set_level(toSpdlog(config_.level));
    sinks.push_back(consoleSink);

    if (config_.enableFileLogging && !config_.logDirectory.empty()) {
        auto logFile = config_.logDirectory / (name + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(),
            config_.maxFileSize,
            config_.maxFiles
        );
        fileSink->set_level(toSpdlog(config_.level));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(toSpdlog(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    std::lock_guard lock(factoryMutex());
    config_ = config;

    spdlog::set_level(toSpdlog(config.level));
    spdlog::set_pattern(config.pattern);
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    {
        std::lock_guard lock(factoryMutex());
        config_.level = level;
    }
    spdlog::set_level(toSpdlog(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(toSpdlog(level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(toSpdlog(level));
        }
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    std::lock_guard lock(factoryMutex());
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
}

std::optional<LogLevel> logLevelFromString(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string_view toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

}  // namespace med_classifier::logging
