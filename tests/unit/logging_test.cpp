#include "core/logging.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace med_classifier::logging;

TEST(LoggingTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("info"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("critical"), LogLevel::Critical);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
}

TEST(LoggingTest, LevelFromStringIgnoresCase) {
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("Warning"), LogLevel::Warning);
}

TEST(LoggingTest, UnknownLevelIsRejected) {
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST(LoggingTest, ToStringRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(toString(level)), level);
    }
}

TEST(LoggingTest, LevelsMapOntoSpdlog) {
    EXPECT_EQ(static_cast<int>(LogLevel::Warning), static_cast<int>(spdlog::level::warn));
    EXPECT_EQ(static_cast<int>(LogLevel::Error), static_cast<int>(spdlog::level::err));
}

TEST(LoggingTest, CreateReturnsSameLoggerForSameName) {
    auto first = LoggerFactory::create("LoggingTestShared");
    auto second = LoggerFactory::create("LoggingTestShared");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggingTestShared");
}

TEST(LoggingTest, SetGlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingTestLevel");
    const auto previous = LoggerFactory::getGlobalLevel();

    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);

    LoggerFactory::setGlobalLevel(previous);
}

TEST(LoggingTest, FileLoggingWritesToDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "med_classifier_logging_test";
    std::filesystem::create_directories(dir);

    LogConfig config;
    config.level = LogLevel::Info;
    config.enableFileLogging = true;
    config.logDirectory = dir;
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("LoggingTestFile");
    logger->info("file sink check");
    logger->flush();

    EXPECT_TRUE(std::filesystem::exists(dir / "LoggingTestFile.log"));

    spdlog::drop("LoggingTestFile");
    LoggerFactory::configure(LogConfig{});
    std::filesystem::remove_all(dir);
}
