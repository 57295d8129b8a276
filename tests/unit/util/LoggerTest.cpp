/**
 * @file LoggerTest.cpp
 * @brief Unit tests for the process-wide logger
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using util::Logger;
using util::LogLevel;

class LoggerTest : public TempDirFixture {
protected:
    void SetUp() override {
        TempDirFixture::SetUp();
        Logger::instance().set_sink([this](LogLevel level, std::string_view line) {
            captured.emplace_back(level, std::string(line));
        });
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.set_sink(nullptr);
        logger.shutdown();
        logger.set_min_level(LogLevel::INFO);
        TempDirFixture::TearDown();
    }

    static std::string Slurp(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::vector<std::pair<LogLevel, std::string>> captured;
};

// ========== Formatting Tests ==========

TEST_F(LoggerTest, Log_LineHasTimestampLevelAndComponent) {
    LOG_INFO("Scheduler", "Dispatching job a1");

    ASSERT_EQ(captured.size(), 1u);
    const auto& line = captured[0].second;
    EXPECT_EQ(captured[0].first, LogLevel::INFO);
    EXPECT_NE(line.find("[INFO ]"), std::string::npos);
    EXPECT_NE(line.find("[Scheduler] Dispatching job a1"), std::string::npos);
    // 2026-01-01T00:00:00.000Z
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], 'T');
    EXPECT_EQ(line[23], 'Z');
    EXPECT_EQ(line.back(), '\n');
}

TEST_F(LoggerTest, Log_BelowMinLevel_IsDropped) {
    Logger::instance().set_min_level(LogLevel::WARNING);

    LOG_DEBUG("Engine", "chunk");
    LOG_INFO("Engine", "started");
    LOG_WARNING("Engine", "retrying");
    LOG_ERROR("Engine", "failed");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].first, LogLevel::WARNING);
    EXPECT_EQ(captured[1].first, LogLevel::ERROR);
}

// ========== File Output Tests ==========

TEST_F(LoggerTest, Initialize_WritesToLogFile) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir / "logs", "unit"));
    EXPECT_TRUE(logger.is_initialized());
    EXPECT_EQ(logger.get_log_file_path(), temp_dir / "logs" / "unit.log");

    LOG_ERROR("Store", "disk full");
    logger.flush();

    EXPECT_NE(Slurp(temp_dir / "logs" / "unit.log").find("[Store] disk full"), std::string::npos);
}

TEST_F(LoggerTest, Shutdown_ClearsFilePath) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir, "unit"));

    logger.shutdown();

    EXPECT_FALSE(logger.is_initialized());
    EXPECT_TRUE(logger.get_log_file_path().empty());
}

// Test: Exceeding the size limit shifts files to .1.log, .2.log
TEST_F(LoggerTest, Rotation_KeepsConfiguredFiles) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir, "unit", LogLevel::INFO,
                                  util::LogRotationPolicy{.max_file_size_bytes = 256, .max_files = 2}));

    const std::string filler(200, 'x');
    for (int i = 0; i < 10; ++i) {
        LOG_INFO("Filler", filler);
    }
    logger.flush();

    EXPECT_TRUE(std::filesystem::exists(temp_dir / "unit.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "unit.1.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "unit.2.log"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "unit.3.log"));
}

// ========== Level Parsing Tests ==========

TEST(LoggerLevelTest, ParseLevel_AcceptsKnownNames) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parse_level("trace").has_value());
}

TEST(LoggerLevelTest, LevelToString_IsFixedWidth) {
    for (auto level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING, LogLevel::ERROR}) {
        EXPECT_EQ(Logger::level_to_string(level).size(), 5u);
    }
}
