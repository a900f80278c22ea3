#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

using namespace waypoint::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::level();
        saved_buf = std::cerr.rdbuf(captured.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(saved_buf);
        Logger::set_level(saved_level);
    }

    std::stringstream captured;
    std::streambuf *saved_buf = nullptr;
    Level saved_level = Level::LVL_INFO;
};

TEST_F(LoggerTest, WritesLevelTagAndMessage) {
    Logger::set_level(Level::LVL_DEBUG);

    LOG_INFO("[Test] port " << 8080);

    const std::string out = captured.str();
    EXPECT_NE(out.find("[INFO]"), std::string::npos);
    EXPECT_NE(out.find("[Test] port 8080"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(LoggerTest, DropsMessagesBelowThreshold) {
    Logger::set_level(Level::LVL_WARN);

    LOG_DEBUG("debug line");
    LOG_INFO("info line");
    EXPECT_TRUE(captured.str().empty());

    LOG_WARN("warn line");
    LOG_ERROR("error line");
    EXPECT_NE(captured.str().find("[WARN]  warn line"), std::string::npos);
    EXPECT_NE(captured.str().find("[ERROR] error line"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);

    LOG_ERROR("should not appear");
    EXPECT_TRUE(captured.str().empty());
}

TEST(LoggerLevelTest, StringToLevelIsCaseInsensitive) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
}

TEST(LoggerLevelTest, UnknownStringDefaultsToInfo) { EXPECT_EQ(string_to_level("verbose"), Level::LVL_INFO); }

TEST(LoggerLevelTest, LevelToStringMatchesConfigNames) {
    EXPECT_EQ(level_to_string(Level::LVL_DEBUG), "debug");
    EXPECT_EQ(level_to_string(Level::LVL_INFO), "info");
    EXPECT_EQ(level_to_string(Level::LVL_WARN), "warn");
    EXPECT_EQ(level_to_string(Level::LVL_ERROR), "error");
}
