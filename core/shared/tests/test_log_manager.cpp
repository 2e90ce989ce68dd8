/**
 * @file test_log_manager.cpp
 * @brief LogManager 레벨 변환 / sink 위임 테스트
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Logging/LogManager.h"

class LogManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& lm = LogManager::getInstance();
        lm.setConsoleOutput(false);
        lm.setFileOutput(false);
        lm.setLogLevel(LogLevel::INFO);
    }

    void TearDown() override {
        auto& lm = LogManager::getInstance();
        for (int id : sink_ids_) lm.removeSink(id);
        lm.setConsoleOutput(true);
    }

    std::vector<int> sink_ids_;
};

TEST_F(LogManagerTest, LevelsMapBothWays) {
    for (LogLevel level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                           LogLevel::LOG_ERROR, LogLevel::LOG_FATAL, LogLevel::OFF}) {
        EXPECT_EQ(LogManager::FromEngineLevel(LogManager::ToEngineLevel(level)), level);
    }
    EXPECT_EQ(LogManager::ToEngineLevel(LogLevel::LOG_ERROR), LogLib::LogLevel::LOG_ERROR);

    auto& lm = LogManager::getInstance();
    lm.setLogLevel(LogLevel::WARN);
    EXPECT_EQ(lm.getLogLevel(), LogLevel::WARN);
}

TEST_F(LogManagerTest, CategoryLogReachesSinkWithEngineLevel) {
    auto& lm = LogManager::getInstance();
    std::vector<LogLib::LogRecord> seen;
    sink_ids_.push_back(lm.addSink([&seen](const LogLib::LogRecord& r) { seen.push_back(r); }));

    lm.log("alarm", LogLevel::DEBUG, "below threshold");
    lm.log("alarm", LogLevel::WARN, "cpu high");
    lm.Error("no category");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].category, "alarm");
    EXPECT_EQ(seen[0].level, LogLib::LogLevel::WARN);
    EXPECT_EQ(seen[0].message, "cpu high");
    EXPECT_TRUE(seen[1].category.empty());
    EXPECT_EQ(seen[1].level, LogLib::LogLevel::LOG_ERROR);
}
