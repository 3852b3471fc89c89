/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <huedisc/utils/logger.hpp>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace huedisc::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setSink([this](LogLevel level, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            levels_.push_back(level);
            lines_.push_back(line);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    std::vector<LogLevel> levels() {
        std::lock_guard<std::mutex> lock(mutex_);
        return levels_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered");
    LOG_DEBUG("Test", "filtered");
    LOG_INFO("Test", "filtered");
    LOG_WARN("Test", "kept");
    LOG_ERROR("Test", "kept");

    auto recorded = levels();
    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0], LogLevel::WARN);
    EXPECT_EQ(recorded[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);

    LOG_ERROR("Test", "dropped");
    LOG_FATAL("Test", "dropped");

    EXPECT_TRUE(lines().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::FATAL));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, FormatsPlaceholdersInOrder) {
    LOG_INFO("Coordinator", "Session {} found {} bridge(s) via {}", 7, 2, "cloud");

    auto recorded = lines();
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_NE(recorded[0].find("[INFO "), std::string::npos);
    EXPECT_NE(recorded[0].find("[Coordinator] Session 7 found 2 bridge(s) via cloud"), std::string::npos);
}

TEST_F(LoggerTest, SurplusArgumentsAreIgnored) {
    LOG_INFO("Test", "no placeholders", 42);

    auto recorded = lines();
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_NE(recorded[0].find("[Test] no placeholders"), std::string::npos);
}

TEST_F(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;

    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("OFF", level));
    EXPECT_EQ(level, LogLevel::OFF);

    level = LogLevel::ERROR;
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_DEBUG("Worker", "thread {} message {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(lines().size(), static_cast<size_t>(num_threads * logs_per_thread));
}
