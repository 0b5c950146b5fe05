/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <ingestd/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace ingestd::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(&output_);
    }

    void TearDown() override {
        Logger::instance().setOutput(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setColorEnabled(true);
    }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");

    LOG_WARN("Test", "visible warning");
    LOG_ERROR("Test", "visible error");

    std::string text = output_.str();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("visible warning"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffDisablesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);

    LOG_ERROR("Test", "should not appear");

    EXPECT_TRUE(output_.str().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("verbose", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, PlaceholderFormatting) {
    LOG_INFO("Fmt", "table {} sent {} records, durable={}", "orders", 42, true);

    EXPECT_NE(output_.str().find("table orders sent 42 records, durable=true"),
              std::string::npos);
}

TEST_F(LoggerTest, ExtraPlaceholdersKeptVerbatim) {
    LOG_INFO("Fmt", "only {} of {}", 1);

    EXPECT_NE(output_.str().find("only 1 of {}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTag) {
    LOG_INFO("MyComponent", "Test message");

    EXPECT_NE(output_.str().find("[MyComponent]"), std::string::npos);
    EXPECT_NE(output_.str().find("Test message"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread" + std::to_string(i), "Message {}", j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(output_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
