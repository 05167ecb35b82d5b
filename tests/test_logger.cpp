/**
 * @file test_logger.cpp
 * @brief Тесты консольного логгера
 */

#include <gtest/gtest.h>

#include "log/logger.hpp"

namespace stepsha::tests {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = log::level();
        log::set_color(false);
    }

    void TearDown() override {
        log::set_level(saved_);
        log::set_color(true);
    }

    log::LogLevel saved_ = log::LogLevel::Info;
};

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("error").value(), log::LogLevel::Error);
    EXPECT_EQ(log::parse_level("warn").value(), log::LogLevel::Warning);
    EXPECT_EQ(log::parse_level("warning").value(), log::LogLevel::Warning);
    EXPECT_EQ(log::parse_level("info").value(), log::LogLevel::Info);
    EXPECT_EQ(log::parse_level("debug").value(), log::LogLevel::Debug);
}

TEST_F(LoggerTest, ParseUnknownLevel) {
    for (std::string_view name : {"", "INFO", "trace", "verbose"}) {
        auto level = log::parse_level(name);
        ASSERT_FALSE(level.has_value()) << name;
        EXPECT_EQ(level.error().code, ErrorCode::ConfigInvalidValue);
    }
}

TEST_F(LoggerTest, ToString) {
    EXPECT_EQ(log::to_string(log::LogLevel::Error), "ERROR");
    EXPECT_EQ(log::to_string(log::LogLevel::Warning), "WARNING");
    EXPECT_EQ(log::to_string(log::LogLevel::Info), "INFO");
    EXPECT_EQ(log::to_string(log::LogLevel::Debug), "DEBUG");
}

TEST_F(LoggerTest, LevelFilter) {
    log::set_level(log::LogLevel::Warning);
    EXPECT_EQ(log::level(), log::LogLevel::Warning);

    EXPECT_TRUE(log::enabled(log::LogLevel::Error));
    EXPECT_TRUE(log::enabled(log::LogLevel::Warning));
    EXPECT_FALSE(log::enabled(log::LogLevel::Info));
    EXPECT_FALSE(log::enabled(log::LogLevel::Debug));

    log::set_level(log::LogLevel::Debug);
    EXPECT_TRUE(log::enabled(log::LogLevel::Debug));
}

TEST_F(LoggerTest, WriteToStreams) {
    log::set_level(log::LogLevel::Info);

    testing::internal::CaptureStderr();
    log::error("ошибка {}", 42);
    const auto err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
    EXPECT_NE(err.find("ошибка 42"), std::string::npos);
    EXPECT_EQ(err.find("\033["), std::string::npos);
}

} // namespace stepsha::tests
