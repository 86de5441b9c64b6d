/**
 * @file test_logger.cpp
 * @brief Tests for log level handling (GoogleTest)
 */

#include <gtest/gtest.h>
#include "yedit/Logger.hpp"

using namespace yedit;

TEST(ParseLogLevel, Names) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
}

TEST(ParseLogLevel, UnknownUsesFallback) {
    EXPECT_EQ(parse_log_level("loud"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(LoggerLevel, SetAndRestore) {
    Logger& log = Logger::instance();
    const LogLevel saved = log.level();
    log.set_level(parse_log_level("debug"));
    EXPECT_EQ(log.level(), LogLevel::DEBUG);
    log.set_level(saved);
    EXPECT_EQ(log.level(), saved);
}
