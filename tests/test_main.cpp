/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target yedit_tests
 * Run:   ./yedit_tests
 */

#include <gtest/gtest.h>
#include "yedit/Logger.hpp"

#include <cstdlib>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Dropped-key warnings are expected in some tests; YEDIT_LOG_LEVEL shows them.
    const char* level = std::getenv("YEDIT_LOG_LEVEL");
    yedit::Logger::instance().set_level(
        yedit::parse_log_level(level != nullptr ? level : "", yedit::LogLevel::ERROR));
    return RUN_ALL_TESTS();
}
