/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"

#include <iostream>

namespace Bestiary {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for Bestiary tests
 *
 * Initializes logging once for the whole run and silences it, so that
 * registry and generation code can log freely during tests.
 */
class BestiaryTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Bestiary Test Suite Starting ===" << std::endl;

        Logger::Initialize("", true);
        Logger::SetLevel(spdlog::level::off);
    }

    void TearDown() override {
        Logger::Shutdown();
        std::cout << "=== Bestiary Test Suite Complete ===" << std::endl;
    }
};

// =============================================================================
// Test Event Listener
// =============================================================================

/**
 * @brief Prints a one-line summary per suite
 */
class BestiaryTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        std::cout << "Suite " << test_suite.name() << ": "
                  << test_suite.successful_test_count() << " passed, "
                  << test_suite.failed_test_count() << " failed" << std::endl;
    }
};

} // namespace Test
} // namespace Bestiary

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Bestiary::Test::BestiaryTestEnvironment());

    ::testing::TestEventListeners& listeners =
        ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new Bestiary::Test::BestiaryTestListener());

    return RUN_ALL_TESTS();
}
