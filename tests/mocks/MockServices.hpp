/**
 * @file MockServices.hpp
 * @brief Mock implementations of injected services for testing
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "math/Random.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Bestiary {
namespace Test {

// =============================================================================
// Mock Random Source
// =============================================================================

/**
 * @brief gmock random source for asserting exactly which draws are made
 *
 * The two Range overloads are told apart with ::testing::An<int>() and
 * ::testing::An<double>() in expectations.
 */
class MockRandomSource : public IRandomSource {
public:
    MOCK_METHOD(double, Value, (), (override));
    MOCK_METHOD(int, Range, (int min, int max), (override));
    MOCK_METHOD(double, Range, (double min, double max), (override));
};

// =============================================================================
// Scripted Random Source
// =============================================================================

/**
 * @brief Replays a fixed list of Value() results
 *
 * Range(int) returns the lower bound and Range(double) the midpoint unless
 * overridden. Running out of scripted values is a test error.
 */
class ScriptedRandom : public IRandomSource {
public:
    ScriptedRandom() = default;
    explicit ScriptedRandom(std::vector<double> values) : m_values(std::move(values)) {}

    void Push(double value) { m_values.push_back(value); }
    void SetRepeat(double value) { m_repeat = value; m_hasRepeat = true; }

    double Value() override {
        ++m_valueCalls;
        if (m_next < m_values.size()) {
            return m_values[m_next++];
        }
        if (m_hasRepeat) {
            return m_repeat;
        }
        throw std::out_of_range("ScriptedRandom: no scripted value left");
    }

    int Range(int min, int max) override {
        ++m_intRangeCalls;
        return max < min ? max : min;
    }

    double Range(double min, double max) override {
        return (min + max) / 2.0;
    }

    [[nodiscard]] size_t GetValueCalls() const { return m_valueCalls; }
    [[nodiscard]] size_t GetIntRangeCalls() const { return m_intRangeCalls; }

private:
    std::vector<double> m_values;
    size_t m_next = 0;
    double m_repeat = 0.0;
    bool m_hasRepeat = false;
    size_t m_valueCalls = 0;
    size_t m_intRangeCalls = 0;
};

} // namespace Test
} // namespace Bestiary
