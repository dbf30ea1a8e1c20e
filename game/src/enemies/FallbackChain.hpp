#pragma once

#include "core/Logger.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Bestiary {
namespace Enemies {

/**
 * @brief One step of a priority-ordered fallback chain
 */
template<typename T>
struct FallbackStep {
    std::string name;
    std::function<std::optional<T>()> attempt;
};

/**
 * @brief Run steps in order and return the first result that succeeds
 *
 * A step fails by returning nullopt. Falling past the first step is
 * logged at debug level with the name of the step that succeeded.
 *
 * @return nullopt when every step failed
 */
template<typename T>
std::optional<T> FirstSuccess(const std::string& chainName, const std::vector<FallbackStep<T>>& steps) {
    for (size_t i = 0; i < steps.size(); ++i) {
        auto result = steps[i].attempt();
        if (!result) {
            continue;
        }
        if (i > 0) {
            GAME_LOG_DEBUG("{}: fell back to '{}'", chainName, steps[i].name);
        }
        return result;
    }
    return std::nullopt;
}

} // namespace Enemies
} // namespace Bestiary
