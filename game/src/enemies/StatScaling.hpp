#pragma once

#include "EnemyRegistry.hpp"
#include "SpawnedUnit.hpp"
#include <string>

namespace Bestiary {
namespace Enemies {

/**
 * @brief Archetype stats at a given depth
 */
struct ScaledStats {
    int maxHp = 0;
    int attack = 0;
    int defense = 0;
    int xp = 0;
    int initiative = 0;

    bool operator==(const ScaledStats& other) const = default;
};

/**
 * @brief Scale an archetype's stats linearly with floor depth
 *
 * Floors below 1 are treated as floor 1. Each stat is
 * trunc(base + perFloor * (floor - 1)). Initiative growth is capped at
 * half a point per floor so enemies never outpace the player.
 */
[[nodiscard]] ScaledStats ComputeScaledStats(const EnemyArchetype& archetype, int floor);

/**
 * @throws NotFoundError if archetypeId is not registered
 */
[[nodiscard]] ScaledStats ComputeScaledStats(const EnemyRegistry& registry,
                                             const std::string& archetypeId, int floor);

/**
 * @brief Build a fresh, non-elite unit for an archetype at a given depth
 */
[[nodiscard]] SpawnedUnit CreateUnit(const EnemyArchetype& archetype, int floor);

} // namespace Enemies
} // namespace Bestiary
