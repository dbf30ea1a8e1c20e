#pragma once

#include "SpawnedUnit.hpp"
#include "math/Random.hpp"
#include <glm/glm.hpp>

namespace Bestiary {
namespace Enemies {

// ============================================================================
// Elite constants
// ============================================================================

inline constexpr double kBaseEliteSpawnChance = 0.15;

inline constexpr double kEliteHpMultiplier = 1.5;
inline constexpr double kEliteAttackMultiplier = 1.25;
inline constexpr double kEliteDefenseMultiplier = 1.2;
inline constexpr double kEliteXpMultiplier = 2.0;

/**
 * @brief Stats after elite multipliers
 */
struct EliteStats {
    int maxHp = 0;
    int attack = 0;
    int defense = 0;
    int xp = 0;

    bool operator==(const EliteStats& other) const = default;
};

// ============================================================================
// Elite rolls
// ============================================================================

/**
 * @brief Elite probability for a floor
 *
 * baseChance on floors 1-2, +0.05 on floors 3-4, +0.10 from floor 5.
 */
[[nodiscard]] double EliteChanceForFloor(int floor, double baseChance = kBaseEliteSpawnChance);

/**
 * @brief Roll whether a spawn on this floor is elite (one draw from random)
 */
[[nodiscard]] bool IsEliteSpawn(IRandomSource& random, int floor,
                                double baseChance = kBaseEliteSpawnChance);

// ============================================================================
// Elite transformation
// ============================================================================

/**
 * @brief Apply elite multipliers, truncating each stat independently
 */
[[nodiscard]] EliteStats ApplyEliteModifiers(int maxHp, int attack, int defense, int xp);

/**
 * @brief Brighter tint used to mark elites
 */
[[nodiscard]] glm::ivec3 EliteColor(const glm::ivec3& baseColor);

/**
 * @brief Turn a unit into its elite variant in place
 *
 * Sets the elite flag, multiplies stats, heals to full, tints the color
 * and prefixes "Elite " to the name once. Stats are multiplied again on
 * every call; only the name change is idempotent.
 */
void MakeEnemyElite(SpawnedUnit& unit);

} // namespace Enemies
} // namespace Bestiary
