#pragma once

#include "SpawnedUnit.hpp"
#include <vector>

namespace Bestiary {
namespace Enemies {

/**
 * @brief Tag counts that drive pack synergies
 */
struct SynergyTally {
    int goblin = 0;
    int undead = 0;
    int cultist = 0;
    int beast = 0;       // Tracked for tooling, grants nothing yet
    int elemental = 0;
    int caster = 0;      // "caster" or "invoker"
    int tank = 0;        // "brute" or "tank"
};

/**
 * @brief Stat multipliers granted to every member of a pack
 */
struct SynergyBonuses {
    double attackMult = 1.0;
    double hpMult = 1.0;
    double defenseMult = 1.0;
    double skillPowerMult = 1.0;

    [[nodiscard]] bool IsNeutral() const {
        return attackMult == 1.0 && hpMult == 1.0 && defenseMult == 1.0 && skillPowerMult == 1.0;
    }
};

/**
 * @brief Count synergy tags across units; units without an archetype are skipped
 */
[[nodiscard]] SynergyTally TallySynergyTags(const std::vector<SpawnedUnit>& units);

/**
 * @brief Multipliers earned by a tally
 *
 * Goblin pack (3+): attack +10%. Undead horde (2+): hp +5% each, at most +25%.
 * Cultist circle (2+): skill power +5% each. Elemental storm (2+): skill
 * power +20%. Tank line (2+): defense +10% each. Casters (2+): skill power +10%.
 */
[[nodiscard]] SynergyBonuses BonusesFromTally(const SynergyTally& tally);

[[nodiscard]] SynergyBonuses CalculatePackSynergies(const std::vector<SpawnedUnit>& units);

/**
 * @brief Apply a bonus bundle to every unit in place
 *
 * Attack and defense are truncated after scaling. Current hp keeps its
 * fraction of max hp. Multipliers of exactly 1.0 leave the stat untouched.
 */
void ApplySynergyBonuses(std::vector<SpawnedUnit>& units, const SynergyBonuses& bonuses);

/**
 * @brief Calculate and apply the pack's synergies
 * @return The bonuses that were applied
 */
SynergyBonuses ApplySynergies(std::vector<SpawnedUnit>& units);

} // namespace Enemies
} // namespace Bestiary
