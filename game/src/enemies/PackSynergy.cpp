#include "PackSynergy.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Bestiary {
namespace Enemies {

SynergyTally TallySynergyTags(const std::vector<SpawnedUnit>& units) {
    SynergyTally tally;
    for (const auto& unit : units) {
        if (unit.archetypeId.empty()) {
            continue;
        }
        if (unit.HasTag("goblin")) ++tally.goblin;
        if (unit.HasTag("undead")) ++tally.undead;
        if (unit.HasTag("cultist")) ++tally.cultist;
        if (unit.HasTag("beast")) ++tally.beast;
        if (unit.HasTag("elemental")) ++tally.elemental;
        if (unit.HasTag("caster") || unit.HasTag("invoker")) ++tally.caster;
        if (unit.HasTag("brute") || unit.HasTag("tank")) ++tally.tank;
    }
    return tally;
}

SynergyBonuses BonusesFromTally(const SynergyTally& tally) {
    SynergyBonuses bonuses;

    if (tally.goblin >= 3) {
        bonuses.attackMult += 0.10;
    }
    if (tally.undead >= 2) {
        bonuses.hpMult += std::min(0.25, 0.05 * tally.undead);
    }
    if (tally.cultist >= 2) {
        bonuses.skillPowerMult += 0.05 * tally.cultist;
    }
    if (tally.elemental >= 2) {
        bonuses.skillPowerMult += 0.20;
    }
    if (tally.tank >= 2) {
        bonuses.defenseMult += 0.10 * tally.tank;
    }
    if (tally.caster >= 2) {
        bonuses.skillPowerMult += 0.10;
    }

    return bonuses;
}

SynergyBonuses CalculatePackSynergies(const std::vector<SpawnedUnit>& units) {
    if (units.empty()) {
        return {};
    }
    return BonusesFromTally(TallySynergyTags(units));
}

void ApplySynergyBonuses(std::vector<SpawnedUnit>& units, const SynergyBonuses& bonuses) {
    for (auto& unit : units) {
        if (bonuses.attackMult != 1.0) {
            unit.attack = static_cast<int>(unit.attack * bonuses.attackMult);
        }

        if (bonuses.hpMult != 1.0) {
            const int newMaxHp = static_cast<int>(unit.maxHp * bonuses.hpMult);
            const double hpRatio = unit.maxHp > 0
                ? static_cast<double>(unit.hp) / unit.maxHp
                : 1.0;
            unit.maxHp = newMaxHp;
            unit.hp = static_cast<int>(newMaxHp * hpRatio);
        }

        if (bonuses.defenseMult != 1.0) {
            unit.defense = static_cast<int>(unit.defense * bonuses.defenseMult);
        }

        if (bonuses.skillPowerMult != 1.0) {
            unit.skillPower *= bonuses.skillPowerMult;
        }
    }
}

SynergyBonuses ApplySynergies(std::vector<SpawnedUnit>& units) {
    const auto bonuses = CalculatePackSynergies(units);
    if (!bonuses.IsNeutral()) {
        GAME_LOG_DEBUG("Pack synergies: attack x{:.2f} hp x{:.2f} defense x{:.2f} skill x{:.2f}",
                       bonuses.attackMult, bonuses.hpMult, bonuses.defenseMult, bonuses.skillPowerMult);
        ApplySynergyBonuses(units, bonuses);
    }
    return bonuses;
}

} // namespace Enemies
} // namespace Bestiary
