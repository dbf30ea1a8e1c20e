#include "EliteVariants.hpp"
#include <algorithm>
#include <string_view>

namespace Bestiary {
namespace Enemies {

namespace {
constexpr std::string_view kElitePrefix = "Elite ";
}

double EliteChanceForFloor(int floor, double baseChance) {
    if (floor <= 2) {
        return baseChance;
    }
    if (floor <= 4) {
        return baseChance + 0.05;
    }
    return baseChance + 0.10;
}

bool IsEliteSpawn(IRandomSource& random, int floor, double baseChance) {
    return random.Value() < EliteChanceForFloor(floor, baseChance);
}

EliteStats ApplyEliteModifiers(int maxHp, int attack, int defense, int xp) {
    EliteStats elite;
    elite.maxHp = static_cast<int>(maxHp * kEliteHpMultiplier);
    elite.attack = static_cast<int>(attack * kEliteAttackMultiplier);
    elite.defense = static_cast<int>(defense * kEliteDefenseMultiplier);
    elite.xp = static_cast<int>(xp * kEliteXpMultiplier);
    return elite;
}

glm::ivec3 EliteColor(const glm::ivec3& baseColor) {
    return glm::ivec3(
        std::min(255, static_cast<int>(baseColor.r * 1.2)),
        std::min(255, static_cast<int>(baseColor.g * 1.15)),
        std::min(255, static_cast<int>(baseColor.b * 1.1)));
}

void MakeEnemyElite(SpawnedUnit& unit) {
    unit.isElite = true;

    const auto elite = ApplyEliteModifiers(unit.maxHp, unit.attack, unit.defense, unit.xp);
    unit.maxHp = elite.maxHp;
    unit.hp = elite.maxHp;
    unit.attack = elite.attack;
    unit.defense = elite.defense;
    unit.xp = elite.xp;

    if (std::string_view(unit.name).substr(0, kElitePrefix.size()) != kElitePrefix) {
        unit.originalName = unit.name;
        unit.name = std::string(kElitePrefix) + unit.name;
    }

    unit.color = EliteColor(unit.color);
}

} // namespace Enemies
} // namespace Bestiary
