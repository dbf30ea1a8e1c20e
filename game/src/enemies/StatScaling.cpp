#include "StatScaling.hpp"
#include <algorithm>

namespace Bestiary {
namespace Enemies {

ScaledStats ComputeScaledStats(const EnemyArchetype& a, int floor) {
    const int level = std::max(1, floor);
    const double steps = static_cast<double>(level - 1);

    ScaledStats stats;
    stats.maxHp = static_cast<int>(a.baseHp + a.hpPerFloor * steps);
    stats.attack = static_cast<int>(a.baseAttack + a.atkPerFloor * steps);
    stats.defense = static_cast<int>(a.baseDefense + a.defPerFloor * steps);
    stats.xp = static_cast<int>(a.baseXp + a.xpPerFloor * steps);

    const double rawInitiative = a.baseInitiative + a.initPerFloor * steps;
    const double maxInitiative = a.baseInitiative + steps * 0.5;
    stats.initiative = static_cast<int>(std::min(rawInitiative, maxInitiative));

    return stats;
}

ScaledStats ComputeScaledStats(const EnemyRegistry& registry, const std::string& archetypeId, int floor) {
    return ComputeScaledStats(registry.Get(archetypeId), floor);
}

SpawnedUnit CreateUnit(const EnemyArchetype& archetype, int floor) {
    const auto stats = ComputeScaledStats(archetype, floor);

    SpawnedUnit unit;
    unit.archetypeId = archetype.id;
    unit.name = archetype.name;
    unit.originalName = archetype.name;
    unit.aiProfile = archetype.aiProfile;
    unit.maxHp = stats.maxHp;
    unit.hp = stats.maxHp;
    unit.attack = stats.attack;
    unit.defense = stats.defense;
    unit.xp = stats.xp;
    unit.initiative = stats.initiative;
    unit.skillIds = archetype.skillIds;
    unit.tags.assign(archetype.tags.begin(), archetype.tags.end());
    std::sort(unit.tags.begin(), unit.tags.end());
    return unit;
}

} // namespace Enemies
} // namespace Bestiary
