#include "FloorEncounters.hpp"
#include "EliteVariants.hpp"
#include "StatScaling.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Bestiary {
namespace Enemies {

namespace {

constexpr double kApproxPackSize = 2.2;

bool IsEnemyFree(const AnchorTag& tag) {
    return tag && (*tag == "start" || *tag == "sanctum");
}

} // anonymous namespace

int FloorPlan::GetUnitCount() const {
    int count = 0;
    for (const auto& group : groups) {
        count += static_cast<int>(group.units.size());
    }
    return count;
}

int FloorPlan::GetEliteCount() const {
    int count = 0;
    for (const auto& group : groups) {
        count += static_cast<int>(std::count_if(group.units.begin(), group.units.end(),
                                                [](const SpawnedUnit& u) { return u.isElite; }));
    }
    return count;
}

FloorEncounterPlanner::FloorEncounterPlanner(const EnemyRegistry& registry, EnemySelector& selector,
                                             IRandomSource& random, EncounterTuning tuning)
    : m_registry(registry)
    , m_selector(selector)
    , m_random(random)
    , m_tuning(std::move(tuning)) {
}

int FloorEncounterPlanner::TargetEnemyCount(int floor, double areaFactor) {
    const double factor = std::clamp(areaFactor, 0.75, 1.8);
    const int target = static_cast<int>(std::nearbyint((2 + floor) * factor));
    return std::clamp(target, 2, 10);
}

int FloorEncounterPlanner::DesiredPackCount(int targetEnemies) {
    return std::max(1, static_cast<int>(std::nearbyint(targetEnemies / kApproxPackSize)));
}

std::vector<AnchorTag> FloorEncounterPlanner::ChooseAnchors(const std::vector<AnchorTag>& candidates,
                                                           int desiredPacks) {
    std::vector<AnchorTag> lairs;
    std::vector<AnchorTag> rooms;
    std::vector<AnchorTag> corridors;

    for (const auto& tag : candidates) {
        if (!tag) {
            corridors.push_back(tag);
        } else if (IsEnemyFree(tag)) {
            continue;
        } else if (*tag == "lair") {
            lairs.push_back(tag);
        } else {
            rooms.push_back(tag);
        }
    }

    const int available = static_cast<int>(lairs.size() + rooms.size() + corridors.size());
    int remaining = std::min(desiredPacks, available);

    std::vector<AnchorTag> chosen;
    auto take = [&](const std::vector<AnchorTag>& from, int count) {
        chosen.insert(chosen.end(), from.begin(), from.begin() + count);
        remaining -= count;
    };

    if (!lairs.empty() && remaining > 0) {
        take(lairs, std::min(static_cast<int>(lairs.size()), std::max(1, remaining / 2)));
    }
    if (!rooms.empty() && remaining > 0) {
        take(rooms, std::min(static_cast<int>(rooms.size()), remaining));
    }
    if (!corridors.empty() && remaining > 0) {
        take(corridors, std::min(static_cast<int>(corridors.size()), remaining));
    }
    return chosen;
}

FloorPlan FloorEncounterPlanner::PlanFloor(int floor, const std::vector<AnchorTag>& candidateAnchors,
                                           double areaFactor) {
    FloorPlan plan;
    plan.floor = std::max(1, floor);
    plan.targetEnemies = TargetEnemyCount(plan.floor, areaFactor);
    plan.maxEnemies = std::min(plan.targetEnemies + 3, m_tuning.maxEnemiesPerFloor);

    const auto anchors = ChooseAnchors(candidateAnchors, DesiredPackCount(plan.targetEnemies));
    if (anchors.empty()) {
        GAME_LOG_DEBUG("Floor {}: no usable anchors, nothing spawned", plan.floor);
        return plan;
    }

    std::set<std::string> spawnedUniques;
    int spawnedTotal = 0;

    for (const auto& roomTag : anchors) {
        if (spawnedTotal >= plan.maxEnemies) {
            break;
        }

        if (auto unique = TrySpawnUnique(plan.floor, roomTag, spawnedUniques)) {
            spawnedTotal += static_cast<int>(unique->units.size());
            plan.groups.push_back(std::move(*unique));
            continue;
        }

        auto group = SpawnPack(plan.floor, roomTag, plan.maxEnemies - spawnedTotal);
        if (group.units.empty()) {
            continue;
        }
        spawnedTotal += static_cast<int>(group.units.size());
        plan.groups.push_back(std::move(group));
    }

    GAME_LOG_INFO("Floor {}: {} enemies in {} groups ({} elite, target {})",
                  plan.floor, plan.GetUnitCount(), plan.groups.size(),
                  plan.GetEliteCount(), plan.targetEnemies);
    return plan;
}

std::optional<EncounterGroup> FloorEncounterPlanner::TrySpawnUnique(int floor, const AnchorTag& roomTag,
                                                                    std::set<std::string>& spawnedUniques) {
    if (!roomTag) {
        return std::nullopt;
    }
    const auto& uniqueIds = m_registry.GetUniqueRoomEnemies(*roomTag);
    if (uniqueIds.empty() || static_cast<int>(spawnedUniques.size()) >= m_tuning.maxUniquePerFloor) {
        return std::nullopt;
    }
    if (!m_random.Bool(m_tuning.uniqueSpawnChance)) {
        return std::nullopt;
    }

    std::vector<std::string> available;
    for (const auto& id : uniqueIds) {
        if (!spawnedUniques.count(id)) {
            available.push_back(id);
        }
    }
    if (available.empty()) {
        return std::nullopt;
    }

    const auto& uniqueId = available[m_random.Range(0, static_cast<int>(available.size()) - 1)];
    const auto& archetype = ResolveOrChoose(uniqueId, floor, roomTag);

    auto unit = CreateUnit(archetype, floor);
    unit.isUnique = true;
    MakeEnemyElite(unit);

    EncounterGroup group;
    group.roomTag = roomTag;
    group.isUnique = true;
    group.units.push_back(std::move(unit));

    spawnedUniques.insert(uniqueId);
    GAME_LOG_DEBUG("Floor {}: unique '{}' guards the {}", floor, archetype.id, *roomTag);
    return group;
}

EncounterGroup FloorEncounterPlanner::SpawnPack(int floor, const AnchorTag& roomTag, int budget) {
    const auto pack = m_selector.ChoosePackForFloor(floor, roomTag);

    EncounterGroup group;
    group.roomTag = roomTag;
    group.packId = pack.id;

    for (const auto& memberId : pack.memberArchIds) {
        if (static_cast<int>(group.units.size()) >= budget) {
            break;
        }
        const auto& archetype = ResolveOrChoose(memberId, floor, roomTag);
        auto unit = CreateUnit(archetype, floor);
        if (IsEliteSpawn(m_random, floor, m_tuning.eliteBaseChance)) {
            MakeEnemyElite(unit);
        }
        group.units.push_back(std::move(unit));
    }

    group.synergies = ApplySynergies(group.units);
    return group;
}

const EnemyArchetype& FloorEncounterPlanner::ResolveOrChoose(const std::string& archetypeId, int floor,
                                                             const AnchorTag& roomTag) {
    if (const auto* archetype = m_registry.Find(archetypeId)) {
        return *archetype;
    }
    GAME_LOG_WARN("Archetype '{}' is not registered, choosing a floor {} replacement", archetypeId, floor);
    return m_selector.ChooseArchetypeForFloor(floor, roomTag);
}

} // namespace Enemies
} // namespace Bestiary
