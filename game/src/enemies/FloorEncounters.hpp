#pragma once

#include "EnemySelection.hpp"
#include "PackSynergy.hpp"
#include "SpawnedUnit.hpp"
#include "config/Config.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Bestiary {
namespace Enemies {

/**
 * @brief Room tag of a spawn anchor; nullopt marks a corridor
 */
using AnchorTag = std::optional<std::string>;

/**
 * @brief Units placed together at one anchor
 */
struct EncounterGroup {
    AnchorTag roomTag;
    std::string packId;                  // Empty for room uniques
    std::vector<SpawnedUnit> units;
    SynergyBonuses synergies;
    bool isUnique = false;
};

/**
 * @brief Everything spawned on one floor
 */
struct FloorPlan {
    int floor = 1;
    int targetEnemies = 0;
    int maxEnemies = 0;
    std::vector<EncounterGroup> groups;

    [[nodiscard]] int GetUnitCount() const;
    [[nodiscard]] int GetEliteCount() const;
};

// ============================================================================
// Floor Encounter Planner
// ============================================================================

/**
 * @brief Decides which packs, uniques and elites populate a dungeon floor
 *
 * Works on anchor room tags only; placing units on tiles is left to the
 * map layer. Anchors in "start" and "sanctum" rooms never receive enemies.
 */
class FloorEncounterPlanner {
public:
    FloorEncounterPlanner(const EnemyRegistry& registry, EnemySelector& selector,
                          IRandomSource& random, EncounterTuning tuning = {});

    /**
     * @brief Desired enemy count: round((2 + floor) * areaFactor) clamped to [2, 10]
     *
     * areaFactor is clamped to [0.75, 1.8] and rounds half to even.
     */
    [[nodiscard]] static int TargetEnemyCount(int floor, double areaFactor = 1.0);

    /**
     * @brief Number of packs for a target, assuming about 2.2 enemies per pack
     */
    [[nodiscard]] static int DesiredPackCount(int targetEnemies);

    /**
     * @brief Pick anchors from the candidates in order
     *
     * Roughly half the packs go to lairs, then ordinary rooms, then corridors.
     */
    [[nodiscard]] static std::vector<AnchorTag> ChooseAnchors(const std::vector<AnchorTag>& candidates,
                                                              int desiredPacks);

    /**
     * @brief Plan every encounter group for a floor
     * @param candidateAnchors Room tag of each possible anchor, in preference order
     * @param areaFactor Floor area relative to a single screen
     */
    FloorPlan PlanFloor(int floor, const std::vector<AnchorTag>& candidateAnchors, double areaFactor = 1.0);

    [[nodiscard]] const EncounterTuning& GetTuning() const { return m_tuning; }

private:
    std::optional<EncounterGroup> TrySpawnUnique(int floor, const AnchorTag& roomTag,
                                                 std::set<std::string>& spawnedUniques);
    EncounterGroup SpawnPack(int floor, const AnchorTag& roomTag, int budget);
    const EnemyArchetype& ResolveOrChoose(const std::string& archetypeId, int floor, const AnchorTag& roomTag);

    const EnemyRegistry& m_registry;
    EnemySelector& m_selector;
    IRandomSource& m_random;
    EncounterTuning m_tuning;
};

} // namespace Enemies
} // namespace Bestiary
