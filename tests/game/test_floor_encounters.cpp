/**
 * @file test_floor_encounters.cpp
 * @brief Unit tests for dungeon floor encounter planning
 */

#include <gtest/gtest.h>

#include "enemies/FloorEncounters.hpp"

#include "mocks/MockServices.hpp"
#include "utils/TestFixtures.hpp"
#include "utils/TestHelpers.hpp"

#include <algorithm>

using namespace Bestiary;
using namespace Bestiary::Enemies;
using namespace Bestiary::Test;

namespace {

EncounterTuning NoRandomExtras() {
    EncounterTuning tuning;
    tuning.uniqueSpawnChance = 0.0;
    tuning.eliteBaseChance = -1.0;
    return tuning;
}

} // namespace

// =============================================================================
// Sizing Tests
// =============================================================================

TEST(FloorSizingTest, TargetEnemyCount) {
    EXPECT_EQ(3, FloorEncounterPlanner::TargetEnemyCount(1));
    EXPECT_EQ(5, FloorEncounterPlanner::TargetEnemyCount(3));
    EXPECT_EQ(10, FloorEncounterPlanner::TargetEnemyCount(10));
    EXPECT_EQ(2, FloorEncounterPlanner::TargetEnemyCount(0));
}

TEST(FloorSizingTest, AreaFactorIsClamped) {
    EXPECT_EQ(2, FloorEncounterPlanner::TargetEnemyCount(1, 0.1));   // 3 * 0.75
    EXPECT_EQ(5, FloorEncounterPlanner::TargetEnemyCount(2, 1.25));
    EXPECT_EQ(9, FloorEncounterPlanner::TargetEnemyCount(3, 3.0));   // 5 * 1.8
    EXPECT_EQ(4, FloorEncounterPlanner::TargetEnemyCount(3, 0.9));   // 4.5 rounds to even
}

TEST(FloorSizingTest, DesiredPackCount) {
    EXPECT_EQ(1, FloorEncounterPlanner::DesiredPackCount(1));
    EXPECT_EQ(1, FloorEncounterPlanner::DesiredPackCount(3));
    EXPECT_EQ(2, FloorEncounterPlanner::DesiredPackCount(5));
    EXPECT_EQ(5, FloorEncounterPlanner::DesiredPackCount(10));
}

// =============================================================================
// Anchor Tests
// =============================================================================

TEST(ChooseAnchorsTest, LairsFirstThenRoomsThenCorridors) {
    const std::vector<AnchorTag> candidates = {
        "start", "lair", "library", std::nullopt, "lair", "sanctum", std::nullopt,
    };

    const auto chosen = FloorEncounterPlanner::ChooseAnchors(candidates, 4);
    const std::vector<AnchorTag> expected = {"lair", "lair", "library", std::nullopt};
    EXPECT_EQ(expected, chosen);
}

TEST(ChooseAnchorsTest, SinglePackPrefersOneLair) {
    const std::vector<AnchorTag> candidates = {"library", "lair", "lair"};

    const auto chosen = FloorEncounterPlanner::ChooseAnchors(candidates, 1);
    ASSERT_EQ(1u, chosen.size());
    EXPECT_EQ("lair", chosen[0].value_or(""));
}

TEST(ChooseAnchorsTest, LimitedByAvailableAnchors) {
    const std::vector<AnchorTag> candidates = {"treasure", std::nullopt};
    EXPECT_EQ(2u, FloorEncounterPlanner::ChooseAnchors(candidates, 6).size());
}

TEST(ChooseAnchorsTest, SafeRoomsNeverChosen) {
    const std::vector<AnchorTag> candidates = {"start", "sanctum", "start"};
    EXPECT_TRUE(FloorEncounterPlanner::ChooseAnchors(candidates, 3).empty());
    EXPECT_TRUE(FloorEncounterPlanner::ChooseAnchors({}, 3).empty());
}

// =============================================================================
// Planning Tests
// =============================================================================

TEST_F(RegistryTestFixture, NoAnchorsNoEnemies) {
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random);

    const auto plan = planner.PlanFloor(2, {"start", "sanctum"});
    EXPECT_EQ(2, plan.floor);
    EXPECT_EQ(4, plan.targetEnemies);
    EXPECT_TRUE(plan.groups.empty());
    EXPECT_EQ(0, plan.GetUnitCount());
}

TEST_F(RegistryTestFixture, PlansStayWithinBudget) {
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random);
    const std::vector<AnchorTag> anchors = {
        "start", "lair", "graveyard", "library", "treasure", "event", std::nullopt, std::nullopt, "lair",
    };

    for (int floor = 1; floor <= 12; ++floor) {
        for (int run = 0; run < 10; ++run) {
            const auto plan = planner.PlanFloor(floor, anchors, 1.5);

            EXPECT_EQ(std::min(plan.targetEnemies + 3, 12), plan.maxEnemies);
            EXPECT_LE(plan.GetUnitCount(), plan.maxEnemies);
            EXPECT_FALSE(plan.groups.empty());

            int uniques = 0;
            for (const auto& group : plan.groups) {
                EXPECT_FALSE(group.units.empty());
                EXPECT_NE("start", group.roomTag.value_or(""));
                if (group.isUnique) {
                    ++uniques;
                    ASSERT_EQ(1u, group.units.size());
                    EXPECT_TRUE(group.units[0].isUnique);
                    EXPECT_TRUE(group.units[0].isElite);
                    EXPECT_TRUE(group.packId.empty());
                }
            }
            EXPECT_LE(uniques, planner.GetTuning().maxUniquePerFloor);
        }
    }
}

TEST_F(RegistryTestFixture, GuaranteedUniqueGuardsItsRoom) {
    auto tuning = NoRandomExtras();
    tuning.uniqueSpawnChance = 1.0;
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random, tuning);

    const auto plan = planner.PlanFloor(1, {"graveyard"});
    ASSERT_EQ(1u, plan.groups.size());

    const auto& group = plan.groups[0];
    EXPECT_TRUE(group.isUnique);
    EXPECT_EQ("graveyard", group.roomTag.value_or(""));
    ASSERT_EQ(1u, group.units.size());
    EXPECT_EQ("grave_warden", group.units[0].archetypeId);
    EXPECT_EQ("Elite grave_warden", group.units[0].name);
    EXPECT_TRUE(group.units[0].isElite);
    EXPECT_EQ(1, plan.GetEliteCount());
}

TEST_F(RegistryTestFixture, EachUniqueSpawnsOncePerFloor) {
    auto tuning = NoRandomExtras();
    tuning.uniqueSpawnChance = 1.0;
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random, tuning);

    // Target 5 on floor 3 asks for two packs; both anchors are graveyards
    const auto plan = planner.PlanFloor(3, {"graveyard", "graveyard"});
    ASSERT_EQ(2u, plan.groups.size());
    EXPECT_TRUE(plan.groups[0].isUnique);
    EXPECT_FALSE(plan.groups[1].isUnique);
    EXPECT_FALSE(plan.groups[1].packId.empty());
}

TEST_F(RegistryTestFixture, UniqueLimitOfZeroDisablesUniques) {
    auto tuning = NoRandomExtras();
    tuning.uniqueSpawnChance = 1.0;
    tuning.maxUniquePerFloor = 0;
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random, tuning);

    const auto plan = planner.PlanFloor(1, {"graveyard"});
    ASSERT_EQ(1u, plan.groups.size());
    EXPECT_FALSE(plan.groups[0].isUnique);
}

TEST_F(RegistryTestFixture, UnregisteredUniqueIsReplaced) {
    auto tuning = NoRandomExtras();
    tuning.uniqueSpawnChance = 1.0;
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random, tuning);

    // The library's arcane_golem is not part of this registry
    const auto plan = planner.PlanFloor(1, {"library"});
    ASSERT_EQ(1u, plan.groups.size());
    ASSERT_EQ(1u, plan.groups[0].units.size());

    const auto& unit = plan.groups[0].units[0];
    EXPECT_TRUE(unit.isUnique);
    EXPECT_TRUE(m_registry.Get(unit.archetypeId).IsEligibleForFloor(1));
}

TEST_F(RegistryTestFixture, GuaranteedElitesOnEveryPackMember) {
    auto tuning = NoRandomExtras();
    tuning.eliteBaseChance = 1.0;
    FloorEncounterPlanner planner(m_registry, *m_selector, m_random, tuning);

    const auto plan = planner.PlanFloor(4, {"lair", "event", std::nullopt});
    ASSERT_FALSE(plan.groups.empty());
    EXPECT_EQ(plan.GetUnitCount(), plan.GetEliteCount());
}

TEST(FloorPlannerPackTest, PackMembersGetSynergies) {
    EnemyRegistry registry;
    auto skirmisher = MakeArchetype("goblin_skirmisher", CombatRole::Skirmisher, 1, {"goblin"});
    skirmisher.baseAttack = 10;
    registry.Register(skirmisher);
    auto brute = MakeArchetype("goblin_brute", CombatRole::Brute, 1, {"goblin", "brute"});
    brute.baseAttack = 6;
    registry.Register(brute);
    registry.RegisterPack(MakePack("goblin_band", 1, {"goblin_skirmisher", "goblin_skirmisher", "goblin_brute"}));
    registry.Seal();

    Random random(17);
    EnemySelector selector(registry, random);
    FloorEncounterPlanner planner(registry, selector, random, NoRandomExtras());

    const auto plan = planner.PlanFloor(1, {"library"});
    ASSERT_EQ(1u, plan.groups.size());

    const auto& group = plan.groups[0];
    EXPECT_EQ("goblin_band", group.packId);
    ASSERT_EQ(3u, group.units.size());
    EXPECT_DOUBLE_EQ(1.10, group.synergies.attackMult);
    EXPECT_EQ(11, group.units[0].attack);
    EXPECT_EQ(6, group.units[2].attack);
    EXPECT_EQ(0, plan.GetEliteCount());
}

TEST(FloorPlannerPackTest, PackIsCutToFloorBudget) {
    EnemyRegistry registry;
    registry.Register(MakeArchetype("goblin_skirmisher", CombatRole::Skirmisher, 1, {"goblin"}));
    registry.RegisterPack(MakePack("goblin_band", 1,
                                   {"goblin_skirmisher", "goblin_skirmisher", "goblin_skirmisher"}));
    registry.Seal();

    auto tuning = NoRandomExtras();
    tuning.maxEnemiesPerFloor = 2;

    Random random(5);
    EnemySelector selector(registry, random);
    FloorEncounterPlanner planner(registry, selector, random, tuning);

    const auto plan = planner.PlanFloor(1, {"library", "lair"});
    EXPECT_EQ(2, plan.maxEnemies);
    EXPECT_EQ(2, plan.GetUnitCount());
    ASSERT_EQ(1u, plan.groups.size());
    EXPECT_TRUE(plan.groups[0].synergies.IsNeutral());
}
