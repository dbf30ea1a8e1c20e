/**
 * @file test_stat_scaling.cpp
 * @brief Unit tests for floor-based stat scaling and unit creation
 */

#include <gtest/gtest.h>

#include "enemies/StatScaling.hpp"

#include "utils/TestFixtures.hpp"
#include "utils/TestHelpers.hpp"

using namespace Bestiary;
using namespace Bestiary::Enemies;
using namespace Bestiary::Test;

namespace {

EnemyArchetype MakeScalingArchetype() {
    auto a = MakeArchetype("goblin_skirmisher", CombatRole::Skirmisher, 1, {"goblin", "skirmisher"});
    a.name = "Goblin Skirmisher";
    a.aiProfile = "skirmisher";
    a.baseHp = 10;
    a.hpPerFloor = 1.0;
    a.baseAttack = 4;
    a.atkPerFloor = 0.7;
    a.baseDefense = 0;
    a.defPerFloor = 0.2;
    a.baseXp = 6;
    a.xpPerFloor = 1.0;
    a.skillIds = {"poison_strike", "nimble_step"};
    return a;
}

} // namespace

// =============================================================================
// Scaling Tests
// =============================================================================

TEST(StatScalingTest, FloorOneIsBaseStats) {
    const auto stats = ComputeScaledStats(MakeScalingArchetype(), 1);

    EXPECT_EQ(10, stats.maxHp);
    EXPECT_EQ(4, stats.attack);
    EXPECT_EQ(0, stats.defense);
    EXPECT_EQ(6, stats.xp);
    EXPECT_EQ(10, stats.initiative);
}

TEST(StatScalingTest, LinearGrowthTruncates) {
    const auto stats = ComputeScaledStats(MakeScalingArchetype(), 4);

    EXPECT_EQ(13, stats.maxHp);   // 10 + 3.0
    EXPECT_EQ(6, stats.attack);   // 4 + 2.1
    EXPECT_EQ(0, stats.defense);  // 0 + 0.6
    EXPECT_EQ(9, stats.xp);
}

TEST(StatScalingTest, FloorsBelowOneClampToOne) {
    const auto archetype = MakeScalingArchetype();
    EXPECT_EQ(ComputeScaledStats(archetype, 1), ComputeScaledStats(archetype, 0));
    EXPECT_EQ(ComputeScaledStats(archetype, 1), ComputeScaledStats(archetype, -5));
}

TEST(StatScalingTest, InitiativeGrowthIsCapped) {
    auto fast = MakeScalingArchetype();
    fast.baseInitiative = 12;
    fast.initPerFloor = 2.0;

    // Capped at half a point per floor: 12 + 9 * 0.5
    EXPECT_EQ(16, ComputeScaledStats(fast, 10).initiative);

    fast.initPerFloor = 0.3;
    EXPECT_EQ(14, ComputeScaledStats(fast, 10).initiative);
}

TEST(StatScalingTest, GrowthHoldsAcrossAllFloors) {
    auto archetype = MakeScalingArchetype();
    archetype.baseInitiative = 9;

    for (const double initPerFloor : {0.3, 0.7, 2.0}) {
        archetype.initPerFloor = initPerFloor;
        int previousHp = ComputeScaledStats(archetype, 1).maxHp;

        for (int floor = 1; floor <= 1000; ++floor) {
            const auto stats = ComputeScaledStats(archetype, floor);
            EXPECT_GE(stats.maxHp, previousHp) << "floor " << floor;
            EXPECT_EQ(static_cast<int>(10 + 1.0 * (floor - 1)), stats.maxHp) << "floor " << floor;
            EXPECT_LE(stats.initiative, 9 + (floor - 1) / 2)
                << "floor " << floor << " initPerFloor " << initPerFloor;
            previousHp = stats.maxHp;
        }
    }
}

TEST_F(RegistryTestFixture, ScalingByIdUsesRegistry) {
    const auto stats = ComputeScaledStats(m_registry, "goblin_skirmisher", 4);
    EXPECT_EQ(13, stats.maxHp);
    EXPECT_EQ(6, stats.attack);

    EXPECT_THROW((void)ComputeScaledStats(m_registry, "ghost", 4), NotFoundError);
}

// =============================================================================
// Unit Creation Tests
// =============================================================================

TEST(CreateUnitTest, CopiesIdentityAndScaledStats) {
    const auto unit = CreateUnit(MakeScalingArchetype(), 4);

    EXPECT_EQ("goblin_skirmisher", unit.archetypeId);
    EXPECT_EQ("Goblin Skirmisher", unit.name);
    EXPECT_EQ("Goblin Skirmisher", unit.originalName);
    EXPECT_EQ("skirmisher", unit.aiProfile);
    EXPECT_EQ(13, unit.maxHp);
    EXPECT_EQ(13, unit.hp);
    EXPECT_EQ(6, unit.attack);
    EXPECT_DOUBLE_EQ(1.0, unit.skillPower);
    EXPECT_EQ((std::vector<std::string>{"poison_strike", "nimble_step"}), unit.skillIds);
    EXPECT_EQ((std::vector<std::string>{"goblin", "skirmisher"}), unit.tags);
    EXPECT_TRUE(unit.HasTag("goblin"));
    EXPECT_FALSE(unit.isElite);
    EXPECT_FALSE(unit.isUnique);
    EXPECT_FALSE(unit.isAlly);
    EXPECT_EQ(kDefaultEnemyColor, unit.color);
}
