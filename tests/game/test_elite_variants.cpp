/**
 * @file test_elite_variants.cpp
 * @brief Unit tests for elite rolls and the elite transformation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "enemies/EliteVariants.hpp"

#include "mocks/MockServices.hpp"
#include "utils/TestHelpers.hpp"

using namespace Bestiary;
using namespace Bestiary::Enemies;
using namespace Bestiary::Test;
using ::testing::Return;

// =============================================================================
// Elite Chance Tests
// =============================================================================

TEST(EliteChanceTest, GrowsWithDepth) {
    EXPECT_DOUBLE_EQ(0.15, EliteChanceForFloor(1));
    EXPECT_DOUBLE_EQ(0.15, EliteChanceForFloor(2));
    EXPECT_DOUBLE_EQ(0.20, EliteChanceForFloor(3));
    EXPECT_DOUBLE_EQ(0.20, EliteChanceForFloor(4));
    EXPECT_DOUBLE_EQ(0.25, EliteChanceForFloor(5));
    EXPECT_DOUBLE_EQ(0.25, EliteChanceForFloor(40));
}

TEST(EliteChanceTest, CustomBaseChance) {
    EXPECT_DOUBLE_EQ(0.0, EliteChanceForFloor(1, 0.0));
    EXPECT_DOUBLE_EQ(0.40, EliteChanceForFloor(6, 0.30));
}

TEST(EliteChanceTest, SpawnRollUsesOneDraw) {
    MockRandomSource random;
    EXPECT_CALL(random, Value())
        .WillOnce(Return(0.19))
        .WillOnce(Return(0.19))
        .WillOnce(Return(0.24));

    EXPECT_FALSE(IsEliteSpawn(random, 1));
    EXPECT_TRUE(IsEliteSpawn(random, 3));
    EXPECT_TRUE(IsEliteSpawn(random, 5));
}

// =============================================================================
// Modifier Tests
// =============================================================================

TEST(EliteModifierTest, TruncatesEachStat) {
    const auto elite = ApplyEliteModifiers(13, 6, 0, 5);

    EXPECT_EQ(19, elite.maxHp);
    EXPECT_EQ(7, elite.attack);
    EXPECT_EQ(0, elite.defense);
    EXPECT_EQ(10, elite.xp);
}

TEST(EliteModifierTest, ColorBrightensAndCaps) {
    EXPECT_EQ(glm::ivec3(240, 0, 88), EliteColor(glm::ivec3(200, 0, 80)));
    EXPECT_EQ(glm::ivec3(255, 255, 255), EliteColor(glm::ivec3(250, 250, 250)));
}

// =============================================================================
// Make Elite Tests
// =============================================================================

TEST(MakeEnemyEliteTest, TransformsUnitInPlace) {
    auto unit = MakeTaggedUnit("goblin_skirmisher", {"goblin"}, 13, 6, 0);
    unit.name = "Goblin Skirmisher";
    unit.originalName = unit.name;
    unit.xp = 5;
    unit.hp = 4;

    MakeEnemyElite(unit);

    EXPECT_TRUE(unit.isElite);
    EXPECT_EQ("Elite Goblin Skirmisher", unit.name);
    EXPECT_EQ("Goblin Skirmisher", unit.originalName);
    EXPECT_EQ(19, unit.maxHp);
    EXPECT_EQ(19, unit.hp);
    EXPECT_EQ(7, unit.attack);
    EXPECT_EQ(0, unit.defense);
    EXPECT_EQ(10, unit.xp);
    EXPECT_EQ(EliteColor(kDefaultEnemyColor), unit.color);
}

TEST(MakeEnemyEliteTest, PrefixIsAppliedOnce) {
    auto unit = MakeTaggedUnit("orc_raider", {"orc"}, 20, 10, 10);
    unit.name = "Orc Raider";

    MakeEnemyElite(unit);
    MakeEnemyElite(unit);

    EXPECT_EQ("Elite Orc Raider", unit.name);
    EXPECT_EQ("Orc Raider", unit.originalName);
    // Stats compound on every application
    EXPECT_EQ(45, unit.maxHp);
    EXPECT_EQ(15, unit.attack);
}
