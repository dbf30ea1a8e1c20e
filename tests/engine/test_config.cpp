/**
 * @file test_config.cpp
 * @brief Unit tests for the configuration document and tuning defaults
 */

#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "utils/TestHelpers.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>

using namespace Bestiary;
using namespace Bestiary::Test;
using json = nlohmann::json;

// =============================================================================
// Key Access Tests
// =============================================================================

TEST(ConfigTest, MissingKeysReturnDefault) {
    Config config;

    EXPECT_EQ(42, config.Get("encounter.max_enemies", 42));
    EXPECT_FALSE(config.Has("encounter.max_enemies"));
}

TEST(ConfigTest, SetCreatesNestedKeys) {
    Config config;
    config.Set("floor.max_enemies", 20);
    config.Set("logging.level", std::string("debug"));

    EXPECT_TRUE(config.Has("floor"));
    EXPECT_TRUE(config.Has("floor.max_enemies"));
    EXPECT_EQ(20, config.Get("floor.max_enemies", 0));
    EXPECT_EQ("debug", config.Get<std::string>("logging.level", "info"));
}

TEST(ConfigTest, TypeMismatchReturnsDefault) {
    Config config;
    config.Set("elite.base_chance", std::string("high"));

    EXPECT_DOUBLE_EQ(0.15, config.Get("elite.base_chance", 0.15));
}

TEST(ConfigTest, KeyThroughScalarIsMissing) {
    Config config;
    config.Set("random.seed", 5);

    EXPECT_FALSE(config.Has("random.seed.low"));
    EXPECT_EQ(-1, config.Get("random.seed.low", -1));
}

TEST(ConfigTest, LoadFromJsonIgnoresNonObjects) {
    Config config;
    config.LoadFromJson(json::array({1, 2, 3}));

    EXPECT_TRUE(config.GetJson().is_object());
    EXPECT_TRUE(config.GetJson().empty());
}

// =============================================================================
// File I/O Tests
// =============================================================================

TEST(ConfigFileTest, MissingFileReportsFileNotFound) {
    ScopedTempDirectory dir("bestiary_config_missing");
    Config config;

    auto result = config.Load(dir.GetPath() / "absent.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::FileNotFound, result.error());
    EXPECT_STREQ("file not found", ConfigErrorToString(result.error()));
}

TEST(ConfigFileTest, CreateIfMissingWritesDefaults) {
    ScopedTempDirectory dir("bestiary_config_create");
    const auto path = dir.GetPath() / "nested" / "encounter.json";
    Config config;

    ASSERT_TRUE(config.Load(path, true).has_value());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(Config::DefaultDocument(), config.GetJson());
    EXPECT_EQ(8, config.Get("encounter.max_enemies", 0));
}

TEST(ConfigFileTest, MalformedFileReportsParseError) {
    ScopedTempDirectory dir("bestiary_config_malformed");
    const auto path = dir.WriteFile("broken.json", "{ \"elite\": { \"base_chance\": ");
    Config config;

    auto result = config.Load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::ParseError, result.error());
}

TEST(ConfigFileTest, SaveAndReload) {
    ScopedTempDirectory dir("bestiary_config_save");
    const auto path = dir.WriteFile("encounter.json", R"({"floor": {"max_enemies": 9}})");
    Config config;
    ASSERT_TRUE(config.Load(path).has_value());

    config.Set("floor.max_enemies", 14);
    ASSERT_TRUE(config.Save().has_value());

    config.Set("floor.max_enemies", 1);
    ASSERT_TRUE(config.Reload().has_value());
    EXPECT_EQ(14, config.Get("floor.max_enemies", 0));
}

TEST(ConfigFileTest, SaveWithoutPathFails) {
    Config config;
    auto result = config.Save();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::WriteError, result.error());
}

TEST(ConfigFileTest, ShippedConfigMatchesDefaults) {
    Config config;
    ASSERT_TRUE(config.Load(std::filesystem::path(BESTIARY_TEST_DATA_DIR) / "config" / "encounter.json").has_value());
    EXPECT_EQ(Config::DefaultDocument(), config.GetJson());
}

// =============================================================================
// Tuning Tests
// =============================================================================

TEST(EncounterTuningTest, DefaultsFromEmptyConfig) {
    Config config;
    const auto tuning = EncounterTuning::FromConfig(config);

    EXPECT_DOUBLE_EQ(0.15, tuning.eliteBaseChance);
    EXPECT_EQ(1, tuning.minEnemies);
    EXPECT_EQ(8, tuning.maxEnemies);
    EXPECT_DOUBLE_EQ(1.5, tuning.swarmMultiplier);
    EXPECT_DOUBLE_EQ(0.75, tuning.eliteMultiplier);
    EXPECT_DOUBLE_EQ(0.15, tuning.uniqueSpawnChance);
    EXPECT_EQ(2, tuning.maxUniquePerFloor);
    EXPECT_EQ(12, tuning.maxEnemiesPerFloor);
    EXPECT_TRUE(Contains(tuning.swarmPartyTypes, std::string("goblin")));
    EXPECT_TRUE(Contains(tuning.elitePartyTypes, std::string("noble")));
}

TEST(EncounterTuningTest, OverridesAreRead) {
    Config config;
    config.Set("elite.base_chance", 0.5);
    config.Set("encounter.max_enemies", 5);
    config.Set("encounter.swarm_party_types", std::vector<std::string>{"rat_swarm"});
    config.Set("floor.max_unique_per_floor", 0);

    const auto tuning = EncounterTuning::FromConfig(config);
    EXPECT_DOUBLE_EQ(0.5, tuning.eliteBaseChance);
    EXPECT_EQ(5, tuning.maxEnemies);
    ASSERT_EQ(1u, tuning.swarmPartyTypes.size());
    EXPECT_EQ("rat_swarm", tuning.swarmPartyTypes[0]);
    EXPECT_EQ(0, tuning.maxUniquePerFloor);
    EXPECT_EQ(1, tuning.minEnemies);
}

TEST(AppConfigTest, ReadsApplicationSettings) {
    Config config;
    config.LoadFromJson(Config::DefaultDocument());
    config.Set("random.seed", 77);
    config.Set("content.directory", std::string("content"));

    const auto app = AppConfig::FromConfig(config);
    EXPECT_EQ("info", app.logLevel);
    EXPECT_TRUE(app.logFile.empty());
    EXPECT_EQ("content", app.contentDirectory);
    EXPECT_EQ(77, app.seed);
}
