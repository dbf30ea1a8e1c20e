/**
 * @file EncounterSimTool.cpp
 * @brief Command-line tool for inspecting encounter generation
 *
 * Usage:
 *   bestiary_sim <command> [options]
 *
 * Commands:
 *   floor       Plan the encounters of one or more dungeon floors
 *   party       Convert an overworld party into battle units
 *   validate    Check all content and report errors and warnings
 *   stats       Print content statistics and floor candidate weights
 *
 * Options:
 *   --config <file>         Configuration file (default: data/config/encounter.json)
 *   --content <dir>         Content directory (overrides config)
 *   --seed <value>          Random seed (overrides config)
 *   --floor <n>             Floor to plan (default: 1)
 *   --floors <n>            Plan floors 1..n instead of a single floor
 *   --anchors <list>        Anchor room tags, "corridor" for corridors
 *   --area <factor>         Floor area factor (default: 1.0)
 *   --room <tag>            Room tag for stats candidate weights
 *   --party <type>          Party type id to convert
 *   --party-name <name>     Display name of the converted party
 *   --companions <n>        Player companions (default: 1)
 *   --level <n>             Player level (default: 1)
 *   --relation <value>      Faction relation with the party (-100..100)
 *   --verbose               Debug logging
 *   --help                  Show this help
 */

#include "core/Logger.hpp"
#include "config/Config.hpp"
#include "math/Random.hpp"
#include "enemies/EnemyRegistry.hpp"
#include "enemies/EnemySelection.hpp"
#include "enemies/EnemyValidation.hpp"
#include "enemies/FloorEncounters.hpp"
#include "overworld/BattleConversion.hpp"
#include "overworld/PartyTypes.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace Bestiary;
using namespace Bestiary::Enemies;
using namespace Bestiary::Overworld;

// ============================================================================
// Configuration
// ============================================================================

enum class Command {
    Floor,
    Party,
    Validate,
    Stats
};

struct ToolConfig {
    Command command = Command::Floor;

    std::string configFile = "data/config/encounter.json";
    std::string contentDir;
    std::optional<std::uint32_t> seed;

    int floor = 1;
    int floors = 0;
    std::vector<AnchorTag> anchors = {"lair", "lair", "generic", "graveyard", "library",
                                      std::nullopt, std::nullopt};
    double areaFactor = 1.0;
    std::optional<std::string> room;
    std::string archetypeId;
    std::string packId;

    std::string partyType = "bandit";
    std::string partyName;
    int companions = 1;
    int level = 1;
    std::optional<int> relation;

    bool verbose = false;
};

void PrintUsage() {
    std::cout << R"(
bestiary_sim - Inspect procedural encounter generation

Usage:
  bestiary_sim <command> [options]

Commands:
  floor                       Plan the encounters of dungeon floors
  party                       Convert an overworld party into battle units
  validate                    Check all content definitions
  stats                       Content statistics and candidate weights

Options:
  --config <file>             Configuration file
                              Default: data/config/encounter.json
  --content <dir>             Content directory (overrides config)
  --seed <value>              Random seed (overrides config)

  --floor <n>                 Floor to plan (default: 1)
  --floors <n>                Plan floors 1..n
  --anchors <list>            Comma separated anchor room tags,
                              "corridor" marks a corridor anchor
  --area <factor>             Floor area factor, 0.75-1.8 (default: 1.0)
  --room <tag>                Room tag for candidate weights (stats)
  --archetype <id>            Show one archetype scaled to --floor (stats)
  --pack <id>                 Show one pack scaled to --floor (stats)

  --party <type>              Party type id (default: bandit)
  --party-name <name>         Party display name
  --companions <n>            Player companions (default: 1)
  --level <n>                 Player level (default: 1)
  --relation <value>          Faction relation with the party

  --verbose, -v               Debug logging
  --help, -h                  Show this help

Examples:
  bestiary_sim floor --floors 6 --seed 42
  bestiary_sim party --party goblin --companions 3 --level 4
  bestiary_sim stats --floor 3 --room lair
  bestiary_sim stats --archetype orc_raider --floor 5
)";
}

std::vector<AnchorTag> ParseAnchors(const std::string& str) {
    std::vector<AnchorTag> anchors;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        if (item == "corridor") {
            anchors.emplace_back(std::nullopt);
        } else {
            anchors.emplace_back(item);
        }
    }
    return anchors;
}

bool ParseCommand(const std::string& name, Command& command) {
    if (name == "floor") command = Command::Floor;
    else if (name == "party") command = Command::Party;
    else if (name == "validate") command = Command::Validate;
    else if (name == "stats") command = Command::Stats;
    else return false;
    return true;
}

bool ParseArguments(int argc, char* argv[], ToolConfig& config) {
    if (argc < 2) {
        return false;
    }

    if (!ParseCommand(argv[1], config.command)) {
        std::cerr << "Unknown command: " << argv[1] << "\n";
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configFile = argv[++i];
        }
        else if (arg == "--content" && i + 1 < argc) {
            config.contentDir = argv[++i];
        }
        else if (arg == "--seed" && i + 1 < argc) {
            config.seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if (arg == "--floor" && i + 1 < argc) {
            config.floor = std::atoi(argv[++i]);
        }
        else if (arg == "--floors" && i + 1 < argc) {
            config.floors = std::atoi(argv[++i]);
        }
        else if (arg == "--anchors" && i + 1 < argc) {
            config.anchors = ParseAnchors(argv[++i]);
        }
        else if (arg == "--area" && i + 1 < argc) {
            config.areaFactor = std::atof(argv[++i]);
        }
        else if (arg == "--room" && i + 1 < argc) {
            config.room = std::string(argv[++i]);
        }
        else if (arg == "--archetype" && i + 1 < argc) {
            config.archetypeId = argv[++i];
        }
        else if (arg == "--pack" && i + 1 < argc) {
            config.packId = argv[++i];
        }
        else if (arg == "--party" && i + 1 < argc) {
            config.partyType = argv[++i];
        }
        else if (arg == "--party-name" && i + 1 < argc) {
            config.partyName = argv[++i];
        }
        else if (arg == "--companions" && i + 1 < argc) {
            config.companions = std::atoi(argv[++i]);
        }
        else if (arg == "--level" && i + 1 < argc) {
            config.level = std::atoi(argv[++i]);
        }
        else if (arg == "--relation" && i + 1 < argc) {
            config.relation = std::atoi(argv[++i]);
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
        }
    }

    return true;
}

// ============================================================================
// Output
// ============================================================================

void PrintUnit(const SpawnedUnit& unit) {
    std::cout << "    " << std::left << std::setw(28) << unit.name
              << " hp " << std::setw(4) << unit.maxHp
              << " atk " << std::setw(3) << unit.attack
              << " def " << std::setw(3) << unit.defense
              << " xp " << std::setw(4) << unit.xp
              << " init " << std::setw(3) << unit.initiative
              << " sp " << std::fixed << std::setprecision(2) << unit.skillPower;
    if (!unit.battleLabel.empty()) std::cout << "  [" << unit.battleLabel << "]";
    if (unit.isUnique) std::cout << "  (unique)";
    if (unit.isAlly) std::cout << "  (ally)";
    std::cout << "\n";
}

void PrintFloorPlan(const FloorPlan& plan) {
    std::cout << "Floor " << plan.floor << ": " << plan.GetUnitCount() << " enemies, "
              << plan.GetEliteCount() << " elite (target " << plan.targetEnemies
              << ", cap " << plan.maxEnemies << ")\n";

    for (const auto& group : plan.groups) {
        std::cout << "  @" << group.roomTag.value_or("corridor") << "  "
                  << (group.isUnique ? std::string("room unique") : group.packId) << "\n";
        for (const auto& unit : group.units) {
            PrintUnit(unit);
        }
        if (!group.synergies.IsNeutral()) {
            std::cout << "    synergy: atk x" << group.synergies.attackMult
                      << " hp x" << group.synergies.hpMult
                      << " def x" << group.synergies.defenseMult
                      << " sp x" << group.synergies.skillPowerMult << "\n";
        }
    }
    std::cout << "\n";
}

void PrintReport(const ValidationReport& report) {
    std::cout << "Archetypes: " << report.archetypeCount << " (" << report.invalidArchetypes << " invalid)\n";
    std::cout << "Packs:      " << report.packCount << " (" << report.invalidPacks << " invalid)\n";
    for (const auto& error : report.result.errors) {
        std::cout << "  ERROR   " << error << "\n";
    }
    for (const auto& warning : report.result.warnings) {
        std::cout << "  WARNING " << warning << "\n";
    }
    if (!report.orphanedArchetypes.empty()) {
        std::cout << "Not used by any pack:";
        for (const auto& id : report.orphanedArchetypes) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    std::cout << (report.result.valid ? "Content is valid\n" : "Content has errors\n");
}

void PrintScaledStats(const std::string& label, const ScaledStats& stats) {
    std::cout << "  " << std::left << std::setw(10) << label
              << " hp " << std::setw(4) << stats.maxHp
              << " atk " << std::setw(3) << stats.attack
              << " def " << std::setw(3) << stats.defense
              << " xp " << std::setw(4) << stats.xp
              << " init " << stats.initiative << "\n";
}

void PrintArchetypeSummary(const ArchetypeSummary& summary) {
    const auto& a = *summary.archetype;
    std::cout << a.name << " (" << a.id << ")\n";
    std::cout << "  role " << CombatRoleToString(a.role) << ", tier " << a.tier
              << ", difficulty " << a.difficultyLevel << ", ai " << a.aiProfile << "\n";
    std::cout << "  floors " << a.spawnMinFloor << "-"
              << (a.spawnMaxFloor ? std::to_string(*a.spawnMaxFloor) : std::string("any"))
              << ", weight " << a.spawnWeight << ", skills " << a.skillIds.size() << "\n";
    std::cout << "  tags";
    for (const auto& tag : summary.tags) {
        std::cout << " " << tag;
    }
    std::cout << "\n";
    std::cout << "  growth hp +" << a.hpPerFloor << " atk +" << a.atkPerFloor
              << " def +" << a.defPerFloor << " per floor\n";
    PrintScaledStats("floor 1", summary.baseStats);
    PrintScaledStats("floor " + std::to_string(summary.floor), summary.floorStats);
}

void PrintPackSummary(const PackSummary& summary) {
    const auto& pack = *summary.pack;
    std::cout << pack.name << " (" << pack.id << ") tier " << pack.tier
              << ", room '" << pack.preferredRoomTag.value_or("any") << "', weight " << pack.weight << "\n";
    for (const auto& member : summary.members) {
        if (!member.stats) {
            std::cout << "  " << std::left << std::setw(10) << member.archetypeId << " (not registered)\n";
            continue;
        }
        PrintScaledStats(member.archetypeId, *member.stats);
    }
    std::cout << "  floor " << summary.floor << " totals: hp " << summary.totalHp
              << " atk " << summary.totalAttack << " xp " << summary.totalXp << "\n";
}

void PrintStats(const EnemyRegistry& registry, const EnemySelector& selector, const ToolConfig& config) {
    std::cout << "Difficulty distribution:\n";
    for (const auto& [bucket, count] : GetDifficultyDistribution(registry)) {
        std::cout << "  " << std::left << std::setw(20) << bucket << count << "\n";
    }

    std::cout << "\nRole distribution:\n";
    for (const auto& [role, count] : GetRoleDistribution(registry)) {
        std::cout << "  " << std::left << std::setw(20) << role << count << "\n";
    }

    const auto [minDifficulty, maxDifficulty] = FloorToDifficultyRange(config.floor);
    std::cout << "\nFloor " << config.floor << " (tier band " << EnemySelector::TierForFloor(config.floor)
              << ", difficulty " << minDifficulty << "-" << maxDifficulty << ")"
              << " room '" << config.room.value_or("none") << "':\n";
    for (const auto& candidate : selector.GetFloorCandidates(config.floor, config.room)) {
        std::cout << "  " << std::left << std::setw(24) << candidate.archetype->id
                  << std::fixed << std::setprecision(2) << candidate.weight << "\n";
    }

    std::cout << "\nPacks:\n";
    const auto packs = selector.GetPackCandidates(config.floor, config.room);
    if (packs.empty()) {
        std::cout << "  (none eligible, single archetype fallback)\n";
    }
    for (const auto& candidate : packs) {
        std::cout << "  " << std::left << std::setw(24) << candidate.pack->id
                  << std::fixed << std::setprecision(2) << candidate.weight << "\n";
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::cout << "bestiary_sim v1.0\n";
    std::cout << "=================\n\n";

    ToolConfig config;
    if (!ParseArguments(argc, argv, config)) {
        PrintUsage();
        return 1;
    }

    Config settings;
    if (auto loaded = settings.Load(config.configFile); !loaded) {
        std::cerr << "Warning: " << ConfigErrorToString(loaded.error())
                  << " for " << config.configFile << ", using defaults\n";
        settings.LoadFromJson(Config::DefaultDocument());
    }

    const auto app = AppConfig::FromConfig(settings);
    const auto tuning = EncounterTuning::FromConfig(settings);

    Logger::Initialize(app.logFile);
    Logger::SetLevel(config.verbose ? std::string("debug") : app.logLevel);

    const std::string contentDir = config.contentDir.empty() ? app.contentDirectory : config.contentDir;
    const fs::path enemiesDir = fs::path(contentDir) / "enemies";
    const fs::path partyTypesFile = fs::path(contentDir) / "overworld" / "party_types.json";

    EnemyRegistry registry;
    PartyTypeCatalog partyTypes;
    try {
        registry.LoadDirectory(enemiesDir);
        if (fs::exists(partyTypesFile)) {
            partyTypes.LoadFile(partyTypesFile);
        }
        registry.Seal();
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::Shutdown();
        return 1;
    }

    Random random;
    if (config.seed) {
        random.Seed(*config.seed);
    } else if (app.seed >= 0) {
        random.Seed(static_cast<std::uint32_t>(app.seed));
    }
    std::cout << "Seed: " << random.GetSeed() << "\n\n";

    EnemySelector selector(registry, random);

    int exitCode = 0;
    try {
        switch (config.command) {
            case Command::Floor: {
                FloorEncounterPlanner planner(registry, selector, random, tuning);
                const int first = config.floors > 0 ? 1 : config.floor;
                const int last = config.floors > 0 ? config.floors : config.floor;
                for (int floor = first; floor <= last; ++floor) {
                    PrintFloorPlan(planner.PlanFloor(floor, config.anchors, config.areaFactor));
                }
                break;
            }
            case Command::Party: {
                const auto& type = partyTypes.Get(config.partyType);

                RoamingParty party;
                party.partyId = config.partyType + "_1";
                party.partyTypeId = type.id;
                party.partyName = config.partyName.empty() ? type.name : config.partyName;
                party.factionId = type.factionId;

                PlayerPartySnapshot snapshot;
                snapshot.companionCount = config.companions;
                snapshot.playerLevel = config.level;

                BattleConverter converter(registry, selector, random, tuning);
                const auto alignment = GetEffectiveAlignment(type, party, config.relation);
                std::cout << party.partyName << " (" << type.id << ", "
                          << PartyAlignmentToString(alignment) << ") vs party of "
                          << snapshot.GetPartySize() << " at level " << snapshot.playerLevel << "\n";
                for (const auto& unit : converter.ConvertPartyToBattleUnits(party, type, snapshot, config.relation)) {
                    PrintUnit(unit);
                }
                break;
            }
            case Command::Validate: {
                const auto report = ValidateRegistry(registry);
                PrintReport(report);
                exitCode = report.result.valid ? 0 : 2;
                break;
            }
            case Command::Stats:
                if (!config.archetypeId.empty()) {
                    PrintArchetypeSummary(SummarizeArchetype(registry, config.archetypeId, config.floor));
                } else if (!config.packId.empty()) {
                    PrintPackSummary(SummarizePack(registry, config.packId, config.floor));
                } else {
                    PrintStats(registry, selector, config);
                }
                break;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exitCode = 1;
    }

    Logger::Shutdown();
    return exitCode;
}
