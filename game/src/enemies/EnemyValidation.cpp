#include "EnemyValidation.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <spdlog/fmt/fmt.h>

namespace Bestiary {
namespace Enemies {

ValidationResult ValidateArchetype(const EnemyArchetype& a) {
    ValidationResult result;
    const std::string path = "archetype:" + a.id;

    const bool blankName = std::all_of(a.name.begin(), a.name.end(),
                                       [](unsigned char c) { return std::isspace(c); });
    if (blankName) {
        result.AddError(path, "Missing or empty name");
    }
    if (a.baseHp <= 0) {
        result.AddError(path, fmt::format("Invalid base_hp: {} (must be > 0)", a.baseHp));
    }
    if (a.baseAttack <= 0) {
        result.AddError(path, fmt::format("Invalid base_attack: {} (must be > 0)", a.baseAttack));
    }
    if (a.difficultyLevel <= 0) {
        result.AddError(path, fmt::format("Invalid difficulty_level: {} (must be > 0)", a.difficultyLevel));
    }

    if (a.spawnMinFloor < 1) {
        result.AddError(path, fmt::format("spawn_min_floor must be >= 1, got {}", a.spawnMinFloor));
    }
    if (a.spawnMaxFloor && *a.spawnMaxFloor < a.spawnMinFloor) {
        result.AddError(path, fmt::format("spawn_max_floor ({}) < spawn_min_floor ({})",
                                          *a.spawnMaxFloor, a.spawnMinFloor));
    }

    if (a.hpPerFloor < 0.0) {
        result.AddError(path, fmt::format("hp_per_floor cannot be negative: {}", a.hpPerFloor));
    }
    if (a.atkPerFloor < 0.0) {
        result.AddError(path, fmt::format("atk_per_floor cannot be negative: {}", a.atkPerFloor));
    }
    if (a.defPerFloor < 0.0) {
        result.AddError(path, fmt::format("def_per_floor cannot be negative: {}", a.defPerFloor));
    }
    if (a.xpPerFloor < 0.0) {
        result.AddError(path, fmt::format("xp_per_floor cannot be negative: {}", a.xpPerFloor));
    }

    if (a.spawnWeight <= 0.0) {
        result.AddWarning(path, fmt::format("spawn_weight {} means it is never picked by weight", a.spawnWeight));
    }
    if (a.tags.empty()) {
        result.AddWarning(path, "No tags defined (recommended for filtering)");
    }

    return result;
}

ValidationResult ValidatePack(const EnemyPackTemplate& pack, const EnemyRegistry& registry) {
    ValidationResult result;
    const std::string path = "pack:" + pack.id;

    if (pack.memberArchIds.empty()) {
        result.AddError(path, "Pack has no members");
    }

    int minTier = 0;
    int maxTier = 0;
    bool anyResolved = false;
    for (const auto& memberId : pack.memberArchIds) {
        const auto* member = registry.Find(memberId);
        if (!member) {
            result.AddError(path, "Member archetype '" + memberId + "' not found in registry");
            continue;
        }
        if (!anyResolved) {
            minTier = maxTier = member->tier;
            anyResolved = true;
        } else {
            minTier = std::min(minTier, member->tier);
            maxTier = std::max(maxTier, member->tier);
        }
    }

    if (pack.weight <= 0.0) {
        result.AddError(path, fmt::format("Pack weight must be > 0, got {}", pack.weight));
    }

    if (anyResolved && maxTier - minTier > 1) {
        result.AddWarning(path, fmt::format("Pack has members from tiers {} to {}", minTier, maxTier));
    }

    return result;
}

std::vector<std::string> FindOrphanedArchetypes(const EnemyRegistry& registry) {
    std::set<std::string> used;
    for (const auto* pack : registry.GetAllPacks()) {
        used.insert(pack->memberArchIds.begin(), pack->memberArchIds.end());
    }

    std::vector<std::string> orphaned;
    for (const auto& id : registry.GetArchetypeIds()) {
        if (!used.count(id)) {
            orphaned.push_back(id);
        }
    }
    return orphaned;
}

ValidationReport ValidateRegistry(const EnemyRegistry& registry) {
    ValidationReport report;

    for (const auto* archetype : registry.GetAll()) {
        auto result = ValidateArchetype(*archetype);
        ++report.archetypeCount;
        if (!result.valid) {
            ++report.invalidArchetypes;
        }
        report.result.Merge(result);
    }

    for (const auto* pack : registry.GetAllPacks()) {
        auto result = ValidatePack(*pack, registry);
        ++report.packCount;
        if (!result.valid) {
            ++report.invalidPacks;
        }
        report.result.Merge(result);
    }

    // Room uniques that do not resolve are skipped at spawn time; surface them here
    for (const auto& [roomTag, ids] : registry.GetUniqueRoomTable()) {
        for (const auto& id : ids) {
            if (!registry.Has(id)) {
                report.result.AddWarning("unique_room_enemies:" + roomTag,
                                         "Unique archetype '" + id + "' is not registered");
            }
        }
    }

    report.orphanedArchetypes = FindOrphanedArchetypes(registry);

    for (const auto& error : report.result.errors) {
        BESTIARY_LOG_ERROR("Content error: {}", error);
    }
    for (const auto& warning : report.result.warnings) {
        BESTIARY_LOG_WARN("Content warning: {}", warning);
    }
    BESTIARY_LOG_INFO("Validated {} archetypes ({} invalid) and {} packs ({} invalid)",
                      report.archetypeCount, report.invalidArchetypes,
                      report.packCount, report.invalidPacks);

    return report;
}

std::map<std::string, int> GetDifficultyDistribution(const EnemyRegistry& registry) {
    std::map<std::string, int> distribution = {
        {"very_easy (1-20)", 0},
        {"easy (21-40)", 0},
        {"medium (41-60)", 0},
        {"hard (61-80)", 0},
        {"very_hard (81-100)", 0},
        {"extreme (100+)", 0},
    };

    for (const auto* archetype : registry.GetAll()) {
        const int d = archetype->difficultyLevel;
        if (d <= 20) {
            ++distribution["very_easy (1-20)"];
        } else if (d <= 40) {
            ++distribution["easy (21-40)"];
        } else if (d <= 60) {
            ++distribution["medium (41-60)"];
        } else if (d <= 80) {
            ++distribution["hard (61-80)"];
        } else if (d <= 100) {
            ++distribution["very_hard (81-100)"];
        } else {
            ++distribution["extreme (100+)"];
        }
    }
    return distribution;
}

std::map<std::string, int> GetRoleDistribution(const EnemyRegistry& registry) {
    std::map<std::string, int> distribution;
    for (const auto* archetype : registry.GetAll()) {
        ++distribution[CombatRoleToString(archetype->role)];
    }
    return distribution;
}

// ============================================================================
// Content summaries
// ============================================================================

ArchetypeSummary SummarizeArchetype(const EnemyRegistry& registry, const std::string& archetypeId, int floor) {
    const auto& archetype = registry.Get(archetypeId);

    ArchetypeSummary summary;
    summary.archetype = &archetype;
    summary.floor = std::max(1, floor);
    summary.baseStats = ComputeScaledStats(archetype, 1);
    summary.floorStats = ComputeScaledStats(archetype, summary.floor);
    summary.tags.assign(archetype.tags.begin(), archetype.tags.end());
    std::sort(summary.tags.begin(), summary.tags.end());
    return summary;
}

PackSummary SummarizePack(const EnemyRegistry& registry, const std::string& packId, int floor) {
    const auto& pack = registry.GetPack(packId);

    PackSummary summary;
    summary.pack = &pack;
    summary.floor = std::max(1, floor);

    for (const auto& memberId : pack.memberArchIds) {
        PackMemberSummary member;
        member.archetypeId = memberId;
        member.archetype = registry.Find(memberId);
        if (member.archetype) {
            member.stats = ComputeScaledStats(*member.archetype, summary.floor);
            summary.totalHp += member.stats->maxHp;
            summary.totalAttack += member.stats->attack;
            summary.totalXp += member.stats->xp;
        } else {
            ++summary.unresolvedCount;
        }
        summary.members.push_back(std::move(member));
    }
    return summary;
}

} // namespace Enemies
} // namespace Bestiary
