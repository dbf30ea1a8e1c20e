#pragma once

#include "EnemyRegistry.hpp"
#include "StatScaling.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Bestiary {
namespace Enemies {

// ============================================================================
// Validation Result
// ============================================================================

/**
 * @brief Errors and warnings collected while checking content
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void AddError(const std::string& path, const std::string& message) {
        valid = false;
        errors.push_back("[" + path + "] " + message);
    }

    void AddWarning(const std::string& path, const std::string& message) {
        warnings.push_back("[" + path + "] " + message);
    }

    void Merge(const ValidationResult& other) {
        if (!other.valid) valid = false;
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }
};

/**
 * @brief Summary of a full registry check
 */
struct ValidationReport {
    ValidationResult result;
    size_t archetypeCount = 0;
    size_t invalidArchetypes = 0;
    size_t packCount = 0;
    size_t invalidPacks = 0;
    std::vector<std::string> orphanedArchetypes;  // Not referenced by any pack, sorted
};

// ============================================================================
// Checks
// ============================================================================

/**
 * @brief Check field ranges of a single archetype
 *
 * Errors: empty name, non-positive base hp/attack/difficulty, spawn range
 * below floor 1 or inverted, negative per-floor growth.
 * Warnings: no tags.
 */
ValidationResult ValidateArchetype(const EnemyArchetype& archetype);

/**
 * @brief Check a pack against the registry it will be used with
 *
 * Errors: no members, unresolved members, non-positive weight.
 * Warnings: members spanning more than one adjacent tier.
 */
ValidationResult ValidatePack(const EnemyPackTemplate& pack, const EnemyRegistry& registry);

/**
 * @brief Check everything in a registry and log the findings
 */
ValidationReport ValidateRegistry(const EnemyRegistry& registry);

/**
 * @brief Archetype ids never referenced by a pack, sorted
 */
std::vector<std::string> FindOrphanedArchetypes(const EnemyRegistry& registry);

// ============================================================================
// Content statistics
// ============================================================================

/**
 * @brief Archetype counts per difficulty bucket
 *
 * Buckets: "very_easy (1-20)", "easy (21-40)", "medium (41-60)",
 * "hard (61-80)", "very_hard (81-100)", "extreme (100+)".
 */
std::map<std::string, int> GetDifficultyDistribution(const EnemyRegistry& registry);

/**
 * @brief Archetype counts per role name
 */
std::map<std::string, int> GetRoleDistribution(const EnemyRegistry& registry);

// ============================================================================
// Content summaries
// ============================================================================

/**
 * @brief One archetype at floor 1 and at a chosen depth
 */
struct ArchetypeSummary {
    const EnemyArchetype* archetype = nullptr;
    int floor = 1;
    ScaledStats baseStats;
    ScaledStats floorStats;
    std::vector<std::string> tags;  // Sorted
};

struct PackMemberSummary {
    std::string archetypeId;
    const EnemyArchetype* archetype = nullptr;  // nullptr if unregistered
    std::optional<ScaledStats> stats;
};

/**
 * @brief A pack's members and their combined stats at a chosen depth
 *
 * Unregistered members are listed but add nothing to the totals.
 */
struct PackSummary {
    const EnemyPackTemplate* pack = nullptr;
    int floor = 1;
    std::vector<PackMemberSummary> members;
    int totalHp = 0;
    int totalAttack = 0;
    int totalXp = 0;
    size_t unresolvedCount = 0;
};

/**
 * @throws NotFoundError if archetypeId is not registered
 */
[[nodiscard]] ArchetypeSummary SummarizeArchetype(const EnemyRegistry& registry,
                                                  const std::string& archetypeId, int floor = 1);

/**
 * @throws NotFoundError if packId is not registered
 */
[[nodiscard]] PackSummary SummarizePack(const EnemyRegistry& registry, const std::string& packId, int floor = 1);

} // namespace Enemies
} // namespace Bestiary
