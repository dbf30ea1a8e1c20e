#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Bestiary {
namespace Enemies {

// ============================================================================
// Combat Role
// ============================================================================

/**
 * @brief Tactical role of an archetype, used for room weighting and AI hints
 */
enum class CombatRole {
    Skirmisher,
    Brute,
    EliteBrute,
    Invoker,
    EliteInvoker,
    Support,
    EliteSupport
};

inline const char* CombatRoleToString(CombatRole role) {
    switch (role) {
        case CombatRole::Skirmisher:   return "Skirmisher";
        case CombatRole::Brute:        return "Brute";
        case CombatRole::EliteBrute:   return "Elite Brute";
        case CombatRole::Invoker:      return "Invoker";
        case CombatRole::EliteInvoker: return "Elite Invoker";
        case CombatRole::Support:      return "Support";
        case CombatRole::EliteSupport: return "Elite Support";
    }
    return "Skirmisher";
}

/**
 * @brief Parse a role name as written in content files
 * @return nullopt for unknown names
 */
std::optional<CombatRole> StringToCombatRole(const std::string& name);

/**
 * @brief Role as a tag: lowercased, spaces replaced by underscores ("elite_brute")
 */
std::string CombatRoleToTag(CombatRole role);

// ============================================================================
// Enemy Archetype
// ============================================================================

/**
 * @brief Static definition of an enemy kind
 *
 * Difficulty and the spawn floor interval are authoritative for selection.
 * The legacy tier is kept for pack matching and the last-resort tier band.
 */
struct EnemyArchetype {
    std::string id;
    std::string name;
    CombatRole role = CombatRole::Skirmisher;
    int tier = 1;                            // Deprecated: 1 = early, 2 = mid, 3 = late
    std::string aiProfile = "basic";

    // Base stats at floor 1
    int baseHp = 10;
    int baseAttack = 3;
    int baseDefense = 0;
    int baseXp = 5;
    int baseInitiative = 10;

    // Linear growth per floor beyond the first
    double hpPerFloor = 0.0;
    double atkPerFloor = 0.0;
    double defPerFloor = 0.0;
    double xpPerFloor = 0.0;
    double initPerFloor = 0.0;

    std::vector<std::string> skillIds;

    int difficultyLevel = 50;                // 1-100
    int spawnMinFloor = 1;
    std::optional<int> spawnMaxFloor;        // nullopt = no upper bound
    double spawnWeight = 1.0;

    std::unordered_set<std::string> tags;
    std::unordered_map<std::string, double> resistances;  // damage type -> multiplier
    std::vector<std::string> uniqueMechanics;

    [[nodiscard]] bool HasTag(const std::string& tag) const {
        return tags.count(tag) > 0;
    }

    /**
     * @brief Whether the archetype may spawn on the given floor
     */
    [[nodiscard]] bool IsEligibleForFloor(int floor) const {
        return spawnMinFloor <= floor && (!spawnMaxFloor || *spawnMaxFloor >= floor);
    }
};

// ============================================================================
// Enemy Pack Template
// ============================================================================

/**
 * @brief Predefined group of archetypes that spawn together
 */
struct EnemyPackTemplate {
    std::string id;
    std::string name;
    int tier = 1;
    std::vector<std::string> memberArchIds;  // Duplicates allowed
    std::optional<std::string> preferredRoomTag;
    double weight = 1.0;
};

// ============================================================================
// Legacy tier defaults
// ============================================================================

/**
 * @brief Difficulty implied by a legacy tier (1: 20, 2: 50, 3: 80, otherwise 50)
 */
int DifficultyForTier(int tier);

/**
 * @brief Spawn floor interval implied by a legacy tier
 */
int SpawnMinFloorForTier(int tier);
std::optional<int> SpawnMaxFloorForTier(int tier);

/**
 * @brief "early_game", "mid_game" or "late_game"
 */
std::string TierTag(int tier);

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Parse an archetype, deriving missing fields from its legacy tier
 * @throws nlohmann::json::exception on malformed values
 * @throws std::invalid_argument on a missing id or unknown role
 */
EnemyArchetype ArchetypeFromJson(const nlohmann::json& j);
nlohmann::json ArchetypeToJson(const EnemyArchetype& archetype);

EnemyPackTemplate PackFromJson(const nlohmann::json& j);
nlohmann::json PackToJson(const EnemyPackTemplate& pack);

} // namespace Enemies
} // namespace Bestiary
