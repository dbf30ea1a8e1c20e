#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace Bestiary {
namespace Enemies {

/**
 * @brief Default display tint for enemy units
 */
inline constexpr glm::ivec3 kDefaultEnemyColor{200, 80, 80};

/**
 * @brief Battle-ready unit record handed to the battle resolver
 *
 * Plain value type, created per encounter and owned by the caller.
 */
struct SpawnedUnit {
    // Identity
    std::string archetypeId;
    std::string name;                  // Display name, "Elite " prefixed for elites
    std::string originalName;          // Name before the elite prefix
    std::string battleLabel;           // Per-battle label, e.g. "Gorak 2"
    std::string aiProfile = "basic";

    // Combat stats
    int maxHp = 1;
    int hp = 1;
    int attack = 0;
    int defense = 0;
    int xp = 0;
    int initiative = 10;
    double skillPower = 1.0;

    std::vector<std::string> skillIds;
    std::vector<std::string> tags;     // Copied from the archetype, sorted

    bool isElite = false;
    bool isUnique = false;
    bool isAlly = false;

    glm::ivec3 color = kDefaultEnemyColor;

    // Overworld origin, empty for dungeon spawns
    std::string partyId;
    std::string partyName;
    std::string partyTypeId;

    [[nodiscard]] bool HasTag(const std::string& tag) const {
        for (const auto& t : tags) {
            if (t == tag) return true;
        }
        return false;
    }
};

} // namespace Enemies
} // namespace Bestiary
