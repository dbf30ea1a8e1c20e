#pragma once

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bestiary {
namespace Overworld {

// ============================================================================
// Party Alignment
// ============================================================================

enum class PartyAlignment {
    Friendly,
    Neutral,
    Hostile
};

inline const char* PartyAlignmentToString(PartyAlignment alignment) {
    switch (alignment) {
        case PartyAlignment::Friendly: return "friendly";
        case PartyAlignment::Neutral:  return "neutral";
        case PartyAlignment::Hostile:  return "hostile";
    }
    return "neutral";
}

/**
 * @return nullopt for unknown names
 */
std::optional<PartyAlignment> StringToPartyAlignment(const std::string& name);

// ============================================================================
// Party Type
// ============================================================================

/**
 * @brief Static definition of a kind of roaming party
 */
struct PartyType {
    std::string id;
    std::string name;
    std::string description;
    PartyAlignment alignment = PartyAlignment::Neutral;
    int combatStrength = 1;                         // 1 = weak, 5 = very strong
    std::optional<std::string> battleUnitTemplate;  // Enemy archetype used for every unit
    std::optional<std::string> factionId;
    glm::ivec3 color{128, 128, 128};
    double spawnWeight = 1.0;
    int minLevel = 1;
    int maxLevel = 100;
};

/**
 * @brief A party met on the overworld map
 */
struct RoamingParty {
    std::string partyId;
    std::string partyTypeId;
    std::string partyName;
    std::optional<std::string> factionId;
};

/**
 * @brief What the converter needs to know about the player's side
 */
struct PlayerPartySnapshot {
    int companionCount = 1;
    int playerLevel = 1;

    // Hero reference stats, used to size allied units
    int heroMaxHp = 30;
    int heroAttack = 5;
    int heroDefense = 0;
    double heroSkillPower = 1.0;
    int heroInitiative = 10;

    /**
     * @brief Hero plus companions, never below two
     */
    [[nodiscard]] int GetPartySize() const {
        return std::max(2, 1 + companionCount);
    }
};

// ============================================================================
// JSON
// ============================================================================

/**
 * @throws nlohmann::json::exception on malformed values
 * @throws std::invalid_argument on a missing id or unknown alignment
 */
PartyType PartyTypeFromJson(const nlohmann::json& j);
nlohmann::json PartyTypeToJson(const PartyType& type);

RoamingParty RoamingPartyFromJson(const nlohmann::json& j);

// ============================================================================
// Party Type Catalog
// ============================================================================

/**
 * @brief Party type definitions keyed by id
 */
class PartyTypeCatalog {
public:
    /**
     * @throws Enemies::DuplicateRegistrationError if the id is already present
     */
    const PartyType& Add(PartyType type);

    /**
     * @brief Load a file with a "party_types" array
     * @return Number of types added
     * @throws Enemies::ContentParseError if the file cannot be read or parsed
     */
    size_t LoadFile(const std::filesystem::path& filePath);

    /**
     * @throws Enemies::NotFoundError if the id is unknown
     */
    [[nodiscard]] const PartyType& Get(const std::string& id) const;
    [[nodiscard]] const PartyType* Find(const std::string& id) const;

    [[nodiscard]] std::vector<std::string> GetIds() const;  // Sorted
    [[nodiscard]] size_t GetCount() const { return m_types.size(); }

private:
    std::unordered_map<std::string, PartyType> m_types;
};

} // namespace Overworld
} // namespace Bestiary
