#include "PartyTypes.hpp"
#include "enemies/EnemyErrors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace Bestiary {
namespace Overworld {

using json = nlohmann::json;

std::optional<PartyAlignment> StringToPartyAlignment(const std::string& name) {
    if (name == "friendly") return PartyAlignment::Friendly;
    if (name == "neutral") return PartyAlignment::Neutral;
    if (name == "hostile") return PartyAlignment::Hostile;
    return std::nullopt;
}

namespace {

glm::ivec3 ParseColor(const json& j) {
    if (j.is_array() && j.size() >= 3) {
        return glm::ivec3(j[0].get<int>(), j[1].get<int>(), j[2].get<int>());
    }
    return glm::ivec3(128, 128, 128);
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

PartyType PartyTypeFromJson(const json& j) {
    PartyType type;

    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw std::invalid_argument("party type definition is missing an id");
    }
    type.id = j["id"].get<std::string>();
    type.name = j.value("name", type.id);
    if (j.contains("description")) type.description = j["description"].get<std::string>();

    if (j.contains("alignment")) {
        const auto name = j["alignment"].get<std::string>();
        auto alignment = StringToPartyAlignment(name);
        if (!alignment) {
            throw std::invalid_argument("party type '" + type.id + "' has unknown alignment '" + name + "'");
        }
        type.alignment = *alignment;
    }

    if (j.contains("combat_strength")) type.combatStrength = j["combat_strength"].get<int>();
    type.battleUnitTemplate = OptionalString(j, "battle_unit_template");
    type.factionId = OptionalString(j, "faction_id");
    if (j.contains("color")) type.color = ParseColor(j["color"]);
    if (j.contains("spawn_weight")) type.spawnWeight = j["spawn_weight"].get<double>();
    if (j.contains("min_level")) type.minLevel = j["min_level"].get<int>();
    if (j.contains("max_level")) type.maxLevel = j["max_level"].get<int>();

    return type;
}

json PartyTypeToJson(const PartyType& type) {
    json j;
    j["id"] = type.id;
    j["name"] = type.name;
    j["description"] = type.description;
    j["alignment"] = PartyAlignmentToString(type.alignment);
    j["combat_strength"] = type.combatStrength;
    j["battle_unit_template"] = type.battleUnitTemplate ? json(*type.battleUnitTemplate) : json(nullptr);
    j["faction_id"] = type.factionId ? json(*type.factionId) : json(nullptr);
    j["color"] = {type.color.r, type.color.g, type.color.b};
    j["spawn_weight"] = type.spawnWeight;
    j["min_level"] = type.minLevel;
    j["max_level"] = type.maxLevel;
    return j;
}

RoamingParty RoamingPartyFromJson(const json& j) {
    RoamingParty party;
    if (j.contains("party_id")) party.partyId = j["party_id"].get<std::string>();
    if (j.contains("party_type_id")) party.partyTypeId = j["party_type_id"].get<std::string>();
    if (j.contains("party_name")) party.partyName = j["party_name"].get<std::string>();
    party.factionId = OptionalString(j, "faction_id");
    return party;
}

// ============================================================================
// PartyTypeCatalog
// ============================================================================

const PartyType& PartyTypeCatalog::Add(PartyType type) {
    if (m_types.count(type.id)) {
        throw Enemies::DuplicateRegistrationError("party type", type.id);
    }
    std::string id = type.id;
    return m_types.emplace(id, std::move(type)).first->second;
}

size_t PartyTypeCatalog::LoadFile(const std::filesystem::path& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw Enemies::ContentParseError(filePath.string(), "cannot open file");
    }

    std::vector<PartyType> parsed;
    try {
        const json root = json::parse(file);
        if (root.contains("party_types")) {
            for (const auto& entry : root["party_types"]) {
                parsed.push_back(PartyTypeFromJson(entry));
            }
        }
    } catch (const json::exception& e) {
        throw Enemies::ContentParseError(filePath.string(), e.what());
    } catch (const std::invalid_argument& e) {
        throw Enemies::ContentParseError(filePath.string(), e.what());
    }

    for (auto& type : parsed) {
        Add(std::move(type));
    }

    BESTIARY_LOG_INFO("Loaded {} party types from {}", parsed.size(), filePath.string());
    return parsed.size();
}

const PartyType& PartyTypeCatalog::Get(const std::string& id) const {
    if (const auto* type = Find(id)) {
        return *type;
    }
    throw Enemies::NotFoundError("party type", id);
}

const PartyType* PartyTypeCatalog::Find(const std::string& id) const {
    auto it = m_types.find(id);
    return it != m_types.end() ? &it->second : nullptr;
}

std::vector<std::string> PartyTypeCatalog::GetIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_types.size());
    for (const auto& [id, type] : m_types) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace Overworld
} // namespace Bestiary
