#include "EnemyTypes.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Bestiary {
namespace Enemies {

using json = nlohmann::json;

std::optional<CombatRole> StringToCombatRole(const std::string& name) {
    static const std::unordered_map<std::string, CombatRole> s_roles = {
        {"Skirmisher", CombatRole::Skirmisher},
        {"Brute", CombatRole::Brute},
        {"Elite Brute", CombatRole::EliteBrute},
        {"Invoker", CombatRole::Invoker},
        {"Elite Invoker", CombatRole::EliteInvoker},
        {"Support", CombatRole::Support},
        {"Elite Support", CombatRole::EliteSupport},
    };
    auto it = s_roles.find(name);
    if (it == s_roles.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CombatRoleToTag(CombatRole role) {
    std::string tag = CombatRoleToString(role);
    std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) {
        return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
    });
    return tag;
}

// ============================================================================
// Legacy tier defaults
// ============================================================================

int DifficultyForTier(int tier) {
    switch (tier) {
        case 1: return 20;
        case 2: return 50;
        case 3: return 80;
        default: return 50;
    }
}

int SpawnMinFloorForTier(int tier) {
    switch (tier) {
        case 2: return 3;
        case 3: return 5;
        default: return 1;
    }
}

std::optional<int> SpawnMaxFloorForTier(int tier) {
    switch (tier) {
        case 1: return 3;
        case 2: return 6;
        default: return std::nullopt;
    }
}

std::string TierTag(int tier) {
    switch (tier) {
        case 1: return "early_game";
        case 2: return "mid_game";
        default: return "late_game";
    }
}

// ============================================================================
// Archetype JSON
// ============================================================================

EnemyArchetype ArchetypeFromJson(const json& j) {
    EnemyArchetype a;

    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw std::invalid_argument("archetype definition is missing an id");
    }
    a.id = j["id"].get<std::string>();
    a.name = j.value("name", a.id);

    if (j.contains("role")) {
        const auto roleName = j["role"].get<std::string>();
        auto role = StringToCombatRole(roleName);
        if (!role) {
            throw std::invalid_argument("archetype '" + a.id + "' has unknown role '" + roleName + "'");
        }
        a.role = *role;
    }
    if (j.contains("tier")) a.tier = j["tier"].get<int>();
    if (j.contains("ai_profile")) a.aiProfile = j["ai_profile"].get<std::string>();

    if (j.contains("base_hp")) a.baseHp = j["base_hp"].get<int>();
    if (j.contains("base_attack")) a.baseAttack = j["base_attack"].get<int>();
    if (j.contains("base_defense")) a.baseDefense = j["base_defense"].get<int>();
    if (j.contains("base_xp")) a.baseXp = j["base_xp"].get<int>();
    if (j.contains("base_initiative")) a.baseInitiative = j["base_initiative"].get<int>();

    if (j.contains("hp_per_floor")) a.hpPerFloor = j["hp_per_floor"].get<double>();
    if (j.contains("atk_per_floor")) a.atkPerFloor = j["atk_per_floor"].get<double>();
    if (j.contains("def_per_floor")) a.defPerFloor = j["def_per_floor"].get<double>();
    if (j.contains("xp_per_floor")) a.xpPerFloor = j["xp_per_floor"].get<double>();
    if (j.contains("initiative_per_floor")) a.initPerFloor = j["initiative_per_floor"].get<double>();

    if (j.contains("skills")) a.skillIds = j["skills"].get<std::vector<std::string>>();

    // Newer fields fall back to values derived from the legacy tier
    a.difficultyLevel = j.contains("difficulty_level")
        ? j["difficulty_level"].get<int>() : DifficultyForTier(a.tier);
    a.spawnMinFloor = j.contains("spawn_min_floor")
        ? j["spawn_min_floor"].get<int>() : SpawnMinFloorForTier(a.tier);

    if (j.contains("spawn_max_floor")) {
        if (!j["spawn_max_floor"].is_null()) {
            a.spawnMaxFloor = j["spawn_max_floor"].get<int>();
        }
    } else {
        a.spawnMaxFloor = SpawnMaxFloorForTier(a.tier);
    }

    if (j.contains("spawn_weight")) a.spawnWeight = j["spawn_weight"].get<double>();

    if (j.contains("tags")) {
        for (const auto& tag : j["tags"]) {
            a.tags.insert(tag.get<std::string>());
        }
    }
    if (a.tags.empty()) {
        a.tags.insert(TierTag(a.tier));
        a.tags.insert(CombatRoleToTag(a.role));
    }

    if (j.contains("resistances") && j["resistances"].is_object()) {
        for (const auto& [damageType, multiplier] : j["resistances"].items()) {
            a.resistances[damageType] = multiplier.get<double>();
        }
    }
    if (j.contains("unique_mechanics")) {
        a.uniqueMechanics = j["unique_mechanics"].get<std::vector<std::string>>();
    }

    return a;
}

json ArchetypeToJson(const EnemyArchetype& a) {
    json j;
    j["id"] = a.id;
    j["name"] = a.name;
    j["role"] = CombatRoleToString(a.role);
    j["tier"] = a.tier;
    j["ai_profile"] = a.aiProfile;

    j["base_hp"] = a.baseHp;
    j["base_attack"] = a.baseAttack;
    j["base_defense"] = a.baseDefense;
    j["base_xp"] = a.baseXp;
    j["base_initiative"] = a.baseInitiative;

    j["hp_per_floor"] = a.hpPerFloor;
    j["atk_per_floor"] = a.atkPerFloor;
    j["def_per_floor"] = a.defPerFloor;
    j["xp_per_floor"] = a.xpPerFloor;
    j["initiative_per_floor"] = a.initPerFloor;

    j["skills"] = a.skillIds;
    j["difficulty_level"] = a.difficultyLevel;
    j["spawn_min_floor"] = a.spawnMinFloor;
    j["spawn_max_floor"] = a.spawnMaxFloor ? json(*a.spawnMaxFloor) : json(nullptr);
    j["spawn_weight"] = a.spawnWeight;

    // Sorted for stable output
    std::vector<std::string> tags(a.tags.begin(), a.tags.end());
    std::sort(tags.begin(), tags.end());
    j["tags"] = tags;

    j["resistances"] = json::object();
    for (const auto& [damageType, multiplier] : a.resistances) {
        j["resistances"][damageType] = multiplier;
    }
    j["unique_mechanics"] = a.uniqueMechanics;
    return j;
}

// ============================================================================
// Pack JSON
// ============================================================================

EnemyPackTemplate PackFromJson(const json& j) {
    EnemyPackTemplate pack;

    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw std::invalid_argument("pack definition is missing an id");
    }
    pack.id = j["id"].get<std::string>();
    pack.name = j.value("name", pack.id);
    if (j.contains("tier")) pack.tier = j["tier"].get<int>();
    if (j.contains("members")) pack.memberArchIds = j["members"].get<std::vector<std::string>>();
    if (j.contains("preferred_room_tag") && !j["preferred_room_tag"].is_null()) {
        pack.preferredRoomTag = j["preferred_room_tag"].get<std::string>();
    }
    if (j.contains("weight")) pack.weight = j["weight"].get<double>();
    return pack;
}

json PackToJson(const EnemyPackTemplate& pack) {
    json j;
    j["id"] = pack.id;
    j["name"] = pack.name;
    j["tier"] = pack.tier;
    j["members"] = pack.memberArchIds;
    j["preferred_room_tag"] = pack.preferredRoomTag ? json(*pack.preferredRoomTag) : json(nullptr);
    j["weight"] = pack.weight;
    return j;
}

} // namespace Enemies
} // namespace Bestiary
