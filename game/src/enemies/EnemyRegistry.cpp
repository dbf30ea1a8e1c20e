#include "EnemyRegistry.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <set>

namespace Bestiary {
namespace Enemies {

using json = nlohmann::json;
namespace fs = std::filesystem;

EnemyRegistry::EnemyRegistry()
    : m_uniqueRoomEnemies{
          {"graveyard", {"grave_warden"}},
          {"sanctum", {"sanctum_guardian"}},
          {"lair", {"pit_champion"}},
          {"treasure", {"hoard_mimic"}},
          {"library", {"arcane_golem"}},
          {"armory", {"animated_armor"}},
      } {
}

// ============================================================================
// Registration
// ============================================================================

void EnemyRegistry::EnsureWritable(const std::string& id) const {
    if (m_sealed) {
        throw RegistrySealedError(id);
    }
}

const EnemyArchetype& EnemyRegistry::Register(EnemyArchetype archetype) {
    EnsureWritable(archetype.id);
    if (m_archetypes.count(archetype.id)) {
        throw DuplicateRegistrationError("archetype", archetype.id);
    }

    std::string id = archetype.id;
    auto [it, inserted] = m_archetypes.emplace(id, std::move(archetype));
    m_archetypeOrder.push_back(id);
    BESTIARY_LOG_TRACE("Registered archetype '{}'", id);
    return it->second;
}

const EnemyPackTemplate& EnemyRegistry::RegisterPack(EnemyPackTemplate pack) {
    EnsureWritable(pack.id);
    if (m_packs.count(pack.id)) {
        throw DuplicateRegistrationError("pack", pack.id);
    }

    std::string id = pack.id;
    auto [it, inserted] = m_packs.emplace(id, std::move(pack));
    m_packOrder.push_back(id);
    BESTIARY_LOG_TRACE("Registered pack '{}'", id);
    return it->second;
}

void EnemyRegistry::SetUniqueRoomEnemies(const std::string& roomTag,
                                         std::vector<std::string> archetypeIds) {
    EnsureWritable(roomTag);
    if (archetypeIds.empty()) {
        m_uniqueRoomEnemies.erase(roomTag);
    } else {
        m_uniqueRoomEnemies[roomTag] = std::move(archetypeIds);
    }
}

void EnemyRegistry::Seal() {
    if (m_sealed) {
        return;
    }
    if (m_archetypeOrder.empty()) {
        throw EmptyRegistryError();
    }
    m_sealed = true;
    BESTIARY_LOG_INFO("Enemy registry sealed: {} archetypes, {} packs",
                      m_archetypeOrder.size(), m_packOrder.size());
}

// ============================================================================
// Loading
// ============================================================================

size_t EnemyRegistry::LoadFile(const fs::path& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ContentParseError(filePath.string(), "cannot open file");
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ContentParseError(filePath.string(), e.what());
    }

    if (!root.is_object()) {
        throw ContentParseError(filePath.string(), "expected a JSON object at top level");
    }

    // Parse and check ids before registering so a rejected file leaves no partial entries behind
    std::vector<EnemyArchetype> archetypes;
    std::vector<EnemyPackTemplate> packs;
    try {
        if (root.contains("archetypes")) {
            for (const auto& entry : root["archetypes"]) {
                archetypes.push_back(ArchetypeFromJson(entry));
            }
        }
        if (root.contains("packs")) {
            for (const auto& entry : root["packs"]) {
                packs.push_back(PackFromJson(entry));
            }
        }
    } catch (const json::exception& e) {
        throw ContentParseError(filePath.string(), e.what());
    } catch (const std::invalid_argument& e) {
        throw ContentParseError(filePath.string(), e.what());
    }

    EnsureWritable(filePath.string());
    std::set<std::string> archetypeIds;
    for (const auto& archetype : archetypes) {
        if (m_archetypes.count(archetype.id) || !archetypeIds.insert(archetype.id).second) {
            throw DuplicateRegistrationError("archetype", archetype.id);
        }
    }
    std::set<std::string> packIds;
    for (const auto& pack : packs) {
        if (m_packs.count(pack.id) || !packIds.insert(pack.id).second) {
            throw DuplicateRegistrationError("pack", pack.id);
        }
    }

    size_t loaded = 0;
    for (auto& archetype : archetypes) {
        Register(std::move(archetype));
        ++loaded;
    }
    for (auto& pack : packs) {
        RegisterPack(std::move(pack));
        ++loaded;
    }

    if (root.contains("unique_room_enemies") && root["unique_room_enemies"].is_object()) {
        for (const auto& [roomTag, ids] : root["unique_room_enemies"].items()) {
            try {
                SetUniqueRoomEnemies(roomTag, ids.get<std::vector<std::string>>());
            } catch (const json::exception& e) {
                throw ContentParseError(filePath.string(), e.what());
            }
        }
    }

    BESTIARY_LOG_DEBUG("Loaded {} definitions from {}", loaded, filePath.string());
    return loaded;
}

size_t EnemyRegistry::LoadDirectory(const fs::path& rootPath) {
    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(rootPath)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw ContentParseError(rootPath.string(), e.what());
    }

    std::sort(files.begin(), files.end());

    size_t loaded = 0;
    for (const auto& path : files) {
        loaded += LoadFile(path);
    }

    BESTIARY_LOG_INFO("Loaded {} enemy definitions from {} files in {}",
                      loaded, files.size(), rootPath.string());
    return loaded;
}

// ============================================================================
// Lookup
// ============================================================================

const EnemyArchetype& EnemyRegistry::Get(const std::string& id) const {
    if (const auto* archetype = Find(id)) {
        return *archetype;
    }
    throw NotFoundError("archetype", id);
}

const EnemyPackTemplate& EnemyRegistry::GetPack(const std::string& id) const {
    if (const auto* pack = FindPack(id)) {
        return *pack;
    }
    throw NotFoundError("pack", id);
}

const EnemyArchetype* EnemyRegistry::Find(const std::string& id) const {
    auto it = m_archetypes.find(id);
    return it != m_archetypes.end() ? &it->second : nullptr;
}

const EnemyPackTemplate* EnemyRegistry::FindPack(const std::string& id) const {
    auto it = m_packs.find(id);
    return it != m_packs.end() ? &it->second : nullptr;
}

// ============================================================================
// Enumeration and filters
// ============================================================================

std::vector<const EnemyArchetype*> EnemyRegistry::GetAll() const {
    return Filter([](const EnemyArchetype&) { return true; });
}

std::vector<const EnemyPackTemplate*> EnemyRegistry::GetAllPacks() const {
    return FilterPacks([](const EnemyPackTemplate&) { return true; });
}

std::vector<std::string> EnemyRegistry::GetArchetypeIds() const {
    std::vector<std::string> ids = m_archetypeOrder;
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> EnemyRegistry::GetPackIds() const {
    std::vector<std::string> ids = m_packOrder;
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetWithTag(const std::string& tag) const {
    return Filter([&](const EnemyArchetype& a) { return a.HasTag(tag); });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetWithSkill(const std::string& skillId) const {
    return Filter([&](const EnemyArchetype& a) {
        return std::find(a.skillIds.begin(), a.skillIds.end(), skillId) != a.skillIds.end();
    });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetByRole(CombatRole role) const {
    return Filter([role](const EnemyArchetype& a) { return a.role == role; });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetByTier(int tier) const {
    return Filter([tier](const EnemyArchetype& a) { return a.tier == tier; });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetByDifficultyRange(int minDifficulty,
                                                                       int maxDifficulty) const {
    return Filter([=](const EnemyArchetype& a) {
        return a.difficultyLevel >= minDifficulty && a.difficultyLevel <= maxDifficulty;
    });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetForFloor(int floor) const {
    return Filter([floor](const EnemyArchetype& a) { return a.IsEligibleForFloor(floor); });
}

std::vector<const EnemyArchetype*> EnemyRegistry::GetForFloorRange(int minFloor, int maxFloor) const {
    return Filter([=](const EnemyArchetype& a) {
        return a.spawnMinFloor <= maxFloor && (!a.spawnMaxFloor || *a.spawnMaxFloor >= minFloor);
    });
}

std::vector<const EnemyPackTemplate*> EnemyRegistry::GetPacksByTier(int tier) const {
    return FilterPacks([tier](const EnemyPackTemplate& p) { return p.tier == tier; });
}

std::vector<const EnemyPackTemplate*> EnemyRegistry::GetPacksByRoomTag(const std::string& roomTag) const {
    return FilterPacks([&](const EnemyPackTemplate& p) {
        return p.preferredRoomTag && *p.preferredRoomTag == roomTag;
    });
}

const std::vector<std::string>& EnemyRegistry::GetUniqueRoomEnemies(const std::string& roomTag) const {
    static const std::vector<std::string> s_empty;
    auto it = m_uniqueRoomEnemies.find(roomTag);
    return it != m_uniqueRoomEnemies.end() ? it->second : s_empty;
}

} // namespace Enemies
} // namespace Bestiary
