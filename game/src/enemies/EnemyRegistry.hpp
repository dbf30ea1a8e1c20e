#pragma once

#include "EnemyTypes.hpp"
#include "EnemyErrors.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bestiary {
namespace Enemies {

// ============================================================================
// Enemy Registry
// ============================================================================

/**
 * @brief Owns every archetype and pack definition for a game session
 *
 * Populated once at startup (in code or from JSON content files), then
 * sealed. After sealing the registry is read-only and safe to share
 * between readers. Enumeration follows registration order so that a
 * seeded random source yields the same choices run after run.
 */
class EnemyRegistry {
public:
    EnemyRegistry();

    EnemyRegistry(const EnemyRegistry&) = delete;
    EnemyRegistry& operator=(const EnemyRegistry&) = delete;
    EnemyRegistry(EnemyRegistry&&) = default;
    EnemyRegistry& operator=(EnemyRegistry&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register an archetype
     * @throws DuplicateRegistrationError if the id is already registered
     * @throws RegistrySealedError after Seal()
     */
    const EnemyArchetype& Register(EnemyArchetype archetype);

    /**
     * @brief Register a pack template
     * @throws DuplicateRegistrationError if the id is already registered
     * @throws RegistrySealedError after Seal()
     */
    const EnemyPackTemplate& RegisterPack(EnemyPackTemplate pack);

    /**
     * @brief Replace the unique archetype ids offered by a room tag
     */
    void SetUniqueRoomEnemies(const std::string& roomTag, std::vector<std::string> archetypeIds);

    /**
     * @brief End the startup phase
     * @throws EmptyRegistryError if no archetype was registered
     */
    void Seal();

    [[nodiscard]] bool IsSealed() const { return m_sealed; }

    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * @brief Register everything defined in a content file
     *
     * The file is a JSON object with optional "archetypes", "packs" and
     * "unique_room_enemies" members.
     *
     * @return Number of archetypes and packs registered
     * @throws ContentParseError if the file cannot be read or parsed
     * @throws DuplicateRegistrationError on a repeated id
     */
    size_t LoadFile(const std::filesystem::path& filePath);

    /**
     * @brief Load every .json file under a directory, in sorted path order
     * @return Number of archetypes and packs registered
     */
    size_t LoadDirectory(const std::filesystem::path& rootPath);

    // =========================================================================
    // Lookup
    // =========================================================================

    /**
     * @throws NotFoundError if the id is not registered
     */
    [[nodiscard]] const EnemyArchetype& Get(const std::string& id) const;
    [[nodiscard]] const EnemyPackTemplate& GetPack(const std::string& id) const;

    /**
     * @brief Non-throwing lookups for fallback code paths
     */
    [[nodiscard]] const EnemyArchetype* Find(const std::string& id) const;
    [[nodiscard]] const EnemyPackTemplate* FindPack(const std::string& id) const;

    [[nodiscard]] bool Has(const std::string& id) const { return Find(id) != nullptr; }
    [[nodiscard]] bool HasPack(const std::string& id) const { return FindPack(id) != nullptr; }

    [[nodiscard]] size_t GetArchetypeCount() const { return m_archetypeOrder.size(); }
    [[nodiscard]] size_t GetPackCount() const { return m_packOrder.size(); }
    [[nodiscard]] bool IsEmpty() const { return m_archetypeOrder.empty(); }

    // =========================================================================
    // Enumeration and filters
    // =========================================================================

    [[nodiscard]] std::vector<const EnemyArchetype*> GetAll() const;
    [[nodiscard]] std::vector<const EnemyPackTemplate*> GetAllPacks() const;

    [[nodiscard]] std::vector<std::string> GetArchetypeIds() const;  // Sorted
    [[nodiscard]] std::vector<std::string> GetPackIds() const;       // Sorted

    [[nodiscard]] std::vector<const EnemyArchetype*> GetWithTag(const std::string& tag) const;
    [[nodiscard]] std::vector<const EnemyArchetype*> GetWithSkill(const std::string& skillId) const;
    [[nodiscard]] std::vector<const EnemyArchetype*> GetByRole(CombatRole role) const;
    [[nodiscard]] std::vector<const EnemyArchetype*> GetByTier(int tier) const;

    /**
     * @brief Archetypes whose difficulty lies in [minDifficulty, maxDifficulty]
     */
    [[nodiscard]] std::vector<const EnemyArchetype*> GetByDifficultyRange(int minDifficulty,
                                                                          int maxDifficulty) const;

    /**
     * @brief Archetypes eligible to spawn on the given floor
     */
    [[nodiscard]] std::vector<const EnemyArchetype*> GetForFloor(int floor) const;

    /**
     * @brief Archetypes eligible on at least one floor of [minFloor, maxFloor]
     */
    [[nodiscard]] std::vector<const EnemyArchetype*> GetForFloorRange(int minFloor, int maxFloor) const;

    [[nodiscard]] std::vector<const EnemyPackTemplate*> GetPacksByTier(int tier) const;
    [[nodiscard]] std::vector<const EnemyPackTemplate*> GetPacksByRoomTag(const std::string& roomTag) const;

    /**
     * @brief Unique archetype ids themed on a room tag (empty if none)
     */
    [[nodiscard]] const std::vector<std::string>& GetUniqueRoomEnemies(const std::string& roomTag) const;

    [[nodiscard]] const std::unordered_map<std::string, std::vector<std::string>>& GetUniqueRoomTable() const {
        return m_uniqueRoomEnemies;
    }

private:
    template<typename Pred>
    std::vector<const EnemyArchetype*> Filter(Pred pred) const;

    template<typename Pred>
    std::vector<const EnemyPackTemplate*> FilterPacks(Pred pred) const;

    void EnsureWritable(const std::string& id) const;

    std::unordered_map<std::string, EnemyArchetype> m_archetypes;
    std::vector<std::string> m_archetypeOrder;

    std::unordered_map<std::string, EnemyPackTemplate> m_packs;
    std::vector<std::string> m_packOrder;

    std::unordered_map<std::string, std::vector<std::string>> m_uniqueRoomEnemies;

    bool m_sealed = false;
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename Pred>
std::vector<const EnemyArchetype*> EnemyRegistry::Filter(Pred pred) const {
    std::vector<const EnemyArchetype*> result;
    for (const auto& id : m_archetypeOrder) {
        const auto& archetype = m_archetypes.at(id);
        if (pred(archetype)) {
            result.push_back(&archetype);
        }
    }
    return result;
}

template<typename Pred>
std::vector<const EnemyPackTemplate*> EnemyRegistry::FilterPacks(Pred pred) const {
    std::vector<const EnemyPackTemplate*> result;
    for (const auto& id : m_packOrder) {
        const auto& pack = m_packs.at(id);
        if (pred(pack)) {
            result.push_back(&pack);
        }
    }
    return result;
}

} // namespace Enemies
} // namespace Bestiary
