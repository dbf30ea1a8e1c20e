#pragma once

#include "EnemyRegistry.hpp"
#include "math/Random.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Bestiary {
namespace Enemies {

/**
 * @brief An archetype together with its room-adjusted selection weight
 */
struct WeightedArchetype {
    const EnemyArchetype* archetype = nullptr;
    double weight = 0.0;
};

/**
 * @brief A pack candidate together with its room-adjusted selection weight
 */
struct WeightedPack {
    const EnemyPackTemplate* pack = nullptr;
    double weight = 0.0;
};

// ============================================================================
// Enemy Selector
// ============================================================================

/**
 * @brief Weighted, context-aware choice of archetypes and packs
 *
 * Every choice first narrows the registry through a fallback chain
 * (spawn range, then legacy tier band, then everything) and then draws
 * one candidate by weight from the injected random source. A choice only
 * fails when the registry holds no archetypes at all.
 */
class EnemySelector {
public:
    EnemySelector(const EnemyRegistry& registry, IRandomSource& random);

    /**
     * @brief Pick an archetype for a dungeon floor, nudged by the room tag
     * @throws EmptyRegistryError if no archetype is registered
     */
    const EnemyArchetype& ChooseArchetypeForFloor(int floor,
                                                  const std::optional<std::string>& roomTag = std::nullopt);

    /**
     * @brief Pick a pack for a dungeon floor
     *
     * Only packs of the floor's tier band whose members all resolve and may
     * spawn on the floor are considered. With no candidate, a single-member
     * pseudo-pack "_single_<id>" wraps ChooseArchetypeForFloor().
     *
     * @throws EmptyRegistryError if no archetype is registered
     */
    EnemyPackTemplate ChoosePackForFloor(int floor,
                                         const std::optional<std::string>& roomTag = std::nullopt);

    /**
     * @brief Pick an archetype for overworld encounters, using the level as floor
     *
     * Chain: preferred tag and eligible, eligible, tier band, everything.
     * Excluded tags filter the first two steps only.
     *
     * @throws EmptyRegistryError if no archetype is registered
     */
    const EnemyArchetype& ChooseArchetypeForPlayerLevel(int playerLevel,
                                                        const std::vector<std::string>& preferredTags = {},
                                                        const std::vector<std::string>& excludedTags = {});

    /**
     * @brief Candidates and weights ChooseArchetypeForFloor() would draw from
     */
    [[nodiscard]] std::vector<WeightedArchetype> GetFloorCandidates(
        int floor, const std::optional<std::string>& roomTag = std::nullopt) const;

    /**
     * @brief Packs and weights ChoosePackForFloor() would draw from (empty if it would synthesize)
     */
    [[nodiscard]] std::vector<WeightedPack> GetPackCandidates(
        int floor, const std::optional<std::string>& roomTag = std::nullopt) const;

    /**
     * @brief Selection weight of an archetype in a room
     */
    [[nodiscard]] static double RoomWeight(const EnemyArchetype& archetype,
                                           const std::optional<std::string>& roomTag);

    /**
     * @brief Legacy tier band: 1 for floors up to 2, 2 up to 4, else 3
     */
    [[nodiscard]] static int TierForFloor(int floor);

    [[nodiscard]] const EnemyRegistry& GetRegistry() const { return m_registry; }
    [[nodiscard]] IRandomSource& GetRandom() const { return m_random; }

private:
    using Candidates = std::vector<const EnemyArchetype*>;

    Candidates FloorCandidates(int floor) const;
    const EnemyArchetype& Draw(const Candidates& candidates, const std::vector<double>& weights);

    const EnemyRegistry& m_registry;
    IRandomSource& m_random;
};

/**
 * @brief Difficulty window appropriate for a floor, clamped to [1, 100]
 *
 * Centered on 10 + (floor - 1) * 9.
 */
[[nodiscard]] std::pair<int, int> FloorToDifficultyRange(int floor, int spread = 15);

} // namespace Enemies
} // namespace Bestiary
