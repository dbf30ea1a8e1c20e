#pragma once

#include "PartyTypes.hpp"
#include "enemies/EnemyRegistry.hpp"
#include "enemies/EnemySelection.hpp"
#include "enemies/SpawnedUnit.hpp"
#include "config/Config.hpp"
#include "math/Random.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Bestiary {
namespace Overworld {

/**
 * @brief Alignment after faction standing is taken into account
 *
 * Hostile parties stay hostile. With a known relation, anything below -50
 * turns hostile; friendly parties need more than 50 to stay friendly and
 * drop to neutral otherwise; neutral parties above 50 turn friendly.
 *
 * @param factionRelation Player standing with the party's faction, if any
 */
[[nodiscard]] PartyAlignment GetEffectiveAlignment(const PartyType& type, const RoamingParty& party,
                                                   std::optional<int> factionRelation = std::nullopt);

/**
 * @brief Per-battle label: first word of the party name, or the title-cased type id, plus index + 1
 */
[[nodiscard]] std::string MakeBattleLabel(const RoamingParty& party, int index);

/**
 * @brief Capitalize the first letter of every alphabetic run ("dark_elf" -> "Dark_Elf")
 */
[[nodiscard]] std::string TitleCase(const std::string& text);

// ============================================================================
// Battle Converter
// ============================================================================

/**
 * @brief Turns overworld parties into battle-ready units
 *
 * Hostile and neutral parties become enemy units sized to the player's
 * party; friendly parties become one or two AI-controlled allies.
 */
class BattleConverter {
public:
    BattleConverter(const Enemies::EnemyRegistry& registry, Enemies::EnemySelector& selector,
                    IRandomSource& random, EncounterTuning tuning = {});

    /**
     * @brief Number of enemies a party fields against the player
     *
     * Base count is uniform in [1, 2 + strength]; every player member beyond
     * two adds between 0.7 and 2.3 more. Swarm party types field 50% more,
     * elite types 25% fewer. The result is clamped to the configured bounds.
     */
    int CalculateEnemyCount(int playerPartySize, int combatStrength, const std::string& partyTypeId);

    /**
     * @brief Swarm/elite adjustment for a party type id
     */
    [[nodiscard]] int ApplyPartyTypeScaling(int count, const std::string& partyTypeId) const;

    /**
     * @brief Enemy units for a hostile or neutral party
     * @throws Enemies::EmptyRegistryError only if no archetype is registered
     */
    std::vector<Enemies::SpawnedUnit> PartyToBattleEnemies(const RoamingParty& party, const PartyType& type,
                                                           const PlayerPartySnapshot& snapshot);

    /**
     * @brief Player-side units for a friendly party, scaled from the hero's stats
     */
    [[nodiscard]] std::vector<Enemies::SpawnedUnit> AlliedPartyToBattleUnits(
        const RoamingParty& party, const PartyType& type, const PlayerPartySnapshot& snapshot) const;

    /**
     * @brief Allies for friendly parties, enemies for everyone else
     */
    std::vector<Enemies::SpawnedUnit> ConvertPartyToBattleUnits(const RoamingParty& party, const PartyType& type,
                                                                const PlayerPartySnapshot& snapshot,
                                                                std::optional<int> factionRelation = std::nullopt);

    /**
     * @brief Archetype every enemy unit of this party type will use
     *
     * Explicit template, then level-appropriate selection, then the legacy
     * strength table, then "goblin_skirmisher", then the first registered id.
     */
    const Enemies::EnemyArchetype& ResolveArchetype(const PartyType& type, int playerLevel);

    /**
     * @brief Legacy archetype id for a combat strength (1-5)
     */
    [[nodiscard]] static std::string ArchetypeIdForStrength(int combatStrength);

    [[nodiscard]] const EncounterTuning& GetTuning() const { return m_tuning; }

private:
    [[nodiscard]] bool IsSwarmType(const std::string& partyTypeId) const;
    [[nodiscard]] bool IsEliteType(const std::string& partyTypeId) const;

    const Enemies::EnemyRegistry& m_registry;
    Enemies::EnemySelector& m_selector;
    IRandomSource& m_random;
    EncounterTuning m_tuning;
};

} // namespace Overworld
} // namespace Bestiary
