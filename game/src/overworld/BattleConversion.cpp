#include "BattleConversion.hpp"
#include "enemies/FallbackChain.hpp"
#include "enemies/StatScaling.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Bestiary {
namespace Overworld {

using Enemies::EnemyArchetype;
using Enemies::FallbackStep;
using Enemies::SpawnedUnit;

namespace {

constexpr int kMaxAllies = 2;

/**
 * @brief Linear interpolation over combat strength 1..5
 */
double StrengthFactor(int combatStrength, double atOne, double atFive) {
    const int strength = std::clamp(combatStrength, 1, 5);
    return atOne + (atFive - atOne) * (strength - 1) / 4.0;
}

} // anonymous namespace

// ============================================================================
// Free helpers
// ============================================================================

PartyAlignment GetEffectiveAlignment(const PartyType& type, const RoamingParty& party,
                                     std::optional<int> factionRelation) {
    if (type.alignment == PartyAlignment::Hostile) {
        return PartyAlignment::Hostile;
    }

    // Relations only matter for parties that belong to a faction
    const bool hasFaction = party.factionId.has_value() || type.factionId.has_value();
    if (!hasFaction || !factionRelation) {
        return type.alignment;
    }

    const int relation = *factionRelation;
    if (relation < -50) {
        return PartyAlignment::Hostile;
    }
    if (relation > 50) {
        return PartyAlignment::Friendly;
    }
    return PartyAlignment::Neutral;
}

std::string TitleCase(const std::string& text) {
    std::string result = text;
    bool startOfWord = true;
    for (auto& c : result) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return result;
}

std::string MakeBattleLabel(const RoamingParty& party, int index) {
    std::istringstream words(party.partyName);
    std::string base;
    if (!(words >> base)) {
        base = TitleCase(party.partyTypeId);
    }
    return base + " " + std::to_string(index + 1);
}

// ============================================================================
// BattleConverter
// ============================================================================

BattleConverter::BattleConverter(const Enemies::EnemyRegistry& registry, Enemies::EnemySelector& selector,
                                 IRandomSource& random, EncounterTuning tuning)
    : m_registry(registry)
    , m_selector(selector)
    , m_random(random)
    , m_tuning(std::move(tuning)) {
}

bool BattleConverter::IsSwarmType(const std::string& partyTypeId) const {
    const auto& ids = m_tuning.swarmPartyTypes;
    return std::find(ids.begin(), ids.end(), partyTypeId) != ids.end();
}

bool BattleConverter::IsEliteType(const std::string& partyTypeId) const {
    const auto& ids = m_tuning.elitePartyTypes;
    return std::find(ids.begin(), ids.end(), partyTypeId) != ids.end();
}

int BattleConverter::ApplyPartyTypeScaling(int count, const std::string& partyTypeId) const {
    if (IsSwarmType(partyTypeId)) {
        return static_cast<int>(count * m_tuning.swarmMultiplier);
    }
    if (IsEliteType(partyTypeId)) {
        return std::max(1, static_cast<int>(count * m_tuning.eliteMultiplier));
    }
    return count;
}

int BattleConverter::CalculateEnemyCount(int playerPartySize, int combatStrength, const std::string& partyTypeId) {
    const int partySize = std::max(2, playerPartySize);
    const int strength = std::max(1, combatStrength);

    const int baseCount = m_random.Range(1, 3 + (strength - 1));

    int additional = 0;
    const int extraMembers = partySize - 2;
    if (extraMembers > 0) {
        const double perMember = m_random.Range(1.0, 2.0);
        const double variation = m_random.Range(-0.3, 0.3);
        additional = std::max(0, static_cast<int>(extraMembers * (perMember + variation)));
    }

    int total = std::clamp(baseCount + additional, m_tuning.minEnemies, m_tuning.maxEnemies);
    total = ApplyPartyTypeScaling(total, partyTypeId);
    total = std::clamp(total, m_tuning.minEnemies, m_tuning.maxEnemies);

    GAME_LOG_DEBUG("Party '{}' (strength {}) vs party of {}: {} enemies",
                   partyTypeId, strength, partySize, total);
    return total;
}

std::string BattleConverter::ArchetypeIdForStrength(int combatStrength) {
    switch (combatStrength) {
        case 1: return "goblin_skirmisher";
        case 2: return "bandit_cutthroat";
        case 3: return "orc_raider";
        case 4: return "dread_knight";
        case 5: return "dragonkin";
        default: return "bandit_cutthroat";
    }
}

const EnemyArchetype& BattleConverter::ResolveArchetype(const PartyType& type, int playerLevel) {
    using Step = FallbackStep<const EnemyArchetype*>;

    auto lookup = [this](const std::string& id) -> std::optional<const EnemyArchetype*> {
        if (const auto* archetype = m_registry.Find(id)) {
            return archetype;
        }
        return std::nullopt;
    };

    const std::vector<Step> steps = {
        {"battle unit template", [&]() -> std::optional<const EnemyArchetype*> {
            if (!type.battleUnitTemplate) {
                return std::nullopt;
            }
            auto found = lookup(*type.battleUnitTemplate);
            if (!found) {
                GAME_LOG_WARN("Party type '{}': battle unit template '{}' is not registered",
                              type.id, *type.battleUnitTemplate);
            }
            return found;
        }},
        {"player level selection", [&]() -> std::optional<const EnemyArchetype*> {
            try {
                return &m_selector.ChooseArchetypeForPlayerLevel(playerLevel);
            } catch (const Enemies::EmptyRegistryError& e) {
                GAME_LOG_WARN("Party type '{}': level selection failed ({}), using strength table",
                              type.id, e.what());
                return std::nullopt;
            }
        }},
        {"strength table", [&]() -> std::optional<const EnemyArchetype*> {
            const auto id = ArchetypeIdForStrength(type.combatStrength);
            auto found = lookup(id);
            if (!found) {
                GAME_LOG_WARN("Party type '{}': strength archetype '{}' is not registered", type.id, id);
            }
            return found;
        }},
        {"goblin skirmisher", [&] { return lookup("goblin_skirmisher"); }},
        {"first registered", [&]() -> std::optional<const EnemyArchetype*> {
            const auto ids = m_registry.GetArchetypeIds();
            if (ids.empty()) {
                return std::nullopt;
            }
            return lookup(ids.front());
        }},
    };

    auto archetype = Enemies::FirstSuccess<const EnemyArchetype*>("archetype for party " + type.id, steps);
    if (!archetype) {
        throw Enemies::EmptyRegistryError();
    }
    return **archetype;
}

std::vector<SpawnedUnit> BattleConverter::PartyToBattleEnemies(const RoamingParty& party, const PartyType& type,
                                                               const PlayerPartySnapshot& snapshot) {
    const int count = CalculateEnemyCount(snapshot.GetPartySize(), type.combatStrength, type.id);
    const int level = std::max(1, snapshot.playerLevel);
    const auto& archetype = ResolveArchetype(type, level);

    std::vector<SpawnedUnit> units;
    units.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto unit = Enemies::CreateUnit(archetype, level);

        // Keep total encounter XP roughly constant regardless of head count
        unit.xp = std::max(1, static_cast<int>(unit.xp / (1.0 + (count - 1) * 0.3)));

        unit.battleLabel = MakeBattleLabel(party, i);
        unit.partyId = party.partyId;
        unit.partyName = party.partyName;
        unit.partyTypeId = party.partyTypeId;
        units.push_back(std::move(unit));
    }

    GAME_LOG_INFO("Party '{}' ({}) fields {} x '{}' at level {}",
                  party.partyId, type.id, count, archetype.id, level);
    return units;
}

std::vector<SpawnedUnit> BattleConverter::AlliedPartyToBattleUnits(const RoamingParty& party, const PartyType& type,
                                                                   const PlayerPartySnapshot& snapshot) const {
    const int count = std::min(kMaxAllies, std::max(1, type.combatStrength));

    const double hpFactor = StrengthFactor(type.combatStrength, 0.7, 1.2);
    const double attackFactor = StrengthFactor(type.combatStrength, 0.6, 1.1);
    const double defenseFactor = StrengthFactor(type.combatStrength, 0.8, 1.3);

    std::vector<SpawnedUnit> allies;
    allies.reserve(count);
    for (int i = 0; i < count; ++i) {
        SpawnedUnit ally;
        ally.name = type.name + " Ally " + std::to_string(i + 1);
        ally.originalName = ally.name;
        ally.battleLabel = ally.name;
        ally.aiProfile = "ally";

        ally.maxHp = std::max(1, static_cast<int>(snapshot.heroMaxHp * hpFactor));
        ally.hp = ally.maxHp;
        ally.attack = std::max(1, static_cast<int>(snapshot.heroAttack * attackFactor));
        ally.defense = static_cast<int>(snapshot.heroDefense * defenseFactor);
        ally.skillPower = std::max(0.1, snapshot.heroSkillPower * 1.0);
        ally.initiative = snapshot.heroInitiative;
        ally.xp = 0;
        ally.skillIds = {"guard"};
        ally.isAlly = true;
        ally.color = type.color;

        ally.partyId = party.partyId;
        ally.partyName = party.partyName;
        ally.partyTypeId = party.partyTypeId;
        allies.push_back(std::move(ally));
    }

    GAME_LOG_INFO("Party '{}' ({}) joins with {} allies", party.partyId, type.id, count);
    return allies;
}

std::vector<SpawnedUnit> BattleConverter::ConvertPartyToBattleUnits(const RoamingParty& party, const PartyType& type,
                                                                    const PlayerPartySnapshot& snapshot,
                                                                    std::optional<int> factionRelation) {
    const auto alignment = GetEffectiveAlignment(type, party, factionRelation);
    if (alignment == PartyAlignment::Friendly) {
        return AlliedPartyToBattleUnits(party, type, snapshot);
    }
    return PartyToBattleEnemies(party, type, snapshot);
}

} // namespace Overworld
} // namespace Bestiary
