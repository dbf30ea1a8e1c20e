#include "EnemySelection.hpp"
#include "FallbackChain.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Bestiary {
namespace Enemies {

namespace {

bool HasAnyTag(const EnemyArchetype& archetype, const std::vector<std::string>& tags) {
    return std::any_of(tags.begin(), tags.end(),
                       [&](const std::string& tag) { return archetype.HasTag(tag); });
}

std::optional<std::vector<const EnemyArchetype*>> NonEmpty(std::vector<const EnemyArchetype*> candidates) {
    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates;
}

} // anonymous namespace

EnemySelector::EnemySelector(const EnemyRegistry& registry, IRandomSource& random)
    : m_registry(registry)
    , m_random(random) {
}

int EnemySelector::TierForFloor(int floor) {
    if (floor <= 2) {
        return 1;
    }
    if (floor <= 4) {
        return 2;
    }
    return 3;
}

double EnemySelector::RoomWeight(const EnemyArchetype& a, const std::optional<std::string>& roomTag) {
    double weight = a.spawnWeight;
    if (!roomTag) {
        return weight;
    }

    const std::string& room = *roomTag;
    if (room == "lair" && (a.role == CombatRole::Brute || a.role == CombatRole::EliteBrute)) {
        weight += 1.0;
    }
    if (room == "event" && (a.role == CombatRole::Invoker || a.role == CombatRole::Support)) {
        weight += 0.7;
    }
    if (room == "graveyard" && a.HasTag("undead")) {
        weight += 1.5;
    }
    if (room == "sanctum" && a.HasTag("holy")) {
        weight += 1.5;
    }
    if (room == "lair" && a.HasTag("beast")) {
        weight += 1.0;
    }
    return weight;
}

// ============================================================================
// Candidate chains
// ============================================================================

EnemySelector::Candidates EnemySelector::FloorCandidates(int floor) const {
    const std::vector<FallbackStep<Candidates>> steps = {
        {"spawn range", [&] { return NonEmpty(m_registry.GetForFloor(floor)); }},
        {"tier band", [&] { return NonEmpty(m_registry.GetByTier(TierForFloor(floor))); }},
        {"full registry", [&] { return NonEmpty(m_registry.GetAll()); }},
    };

    auto candidates = FirstSuccess<Candidates>("archetype for floor " + std::to_string(floor), steps);
    if (!candidates) {
        throw EmptyRegistryError();
    }
    return *candidates;
}

const EnemyArchetype& EnemySelector::Draw(const Candidates& candidates, const std::vector<double>& weights) {
    const size_t index = PickWeightedIndex(m_random, weights);
    return *candidates[index];
}

std::vector<WeightedArchetype> EnemySelector::GetFloorCandidates(
    int floor, const std::optional<std::string>& roomTag) const {
    std::vector<WeightedArchetype> result;
    for (const auto* archetype : FloorCandidates(floor)) {
        result.push_back({archetype, RoomWeight(*archetype, roomTag)});
    }
    return result;
}

std::vector<WeightedPack> EnemySelector::GetPackCandidates(
    int floor, const std::optional<std::string>& roomTag) const {
    std::vector<WeightedPack> result;
    const int tier = TierForFloor(floor);

    for (const auto* pack : m_registry.GetPacksByTier(tier)) {
        const bool membersEligible = std::all_of(
            pack->memberArchIds.begin(), pack->memberArchIds.end(), [&](const std::string& id) {
                const auto* member = m_registry.Find(id);
                return member && member->IsEligibleForFloor(floor);
            });
        if (!membersEligible) {
            continue;
        }

        double weight = pack->weight;
        // Untagged packs also match untagged rooms
        if (pack->preferredRoomTag == roomTag) {
            weight += 1.0;
        }
        result.push_back({pack, weight});
    }
    return result;
}

// ============================================================================
// Choices
// ============================================================================

const EnemyArchetype& EnemySelector::ChooseArchetypeForFloor(int floor,
                                                             const std::optional<std::string>& roomTag) {
    const auto candidates = FloorCandidates(floor);

    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto* archetype : candidates) {
        weights.push_back(RoomWeight(*archetype, roomTag));
    }

    const auto& chosen = Draw(candidates, weights);
    GAME_LOG_TRACE("Floor {} room '{}': chose archetype '{}' from {} candidates",
                   floor, roomTag.value_or("none"), chosen.id, candidates.size());
    return chosen;
}

EnemyPackTemplate EnemySelector::ChoosePackForFloor(int floor, const std::optional<std::string>& roomTag) {
    const auto candidates = GetPackCandidates(floor, roomTag);

    if (candidates.empty()) {
        const auto& archetype = ChooseArchetypeForFloor(floor, roomTag);

        EnemyPackTemplate single;
        single.id = "_single_" + archetype.id;
        single.name = archetype.name;
        single.tier = archetype.tier;
        single.memberArchIds = {archetype.id};
        single.preferredRoomTag = roomTag;
        single.weight = 1.0;

        GAME_LOG_DEBUG("Floor {}: no eligible pack, using single '{}'", floor, archetype.id);
        return single;
    }

    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        weights.push_back(candidate.weight);
    }

    const auto& chosen = *candidates[PickWeightedIndex(m_random, weights)].pack;
    GAME_LOG_TRACE("Floor {} room '{}': chose pack '{}' from {} candidates",
                   floor, roomTag.value_or("none"), chosen.id, candidates.size());
    return chosen;
}

const EnemyArchetype& EnemySelector::ChooseArchetypeForPlayerLevel(int playerLevel,
                                                                   const std::vector<std::string>& preferredTags,
                                                                   const std::vector<std::string>& excludedTags) {
    auto allowed = [&](const EnemyArchetype& a) {
        return a.IsEligibleForFloor(playerLevel) && !HasAnyTag(a, excludedTags);
    };

    const std::vector<FallbackStep<Candidates>> steps = {
        {"preferred tags", [&]() -> std::optional<Candidates> {
            if (preferredTags.empty()) {
                return std::nullopt;
            }
            Candidates preferred;
            for (const auto* a : m_registry.GetAll()) {
                if (allowed(*a) && HasAnyTag(*a, preferredTags)) {
                    preferred.push_back(a);
                }
            }
            return NonEmpty(std::move(preferred));
        }},
        {"level range", [&]() {
            Candidates eligible;
            for (const auto* a : m_registry.GetAll()) {
                if (allowed(*a)) {
                    eligible.push_back(a);
                }
            }
            return NonEmpty(std::move(eligible));
        }},
        {"tier band", [&] { return NonEmpty(m_registry.GetByTier(TierForFloor(playerLevel))); }},
        {"full registry", [&] { return NonEmpty(m_registry.GetAll()); }},
    };

    auto candidates = FirstSuccess<Candidates>("archetype for level " + std::to_string(playerLevel), steps);
    if (!candidates) {
        throw EmptyRegistryError();
    }

    std::vector<double> weights;
    weights.reserve(candidates->size());
    for (const auto* archetype : *candidates) {
        weights.push_back(archetype->spawnWeight);
    }

    const auto& chosen = Draw(*candidates, weights);
    GAME_LOG_TRACE("Level {}: chose archetype '{}' from {} candidates",
                   playerLevel, chosen.id, candidates->size());
    return chosen;
}

// ============================================================================
// Difficulty helpers
// ============================================================================

std::pair<int, int> FloorToDifficultyRange(int floor, int spread) {
    const int base = 10 + (floor - 1) * 9;
    return {std::max(1, base - spread), std::min(100, base + spread)};
}

} // namespace Enemies
} // namespace Bestiary
