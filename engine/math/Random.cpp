#include "math/Random.hpp"
#include <stdexcept>
#include <utility>

namespace Bestiary {

Random::Random()
    : Random(std::random_device{}()) {
}

Random::Random(std::uint32_t seed)
    : m_engine(seed)
    , m_seed(seed) {
}

void Random::Seed(std::uint32_t seed) {
    m_seed = seed;
    m_engine.seed(seed);
}

double Random::Value() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_engine);
}

int Random::Range(int min, int max) {
    if (max < min) {
        std::swap(min, max);
    }
    std::uniform_int_distribution<int> dist(min, max);
    return dist(m_engine);
}

double Random::Range(double min, double max) {
    if (max < min) {
        std::swap(min, max);
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(m_engine);
}

std::size_t PickWeightedIndex(IRandomSource& random, const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("PickWeightedIndex: no candidates to choose from");
    }

    double total = 0.0;
    for (double w : weights) {
        if (w > 0.0) {
            total += w;
        }
    }

    if (total <= 0.0) {
        return static_cast<std::size_t>(random.Range(0, static_cast<int>(weights.size()) - 1));
    }

    const double roll = random.Value() * total;
    double cumulative = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) {
            continue;
        }
        cumulative += weights[i];
        if (roll < cumulative) {
            return i;
        }
    }

    // Floating point slack: fall back to the last positive weight
    for (std::size_t i = weights.size(); i-- > 0;) {
        if (weights[i] > 0.0) {
            return i;
        }
    }
    return weights.size() - 1;
}

} // namespace Bestiary
