#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace Bestiary {

/**
 * @brief Source of randomness injected into every generation routine
 *
 * Selection, elite rolls and enemy counts never touch a global engine;
 * they draw from the IRandomSource they were given so that a fixed seed
 * (or a mock in tests) reproduces the exact sequence of decisions.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Get a random double in range [0, 1)
     */
    virtual double Value() = 0;

    /**
     * @brief Get a random integer in range [min, max]
     */
    virtual int Range(int min, int max) = 0;

    /**
     * @brief Get a random double in range [min, max]
     */
    virtual double Range(double min, double max) = 0;

    /**
     * @brief Bernoulli trial, true with the given probability
     */
    bool Bool(double probability) { return Value() < probability; }
};

/**
 * @brief Seedable Mersenne Twister implementation of IRandomSource
 */
class Random final : public IRandomSource {
public:
    /**
     * @brief Create a generator seeded from std::random_device
     */
    Random();

    /**
     * @brief Create a generator with a fixed seed
     */
    explicit Random(std::uint32_t seed);

    /**
     * @brief Reseed the generator
     */
    void Seed(std::uint32_t seed);

    [[nodiscard]] std::uint32_t GetSeed() const { return m_seed; }

    double Value() override;
    int Range(int min, int max) override;
    double Range(double min, double max) override;

private:
    std::mt19937 m_engine;
    std::uint32_t m_seed = 0;
};

/**
 * @brief Weighted categorical draw
 *
 * Draws r = Value() * sum(weights) and returns the first index whose
 * cumulative weight exceeds r. Non-positive weights are never chosen
 * unless every weight is non-positive, in which case the draw is uniform.
 *
 * @throws std::invalid_argument if weights is empty
 */
[[nodiscard]] std::size_t PickWeightedIndex(IRandomSource& random,
                                            const std::vector<double>& weights);

} // namespace Bestiary
