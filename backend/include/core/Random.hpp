#pragma once
#include <cstdint>
#include <random>

namespace keystone {

/**
 * @brief Randomness source handed to every stage that draws bits or bases.
 *
 * A seed of 0 seeds from std::random_device; any other seed gives a reproducible stream.
 * Not thread-safe: give each thread (or each generate call) its own instance.
 */
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 0);

    // uniform 0/1
    int bit();

    uint64_t seed() const { return seed_; }
    std::mt19937_64& engine() { return rng_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<int> bit_dist_{0, 1};
};

} // namespace keystone
