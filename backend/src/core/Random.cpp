#include "core/Random.hpp"

namespace keystone {

RandomSource::RandomSource(uint64_t seed)
: seed_(seed) {
    if (seed == 0) {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        rng_.seed(seq);
    } else {
        rng_.seed(seed);
    }
}

int RandomSource::bit() {
    return bit_dist_(rng_);
}

} // namespace keystone
