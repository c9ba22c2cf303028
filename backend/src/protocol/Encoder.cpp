#include "protocol/Encoder.hpp"
#include "core/Random.hpp"

namespace keystone {

Encoder::Encoder(RandomSource& rng)
: rng_(rng) {}

EncodedBatch Encoder::prepare(std::size_t num_bits) {
    EncodedBatch batch;
    batch.bits.resize(num_bits);
    batch.bases.resize(num_bits);
    for (std::size_t i = 0; i < num_bits; ++i) batch.bits[i] = static_cast<Bit>(rng_.bit());
    for (std::size_t i = 0; i < num_bits; ++i) batch.bases[i] = rng_.bit() ? Basis::X : Basis::Z;

    batch.qubits.reserve(num_bits);
    for (std::size_t i = 0; i < num_bits; ++i) {
        batch.qubits.emplace_back(batch.bases[i], batch.bits[i]);
    }
    return batch;
}

} // namespace keystone
