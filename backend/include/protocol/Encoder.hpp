#pragma once
#include "protocol/QubitState.hpp"
#include <cstddef>

namespace keystone {

class RandomSource;

struct EncodedBatch {
    BitSequence bits;     // RawKey (sender)
    BasisSequence bases;  // preparation bases
    std::vector<QubitState> qubits;
};

// Sender side: draws a raw key and preparation bases, then prepares one qubit per bit.
class Encoder {
public:
    explicit Encoder(RandomSource& rng);

    EncodedBatch prepare(std::size_t num_bits);

private:
    RandomSource& rng_;
};

} // namespace keystone
