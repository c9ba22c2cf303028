#pragma once
#include "protocol/QubitState.hpp"
#include "core/Config.hpp"

namespace keystone {

class RandomSource;

struct MeasuredBatch {
    BitSequence bits;     // RawKey (receiver)
    BasisSequence bases;  // measurement bases
};

// Receiver side: picks a basis per qubit, independent of the sender, and measures.
class Decoder {
public:
    explicit Decoder(RandomSource& rng, MeasurementMode mode = MeasurementMode::Direct);

    MeasuredBatch measure_all(const std::vector<QubitState>& qubits);

private:
    RandomSource& rng_;
    MeasurementMode mode_;
};

} // namespace keystone
