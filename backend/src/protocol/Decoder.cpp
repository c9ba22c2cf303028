#include "protocol/Decoder.hpp"
#include "protocol/Measurement.hpp"
#include "core/Random.hpp"

namespace keystone {

Decoder::Decoder(RandomSource& rng, MeasurementMode mode)
: rng_(rng), mode_(mode) {}

MeasuredBatch Decoder::measure_all(const std::vector<QubitState>& qubits) {
    MeasuredBatch out;
    out.bases.resize(qubits.size());
    for (std::size_t i = 0; i < qubits.size(); ++i) out.bases[i] = rng_.bit() ? Basis::X : Basis::Z;

    Measurement meter(rng_, mode_);
    out.bits.reserve(qubits.size());
    for (std::size_t i = 0; i < qubits.size(); ++i) {
        out.bits.push_back(meter.measure(qubits[i], out.bases[i]));
    }
    return out;
}

} // namespace keystone
