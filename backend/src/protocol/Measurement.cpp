#include "protocol/Measurement.hpp"
#include "core/Random.hpp"
#include "simulator/qubit_sim.hpp"

namespace keystone {

Measurement::Measurement(RandomSource& rng, MeasurementMode mode)
: rng_(rng), mode_(mode) {}

Bit Measurement::measure(const QubitState& qubit, Basis measured_basis) {
    if (mode_ == MeasurementMode::StateVector) return measure_state_vector(qubit, measured_basis);
    return measure_direct(qubit, measured_basis);
}

Bit Measurement::measure_direct(const QubitState& qubit, Basis measured_basis) {
    if (measured_basis == qubit.basis()) return qubit.bit();
    return static_cast<Bit>(rng_.bit());
}

Bit Measurement::measure_state_vector(const QubitState& qubit, Basis measured_basis) {
    QubitModel q(1);
    // prepare: |0> -> |bit> -> H|bit> for the diagonal basis
    if (qubit.bit()) q.apply_gate(0, gates::pauli_x());
    if (qubit.basis() == Basis::X) q.apply_gate(0, gates::hadamard());
    // rotate the measurement basis onto the computational one
    if (measured_basis == Basis::X) q.apply_gate(0, gates::hadamard());
    return static_cast<Bit>(q.measure(0, rng_.engine()));
}

} // namespace keystone
