#pragma once
#include <vector>
#include <complex>
#include <random>

namespace keystone {

using cplx = std::complex<double>;
using GateMatrix = std::vector<std::vector<cplx>>;

namespace gates {
// Pauli-X (bit flip)
const GateMatrix& pauli_x();
// Hadamard: Z basis <-> X basis
const GateMatrix& hadamard();
} // namespace gates

/**
 * @brief Dense state-vector model of n qubits, initialised to |0...0>.
 *
 * Qubit k is bit k of the basis-state index.
 */
class QubitModel {
public:
    explicit QubitModel(int n);

    // Apply a single-qubit gate (2x2 matrix)
    void apply_gate(int qubit, const GateMatrix& matrix);

    // Measure a qubit in the computational basis, returns 0 or 1 and collapses the state.
    // An outcome with zero amplitude is never returned.
    int measure(int qubit, std::mt19937_64& rng);

    // Probability of reading 1 on `qubit` without collapsing
    double probability_one(int qubit) const;

    // Access full state vector
    const std::vector<cplx>& state_vector() const;

private:
    void check_qubit(int qubit) const;

    int n_qubits;
    std::vector<cplx> state;
};

} // namespace keystone
