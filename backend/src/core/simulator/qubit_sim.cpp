#include "simulator/qubit_sim.hpp"
#include "core/ErrorCatalog.hpp"
#include <cmath>

namespace keystone {

namespace gates {

const GateMatrix& pauli_x() {
    static const GateMatrix m = {
        {cplx(0.0), cplx(1.0)},
        {cplx(1.0), cplx(0.0)}
    };
    return m;
}

const GateMatrix& hadamard() {
    static const double s = 1.0 / std::sqrt(2.0);
    static const GateMatrix m = {
        {cplx(s), cplx(s)},
        {cplx(s), cplx(-s)}
    };
    return m;
}

} // namespace gates

QubitModel::QubitModel(int n)
: n_qubits(n) {
    if (n < 1 || n > 20) throw errors::invalid_argument("qubit count must be in [1, 20]");
    state.assign(std::size_t(1) << n, cplx(0.0));
    state[0] = cplx(1.0);
}

void QubitModel::check_qubit(int qubit) const {
    if (qubit < 0 || qubit >= n_qubits) throw errors::invalid_argument("qubit index out of range");
}

void QubitModel::apply_gate(int qubit, const GateMatrix& matrix) {
    check_qubit(qubit);
    if (matrix.size() != 2 || matrix[0].size() != 2 || matrix[1].size() != 2) {
        throw errors::invalid_argument("single-qubit gate must be 2x2");
    }
    const std::size_t mask = std::size_t(1) << qubit;
    for (std::size_t i = 0; i < state.size(); ++i) {
        if (i & mask) continue;
        const std::size_t j = i | mask;
        const cplx a0 = state[i];
        const cplx a1 = state[j];
        state[i] = matrix[0][0] * a0 + matrix[0][1] * a1;
        state[j] = matrix[1][0] * a0 + matrix[1][1] * a1;
    }
}

double QubitModel::probability_one(int qubit) const {
    check_qubit(qubit);
    const std::size_t mask = std::size_t(1) << qubit;
    double p0 = 0.0, p1 = 0.0;
    for (std::size_t i = 0; i < state.size(); ++i) {
        if (i & mask) p1 += std::norm(state[i]);
        else p0 += std::norm(state[i]);
    }
    const double total = p0 + p1;
    if (total <= 0.0) return 0.0;
    return p1 / total;
}

int QubitModel::measure(int qubit, std::mt19937_64& rng) {
    const double p1 = probability_one(qubit);
    int outcome;
    // exact 0 and 1 short-circuit so a prepared eigenstate always reads back unchanged
    if (p1 <= 0.0) outcome = 0;
    else if (p1 >= 1.0) outcome = 1;
    else outcome = std::uniform_real_distribution<double>(0.0, 1.0)(rng) < p1 ? 1 : 0;

    // collapse and renormalise
    const std::size_t mask = std::size_t(1) << qubit;
    double kept = 0.0;
    for (std::size_t i = 0; i < state.size(); ++i) {
        const bool one = (i & mask) != 0;
        if (one != (outcome == 1)) state[i] = cplx(0.0);
        else kept += std::norm(state[i]);
    }
    const double scale = kept > 0.0 ? 1.0 / std::sqrt(kept) : 1.0;
    for (auto& a : state) a *= scale;
    return outcome;
}

const std::vector<cplx>& QubitModel::state_vector() const {
    return state;
}

} // namespace keystone
