#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace keystone {

using Bit = uint8_t; // 0 or 1

enum class Basis : uint8_t {
    Z = 0, // rectilinear
    X = 1  // diagonal
};

using BitSequence = std::vector<Bit>;
using BasisSequence = std::vector<Basis>;

/**
 * @brief One simulated qubit: the bit encoded and the basis it was prepared in.
 *
 * Immutable once created; lives only for one simulated transmission.
 */
class QubitState {
public:
    QubitState(Basis basis, Bit bit) : basis_(basis), bit_(bit & 1) {}

    Basis basis() const { return basis_; }
    Bit bit() const { return bit_; }

private:
    Basis basis_;
    Bit bit_;
};

inline char basis_symbol(Basis b) { return b == Basis::Z ? 'Z' : 'X'; }

// "0110..." rendering used for FinalKey and diagnostics
inline std::string to_bit_string(const BitSequence& bits) {
    std::string out;
    out.reserve(bits.size());
    for (auto b : bits) out.push_back(b ? '1' : '0');
    return out;
}

} // namespace keystone
