#pragma once
#include "protocol/QubitState.hpp"
#include <string>
#include <vector>

namespace keystone {

/**
 * @brief Transport between the sender's preparation and the receiver's measurement.
 *
 * The product ships only the lossless pass-through; tests substitute other channels
 * to drive the abort branch of the eavesdropper check.
 */
class IQuantumChannel {
public:
    virtual ~IQuantumChannel() = default;
    /** @brief Channel name (for logging) */
    virtual std::string name() const = 0;
    /** @brief Deliver the prepared qubits; the result must have the same length */
    virtual std::vector<QubitState> transmit(const std::vector<QubitState>& qubits) = 0;
};

class PassThroughChannel : public IQuantumChannel {
public:
    std::string name() const override { return "pass_through"; }
    std::vector<QubitState> transmit(const std::vector<QubitState>& qubits) override { return qubits; }
};

} // namespace keystone
