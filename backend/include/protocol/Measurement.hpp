#pragma once
#include "protocol/QubitState.hpp"
#include "core/Config.hpp"

namespace keystone {

class RandomSource;

/**
 * @brief Reads a classical bit out of a prepared qubit.
 *
 * Measuring in the preparation basis returns the encoded bit with certainty.
 * Measuring in the other basis returns a fair coin flip, independent of the encoded bit.
 * Both modes follow these statistics; StateVector gets there through QubitModel.
 */
class Measurement {
public:
    explicit Measurement(RandomSource& rng, MeasurementMode mode = MeasurementMode::Direct);

    Bit measure(const QubitState& qubit, Basis measured_basis);

    MeasurementMode mode() const { return mode_; }

private:
    Bit measure_direct(const QubitState& qubit, Basis measured_basis);
    Bit measure_state_vector(const QubitState& qubit, Basis measured_basis);

    RandomSource& rng_;
    MeasurementMode mode_;
};

} // namespace keystone
