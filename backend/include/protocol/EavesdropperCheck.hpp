#pragma once
#include "protocol/Sifter.hpp"

namespace keystone {

struct CheckResult {
    bool passed = false;
    std::size_t prefix_length = 0;
    std::size_t mismatches = 0;
    double error_rate = 0.0;  // mismatches / prefix_length, 0 for an empty prefix
    BitSequence final_key;    // sender suffix; empty unless passed
};

/**
 * @brief Discloses the first floor(L * fraction) sifted bits of both parties and compares them.
 *
 * Any disagreement fails the whole attempt. On success the undisclosed suffix of the
 * sender's sifted key is the final key; an empty sifted key passes with an empty key.
 */
class EavesdropperCheck {
public:
    explicit EavesdropperCheck(double check_fraction = 0.5);

    std::size_t prefix_length(std::size_t sifted_length) const;
    CheckResult run(const SiftedPair& sifted) const;

private:
    double fraction_;
};

} // namespace keystone
