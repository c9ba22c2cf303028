#pragma once
#include "protocol/QubitState.hpp"
#include <cstddef>

namespace keystone {

struct SiftedPair {
    BitSequence sender;
    BitSequence receiver;
    // original positions kept, ascending
    std::vector<std::size_t> kept_indices;

    std::size_t size() const { return sender.size(); }
};

class Sifter {
public:
    // Keeps position i iff both parties used the same basis there.
    // All four sequences must share one length, otherwise errors::CatalogError (E3000).
    static SiftedPair sift(const BitSequence& sender_bits, const BasisSequence& sender_bases,
                           const BitSequence& receiver_bits, const BasisSequence& receiver_bases);
};

} // namespace keystone
