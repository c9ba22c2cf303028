#include "protocol/Sifter.hpp"
#include "core/ErrorCatalog.hpp"

namespace keystone {

SiftedPair Sifter::sift(const BitSequence& sender_bits, const BasisSequence& sender_bases,
                        const BitSequence& receiver_bits, const BasisSequence& receiver_bases) {
    const std::size_t n = sender_bits.size();
    if (sender_bases.size() != n || receiver_bits.size() != n || receiver_bases.size() != n) {
        throw errors::invalid_argument(errors::D3000_SEQUENCE_LENGTH_MISMATCH);
    }

    SiftedPair out;
    for (std::size_t i = 0; i < n; ++i) {
        if (sender_bases[i] != receiver_bases[i]) continue;
        out.sender.push_back(sender_bits[i]);
        out.receiver.push_back(receiver_bits[i]);
        out.kept_indices.push_back(i);
    }
    return out;
}

} // namespace keystone
