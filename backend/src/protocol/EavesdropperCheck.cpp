#include "protocol/EavesdropperCheck.hpp"
#include "core/ErrorCatalog.hpp"
#include <cmath>
#include <cstddef>

namespace keystone {

EavesdropperCheck::EavesdropperCheck(double check_fraction)
: fraction_(check_fraction) {
    if (!std::isfinite(check_fraction) || check_fraction < 0.0 || check_fraction >= 1.0) {
        throw errors::invalid_argument(errors::D3000_CHECK_FRACTION_INVALID);
    }
}

std::size_t EavesdropperCheck::prefix_length(std::size_t sifted_length) const {
    auto n = static_cast<std::size_t>(std::floor(static_cast<double>(sifted_length) * fraction_));
    return n > sifted_length ? sifted_length : n;
}

CheckResult EavesdropperCheck::run(const SiftedPair& sifted) const {
    if (sifted.sender.size() != sifted.receiver.size()) {
        throw errors::invalid_argument(errors::D3000_SEQUENCE_LENGTH_MISMATCH);
    }

    CheckResult r;
    const std::size_t len = sifted.size();
    r.prefix_length = prefix_length(len);
    for (std::size_t i = 0; i < r.prefix_length; ++i) {
        if (sifted.sender[i] != sifted.receiver[i]) ++r.mismatches;
    }
    r.error_rate = r.prefix_length ? static_cast<double>(r.mismatches) / r.prefix_length : 0.0;
    r.passed = r.mismatches == 0;
    if (r.passed) {
        r.final_key.assign(sifted.sender.begin() + static_cast<std::ptrdiff_t>(r.prefix_length), sifted.sender.end());
    }
    return r;
}

} // namespace keystone
