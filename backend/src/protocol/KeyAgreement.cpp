#include "protocol/KeyAgreement.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Random.hpp"
#include <chrono>
#include <iostream>
#include <limits>

namespace keystone {

AgreementOutcome require_key_length(const KeyOutcome& outcome, std::size_t required) {
    if (auto abort = std::get_if<AbortSignal>(&outcome)) {
        return AgreementFailure{abort->code, abort->reason, 1};
    }
    const auto& key = std::get<FinalKey>(outcome);
    // an empty key is never usable, even when nothing was required
    if (key.empty() || key.size() < required) {
        return AgreementFailure{errors::E3110_INSUFFICIENT_SIFTED_BITS,
                                errors::format_E3110_insufficient_sifted_bits(key.size(), required), 1};
    }
    return key;
}

KeyAgreement::KeyAgreement(const KeyGenerator& generator, RandomSource& rng)
: generator_(generator), rng_(rng) {}

AgreementOutcome KeyAgreement::establish(std::size_t desired_length) {
    last_attempts_ = 0;
    if (desired_length == 0 || desired_length > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw errors::invalid_argument(errors::D3000_KEY_LENGTH_NOT_POSITIVE);
    }

    const auto& cfg = generator_.config();
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::chrono::milliseconds(cfg.deadline_ms);

    AgreementFailure last{errors::E3110_INSUFFICIENT_SIFTED_BITS,
                          errors::format_E3110_insufficient_sifted_bits(0, desired_length), 0};
    for (int attempt = 1; attempt <= cfg.max_attempts; ++attempt) {
        if (cfg.deadline_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "KeyAgreement: deadline of " << cfg.deadline_ms << " ms reached after "
                      << last_attempts_ << " attempt(s)" << std::endl;
            return AgreementFailure{errors::E3120_DEADLINE_EXCEEDED, errors::MSG_E3120_DEADLINE_EXCEEDED, last_attempts_};
        }
        last_attempts_ = attempt;

        auto checked = require_key_length(generator_.generate(static_cast<int>(desired_length), rng_), desired_length);
        if (auto key = std::get_if<FinalKey>(&checked)) {
            key->bits.resize(desired_length);
            return *key;
        }
        last = std::get<AgreementFailure>(checked);
        last.attempts = attempt;
        std::cerr << "KeyAgreement: attempt " << attempt << "/" << cfg.max_attempts
                  << " failed: " << last.message << std::endl;
    }
    return last;
}

} // namespace keystone
