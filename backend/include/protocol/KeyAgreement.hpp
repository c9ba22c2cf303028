#pragma once
#include "protocol/KeyGenerator.hpp"
#include <cstddef>
#include <string>
#include <variant>

namespace keystone {

class RandomSource;

struct AgreementFailure {
    int code = 0;       // errors::E3100 / E3110 / E3120
    std::string message;
    int attempts = 0;
};

using AgreementOutcome = std::variant<FinalKey, AgreementFailure>;

// Single-shot usability check: an aborted run, or a key shorter than `required`
// (including an empty key), becomes a failure.
AgreementOutcome require_key_length(const KeyOutcome& outcome, std::size_t required);

/**
 * @brief Caller-side loop around KeyGenerator for a key of a guaranteed length.
 *
 * Re-runs generation until a key of at least `desired_length` bits arrives, bounded by
 * config().max_attempts and, when non-zero, config().deadline_ms. The returned key is
 * truncated to exactly `desired_length` bits.
 */
class KeyAgreement {
public:
    KeyAgreement(const KeyGenerator& generator, RandomSource& rng);

    AgreementOutcome establish(std::size_t desired_length);

    // attempts used by the last establish() call
    int last_attempts() const { return last_attempts_; }

private:
    const KeyGenerator& generator_;
    RandomSource& rng_;
    int last_attempts_ = 0;
};

} // namespace keystone
