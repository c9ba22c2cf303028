#pragma once
#include "protocol/Encoder.hpp"
#include "protocol/Decoder.hpp"
#include "protocol/Sifter.hpp"
#include "protocol/EavesdropperCheck.hpp"
#include "protocol/QuantumChannel.hpp"
#include "core/Config.hpp"
#include <memory>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace keystone {

class RandomSource;

enum class GeneratorState {
    Init,
    Encoded,
    Measured,
    Sifted,
    Checked,
    Success,
    Aborted
};

std::string to_string(GeneratorState state);

/// Shared secret produced by a successful run, as '0'/'1' characters.
struct FinalKey {
    std::string bits;

    std::size_t size() const { return bits.size(); }
    bool empty() const { return bits.empty(); }
};

/// Failure value of a run; `code` is an errors::E* constant.
struct AbortSignal {
    int code = 0;
    std::string reason;
};

using KeyOutcome = std::variant<FinalKey, AbortSignal>;

inline bool has_key(const KeyOutcome& o) { return std::holds_alternative<FinalKey>(o); }

// Every intermediate artifact of one run, for inspection and reporting.
struct GenerationRun {
    std::size_t num_bits = 0;
    EncodedBatch encoded;
    MeasuredBatch measured;
    SiftedPair sifted;
    CheckResult check;
    GeneratorState state = GeneratorState::Init;
    KeyOutcome outcome;

    // summary without key material
    nlohmann::json report() const;
};

/**
 * @brief Runs one BB84 attempt: Encoder -> channel -> Decoder -> Sifter -> EavesdropperCheck.
 *
 * Holds only configuration, so concurrent generate() calls are safe as long as each
 * call gets its own RandomSource. No retries; see KeyAgreement for that.
 */
class KeyGenerator {
public:
    explicit KeyGenerator(ProtocolConfig cfg = {}, std::shared_ptr<IQuantumChannel> channel = nullptr);

    // fresh RandomSource seeded from config().seed
    KeyOutcome generate(int min_key_length) const;
    KeyOutcome generate(int min_key_length, RandomSource& rng) const;
    GenerationRun run(int min_key_length, RandomSource& rng) const;

    // throws errors::CatalogError (E3000) unless 0 < min_key_length <= config().max_key_length
    std::size_t num_bits_for(int min_key_length) const;

    const ProtocolConfig& config() const { return cfg_; }

private:
    ProtocolConfig cfg_;
    std::shared_ptr<IQuantumChannel> channel_;
};

} // namespace keystone
