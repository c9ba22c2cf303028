#include "protocol/KeyGenerator.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Random.hpp"
#include <iostream>
#include <limits>

using nlohmann::json;

namespace keystone {

std::string to_string(GeneratorState state) {
    switch (state) {
        case GeneratorState::Init: return "init";
        case GeneratorState::Encoded: return "encoded";
        case GeneratorState::Measured: return "measured";
        case GeneratorState::Sifted: return "sifted";
        case GeneratorState::Checked: return "checked";
        case GeneratorState::Success: return "success";
        case GeneratorState::Aborted: return "aborted";
    }
    return "unknown";
}

json GenerationRun::report() const {
    json j = {
        {"num_bits", num_bits},
        {"sifted_length", sifted.size()},
        {"prefix_length", check.prefix_length},
        {"mismatches", check.mismatches},
        {"error_rate", check.error_rate},
        {"state", to_string(state)}
    };
    if (auto key = std::get_if<FinalKey>(&outcome)) {
        j["outcome"] = "key";
        j["key_length"] = key->size();
    } else {
        const auto& abort = std::get<AbortSignal>(outcome);
        j["outcome"] = "aborted";
        j["key_length"] = 0;
        j["code"] = abort.code;
        j["reason"] = abort.reason;
    }
    return j;
}

KeyGenerator::KeyGenerator(ProtocolConfig cfg, std::shared_ptr<IQuantumChannel> channel)
: cfg_(std::move(cfg)), channel_(std::move(channel)) {
    cfg_.validate();
    if (!channel_) channel_ = std::make_shared<PassThroughChannel>();
}

std::size_t KeyGenerator::num_bits_for(int min_key_length) const {
    if (min_key_length <= 0) throw errors::invalid_argument(errors::D3000_KEY_LENGTH_NOT_POSITIVE);
    if (min_key_length > cfg_.max_key_length) {
        throw errors::invalid_argument(std::string(errors::D3000_KEY_LENGTH_TOO_LARGE) + " (" +
                                       std::to_string(min_key_length) + " > " + std::to_string(cfg_.max_key_length) + ")");
    }
    const auto factor = static_cast<std::size_t>(cfg_.oversampling_factor);
    const auto len = static_cast<std::size_t>(min_key_length);
    if (len > std::numeric_limits<std::size_t>::max() / factor) {
        throw errors::invalid_argument(errors::D3000_KEY_LENGTH_TOO_LARGE);
    }
    return len * factor;
}

KeyOutcome KeyGenerator::generate(int min_key_length) const {
    RandomSource rng(cfg_.seed);
    return generate(min_key_length, rng);
}

KeyOutcome KeyGenerator::generate(int min_key_length, RandomSource& rng) const {
    return run(min_key_length, rng).outcome;
}

GenerationRun KeyGenerator::run(int min_key_length, RandomSource& rng) const {
    GenerationRun r;
    r.num_bits = num_bits_for(min_key_length);

    Encoder encoder(rng);
    r.encoded = encoder.prepare(r.num_bits);
    r.state = GeneratorState::Encoded;

    auto delivered = channel_->transmit(r.encoded.qubits);
    if (delivered.size() != r.encoded.qubits.size()) {
        throw errors::invalid_argument("channel " + channel_->name() + " changed the qubit count");
    }
    Decoder decoder(rng, cfg_.measurement_mode);
    r.measured = decoder.measure_all(delivered);
    r.state = GeneratorState::Measured;

    r.sifted = Sifter::sift(r.encoded.bits, r.encoded.bases, r.measured.bits, r.measured.bases);
    r.state = GeneratorState::Sifted;

    EavesdropperCheck check(cfg_.check_fraction);
    r.check = check.run(r.sifted);
    r.state = GeneratorState::Checked;

    if (cfg_.log_stages) {
        std::cerr << "KeyGenerator: num_bits=" << r.num_bits
                  << " sifted=" << r.sifted.size()
                  << " disclosed=" << r.check.prefix_length
                  << " mismatches=" << r.check.mismatches
                  << " channel=" << channel_->name() << std::endl;
    }

    if (r.check.passed) {
        r.outcome = FinalKey{to_bit_string(r.check.final_key)};
        r.state = GeneratorState::Success;
    } else {
        r.outcome = AbortSignal{errors::E3100_EAVESDROPPER_DETECTED, errors::MSG_E3100_EAVESDROPPER_DETECTED};
        r.state = GeneratorState::Aborted;
    }
    return r;
}

} // namespace keystone
