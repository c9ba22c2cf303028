#include "KeyProtocol.hpp"
#include "protocol/KeyGenerator.hpp"
#include "protocol/KeyAgreement.hpp"
#include "cipher/Cipher.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Random.hpp"
#include <iostream>

using nlohmann::json;

namespace keystone {

namespace {

// thrown inside dispatch for malformed requests; mapped to E2400 replies
struct ControlRejected {
    std::string detail;
};

json error_body(int code, const std::string& message) {
    return { {"code", code}, {"message", message} };
}

} // namespace

KeyProtocol::KeyProtocol(const KeyGenerator& gen)
: generator(gen) {}

json KeyProtocol::build_info_message() const {
    return {
        {"name", "keystone"},
        {"version", buildinfo::version()},
        {"git_commit", buildinfo::git_commit()},
        {"build_time", buildinfo::build_time_utc_approx()},
        {"config", generator.config().to_json()},
        {"methods", {"backend.info", "qkd.generate", "cipher.encrypt", "cipher.decrypt"}}
    };
}

json KeyProtocol::handle_rpc(const json& request) const {
    json reply = { {"type", "rpc_result"}, {"id", nullptr}, {"ok", false} };
    try {
        if (!request.is_object() || request.value("type", std::string{}) != "rpc") {
            throw ControlRejected{errors::D2400_INVALID_REQUEST};
        }
        if (!request.contains("id")) throw ControlRejected{errors::D2400_RPC_MISSING_ID};
        reply["id"] = request["id"];
        if (!request.contains("method") || !request["method"].is_string()) {
            throw ControlRejected{errors::D2400_RPC_MISSING_METHOD};
        }
        json params = request.value("params", json::object());
        if (!params.is_object()) throw ControlRejected{errors::D2400_PARAMS_NOT_OBJECT};

        reply["result"] = dispatch(request["method"].get<std::string>(), params);
        reply["ok"] = true;
    } catch (const ControlRejected& r) {
        reply["error"] = error_body(errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(r.detail));
    } catch (const errors::CatalogError& e) {
        reply["error"] = error_body(e.code(), e.what());
    } catch (const json::exception& e) {
        // type mismatch in params
        reply["error"] = error_body(errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(e.what()));
    } catch (const std::exception& e) {
        std::cerr << "KeyProtocol: unexpected error: " << e.what() << std::endl;
        reply["error"] = error_body(errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(e.what()));
    }
    return reply;
}

json KeyProtocol::dispatch(const std::string& method, const json& params) const {
    if (method == "backend.info") return build_info_message();
    if (method == "qkd.generate") return do_generate(params);
    if (method == "cipher.encrypt") return do_cipher(params, true);
    if (method == "cipher.decrypt") return do_cipher(params, false);
    throw ControlRejected{errors::D2400_RPC_UNKNOWN_METHOD};
}

json KeyProtocol::do_generate(const json& params) const {
    if (!params.contains("min_key_length")) throw ControlRejected{errors::D2400_MISSING_MIN_KEY_LENGTH};
    const int min_len = params.at("min_key_length").get<int>();
    const bool establish = params.value("establish", false);

    RandomSource rng(generator.config().seed);
    if (establish) {
        if (min_len <= 0) throw errors::invalid_argument(errors::D3000_KEY_LENGTH_NOT_POSITIVE);
        KeyAgreement agreement(generator, rng);
        auto outcome = agreement.establish(static_cast<std::size_t>(min_len));
        json r = { {"attempts", agreement.last_attempts()} };
        if (auto key = std::get_if<FinalKey>(&outcome)) {
            r["outcome"] = "key";
            r["key"] = key->bits;
            r["key_length"] = key->size();
        } else {
            const auto& failure = std::get<AgreementFailure>(outcome);
            r["outcome"] = "failed";
            r["code"] = failure.code;
            r["reason"] = failure.message;
        }
        return r;
    }

    auto run = generator.run(min_len, rng);
    json r = { {"report", run.report()} };
    if (auto key = std::get_if<FinalKey>(&run.outcome)) {
        r["outcome"] = "key";
        r["key"] = key->bits;
    } else {
        const auto& abort = std::get<AbortSignal>(run.outcome);
        std::cerr << "KeyProtocol: generation aborted: " << abort.reason << std::endl;
        r["outcome"] = "aborted";
        r["code"] = abort.code;
        r["reason"] = abort.reason;
    }
    return r;
}

json KeyProtocol::do_cipher(const json& params, bool encrypting) const {
    if (!params.contains("text")) throw ControlRejected{errors::D2400_MISSING_TEXT};
    if (!params.contains("key")) throw ControlRejected{errors::D2400_MISSING_KEY};
    const auto text = params.at("text").get<std::string>();
    const auto key = params.at("key").get<std::string>();
    return { {"text", encrypting ? cipher::encrypt(text, key) : cipher::decrypt(text, key)} };
}

} // namespace keystone
