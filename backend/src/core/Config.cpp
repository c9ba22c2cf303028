#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace keystone {

std::string to_string(MeasurementMode mode) {
    switch (mode) {
        case MeasurementMode::Direct: return "direct";
        case MeasurementMode::StateVector: return "state_vector";
    }
    return "direct";
}

MeasurementMode measurement_mode_from_string(const std::string& name) {
    if (name == "direct") return MeasurementMode::Direct;
    if (name == "state_vector") return MeasurementMode::StateVector;
    throw errors::invalid_argument(std::string(errors::D3000_UNKNOWN_MEASUREMENT_MODE) + ": " + name);
}

void ProtocolConfig::validate() const {
    if (oversampling_factor < 1) throw errors::invalid_argument(errors::D3000_OVERSAMPLING_INVALID);
    if (!std::isfinite(check_fraction) || check_fraction < 0.0 || check_fraction >= 1.0) {
        throw errors::invalid_argument(errors::D3000_CHECK_FRACTION_INVALID);
    }
    if (max_key_length < 1) throw errors::invalid_argument(errors::D3000_MAX_KEY_LENGTH_INVALID);
    if (max_attempts < 1) throw errors::invalid_argument(errors::D3000_MAX_ATTEMPTS_INVALID);
    if (deadline_ms < 0) throw errors::invalid_argument(errors::D3000_DEADLINE_INVALID);
}

json ProtocolConfig::to_json() const {
    return {
        {"oversampling_factor", oversampling_factor},
        {"check_fraction", check_fraction},
        {"measurement_mode", to_string(measurement_mode)},
        {"seed", seed},
        {"max_key_length", max_key_length},
        {"max_attempts", max_attempts},
        {"deadline_ms", deadline_ms},
        {"log_stages", log_stages}
    };
}

ProtocolConfig ProtocolConfig::from_json(const json& j) {
    if (!j.is_object()) throw errors::invalid_argument(errors::D3000_CONFIG_NOT_OBJECT);

    ProtocolConfig cfg;
    try {
        cfg.oversampling_factor = j.value("oversampling_factor", cfg.oversampling_factor);
        cfg.check_fraction = j.value("check_fraction", cfg.check_fraction);
        if (j.contains("measurement_mode")) {
            cfg.measurement_mode = measurement_mode_from_string(j.at("measurement_mode").get<std::string>());
        }
        if (j.contains("seed")) {
            const auto& s = j.at("seed");
            // negative integers would wrap around in get<uint64_t>()
            if (!s.is_number_integer() || (!s.is_number_unsigned() && s.get<int64_t>() < 0)) {
                throw errors::invalid_argument(errors::D3000_SEED_INVALID);
            }
            cfg.seed = s.get<uint64_t>();
        }
        cfg.max_key_length = j.value("max_key_length", cfg.max_key_length);
        cfg.max_attempts = j.value("max_attempts", cfg.max_attempts);
        cfg.deadline_ms = j.value("deadline_ms", cfg.deadline_ms);
        cfg.log_stages = j.value("log_stages", cfg.log_stages);
    } catch (const json::exception& e) {
        // wrong value types surface as type_error from nlohmann
        throw errors::invalid_argument(e.what());
    }
    cfg.validate();
    return cfg;
}

uint64_t parse_seed(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw errors::invalid_argument(std::string(errors::D3000_SEED_INVALID) + ": " + text);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw errors::invalid_argument(std::string(errors::D3000_SEED_INVALID) + ": " + text);
    }
}

ProtocolConfig load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw errors::invalid_argument(std::string(errors::D3000_CONFIG_OPEN_FAILED) + ": " + path);
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw errors::invalid_argument(path + ": " + e.what());
    }
    return ProtocolConfig::from_json(j);
}

std::string resolve_config_path() {
    const char* env = std::getenv("KEYSTONE_CONFIG");
    if (env && *env) return std::string(env);
    return {};
}

} // namespace keystone
