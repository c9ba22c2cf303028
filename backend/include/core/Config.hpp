#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace keystone {

enum class MeasurementMode {
    Direct,      // probabilistic rule
    StateVector  // QubitModel projective measurement
};

std::string to_string(MeasurementMode mode);
// throws errors::CatalogError (E3000) for unknown names
MeasurementMode measurement_mode_from_string(const std::string& name);

struct ProtocolConfig {
    int oversampling_factor = 4;
    double check_fraction = 0.5;
    MeasurementMode measurement_mode = MeasurementMode::Direct;
    uint64_t seed = 0; // 0: nondeterministic
    int max_key_length = 1 << 20;
    int max_attempts = 16;
    int64_t deadline_ms = 0; // 0: no deadline
    bool log_stages = false;

    // throws errors::CatalogError (E3000) on the first invalid field
    void validate() const;

    nlohmann::json to_json() const;
    // start from defaults, overlay known keys from j, then validate
    static ProtocolConfig from_json(const nlohmann::json& j);
};

// Decimal seed from the command line; throws errors::CatalogError (E3000) for negative or non-numeric text.
uint64_t parse_seed(const std::string& text);

// Load a JSON config file; throws errors::CatalogError when the file is missing or invalid.
ProtocolConfig load_config_file(const std::string& path);

// Path from KEYSTONE_CONFIG, or empty when unset.
std::string resolve_config_path();

} // namespace keystone
