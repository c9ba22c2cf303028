#pragma once

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keystone::errors {

// 2400-2499: WebSocket / control channel errors
// 3000-3099: argument and configuration errors
// 3100-3199: key generation outcomes
// 3200-3299: cipher input errors

inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E3000_INVALID_ARGUMENT = 3000;
inline constexpr int E3100_EAVESDROPPER_DETECTED = 3100;
inline constexpr int E3110_INSUFFICIENT_SIFTED_BITS = 3110;
inline constexpr int E3120_DEADLINE_EXCEEDED = 3120;
inline constexpr int E3200_OUT_OF_RANGE_CHARACTER = 3200;
inline constexpr int E3210_INVALID_KEY_MATERIAL = 3210;
inline constexpr int E3220_MALFORMED_TEXT = 3220;

inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E3000_INVALID_ARGUMENT_PREFIX = "Error 3000: Invalid argument: ";
// Text surfaced to callers when the disclosed prefix disagrees.
inline constexpr const char* MSG_E3100_EAVESDROPPER_DETECTED = "There was an eavesdropper!";
inline constexpr const char* MSG_E3110_INSUFFICIENT_SIFTED_BITS_PREFIX = "Error 3110: Insufficient sifted bits: ";
inline constexpr const char* MSG_E3120_DEADLINE_EXCEEDED = "Error 3120: Key agreement deadline exceeded";
inline constexpr const char* MSG_E3200_OUT_OF_RANGE_CHARACTER_PREFIX = "Error 3200: Character out of range (code point > 255): ";
inline constexpr const char* MSG_E3210_INVALID_KEY_MATERIAL_PREFIX = "Error 3210: Invalid key material: ";
inline constexpr const char* MSG_E3220_MALFORMED_TEXT_PREFIX = "Error 3220: Malformed UTF-8 text: ";

// Common, catalogued detail strings for E2400.
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_PARAMS_NOT_OBJECT = "params must be object";
inline constexpr const char* D2400_MISSING_MIN_KEY_LENGTH = "missing params.min_key_length";
inline constexpr const char* D2400_MISSING_TEXT = "missing params.text";
inline constexpr const char* D2400_MISSING_KEY = "missing params.key";

// Details for E3000.
inline constexpr const char* D3000_KEY_LENGTH_NOT_POSITIVE = "min_key_length must be > 0";
inline constexpr const char* D3000_OVERSAMPLING_INVALID = "oversampling_factor must be >= 1";
inline constexpr const char* D3000_CHECK_FRACTION_INVALID = "check_fraction must be in [0, 1)";
inline constexpr const char* D3000_UNKNOWN_MEASUREMENT_MODE = "unknown measurement_mode";
inline constexpr const char* D3000_KEY_LENGTH_TOO_LARGE = "min_key_length exceeds max_key_length";
inline constexpr const char* D3000_MAX_KEY_LENGTH_INVALID = "max_key_length must be >= 1";
inline constexpr const char* D3000_SEED_INVALID = "seed must be a non-negative integer";
inline constexpr const char* D3000_MAX_ATTEMPTS_INVALID = "max_attempts must be >= 1";
inline constexpr const char* D3000_DEADLINE_INVALID = "deadline_ms must be >= 0";
inline constexpr const char* D3000_CONFIG_NOT_OBJECT = "configuration must be a JSON object";
inline constexpr const char* D3000_CONFIG_OPEN_FAILED = "unable to open configuration file";
inline constexpr const char* D3000_SEQUENCE_LENGTH_MISMATCH = "bit and basis sequences differ in length";

// Details for E3210.
inline constexpr const char* D3210_EMPTY_KEY = "key is empty";
inline constexpr const char* D3210_NON_BINARY_KEY = "key must contain only '0' and '1'";

/// Exception type for catalogued failures; `code()` is one of the E* constants.
class CatalogError : public std::runtime_error {
public:
    CatalogError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

inline std::string with_detail(const char* prefix, std::string_view detail, const char* fallback) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    if (detail.empty()) {
        out.append(fallback);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline std::string format_E2400_control_rejected(std::string_view detail) {
    return with_detail(MSG_E2400_CONTROL_REJECTED_PREFIX, detail, D2400_INVALID_REQUEST);
}

inline std::string format_E3000_invalid_argument(std::string_view detail) {
    return with_detail(MSG_E3000_INVALID_ARGUMENT_PREFIX, detail, "unspecified");
}

inline std::string format_E3110_insufficient_sifted_bits(std::size_t got, std::size_t required) {
    return std::string(MSG_E3110_INSUFFICIENT_SIFTED_BITS_PREFIX) + "got " + std::to_string(got) +
           " bits, need " + std::to_string(required);
}

inline std::string format_E3200_out_of_range(char32_t code_point, std::size_t position) {
    std::ostringstream os;
    os << MSG_E3200_OUT_OF_RANGE_CHARACTER_PREFIX << "U+" << std::uppercase << std::hex << std::setw(4)
       << std::setfill('0') << static_cast<unsigned long>(code_point) << std::dec << " at position " << position;
    return os.str();
}

inline std::string format_E3210_invalid_key(std::string_view detail) {
    return with_detail(MSG_E3210_INVALID_KEY_MATERIAL_PREFIX, detail, D3210_EMPTY_KEY);
}

inline std::string format_E3220_malformed_text(std::size_t byte_offset) {
    return std::string(MSG_E3220_MALFORMED_TEXT_PREFIX) + "invalid sequence at byte " + std::to_string(byte_offset);
}

inline CatalogError invalid_argument(std::string_view detail) {
    return CatalogError(E3000_INVALID_ARGUMENT, format_E3000_invalid_argument(detail));
}

} // namespace keystone::errors
