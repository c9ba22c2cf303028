#include "cipher/Cipher.hpp"
#include "cipher/TextCodec.hpp"
#include "core/ErrorCatalog.hpp"

namespace keystone::cipher {

void validate_key(const std::string& key) {
    if (key.empty()) {
        throw errors::CatalogError(errors::E3210_INVALID_KEY_MATERIAL, errors::format_E3210_invalid_key(errors::D3210_EMPTY_KEY));
    }
    for (char c : key) {
        if (c != '0' && c != '1') {
            throw errors::CatalogError(errors::E3210_INVALID_KEY_MATERIAL, errors::format_E3210_invalid_key(errors::D3210_NON_BINARY_KEY));
        }
    }
}

std::string stretch_key(const std::string& key, std::size_t length) {
    validate_key(key);
    std::string stretched = key;
    while (stretched.size() < length) stretched += key;
    stretched.resize(length);
    return stretched;
}

std::string xor_bits(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) throw errors::invalid_argument("xor operands differ in length");
    std::string out(a.size(), '0');
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) out[i] = '1';
    }
    return out;
}

std::string encrypt(const std::string& text, const std::string& key) {
    validate_key(key);
    const std::string bits = text_to_binary(text);
    return binary_to_text(xor_bits(bits, stretch_key(key, bits.size())));
}

std::string decrypt(const std::string& text, const std::string& key) {
    return encrypt(text, key);
}

} // namespace keystone::cipher
