#pragma once
#include <cstddef>
#include <string>

namespace keystone::cipher {

// Throws errors::CatalogError (E3210) unless key is non-empty and only '0'/'1'.
void validate_key(const std::string& key);

// Self-concatenate `key` until it covers `length` digits, then cut to exactly `length`.
std::string stretch_key(const std::string& key, std::size_t length);

// Digit-wise XOR of two equal-length '0'/'1' strings.
std::string xor_bits(const std::string& a, const std::string& b);

/**
 * @brief XOR `text` against the stretched binary key.
 *
 * Text is UTF-8; every character must be a code point in 0-255 (E3200 otherwise).
 * The result is UTF-8 text whose characters are again in 0-255.
 */
std::string encrypt(const std::string& text, const std::string& key);

// Same transform as encrypt; XOR is its own inverse.
std::string decrypt(const std::string& text, const std::string& key);

} // namespace keystone::cipher
