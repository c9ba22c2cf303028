#pragma once
#include <string>

namespace keystone::cipher {

// UTF-8 <-> code points. Malformed input throws errors::CatalogError (E3220).
std::u32string decode_utf8(const std::string& text);
std::string encode_utf8(const std::u32string& code_points);

// Each character (code point 0-255) becomes 8 '0'/'1' digits, most significant bit first.
// Throws errors::CatalogError (E3200) for a code point above 255.
std::string text_to_binary(const std::string& text);

// Inverse of text_to_binary; `bits` length must be a multiple of 8.
std::string binary_to_text(const std::string& bits);

} // namespace keystone::cipher
