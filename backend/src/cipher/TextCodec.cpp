#include "cipher/TextCodec.hpp"
#include "core/ErrorCatalog.hpp"

namespace keystone::cipher {

std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra;
        char32_t cp;
        if (lead < 0x80) { cp = lead; extra = 0; }
        else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
        else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
        else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
        else throw errors::CatalogError(errors::E3220_MALFORMED_TEXT, errors::format_E3220_malformed_text(i));

        if (extra > 0 && i + extra >= text.size()) {
            throw errors::CatalogError(errors::E3220_MALFORMED_TEXT, errors::format_E3220_malformed_text(i));
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            if ((c & 0xC0) != 0x80) {
                throw errors::CatalogError(errors::E3220_MALFORMED_TEXT, errors::format_E3220_malformed_text(i + k));
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        // reject overlong forms, surrogates and values past U+10FFFF
        const bool overlong = (extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000);
        if (overlong || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            throw errors::CatalogError(errors::E3220_MALFORMED_TEXT, errors::format_E3220_malformed_text(i));
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string encode_utf8(const std::u32string& code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (char32_t cp : code_points) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

std::string text_to_binary(const std::string& text) {
    const auto code_points = decode_utf8(text);
    std::string bits;
    bits.reserve(code_points.size() * 8);
    for (std::size_t pos = 0; pos < code_points.size(); ++pos) {
        const char32_t cp = code_points[pos];
        if (cp > 0xFF) {
            throw errors::CatalogError(errors::E3200_OUT_OF_RANGE_CHARACTER, errors::format_E3200_out_of_range(cp, pos));
        }
        for (int b = 7; b >= 0; --b) bits.push_back(((cp >> b) & 1) ? '1' : '0');
    }
    return bits;
}

std::string binary_to_text(const std::string& bits) {
    if (bits.size() % 8 != 0) throw errors::invalid_argument("binary text length must be a multiple of 8");
    std::u32string code_points;
    code_points.reserve(bits.size() / 8);
    for (std::size_t i = 0; i < bits.size(); i += 8) {
        char32_t cp = 0;
        for (std::size_t k = 0; k < 8; ++k) {
            const char c = bits[i + k];
            if (c != '0' && c != '1') throw errors::invalid_argument("binary text must contain only '0' and '1'");
            cp = (cp << 1) | (c == '1' ? 1u : 0u);
        }
        code_points.push_back(cp);
    }
    return encode_utf8(code_points);
}

} // namespace keystone::cipher
