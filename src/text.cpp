// -----------------------------------------------------------------------------
// @file text.cpp
// @brief UTF-8 validation and hex conversion used by the chunk codec and tool.
// -----------------------------------------------------------------------------
#include "pngme/text.hpp"

namespace pngme {

// =============================================================================
// UTF-8
// =============================================================================

bool is_valid_utf8(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint8_t b = data[i];

        // Plain ASCII
        if (b < 0x80) { ++i; continue; }

        size_t   need = 0;     // continuation bytes expected
        uint32_t cp   = 0;     // decoded code point
        uint32_t min  = 0;     // smallest code point allowed for this length

        if ((b & 0xE0) == 0xC0)      { need = 1; cp = b & 0x1F; min = 0x80; }
        else if ((b & 0xF0) == 0xE0) { need = 2; cp = b & 0x0F; min = 0x800; }
        else if ((b & 0xF8) == 0xF0) { need = 3; cp = b & 0x07; min = 0x10000; }
        else return false;     // stray continuation byte or 0xF8..0xFF

        if (len - i - 1 < need) return false;   // sequence runs past the end

        for (size_t k = 1; k <= need; ++k) {
            uint8_t c = data[i + k];
            if ((c & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (c & 0x3F);
        }

        if (cp < min) return false;                     // overlong
        if (cp > 0x10FFFF) return false;                // beyond Unicode
        if (cp >= 0xD800 && cp <= 0xDFFF) return false; // surrogate half

        i += need + 1;
    }
    return true;
}

// =============================================================================
// Hex
// =============================================================================

std::string to_hex_string(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0F];
    }
    return hex;
}

std::string to_hex_string(const std::vector<uint8_t>& bytes) {
    return to_hex_string(bytes.data(), bytes.size());
}

// Convert a single hexadecimal character (0–9, A–F, a–f) into its value (0–15)
static bool hex_char_to_val(char c, uint8_t& out) {
    if ('0' <= c && c <= '9') { out = c - '0';      return true; }
    if ('A' <= c && c <= 'F') { out = c - 'A' + 10; return true; }
    if ('a' <= c && c <= 'f') { out = c - 'a' + 10; return true; }
    return false;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out, Error* err) {
    out.clear();

    size_t i = 0;
    // Skip optional "0x" or "0X" prefix if present
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        i = 2;

    out.reserve((text.size() - i) / 2);
    while (i < text.size()) {
        if (is_space(text[i])) { ++i; continue; }

        // A byte needs two adjacent digits
        if (i + 1 >= text.size()) {
            out.clear();
            report(err, Error(Errc::InvalidHex, 0, 0, i));
            return false;
        }

        uint8_t hi = 0, lo = 0;
        size_t bad = text.size();
        if (!hex_char_to_val(text[i], hi))          bad = i;
        else if (!hex_char_to_val(text[i + 1], lo)) bad = i + 1;
        if (bad != text.size()) {
            out.clear();
            report(err, Error(Errc::InvalidHex, 0, 0, bad));
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

} // namespace pngme
