// -----------------------------------------------------------------------------
// @file chunk_type.cpp
// @brief Implementation of pngme::ChunkType.
//
// The property checks read one byte each and never look at the others, so a
// tag can be critical and invalid at the same time. The only validating path
// is from_string(); raw-byte construction lives inline in the header.
// -----------------------------------------------------------------------------
#include "pngme/chunk_type.hpp"
#include "pngme/text.hpp"

#include <cstring>

namespace pngme {

static bool is_upper(uint8_t b) { return b >= 'A' && b <= 'Z'; }
static bool is_lower(uint8_t b) { return b >= 'a' && b <= 'z'; }

// =============================================================================
// Construction from text
// =============================================================================

std::optional<ChunkType> ChunkType::from_string(const char* text, size_t len, Error* err) {
    // Characters first: "Ru1t" and "Ru1tX" both fail on the digit.
    const size_t n = len < kSize ? len : kSize;
    for (size_t i = 0; i < n; ++i) {
        if (!is_ascii_letter(static_cast<uint8_t>(text[i]))) {
            report(err, Error(Errc::InvalidCharacter, 0, 0, i));
            return std::nullopt;
        }
    }

    // Exactly four; trailing characters are not silently dropped.
    if (len != kSize) {
        report(err, Error(Errc::InvalidLength, kSize, len, 0));
        return std::nullopt;
    }

    std::array<uint8_t, kSize> bytes{};
    std::memcpy(bytes.data(), text, kSize);
    return ChunkType(bytes);
}

std::optional<ChunkType> ChunkType::from_string(const std::string& text, Error* err) {
    return from_string(text.data(), text.size(), err);
}

// =============================================================================
// Properties
// =============================================================================

bool ChunkType::is_valid() const {
    for (uint8_t b : bytes_) {
        if (!is_ascii_letter(b)) return false;
    }
    return is_reserved_bit_valid();
}

bool ChunkType::is_critical() const           { return is_upper(bytes_[0]); }
bool ChunkType::is_public() const             { return is_upper(bytes_[1]); }
bool ChunkType::is_reserved_bit_valid() const { return is_upper(bytes_[2]); }
bool ChunkType::is_safe_to_copy() const       { return is_lower(bytes_[3]); }

// =============================================================================
// Conversion
// =============================================================================

std::optional<ChunkTypeStr> ChunkType::to_string(Error* err) const {
    if (!is_valid_utf8(bytes_.data(), bytes_.size())) {
        report(err, Error(Errc::EncodingError, 0, 0, 0));
        return std::nullopt;
    }
    ChunkTypeStr s;
    for (uint8_t b : bytes_) s += static_cast<char>(b);
    return s;
}

} // namespace pngme
