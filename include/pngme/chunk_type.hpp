/**
 * @page pngme-chunk-type pngme ChunkType
 * @file chunk_type.hpp
 * @brief pngme ChunkType: the 4-byte chunk type tag and its case-bit properties.
 *
 * Every PNG chunk is labelled with four ASCII letters ("IHDR", "tEXt", "RuSt").
 * Besides naming the chunk, the *case* of each letter is a flag. Bit 5 of each
 * byte (0x20) is the lowercase bit, so the four letters carry four booleans:
 *
 * | Byte | Uppercase means            | Lowercase means                   |
 * |------|----------------------------|-----------------------------------|
 * | 0    | critical                   | ancillary (may be ignored)        |
 * | 1    | public (registered name)   | private                           |
 * | 2    | reserved bit valid         | non-conforming / future use       |
 * | 3    | unsafe to copy             | safe to copy                      |
 *
 * ### Example
 * "RuSt" = critical, private, reserved bit valid, safe to copy.
 *
 * ### Construct now, validate later
 * A tag built from 4 raw bytes always succeeds and keeps the bytes verbatim,
 * even when they are digits or binary. Validity is a separate query
 * (`is_valid()`), so callers can still inspect, print or copy a malformed tag
 * they received from the wire. Only the *text* constructor (`from_string`)
 * refuses bad input, because there the caller is asking for a well-formed name.
 */

#ifndef PNGME_CHUNK_TYPE_HPP
#define PNGME_CHUNK_TYPE_HPP

#include "pngme/error.hpp"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <array>
#include <optional>
#include <string>

namespace pngme {

/// Fixed-capacity text form of a chunk type (exactly 4 characters).
using ChunkTypeStr = etl::string<4>;

/**
 * @class ChunkType
 * @brief Four raw bytes plus bit-level property checks.
 */
class ChunkType {
public:
    static constexpr size_t kSize = 4;

    /// 'A'..'Z' or 'a'..'z'. No locale involved.
    static bool is_ascii_letter(uint8_t b) {
        return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
    }

    /**
     * @brief Stores the 4 bytes verbatim. Never fails, never validates.
     */
    explicit ChunkType(const std::array<uint8_t, kSize>& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse a chunk type from text.
     *
     * The text must be exactly 4 bytes, all ASCII letters.
     * - a non-letter among the first 4 bytes → `Errc::InvalidCharacter`
     *   (offset = index of the first offending byte)
     * - otherwise, any length other than 4 → `Errc::InvalidLength`
     *
     * Note that "Rust" parses fine; it is merely not `is_valid()`.
     */
    static std::optional<ChunkType> from_string(const char* text, size_t len, Error* err = nullptr);
    static std::optional<ChunkType> from_string(const std::string& text, Error* err = nullptr);

    /// The raw 4 bytes, as stored.
    const std::array<uint8_t, kSize>& bytes() const { return bytes_; }

    /**
     * @brief All four bytes are ASCII letters and the reserved bit is valid.
     */
    bool is_valid() const;

    /// Byte 0 uppercase.
    bool is_critical() const;

    /// Byte 1 uppercase.
    bool is_public() const;

    /// Byte 2 uppercase.
    bool is_reserved_bit_valid() const;

    /// Byte 3 lowercase.
    bool is_safe_to_copy() const;

    /**
     * @brief The 4 bytes as text.
     *
     * Fails with `Errc::EncodingError` when the bytes are not valid UTF-8,
     * which can only happen for tags built from raw bytes.
     */
    std::optional<ChunkTypeStr> to_string(Error* err = nullptr) const;

    bool operator==(const ChunkType& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ChunkType& other) const { return !(*this == other); }

private:
    std::array<uint8_t, kSize> bytes_;
};

} // namespace pngme

#endif // PNGME_CHUNK_TYPE_HPP
