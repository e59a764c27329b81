/**
 * @file error.hpp
 * @brief pngme Error: closed set of failure kinds reported by the chunk codec.
 *
 * Every fallible operation in pngme returns `std::optional<T>` and, when the
 * caller passes a non-null `Error*`, fills in *why* it failed. Nothing throws
 * on malformed input and nothing is silently repaired: a wrong length is a
 * wrong length, never a truncation.
 *
 * The `Error` record carries a small amount of context next to the kind:
 *
 * | Field      | Meaning                                                    |
 * |------------|------------------------------------------------------------|
 * | `code`     | which check failed (`Errc`)                                |
 * | `expected` | what the check wanted (declared length, declared CRC, ...) |
 * | `actual`   | what it observed (payload size, recomputed CRC, ...)       |
 * | `offset`   | byte offset in the input where the problem was found       |
 *
 * `to_string()` renders a single grep-friendly line in the same shape the
 * tool prints on stderr:
 * @code
 *   status=error reason=checksum_mismatch expected=2882656333 actual=2882656334 offset=50
 * @endcode
 */

#ifndef PNGME_ERROR_HPP
#define PNGME_ERROR_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>

namespace pngme {

/**
 * @enum Errc
 * @brief Failure kinds. `None` means "no failure recorded".
 */
enum class Errc : uint8_t {
    None = 0,
    InvalidCharacter,   ///< text → ChunkType saw a non-alphabetic byte
    InvalidLength,      ///< text → ChunkType was not exactly 4 bytes
    EncodingError,      ///< ChunkType bytes are not valid UTF-8 text
    InsufficientData,   ///< buffer shorter than the frame it must hold
    InvalidTypeBytes,   ///< parsed type bytes are not all ASCII alphabetic
    LengthMismatch,     ///< declared length disagrees with observed payload size
    ChecksumMismatch,   ///< declared CRC disagrees with recomputed CRC
    DataNotText,        ///< payload requested as text is not valid UTF-8
    InvalidSignature,   ///< container does not start with the PNG signature
    ChunkNotFound,      ///< no chunk of the requested type in the container
    InvalidHex          ///< hex text has a non-hex character or an unpaired digit
};

/**
 * @brief Stable snake_case token for an error kind (e.g. "length_mismatch").
 */
const char* errc_name(Errc code);

/**
 * @struct Error
 * @brief A failure kind plus the numbers that explain it.
 */
struct Error {
    Errc     code     = Errc::None;
    uint64_t expected = 0;
    uint64_t actual   = 0;
    size_t   offset   = 0;

    Error() = default;
    Error(Errc c, uint64_t exp, uint64_t act, size_t off)
        : code(c), expected(exp), actual(act), offset(off) {}

    /// true when a failure has been recorded
    explicit operator bool() const { return code != Errc::None; }

    const char* name() const { return errc_name(code); }

    /**
     * @brief One-line `status=error reason=<name> expected=.. actual=.. offset=..`.
     *
     * Fields that carry no information for the kind are left out, so
     * `data_not_text` prints only its reason.
     */
    std::string to_string() const;
};

/**
 * @brief Store `e` into `*out` if the caller asked for details.
 */
inline void report(Error* out, const Error& e) {
    if (out) *out = e;
}

} // namespace pngme

#endif // PNGME_ERROR_HPP
