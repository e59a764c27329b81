/**
 * @file text.hpp
 * @brief Byte ↔ text helpers: UTF-8 validation and hex conversion.
 *
 * Chunk payloads are opaque bytes. These helpers decide when such bytes may
 * be shown as text (`is_valid_utf8`) and give a lossless printable form for
 * everything else (`to_hex_string` / `hex_to_bytes`).
 */

#ifndef PNGME_TEXT_HPP
#define PNGME_TEXT_HPP

#include "pngme/error.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace pngme {

/**
 * @brief Strict UTF-8 check.
 *
 * Rejects overlong encodings, UTF-16 surrogates (U+D800..U+DFFF), code points
 * above U+10FFFF and truncated sequences. An empty range is valid.
 */
bool is_valid_utf8(const uint8_t* data, size_t len);

/**
 * @brief Uppercase hex, two characters per byte, no separators.
 */
std::string to_hex_string(const uint8_t* data, size_t len);
std::string to_hex_string(const std::vector<uint8_t>& bytes);

/**
 * @brief Parse hex text into bytes.
 *
 * Accepts an optional "0x"/"0X" prefix, either case, and ASCII whitespace
 * between byte pairs ("00 00 00 2A 52 75 ..."). A pair may not be split by
 * whitespace.
 *
 * @param text Input text.
 * @param out  Receives the bytes; cleared first. Left empty on failure.
 * @param err  Optional; `Errc::InvalidHex` with the offset of the bad or
 *             unpaired character.
 * @return false on an odd digit count or a non-hex character.
 */
bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out, Error* err = nullptr);

} // namespace pngme

#endif // PNGME_TEXT_HPP
