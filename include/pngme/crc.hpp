/**
 * @file crc.hpp
 * @brief CRC-32/ISO-HDLC (the zlib/PNG checksum) over one or two byte ranges.
 */

#ifndef PNGME_CRC_HPP
#define PNGME_CRC_HPP

#include <stdint.h>
#include <stddef.h>

namespace pngme {

/**
 * @brief CRC-32 of `[data, data+len)`.
 */
uint32_t crc32(const uint8_t* data, size_t len);

/**
 * @brief CRC-32 of the concatenation `a ++ b` without building it.
 *
 * The chunk checksum covers `type ++ payload`; this lets the codec hash the
 * two pieces where they already live.
 */
uint32_t crc32(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len);

} // namespace pngme

#endif // PNGME_CRC_HPP
