// -----------------------------------------------------------------------------
// @file crc.cpp
// @brief Thin wrapper over zlib's crc32() for arbitrary-length ranges.
// -----------------------------------------------------------------------------
#include "pngme/crc.hpp"

#include <zlib.h>
#include <algorithm>

namespace pngme {

// zlib takes uInt lengths; feed larger ranges in pieces.
static uLong crc_update(uLong crc, const uint8_t* data, size_t len) {
    const size_t step = static_cast<size_t>(UINT32_MAX);
    while (len > 0) {
        size_t n = std::min(len, step);
        crc = ::crc32(crc, data, static_cast<uInt>(n));
        data += n;
        len  -= n;
    }
    return crc;
}

uint32_t crc32(const uint8_t* data, size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = crc_update(crc, data, len);
    return static_cast<uint32_t>(crc);
}

uint32_t crc32(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = crc_update(crc, a, a_len);
    crc = crc_update(crc, b, b_len);
    return static_cast<uint32_t>(crc);
}

} // namespace pngme
