/**
 * @file bytes.hpp
 * @brief Big-endian u32 load/store shared by the chunk and container codecs.
 */

#ifndef PNGME_BYTES_HPP
#define PNGME_BYTES_HPP

#include <stdint.h>
#include <vector>

namespace pngme {

// Append a u32 in network (big-endian) order.
inline void put_u32_be(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));   // high byte first
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>(v & 0xFF));
}

// Read a u32 stored big-endian at p[0..3]. Caller guarantees 4 bytes.
inline uint32_t get_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
            static_cast<uint32_t>(p[3]);
}

} // namespace pngme

#endif // PNGME_BYTES_HPP
