// -----------------------------------------------------------------------------
// @file chunk.cpp
// @brief Implementation of pngme::Chunk (construction, parsing and serialization).
//
// For the wire layout and the order of the decode checks see chunk.hpp.
// -----------------------------------------------------------------------------
#include "pngme/chunk.hpp"
#include "pngme/bytes.hpp"
#include "pngme/crc.hpp"
#include "pngme/text.hpp"

#include <utility>

namespace pngme {

// ============================================================================
// Low-level helpers
// ============================================================================

static inline uint32_t chunk_crc(const ChunkType& type, const std::vector<uint8_t>& data) {
    return crc32(type.bytes().data(), ChunkType::kSize, data.data(), data.size());
}

// ============================================================================
// Construction
// ============================================================================

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
    : type_(type), data_(std::move(data)), crc_(0) {
    crc_ = chunk_crc(type_, data_);
}

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc)
    : type_(type), data_(std::move(data)), crc_(crc) {}

// ============================================================================
// Parsing
// ============================================================================

std::optional<Chunk> Chunk::from_bytes(const uint8_t* data, size_t len, Error* err) {
    // 1) Smallest possible frame: length + type + crc with an empty payload.
    if (len < kMinChunkSize) {
        report(err, Error(Errc::InsufficientData, kMinChunkSize, len, 0));
        return std::nullopt;
    }

    // 2) Declared length. Compared below, never used as an index.
    const uint32_t declared_len = get_u32_be(data);

    // 3) Type bytes must be letters before anything else is trusted.
    std::array<uint8_t, ChunkType::kSize> tb{};
    for (size_t i = 0; i < ChunkType::kSize; ++i) {
        tb[i] = data[kChunkLengthSize + i];
        if (!ChunkType::is_ascii_letter(tb[i])) {
            report(err, Error(Errc::InvalidTypeBytes, 0, 0, kChunkLengthSize + i));
            return std::nullopt;
        }
    }
    ChunkType type(tb);

    // 4) Payload is whatever sits between the type and the trailing crc.
    const uint8_t* payload     = data + kChunkHeaderSize;
    const size_t   payload_len = len - kMinChunkSize;

    // 5) Declared crc from the last 4 bytes.
    const size_t   crc_off      = len - kChunkCrcSize;
    const uint32_t declared_crc = get_u32_be(data + crc_off);

    // 6) Length check. On mismatch the checksum is not examined.
    if (static_cast<uint64_t>(declared_len) != static_cast<uint64_t>(payload_len)) {
        report(err, Error(Errc::LengthMismatch, declared_len, payload_len, 0));
        return std::nullopt;
    }

    // 7) Checksum check over type ++ payload, straight from the buffer.
    const uint32_t actual_crc = crc32(tb.data(), tb.size(), payload, payload_len);
    if (actual_crc != declared_crc) {
        report(err, Error(Errc::ChecksumMismatch, declared_crc, actual_crc, crc_off));
        return std::nullopt;
    }

    // 8) Copy the payload out; keep the validated crc.
    std::vector<uint8_t> body(payload, payload + payload_len);
    return Chunk(type, std::move(body), declared_crc);
}

std::optional<Chunk> Chunk::from_bytes(const std::vector<uint8_t>& bytes, Error* err) {
    return from_bytes(bytes.data(), bytes.size(), err);
}

// ============================================================================
// Accessors / serialization
// ============================================================================

std::optional<std::string> Chunk::data_as_string(Error* err) const {
    if (!is_valid_utf8(data_.data(), data_.size())) {
        report(err, Error(Errc::DataNotText, 0, 0, 0));
        return std::nullopt;
    }
    return std::string(data_.begin(), data_.end());
}

std::vector<uint8_t> Chunk::as_bytes() const {
    std::vector<uint8_t> b;
    b.reserve(kMinChunkSize + data_.size());
    put_u32_be(b, length());
    b.insert(b.end(), type_.bytes().begin(), type_.bytes().end());
    b.insert(b.end(), data_.begin(), data_.end());
    put_u32_be(b, crc_);
    return b;
}

} // namespace pngme
