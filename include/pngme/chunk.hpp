/**
 * @page pngme-chunk pngme Chunk
 * @file chunk.hpp
 * @brief pngme Chunk: a length-prefixed, type-tagged, CRC-checked byte record.
 *
 * @details
 * WIRE LAYOUT
 * -----------
 * Big-endian throughout. This is exactly what `as_bytes()` produces and what
 * `from_bytes()` accepts:
 *
 * | Offset   | Size   | Field    | Notes                                        |
 * |----------|--------|----------|----------------------------------------------|
 * | 0        | 4      | length   | byte count of the payload only               |
 * | 4        | 4      | type     | 4 ASCII letters (see chunk_type.hpp)         |
 * | 8        | length | payload  | opaque bytes                                 |
 * | 8+length | 4      | crc      | CRC-32 over bytes [4, 8+length)              |
 *
 * The CRC covers type + payload, never the length field.
 *
 * ENCODE PATH
 * -----------
 *   Chunk c(type, payload);          // length and crc are derived, never passed in
 *   std::vector<uint8_t> wire = c.as_bytes();
 *
 * Building a chunk does not check `type.is_valid()`. Encoding enforces the
 * framing invariants only; whether the tag is semantically acceptable is the
 * caller's call.
 *
 * DECODE PATH
 * -----------
 *   Error err;
 *   auto c = Chunk::from_bytes(buf, len, &err);
 *   if (!c) std::cerr << err.to_string() << "\n";
 *
 * Checks run in this order and stop at the first failure:
 *   1. at least 12 bytes                       → InsufficientData
 *   2. type bytes are ASCII letters            → InvalidTypeBytes
 *   3. declared length == bytes between type and crc → LengthMismatch
 *   4. declared crc == recomputed crc          → ChecksumMismatch
 *
 * The declared length is untrusted input: the payload slice is bounded by the
 * buffer, and the length field is only *compared*, never used to index.
 * A corrupted length and a corrupted checksum are therefore distinguishable.
 *
 * OWNERSHIP
 * ---------
 * A Chunk owns its payload. `from_bytes()` copies what it needs and keeps no
 * reference to the caller's buffer.
 */

#ifndef PNGME_CHUNK_HPP
#define PNGME_CHUNK_HPP

#include "pngme/chunk_type.hpp"
#include "pngme/error.hpp"
#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <vector>

namespace pngme {

static constexpr size_t kChunkLengthSize = 4;   ///< length field
static constexpr size_t kChunkHeaderSize = 8;   ///< length + type
static constexpr size_t kChunkCrcSize    = 4;   ///< trailing crc
static constexpr size_t kMinChunkSize    = kChunkHeaderSize + kChunkCrcSize;   ///< empty payload

/**
 * @class Chunk
 * @brief Immutable chunk value. Construct from parts or parse from bytes.
 */
class Chunk {
public:
    /**
     * @brief Build a chunk from a type and a payload.
     *
     * Infallible. `length()` is the payload size, `crc()` is computed over
     * `type.bytes() ++ data`.
     */
    Chunk(const ChunkType& type, std::vector<uint8_t> data);

    /**
     * @brief Parse one complete chunk frame.
     *
     * The whole of `[data, data+len)` is the frame: everything between the type
     * and the last 4 bytes is payload.
     *
     * @param data Pointer to the frame.
     * @param len  Frame size in bytes.
     * @param err  Optional; receives the failure kind and context.
     * @return The chunk, or std::nullopt on the first failed check.
     */
    static std::optional<Chunk> from_bytes(const uint8_t* data, size_t len, Error* err = nullptr);
    static std::optional<Chunk> from_bytes(const std::vector<uint8_t>& bytes, Error* err = nullptr);

    /// Payload byte count.
    uint32_t length() const { return static_cast<uint32_t>(data_.size()); }

    const ChunkType& chunk_type() const { return type_; }

    const std::vector<uint8_t>& data() const { return data_; }

    uint32_t crc() const { return crc_; }

    /**
     * @brief Payload as text; `Errc::DataNotText` if it is not valid UTF-8.
     *
     * Binary payloads are normal for most chunk types. Use `data()` for them.
     */
    std::optional<std::string> data_as_string(Error* err = nullptr) const;

    /**
     * @brief Text rendering of the chunk: its payload as text.
     *
     * Same result and failure as `data_as_string()`.
     */
    std::optional<std::string> to_string(Error* err = nullptr) const { return data_as_string(err); }

    /**
     * @brief Serialize to the wire layout documented above.
     */
    std::vector<uint8_t> as_bytes() const;

    bool operator==(const Chunk& other) const {
        return type_ == other.type_ && crc_ == other.crc_ && data_ == other.data_;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }

private:
    // Used by from_bytes(): crc has already been verified.
    Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc);

    ChunkType            type_;
    std::vector<uint8_t> data_;
    uint32_t             crc_;
};

} // namespace pngme

#endif // PNGME_CHUNK_HPP
