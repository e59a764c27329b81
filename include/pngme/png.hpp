/**
 * @file png.hpp
 * @brief pngme Png: the PNG signature followed by a sequence of chunks, in memory.
 *
 * Png works on byte buffers only. Reading or writing files is left to the
 * caller: hand `from_bytes()` the file contents, write `as_bytes()` back.
 *
 * Layout:
 * @code
 *   89 50 4E 47 0D 0A 1A 0A  | chunk | chunk | ... | chunk
 * @endcode
 * Each chunk uses the frame layout from chunk.hpp. Frames sit back to back;
 * each frame's own length field tells where the next one starts.
 */

#ifndef PNGME_PNG_HPP
#define PNGME_PNG_HPP

#include "pngme/chunk.hpp"
#include "pngme/error.hpp"
#include <stdint.h>
#include <stddef.h>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace pngme {

class Png {
public:
    static constexpr size_t kSignatureSize = 8;
    static const std::array<uint8_t, kSignatureSize> kSignature;

    Png() = default;
    explicit Png(std::vector<Chunk> chunks);

    /**
     * @brief Parse a whole PNG byte stream.
     *
     * Failures:
     * - no signature, or shorter than 8 bytes  → `InvalidSignature`
     * - a frame runs past the end of the buffer → `InsufficientData`
     *   (offset = start of that frame)
     * - a frame fails to decode → the chunk's own kind, offset rebased onto
     *   the whole buffer
     */
    static std::optional<Png> from_bytes(const uint8_t* data, size_t len, Error* err = nullptr);
    static std::optional<Png> from_bytes(const std::vector<uint8_t>& bytes, Error* err = nullptr);

    void append_chunk(Chunk chunk);

    /**
     * @brief Remove and return the first chunk whose type text equals `type`.
     * @return std::nullopt with `Errc::ChunkNotFound` when there is none.
     */
    std::optional<Chunk> remove_first_chunk(const std::string& type, Error* err = nullptr);

    /// First chunk whose type text equals `type`, or nullptr.
    const Chunk* chunk_by_type(const std::string& type) const;

    const std::array<uint8_t, kSignatureSize>& header() const { return kSignature; }

    const std::vector<Chunk>& chunks() const { return chunks_; }

    /// Signature followed by every chunk's wire bytes, in order.
    std::vector<uint8_t> as_bytes() const;

private:
    std::vector<Chunk> chunks_;
};

} // namespace pngme

#endif // PNGME_PNG_HPP
