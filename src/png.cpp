// -----------------------------------------------------------------------------
// @file png.cpp
// @brief In-memory PNG container: signature + back-to-back chunk frames.
// -----------------------------------------------------------------------------
#include "pngme/png.hpp"
#include "pngme/bytes.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace pngme {

const std::array<uint8_t, Png::kSignatureSize> Png::kSignature = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

Png::Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

// Chunk type text equals `type`. Tags that are not text never match.
static bool type_matches(const Chunk& c, const std::string& type) {
    auto s = c.chunk_type().to_string();
    return s && type.size() == s->size() &&
           std::memcmp(type.data(), s->data(), s->size()) == 0;
}

// =============================================================================
// Parsing
// =============================================================================

std::optional<Png> Png::from_bytes(const uint8_t* data, size_t len, Error* err) {
    if (len < kSignatureSize || std::memcmp(data, kSignature.data(), kSignatureSize) != 0) {
        report(err, Error(Errc::InvalidSignature, 0, 0, 0));
        return std::nullopt;
    }

    std::vector<Chunk> chunks;
    size_t off = kSignatureSize;
    while (off < len) {
        const size_t remaining = len - off;

        // Need at least the fixed part of a frame to read its length.
        if (remaining < kMinChunkSize) {
            report(err, Error(Errc::InsufficientData, kMinChunkSize, remaining, off));
            return std::nullopt;
        }

        const uint8_t* p = data + off;
        const uint64_t declared = get_u32_be(p);
        const uint64_t frame = declared + kMinChunkSize;
        if (frame > remaining) {
            report(err, Error(Errc::InsufficientData, frame, remaining, off));
            return std::nullopt;
        }

        Error chunk_err;
        auto chunk = Chunk::from_bytes(p, static_cast<size_t>(frame), &chunk_err);
        if (!chunk) {
            chunk_err.offset += off;
            report(err, chunk_err);
            return std::nullopt;
        }
        chunks.push_back(std::move(*chunk));
        off += static_cast<size_t>(frame);
    }

    return Png(std::move(chunks));
}

std::optional<Png> Png::from_bytes(const std::vector<uint8_t>& bytes, Error* err) {
    return from_bytes(bytes.data(), bytes.size(), err);
}

// =============================================================================
// Chunk list
// =============================================================================

void Png::append_chunk(Chunk chunk) {
    chunks_.push_back(std::move(chunk));
}

std::optional<Chunk> Png::remove_first_chunk(const std::string& type, Error* err) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [&](const Chunk& c) { return type_matches(c, type); });
    if (it == chunks_.end()) {
        report(err, Error(Errc::ChunkNotFound, 0, 0, 0));
        return std::nullopt;
    }
    Chunk removed = std::move(*it);
    chunks_.erase(it);
    return removed;
}

const Chunk* Png::chunk_by_type(const std::string& type) const {
    for (const auto& c : chunks_) {
        if (type_matches(c, type)) return &c;
    }
    return nullptr;
}

std::vector<uint8_t> Png::as_bytes() const {
    std::vector<uint8_t> out(kSignature.begin(), kSignature.end());
    for (const auto& c : chunks_) {
        auto b = c.as_bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

} // namespace pngme
