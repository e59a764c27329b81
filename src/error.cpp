// -----------------------------------------------------------------------------
// @file error.cpp
// @brief Names and one-line rendering for pngme::Error.
// -----------------------------------------------------------------------------
#include "pngme/error.hpp"

#include <sstream>

namespace pngme {

const char* errc_name(Errc code) {
    switch (code) {
        case Errc::None:             return "none";
        case Errc::InvalidCharacter: return "invalid_character";
        case Errc::InvalidLength:    return "invalid_length";
        case Errc::EncodingError:    return "encoding_error";
        case Errc::InsufficientData: return "insufficient_data";
        case Errc::InvalidTypeBytes: return "invalid_type_bytes";
        case Errc::LengthMismatch:   return "length_mismatch";
        case Errc::ChecksumMismatch: return "checksum_mismatch";
        case Errc::DataNotText:      return "data_not_text";
        case Errc::InvalidSignature: return "invalid_signature";
        case Errc::ChunkNotFound:    return "chunk_not_found";
        case Errc::InvalidHex:       return "invalid_hex";
    }
    return "unknown";
}

// Only the kinds that compare two numbers print expected/actual.
static bool has_counts(Errc code) {
    switch (code) {
        case Errc::InvalidLength:
        case Errc::InsufficientData:
        case Errc::LengthMismatch:
        case Errc::ChecksumMismatch:
            return true;
        default:
            return false;
    }
}

// Only the kinds found at a position in an input buffer or text print offset.
static bool has_offset(Errc code) {
    switch (code) {
        case Errc::InvalidCharacter:
        case Errc::InsufficientData:
        case Errc::InvalidTypeBytes:
        case Errc::LengthMismatch:
        case Errc::ChecksumMismatch:
        case Errc::InvalidHex:
            return true;
        default:
            return false;
    }
}

std::string Error::to_string() const {
    std::ostringstream os;
    if (code == Errc::None) {
        os << "status=ok";
        return os.str();
    }
    os << "status=error reason=" << name();
    if (has_counts(code))
        os << " expected=" << expected << " actual=" << actual;
    if (has_offset(code))
        os << " offset=" << offset;
    return os.str();
}

} // namespace pngme
