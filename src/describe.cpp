// -----------------------------------------------------------------------------
// @file describe.cpp
// @brief describe_pretty() / describe_json(): flatten a chunk into key=value
//        pairs or a JSON object for logs and the pngme-chunk tool.
// -----------------------------------------------------------------------------
#include "pngme/describe.hpp"
#include "pngme/text.hpp"

#include <sstream>

namespace pngme {

// Text that can sit between quotes on one line without escaping.
static bool is_plain_line(const std::string& text) {
    for (unsigned char c : text) {
        if (c < 0x20 || c == 0x7F || c == '"' || c == '\\') return false;
    }
    return true;
}

std::string describe_pretty(const Chunk& chunk) {
    std::ostringstream os;
    const ChunkType& t = chunk.chunk_type();

    if (auto s = t.to_string()) os << "type=" << std::string(s->begin(), s->end());
    else                        os << "type_hex=" << to_hex_string(t.bytes().data(), t.bytes().size());

    os << " length=" << chunk.length()
       << " crc=" << chunk.crc()
       << " critical=" << t.is_critical()
       << " public=" << t.is_public()
       << " reserved_ok=" << t.is_reserved_bit_valid()
       << " safe_to_copy=" << t.is_safe_to_copy()
       << " valid=" << t.is_valid();

    // Quote text so embedded spaces stay inside one field. Quotes, backslashes
    // and control characters would break the line; those payloads go out as hex.
    auto text = chunk.data_as_string();
    if (text && is_plain_line(*text)) os << " data=\"" << *text << "\"";
    else                              os << " data_hex=" << to_hex_string(chunk.data());

    return os.str();
}

nlohmann::json describe_json(const Chunk& chunk) {
    const ChunkType& t = chunk.chunk_type();
    nlohmann::json j;

    if (auto s = t.to_string()) j["type"] = std::string(s->begin(), s->end());
    else                        j["type_hex"] = to_hex_string(t.bytes().data(), t.bytes().size());

    j["length"]       = chunk.length();
    j["crc"]          = chunk.crc();
    j["critical"]     = t.is_critical();
    j["public"]       = t.is_public();
    j["reserved_ok"]  = t.is_reserved_bit_valid();
    j["safe_to_copy"] = t.is_safe_to_copy();
    j["valid"]        = t.is_valid();

    if (auto text = chunk.data_as_string()) j["data"] = *text;
    else                                    j["data_hex"] = to_hex_string(chunk.data());

    return j;
}

nlohmann::json describe_error_json(const Error& err) {
    nlohmann::json j;
    j["status"]   = err ? "error" : "ok";
    j["reason"]   = err.name();
    j["expected"] = err.expected;
    j["actual"]   = err.actual;
    j["offset"]   = err.offset;
    return j;
}

} // namespace pngme
