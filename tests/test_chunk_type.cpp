#include <doctest/doctest.h>
#include "pngme/chunk_type.hpp"

#include <array>
#include <string>

using namespace pngme;

static ChunkType tag(const char* s) {
    auto t = ChunkType::from_string(s);
    REQUIRE(t.has_value());
    return *t;
}

TEST_CASE("ChunkType from raw bytes keeps them verbatim") {
    std::array<uint8_t, 4> raw{82, 117, 83, 116};
    ChunkType t(raw);
    CHECK(t.bytes() == raw);
}

TEST_CASE("ChunkType from text equals the same raw bytes") {
    ChunkType expected(std::array<uint8_t, 4>{82, 117, 83, 116});
    CHECK(tag("RuSt") == expected);
    CHECK(tag("RuST") != expected);
}

TEST_CASE("Case bits of RuSt") {
    ChunkType t = tag("RuSt");
    CHECK(t.is_critical());
    CHECK_FALSE(t.is_public());
    CHECK(t.is_reserved_bit_valid());
    CHECK(t.is_safe_to_copy());
    CHECK(t.is_valid());
}

TEST_CASE("Each property follows its own byte") {
    CHECK_FALSE(tag("ruSt").is_critical());
    CHECK(tag("RUSt").is_public());
    CHECK_FALSE(tag("RuST").is_safe_to_copy());
    CHECK_FALSE(tag("Rust").is_reserved_bit_valid());

    // Non-letters elsewhere do not change a single-byte property.
    ChunkType odd(std::array<uint8_t, 4>{'R', '1', '2', 't'});
    CHECK(odd.is_critical());
    CHECK_FALSE(odd.is_public());
    CHECK_FALSE(odd.is_reserved_bit_valid());
    CHECK(odd.is_safe_to_copy());
}

TEST_CASE("Reserved bit lowercase makes the tag invalid") {
    ChunkType t = tag("Rust");
    CHECK_FALSE(t.is_valid());
}

TEST_CASE("Non-letters are never valid, whatever the case bits say") {
    ChunkType t(std::array<uint8_t, 4>{'R', 'u', 'S', '1'});
    CHECK(t.is_reserved_bit_valid());
    CHECK_FALSE(t.is_valid());

    ChunkType binary(std::array<uint8_t, 4>{0x00, 0xFF, 'S', 't'});
    CHECK_FALSE(binary.is_valid());
}

TEST_CASE("Text construction rejects digits with InvalidCharacter") {
    Error err;
    CHECK_FALSE(ChunkType::from_string("Ru1t", &err).has_value());
    CHECK(err.code == Errc::InvalidCharacter);
    CHECK(err.offset == 2);

    // Character check wins over length check.
    err = Error();
    CHECK_FALSE(ChunkType::from_string("Ru1tX", &err).has_value());
    CHECK(err.code == Errc::InvalidCharacter);
}

TEST_CASE("Text construction requires exactly four characters") {
    Error err;
    CHECK_FALSE(ChunkType::from_string("RuStX", &err).has_value());
    CHECK(err.code == Errc::InvalidLength);
    CHECK(err.expected == 4);
    CHECK(err.actual == 5);

    err = Error();
    CHECK_FALSE(ChunkType::from_string("RuS", &err).has_value());
    CHECK(err.code == Errc::InvalidLength);
    CHECK(err.actual == 3);

    err = Error();
    CHECK_FALSE(ChunkType::from_string(std::string(), &err).has_value());
    CHECK(err.code == Errc::InvalidLength);
}

TEST_CASE("Text rendering") {
    auto s = tag("RuSt").to_string();
    REQUIRE(s.has_value());
    CHECK(*s == ChunkTypeStr("RuSt"));
}

TEST_CASE("Text rendering of raw bytes that are not UTF-8 fails with EncodingError") {
    ChunkType bad(std::array<uint8_t, 4>{0xFF, 'u', 'S', 't'});
    Error err;
    CHECK_FALSE(bad.to_string(&err).has_value());
    CHECK(err.code == Errc::EncodingError);

    // Valid UTF-8 that is not a valid tag still renders.
    ChunkType accented(std::array<uint8_t, 4>{0xC3, 0xA9, 'A', 'B'});
    CHECK(accented.to_string().has_value());
    CHECK_FALSE(accented.is_valid());
}
