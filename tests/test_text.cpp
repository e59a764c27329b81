#include <doctest/doctest.h>
#include "pngme/text.hpp"
#include "pngme/error.hpp"
#include "pngme/describe.hpp"

#include <string>
#include <vector>

using namespace pngme;

static bool utf8(const std::vector<uint8_t>& b) { return is_valid_utf8(b.data(), b.size()); }

TEST_CASE("UTF-8 validation") {
    CHECK(utf8({}));
    CHECK(utf8({'h', 'i'}));
    CHECK(utf8({0xC3, 0xA9}));                 // é
    CHECK(utf8({0xE2, 0x82, 0xAC}));           // €
    CHECK(utf8({0xF0, 0x9F, 0x98, 0x80}));     // emoji

    CHECK_FALSE(utf8({0x80}));                 // lone continuation
    CHECK_FALSE(utf8({0xC3}));                 // truncated
    CHECK_FALSE(utf8({0xC0, 0xAF}));           // overlong '/'
    CHECK_FALSE(utf8({0xED, 0xA0, 0x80}));     // surrogate
    CHECK_FALSE(utf8({0xF4, 0x90, 0x80, 0x80})); // > U+10FFFF
    CHECK_FALSE(utf8({0xFF}));
}

TEST_CASE("Hex encode and decode") {
    CHECK(to_hex_string(std::vector<uint8_t>{0x00, 0xAB, 0x7F}) == "00AB7F");

    std::vector<uint8_t> out;
    REQUIRE(hex_to_bytes("0x00ab7F", out));
    CHECK(out == std::vector<uint8_t>{0x00, 0xAB, 0x7F});

    REQUIRE(hex_to_bytes("00 AB\n7f", out));
    CHECK(out == std::vector<uint8_t>{0x00, 0xAB, 0x7F});

    CHECK_FALSE(hex_to_bytes("ABC", out));
    CHECK(out.empty());
    CHECK_FALSE(hex_to_bytes("A B", out));
    CHECK_FALSE(hex_to_bytes("zz", out));
}

TEST_CASE("Bad hex reports where it stopped") {
    std::vector<uint8_t> out;
    Error err;
    CHECK_FALSE(hex_to_bytes("ABC", out, &err));
    CHECK(err.code == Errc::InvalidHex);
    CHECK(err.offset == 2);

    err = Error();
    CHECK_FALSE(hex_to_bytes("zz", out, &err));
    CHECK(err.code == Errc::InvalidHex);
    CHECK(err.offset == 0);

    err = Error();
    CHECK_FALSE(hex_to_bytes("0xAg", out, &err));
    CHECK(err.offset == 3);

    err = Error();
    CHECK_FALSE(hex_to_bytes("A B", out, &err));
    CHECK(err.offset == 1);

    CHECK(err.to_string() == "status=error reason=invalid_hex offset=1");
    CHECK(std::string(errc_name(Errc::InvalidHex)) == "invalid_hex");
}

TEST_CASE("Error renders as a status line") {
    CHECK(Error().to_string() == "status=ok");
    CHECK(Error(Errc::LengthMismatch, 44, 42, 0).to_string() ==
          "status=error reason=length_mismatch expected=44 actual=42 offset=0");
    CHECK(Error(Errc::InvalidTypeBytes, 0, 0, 6).to_string() ==
          "status=error reason=invalid_type_bytes offset=6");
    CHECK(std::string(errc_name(Errc::ChecksumMismatch)) == "checksum_mismatch");
    CHECK(static_cast<bool>(Error(Errc::DataNotText, 0, 0, 0)));
    CHECK_FALSE(static_cast<bool>(Error()));
}

TEST_CASE("Errors without a position print no offset") {
    CHECK(Error(Errc::DataNotText, 0, 0, 0).to_string() == "status=error reason=data_not_text");
    CHECK(Error(Errc::ChunkNotFound, 0, 0, 0).to_string() == "status=error reason=chunk_not_found");
    CHECK(Error(Errc::InvalidSignature, 0, 0, 0).to_string() == "status=error reason=invalid_signature");
}

TEST_CASE("describe_error_json carries every field") {
    auto j = describe_error_json(Error(Errc::ChecksumMismatch, 1, 2, 54));
    CHECK(j["status"].get<std::string>() == "error");
    CHECK(j["reason"].get<std::string>() == "checksum_mismatch");
    CHECK(j["expected"].get<uint64_t>() == 1);
    CHECK(j["actual"].get<uint64_t>() == 2);
    CHECK(j["offset"].get<size_t>() == 54);

    CHECK(describe_error_json(Error())["status"].get<std::string>() == "ok");
}

TEST_CASE("describe_pretty and describe_json") {
    auto t = ChunkType::from_string("RuSt");
    REQUIRE(t.has_value());
    std::string msg = "This is where your secret message will be!";
    Chunk c(*t, std::vector<uint8_t>(msg.begin(), msg.end()));

    CHECK(describe_pretty(c) ==
          "type=RuSt length=42 crc=2882656334 critical=1 public=0 reserved_ok=1"
          " safe_to_copy=1 valid=1 data=\"" + msg + "\"");

    auto j = describe_json(c);
    CHECK(j["type"].get<std::string>() == "RuSt");
    CHECK(j["length"].get<uint32_t>() == 42);
    CHECK(j["crc"].get<uint32_t>() == 2882656334u);
    CHECK(j["valid"].get<bool>());
    CHECK(j["data"].get<std::string>() == msg);

    Chunk bin(*t, std::vector<uint8_t>{0xFF, 0x00});
    CHECK(describe_pretty(bin).find("data_hex=FF00") != std::string::npos);
    CHECK(describe_json(bin)["data_hex"].get<std::string>() == "FF00");
}

TEST_CASE("describe_pretty keeps awkward text on one line") {
    auto t = ChunkType::from_string("RuSt");
    REQUIRE(t.has_value());

    Chunk quoted(*t, std::vector<uint8_t>{'a', '"', 'b'});
    std::string line = describe_pretty(quoted);
    CHECK(line.find("data_hex=612262") != std::string::npos);
    CHECK(line.find("data=") == std::string::npos);

    Chunk multi(*t, std::vector<uint8_t>{'a', '\n', 'b'});
    line = describe_pretty(multi);
    CHECK(line.find('\n') == std::string::npos);
    CHECK(line.find("data_hex=610A62") != std::string::npos);

    Chunk slash(*t, std::vector<uint8_t>{'a', '\\', 'b'});
    CHECK(describe_pretty(slash).find("data_hex=615C62") != std::string::npos);

    // JSON escapes on its own; the text stays readable there.
    CHECK(describe_json(multi)["data"].get<std::string>() == "a\nb");
}
