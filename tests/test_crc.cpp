#include <doctest/doctest.h>
#include "pngme/crc.hpp"
#include "pngme/bytes.hpp"

#include <string>
#include <vector>

using namespace pngme;

static const uint8_t* u8(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

TEST_CASE("CRC-32 of a single range") {
    const std::string iend = "IEND";
    CHECK(crc32(u8(iend), iend.size()) == 0xAE426082u);
    CHECK(crc32(nullptr, 0) == 0u);
}

TEST_CASE("CRC-32 over two ranges equals CRC-32 of their concatenation") {
    const std::string type = "RuSt";
    const std::string msg  = "This is where your secret message will be!";
    const std::string both = type + msg;

    CHECK(crc32(u8(both), both.size()) == 2882656334u);
    CHECK(crc32(u8(type), type.size(), u8(msg), msg.size()) == 2882656334u);

    // Either side may be empty.
    CHECK(crc32(u8(both), both.size(), nullptr, 0) == 2882656334u);
    CHECK(crc32(nullptr, 0, u8(both), both.size()) == 2882656334u);
}

TEST_CASE("Big-endian u32 helpers") {
    std::vector<uint8_t> b;
    put_u32_be(b, 0x0000002Au);
    put_u32_be(b, 0xAE426082u);
    CHECK(b == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x2A, 0xAE, 0x42, 0x60, 0x82});
    CHECK(get_u32_be(b.data()) == 42u);
    CHECK(get_u32_be(b.data() + 4) == 0xAE426082u);
}
