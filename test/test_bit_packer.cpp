// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <modern-oid/bit_packer.h>

#include <vector>

using namespace moid;
using namespace moid::impl;
using namespace std::literals;

namespace doctest {
    template<> struct StringMaker<object_id_fields> {
        static String convert(const object_id_fields & f) {
            String ret = "{";
            ret += toString(f.timestamp);
            ret += ", ";
            ret += toString(f.machine);
            ret += ", ";
            ret += toString(unsigned(f.pid));
            ret += ", ";
            ret += toString(f.increment);
            ret += "}";
            return ret;
        }
    };
}

TEST_SUITE("bit_packer") {

TEST_CASE("zero") {
    constexpr auto bytes = pack({0, 0, 0, 0});
    CHECK_EQUAL_SEQ(bytes, ARR(0,0,0,0, 0,0,0, 0,0, 0,0,0));
    CHECK(unpack(bytes) == object_id_fields{0, 0, 0, 0});
}

TEST_CASE("layout") {
    CHECK_EQUAL_SEQ(pack({1, 0, 0, 1}), ARR(0,0,0,1, 0,0,0, 0,0, 0,0,1));
    CHECK_EQUAL_SEQ(pack({0x01020304, 0x050607, 0x0809, 0x0A0B0C}),
                    ARR(0x01,0x02,0x03,0x04, 0x05,0x06,0x07, 0x08,0x09, 0x0A,0x0B,0x0C));
    CHECK_EQUAL_SEQ(pack({-1, 0xFFFFFF, 0xFFFF, 0xFFFFFF}),
                    ARR(0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF, 0xFF,0xFF, 0xFF,0xFF,0xFF));
    CHECK_EQUAL_SEQ(pack({std::numeric_limits<int32_t>::min(), 0, 0x8000, 0}),
                    ARR(0x80,0,0,0, 0,0,0, 0x80,0, 0,0,0));
}

TEST_CASE("big endian helpers") {
    std::array<uint8_t, 9> buf{};

    auto * p = write_bytes(uint32_t(0x01020304), buf.data());
    p = write_bytes(uint16_t(0x0506), p);
    p = write_u24(0x070809, p);
    CHECK(p == buf.data() + buf.size());
    CHECK_EQUAL_SEQ(buf, ARR(1,2,3,4, 5,6, 7,8,9));

    uint32_t u32 = 0;
    uint16_t u16 = 0;
    uint32_t u24 = 0;
    const uint8_t * q = buf.data();
    q = read_bytes(q, u32);
    q = read_bytes(q, u16);
    q = read_u24(q, u24);
    CHECK(q == buf.data() + buf.size());
    CHECK(u32 == 0x01020304);
    CHECK(u16 == 0x0506);
    CHECK(u24 == 0x070809);

    std::array<std::byte, 2> bytes;
    write_bytes(uint16_t(0xFFFE), bytes.data());
    CHECK(bytes[0] == std::byte{0xFF});
    CHECK(bytes[1] == std::byte{0xFE});
}

TEST_CASE("fields round trip") {
    const object_id_fields samples[] = {
        {0, 0, 0, 0},
        {1, 2, 3, 4},
        {-1, 0xFFFFFF, 0xFFFF, 0xFFFFFF},
        {std::numeric_limits<int32_t>::min(), 0x800000, 0x8000, 0x800000},
        {std::numeric_limits<int32_t>::max(), 0x7FFFFF, 0x7FFF, 0x7FFFFF},
        {1700000000, 0xABCDEF, 0x1234, 0x000001}
    };

    for (auto & fields: samples) {
        auto bytes = pack(fields);
        CHECK(unpack(bytes) == fields);
        CHECK(unpack(std::span<const uint8_t>(bytes)) == fields);
    }
}

TEST_CASE("out of range") {
    CHECK_THROWS_ERRC(pack({0, 0x01000000, 0, 0}), errc::out_of_range);
    CHECK_THROWS_ERRC(pack({0, 0, 0, 0x01000000}), errc::out_of_range);
    CHECK_THROWS_ERRC(pack({0, 0xFFFFFFFF, 0, 0}), errc::out_of_range);
    CHECK_NOTHROW(pack({0, 0x00FFFFFF, 0, 0x00FFFFFF}));
}

TEST_CASE("pack into buffer") {
    std::vector<uint8_t> buf(14, 0xEE);
    pack({1, 0, 0, 1}, buf);
    CHECK(buf == std::vector<uint8_t>{0,0,0,1, 0,0,0, 0,0, 0,0,1, 0xEE,0xEE});

    std::array<std::byte, 12> bytes;
    pack({0x01020304, 0x050607, 0x0809, 0x0A0B0C}, bytes);
    CHECK(bytes[0] == std::byte{0x01});
    CHECK(bytes[11] == std::byte{0x0C});

    std::vector<uint8_t> small(11);
    CHECK_THROWS_ERRC(pack({0, 0, 0, 0}, small), errc::invalid_length);
}

TEST_CASE("unpack length") {
    std::vector<uint8_t> short_buf(11);
    std::vector<uint8_t> long_buf(13);
    CHECK_THROWS_ERRC(unpack(short_buf), errc::invalid_length);
    CHECK_THROWS_ERRC(unpack(long_buf), errc::invalid_length);
    CHECK_THROWS_ERRC(unpack(std::span<const uint8_t>()), errc::invalid_length);
}

TEST_CASE("hex") {
    std::array<char, hex_length> str;
    auto bytes = ARR(0x01,0x23,0x45,0x67,0x89,0xAB,0xCD,0xEF,0x00,0x10,0xFE,0xFF);

    encode_hex(std::span<const uint8_t, packed_size>(bytes), str.data(), false);
    CHECK(std::string_view(str.data(), str.size()) == "0123456789abcdef0010feff");
    encode_hex(std::span<const uint8_t, packed_size>(bytes), str.data(), true);
    CHECK(std::string_view(str.data(), str.size()) == "0123456789ABCDEF0010FEFF");

    std::array<uint8_t, packed_size> decoded{};
    CHECK(decode_hex("0123456789abcdef0010FEFF", decoded));
    CHECK_EQUAL_SEQ(decoded, bytes);

    CHECK(decode_hex(u"0123456789AbCdEf0010feff", decoded));
    CHECK_EQUAL_SEQ(decoded, bytes);

    CHECK(!decode_hex("0123456789abcdef0010fefg", decoded));
    CHECK(!decode_hex("x123456789abcdef0010feff", decoded));
    CHECK(!decode_hex(L"0123456789abcdef0010fe-f", decoded));
}

TEST_CASE("hex alphabet") {
    for (unsigned i = 0; i < 16; ++i) {
        CHECK(hex_alphabet::decode(hex_alphabet::encode<char>(false, uint8_t(i))) == i);
        CHECK(hex_alphabet::decode(hex_alphabet::encode<char>(true, uint8_t(i))) == i);
        CHECK(hex_alphabet::decode(hex_alphabet::encode<char32_t>(true, uint8_t(i))) == i);
    }
    CHECK(hex_alphabet::decode('g') == hex_alphabet::size);
    CHECK(hex_alphabet::decode(' ') == hex_alphabet::size);
    CHECK(hex_alphabet::decode(char(0xC3)) == hex_alphabet::size);
    CHECK(hex_alphabet::decode(U'\x1F600') == hex_alphabet::size);
}

}
