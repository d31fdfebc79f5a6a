/**
 * @file test_varint.cpp
 * @brief Unit tests for LEB128 varint reads.
 */

#include <catch2/catch_test_macros.hpp>
#include <wirebin/bytereader.hpp>

#include <cstdint>
#include <limits>
#include <vector>

using namespace wirebin;

namespace {

std::vector<std::uint8_t> put_uvarint(std::uint64_t x) {
    std::vector<std::uint8_t> out;
    while (x >= 0x80) {
        out.push_back(static_cast<std::uint8_t>(x | 0x80));
        x >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(x));
    return out;
}

std::vector<std::uint8_t> put_varint(std::int64_t x) {
    std::uint64_t ux = static_cast<std::uint64_t>(x) << 1;
    if (x < 0) {
        ux = ~ux;
    }
    return put_uvarint(ux);
}

} // namespace

TEST_CASE("Unsigned varint known encodings", "[varint]") {
    SECTION("single byte") {
        std::uint8_t data[] = {0x05};
        ByteReader reader(data, 1);
        std::uint64_t v = 0;
        REQUIRE(reader.read_uvarint64(v) == Error::Ok);
        REQUIRE(v == 5);
        REQUIRE(reader.position() == 1);
    }

    SECTION("300") {
        std::uint8_t data[] = {0xAC, 0x02};
        ByteReader reader(data, 2);
        std::uint64_t v = 0;
        REQUIRE(reader.read_uvarint64(v) == Error::Ok);
        REQUIRE(v == 300);
        REQUIRE(reader.remaining() == 0);
    }

    SECTION("max uint64") {
        std::uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
        ByteReader reader(data, sizeof(data));
        std::uint64_t v = 0;
        REQUIRE(reader.read_uvarint64(v) == Error::Ok);
        REQUIRE(v == std::numeric_limits<std::uint64_t>::max());
    }
}

TEST_CASE("Unsigned varint failures", "[varint]") {
    std::uint64_t v = 0;

    SECTION("empty buffer") {
        ByteReader reader(nullptr, 0);
        REQUIRE(reader.read_uvarint64(v) == Error::InvalidVarint);
    }

    SECTION("no terminating byte") {
        std::uint8_t data[] = {0x80, 0x80};
        ByteReader reader(data, 2);
        REQUIRE(reader.read_uvarint64(v) == Error::InvalidVarint);
        REQUIRE(reader.position() == 0);
    }

    SECTION("tenth byte above one overflows") {
        std::uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02};
        ByteReader reader(data, sizeof(data));
        REQUIRE(reader.read_uvarint64(v) == Error::InvalidVarint);
        REQUIRE(reader.position() == 0);
    }

    SECTION("eleven bytes overflow") {
        std::uint8_t data[] = {0x80, 0x80, 0x80, 0x80, 0x80, 0x80,
                               0x80, 0x80, 0x80, 0x80, 0x00};
        ByteReader reader(data, sizeof(data));
        REQUIRE(reader.read_uvarint64(v) == Error::InvalidVarint);
    }
}

TEST_CASE("Varint round trip", "[varint]") {
    SECTION("unsigned") {
        const std::uint64_t values[] = {0,
                                        1,
                                        127,
                                        128,
                                        16383,
                                        16384,
                                        0xFFFFFFFFULL,
                                        0x100000000ULL,
                                        std::numeric_limits<std::uint64_t>::max() - 1,
                                        std::numeric_limits<std::uint64_t>::max()};
        for (std::uint64_t n : values) {
            auto bytes = put_uvarint(n);
            ByteReader reader(bytes.data(), bytes.size());
            std::uint64_t out = 0;
            REQUIRE(reader.read_uvarint64(out) == Error::Ok);
            REQUIRE(out == n);
            REQUIRE(reader.remaining() == 0);
        }
    }

    SECTION("signed") {
        const std::int64_t values[] = {0,
                                       1,
                                       -1,
                                       63,
                                       -64,
                                       64,
                                       -65,
                                       1000000,
                                       -1000000,
                                       std::numeric_limits<std::int64_t>::max(),
                                       std::numeric_limits<std::int64_t>::min()};
        for (std::int64_t n : values) {
            auto bytes = put_varint(n);
            ByteReader reader(bytes.data(), bytes.size());
            std::int64_t out = 0;
            REQUIRE(reader.read_varint64(out) == Error::Ok);
            REQUIRE(out == n);
            REQUIRE(reader.remaining() == 0);
        }
    }
}

TEST_CASE("Signed varint zig-zag mapping", "[varint]") {
    std::uint8_t data[] = {0x00, 0x01, 0x02, 0x03};
    ByteReader reader(data, 4);
    std::int64_t v = 99;

    REQUIRE(reader.read_varint64(v) == Error::Ok);
    REQUIRE(v == 0);
    REQUIRE(reader.read_varint64(v) == Error::Ok);
    REQUIRE(v == -1);
    REQUIRE(reader.read_varint64(v) == Error::Ok);
    REQUIRE(v == 1);
    REQUIRE(reader.read_varint64(v) == Error::Ok);
    REQUIRE(v == -2);
}

TEST_CASE("Narrow varint reads truncate", "[varint]") {
    auto bytes = put_uvarint(0x1234567ULL);

    SECTION("uvarint32 keeps value in range") {
        ByteReader reader(bytes.data(), bytes.size());
        std::uint32_t v = 0;
        REQUIRE(reader.read_uvarint32(v) == Error::Ok);
        REQUIRE(v == 0x1234567U);
    }

    SECTION("uvarint16 drops high bits") {
        ByteReader reader(bytes.data(), bytes.size());
        std::uint16_t v = 0;
        REQUIRE(reader.read_uvarint16(v) == Error::Ok);
        REQUIRE(v == 0x4567);
    }

    SECTION("varint32 and varint16") {
        auto neg = put_varint(-300);
        ByteReader r32(neg.data(), neg.size());
        std::int32_t v32 = 0;
        REQUIRE(r32.read_varint32(v32) == Error::Ok);
        REQUIRE(v32 == -300);

        ByteReader r16(neg.data(), neg.size());
        std::int16_t v16 = 0;
        REQUIRE(r16.read_varint16(v16) == Error::Ok);
        REQUIRE(v16 == -300);
    }
}
