/**
 * @file test_properties.cpp
 * @brief End-to-end wire format properties across the three encodings.
 */

#include <catch2/catch_test_macros.hpp>
#include <wirebin/wirebin.hpp>

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace wirebin;

namespace {

struct Extended {
    std::uint16_t a = 0;
    std::uint32_t b = 0;
    std::optional<std::string> c;

    static constexpr auto binary_fields() {
        return std::make_tuple(field("A", &Extended::a),
                               field("B", &Extended::b, "binary_extension"),
                               field("C", &Extended::c, "binary_extension optional"));
    }
};

struct Misordered {
    std::uint8_t a = 0;
    std::uint8_t b = 0;

    static constexpr auto binary_fields() {
        return std::make_tuple(field("A", &Misordered::a, "binary_extension"),
                               field("B", &Misordered::b));
    }
};

struct ByteCount {
    std::uint8_t len = 0;
    std::vector<std::uint8_t> items;

    static constexpr auto binary_fields() {
        return std::make_tuple(field("Len", &ByteCount::len, "sizeof=Items"),
                               field("Items", &ByteCount::items));
    }
};

struct WordCount {
    std::uint32_t len = 0;
    std::vector<std::uint8_t> items;

    static constexpr auto binary_fields() {
        return std::make_tuple(field("Len", &WordCount::len, "sizeof=Items"),
                               field("Items", &WordCount::items));
    }
};

struct QuietLog {
    QuietLog() {
        sink_ = std::tmpfile();
        log::set_sink(sink_);
    }
    ~QuietLog() {
        log::set_sink(nullptr);
        if (sink_ != nullptr) {
            std::fclose(sink_);
        }
    }

private:
    std::FILE* sink_ = nullptr;
};

} // namespace

TEST_CASE("Fixed-width reads never advance on truncation", "[properties]") {
    std::uint8_t data[7] = {};

    for (std::size_t size = 0; size < 8; ++size) {
        ByteReader reader(data, size);
        std::uint64_t u64 = 0;
        REQUIRE(reader.read_uint64(ByteOrder::Little, u64) == Error::TruncatedInput);
        REQUIRE(reader.position() == 0);
        REQUIRE(reader.last_error().required == 8);
        REQUIRE(reader.last_error().available == size);

        if (size < 4) {
            std::uint32_t u32 = 0;
            REQUIRE(reader.read_uint32(ByteOrder::Big, u32) == Error::TruncatedInput);
            float f32 = 0.0F;
            REQUIRE(reader.read_float32(ByteOrder::Little, f32) == Error::TruncatedInput);
            REQUIRE(reader.position() == 0);
        }
        if (size < 2) {
            std::int16_t i16 = 0;
            REQUIRE(reader.read_int16(ByteOrder::Little, i16) == Error::TruncatedInput);
            REQUIRE(reader.position() == 0);
        }
    }
}

TEST_CASE("Absent optional consumes exactly the presence byte", "[properties]") {
    FieldDirective directive;
    directive.is_optional = true;

    SECTION("regardless of the wrapped type's size") {
        std::uint8_t data[] = {0x00, 0xAA, 0xBB};

        auto dec64 = Decoder::bin(data);
        std::optional<std::uint64_t> v64 = 1;
        REQUIRE(decode_value(dec64, v64, directive) == Error::Ok);
        REQUIRE_FALSE(v64.has_value());
        REQUIRE(dec64.position() == 1);

        auto decs = Decoder::borsh(data);
        std::optional<std::string> vs = std::string("old");
        REQUIRE(decode_value(decs, vs, directive) == Error::Ok);
        REQUIRE_FALSE(vs.has_value());
        REQUIRE(decs.position() == 1);

        auto deci = Decoder::bin(data);
        std::uint32_t plain = 77;
        REQUIRE(decode_value(deci, plain, directive) == Error::Ok);
        REQUIRE(plain == 0);
        REQUIRE(deci.position() == 1);
    }

    SECTION("present value follows a non-zero byte") {
        std::uint8_t data[] = {0x07, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        auto dec = Decoder::bin(data);
        std::optional<std::uint64_t> v;
        REQUIRE(decode_value(dec, v, directive) == Error::Ok);
        REQUIRE(v == std::uint64_t{1});
        REQUIRE(dec.remaining() == 0);
    }
}

TEST_CASE("Extension fields are forward compatible", "[properties]") {
    SECTION("only the leading field present") {
        std::uint8_t data[] = {0x05, 0x00};
        Extended e;
        REQUIRE(unmarshal_bin(data, e) == Error::Ok);
        REQUIRE(e.a == 5);
        REQUIRE(e.b == 0);
        REQUIRE_FALSE(e.c.has_value());
    }

    SECTION("all fields present") {
        std::uint8_t data[] = {0x05, 0x00, 0x09, 0x00, 0x00, 0x00, 0x01, 0x02, 'h', 'i'};
        Extended e;
        REQUIRE(unmarshal_bin(data, e) == Error::Ok);
        REQUIRE(e.a == 5);
        REQUIRE(e.b == 9);
        REQUIRE(e.c == std::string("hi"));
    }

    SECTION("extension truncated partway still fails") {
        std::uint8_t data[] = {0x05, 0x00, 0x09, 0x00};
        Extended e;
        REQUIRE(unmarshal_bin(data, e) == Error::TruncatedInput);
    }
}

TEST_CASE("Size linkage supplies the sequence count", "[properties]") {
    SECTION("one-byte size field") {
        std::uint8_t data[] = {0x03, 0x41, 0x42, 0x43};
        auto dec = Decoder::bin(data);
        ByteCount r;
        REQUIRE(decode(dec, r) == Error::Ok);
        REQUIRE(r.len == 3);
        REQUIRE(r.items == std::vector<std::uint8_t>{0x41, 0x42, 0x43});
        REQUIRE(dec.position() == 4);
    }

    SECTION("four-byte size field") {
        std::uint8_t data[] = {0x03, 0x00, 0x00, 0x00, 0x41, 0x42, 0x43};
        auto dec = Decoder::bin(data);
        WordCount r;
        REQUIRE(decode(dec, r) == Error::Ok);
        REQUIRE(r.len == 3);
        REQUIRE(r.items == std::vector<std::uint8_t>{0x41, 0x42, 0x43});
        REQUIRE(dec.position() == 7);
    }
}

TEST_CASE("Length prefix follows the encoding", "[properties]") {
    std::uint8_t bin[] = {0x05, 1, 2, 3, 4, 5};
    std::uint8_t borsh[] = {0x05, 0x00, 0x00, 0x00, 1, 2, 3, 4, 5};
    std::uint8_t compact[] = {0x05, 1, 2, 3, 4, 5};

    std::size_t length = 0;
    auto dec_bin = Decoder::bin(bin);
    REQUIRE(dec_bin.read_length(length) == Error::Ok);
    REQUIRE(length == 5);
    REQUIRE(dec_bin.position() == 1);

    auto dec_borsh = Decoder::borsh(borsh);
    REQUIRE(dec_borsh.read_length(length) == Error::Ok);
    REQUIRE(length == 5);
    REQUIRE(dec_borsh.position() == 4);

    auto dec_compact = Decoder::compact_u16(compact);
    REQUIRE(dec_compact.read_length(length) == Error::Ok);
    REQUIRE(length == 5);
    REQUIRE(dec_compact.position() == 1);

    std::string a;
    std::string b;
    REQUIRE(unmarshal_bin(bin, a) == Error::Ok);
    REQUIRE(unmarshal_borsh(borsh, b) == Error::Ok);
    REQUIRE(a == b);
    REQUIRE(a.size() == 5);
}

TEST_CASE("NaN is rejected only under Borsh", "[properties]") {
    std::uint8_t nan_bits[] = {0x01, 0x00, 0x80, 0x7F};

    float borsh_value = 0.0F;
    ErrorInfo info;
    REQUIRE(unmarshal_borsh(nan_bits, borsh_value, &info) == Error::DisallowedNaN);
    REQUIRE(info.code == Error::DisallowedNaN);

    float bin_value = 0.0F;
    REQUIRE(unmarshal_bin(nan_bits, bin_value) == Error::Ok);
    REQUIRE(std::isnan(bin_value));

    float compact_value = 0.0F;
    REQUIRE(unmarshal_compact_u16(nan_bits, compact_value) == Error::Ok);
    REQUIRE(std::isnan(compact_value));
}

TEST_CASE("Misordered extension fields fail before reading", "[properties]") {
    STATIC_REQUIRE_FALSE(has_valid_field_order<Misordered>());
    STATIC_REQUIRE(misordered_field_index<Misordered>() == 1);
    STATIC_REQUIRE(has_valid_field_order<Extended>());

    QuietLog quiet;
    std::uint8_t data[] = {0x01, 0x02};
    auto dec = Decoder::bin(data);
    Misordered m;
    REQUIRE(decode(dec, m) == Error::TagOrderingViolation);
    REQUIRE(dec.position() == 0);
    REQUIRE(dec.last_error().position == 0);
    REQUIRE(dec.last_error().field == "B");
    REQUIRE(m.a == 0);

    SECTION("also when nested in a sequence") {
        std::uint8_t seq[] = {0x01, 0x01, 0x02};
        std::vector<Misordered> v;
        ErrorInfo info;
        REQUIRE(unmarshal_bin(seq, v, &info) == Error::TagOrderingViolation);
        REQUIRE(info.position == 1);
    }

#if !WIREBIN_NO_EXCEPTIONS
    SECTION("throwing entry point reports a definition error") {
        REQUIRE_THROWS_AS(unmarshal_or_throw<Misordered>(data, Encoding::Bin),
                          DefinitionException);
    }
#endif
}
