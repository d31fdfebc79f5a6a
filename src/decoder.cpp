/**
 * @file decoder.cpp
 * @brief Encoding-dependent reads of the decode session.
 */

#include <wirebin/compact_u16.hpp>
#include <wirebin/decoder.hpp>
#include <wirebin/log.hpp>

#include <cmath>

namespace wirebin {

namespace {

constexpr std::string_view REPLACEMENT_CHAR = "\xEF\xBF\xBD";

/// Length of the valid UTF-8 sequence at s[i], or 0 if invalid
std::size_t utf8_sequence_length(std::string_view s, std::size_t i) noexcept {
    auto at = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    auto cont = [&](std::size_t k, unsigned char lo, unsigned char hi) {
        return k < s.size() && at(k) >= lo && at(k) <= hi;
    };

    unsigned char b = at(i);
    if (b < 0x80) {
        return 1;
    }
    if (b >= 0xC2 && b <= 0xDF) {
        return cont(i + 1, 0x80, 0xBF) ? 2 : 0;
    }
    if (b >= 0xE0 && b <= 0xEF) {
        unsigned char lo = (b == 0xE0) ? 0xA0 : 0x80;
        unsigned char hi = (b == 0xED) ? 0x9F : 0xBF;
        return (cont(i + 1, lo, hi) && cont(i + 2, 0x80, 0xBF)) ? 3 : 0;
    }
    if (b >= 0xF0 && b <= 0xF4) {
        unsigned char lo = (b == 0xF0) ? 0x90 : 0x80;
        unsigned char hi = (b == 0xF4) ? 0x8F : 0xBF;
        return (cont(i + 1, lo, hi) && cont(i + 2, 0x80, 0xBF) && cont(i + 3, 0x80, 0xBF)) ? 4
                                                                                            : 0;
    }
    return 0;
}

} // namespace

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t n = utf8_sequence_length(bytes, i);
        if (n == 0) {
            out.append(REPLACEMENT_CHAR);
            ++i;
        } else {
            out.append(bytes.substr(i, n));
            i += n;
        }
    }
    return out;
}

Error Decoder::read_length(std::size_t& length) noexcept {
    switch (encoding_) {
    case Encoding::Bin: {
        std::uint64_t val = 0;
        if (auto err = read_uvarint64(val); err != Error::Ok) {
            return err;
        }
        length = static_cast<std::size_t>(val);
        break;
    }
    case Encoding::Borsh: {
        std::uint32_t val = 0;
        if (auto err = read_uint32(ByteOrder::Little, val); err != Error::Ok) {
            return err;
        }
        length = val;
        break;
    }
    case Encoding::CompactU16:
        if (auto err = read_compact_u16(*this, length); err != Error::Ok) {
            return err;
        }
        break;
    default:
        return fail(Error::InvalidArgument, "read length: encoding not implemented");
    }
    WIREBIN_LOG_TRACE("decode: read length %zu (%s)", length, encoding_name(encoding_));
    return Error::Ok;
}

Error Decoder::read_byte_slice(std::vector<std::uint8_t>& out) {
    const std::size_t start = position();
    std::size_t length = 0;
    if (auto err = read_length(length); err != Error::Ok) {
        return err;
    }
    if (remaining() < length) {
        auto err = fail(Error::TruncatedInput, "read byte slice", length);
        rewind_to(start);
        return err;
    }
    out.assign(data() + position(), data() + position() + length);
    advance(length);
    WIREBIN_LOG_TRACE("decode: read byte slice len=%zu", length);
    return Error::Ok;
}

Error Decoder::read_string(std::string& out) {
    std::vector<std::uint8_t> bytes;
    if (auto err = read_byte_slice(bytes); err != Error::Ok) {
        return err;
    }
    out.assign(bytes.begin(), bytes.end());
    return Error::Ok;
}

Error Decoder::read_utf8_string(std::string& out) {
    std::vector<std::uint8_t> bytes;
    if (auto err = read_byte_slice(bytes); err != Error::Ok) {
        return err;
    }
    out = sanitize_utf8(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    WIREBIN_LOG_TRACE("decode: read utf8 string len=%zu", out.size());
    return Error::Ok;
}

Error Decoder::read_compact_u16_length(std::size_t& length) noexcept {
    if (auto err = read_compact_u16(*this, length); err != Error::Ok) {
        return err;
    }
    WIREBIN_LOG_TRACE("decode: read compact-u16 length %zu", length);
    return Error::Ok;
}

Error Decoder::read_float32(ByteOrder order, float& out) noexcept {
    float value = 0.0F;
    if (auto err = ByteReader::read_float32(order, value); err != Error::Ok) {
        return err;
    }
    if (is_borsh() && std::isnan(value)) {
        out = 0.0F;
        return fail(Error::DisallowedNaN, "read float32");
    }
    out = value;
    return Error::Ok;
}

Error Decoder::read_float64(ByteOrder order, double& out) noexcept {
    double value = 0.0;
    if (auto err = ByteReader::read_float64(order, value); err != Error::Ok) {
        return err;
    }
    if (is_borsh() && std::isnan(value)) {
        out = 0.0;
        return fail(Error::DisallowedNaN, "read float64");
    }
    out = value;
    return Error::Ok;
}

Error Decoder::read_float128(ByteOrder order, Float128& out) noexcept {
    return read_uint128(order, out.bits);
}

} // namespace wirebin
