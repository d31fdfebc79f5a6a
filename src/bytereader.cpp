/**
 * @file bytereader.cpp
 * @brief Byte reader primitives.
 */

#include <wirebin/bytereader.hpp>
#include <wirebin/log.hpp>

#include <bit>
#include <cinttypes>
#include <cstring>

namespace wirebin {

namespace {

std::uint16_t load16(const std::uint8_t* p, ByteOrder order) noexcept {
    if (order == ByteOrder::Little) {
        return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
    }
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t load32(const std::uint8_t* p, ByteOrder order) noexcept {
    std::uint32_t value = 0;
    if (order == ByteOrder::Little) {
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | p[i];
        }
    } else {
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | p[i];
        }
    }
    return value;
}

std::uint64_t load64(const std::uint8_t* p, ByteOrder order) noexcept {
    std::uint64_t value = 0;
    if (order == ByteOrder::Little) {
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | p[i];
        }
    } else {
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | p[i];
        }
    }
    return value;
}

} // namespace

Error ByteReader::fail(Error code, const char* context, std::size_t required) noexcept {
    last_error_.code = code;
    last_error_.position = pos_;
    last_error_.required = required;
    last_error_.available = remaining();
    last_error_.context = context;
    last_error_.field = field_;
    ++failure_count_;
    WIREBIN_LOG_TRACE("decode: %s failed: %s at %zu", context, error_string(code), pos_);
    return code;
}

Error ByteReader::read_byte(std::uint8_t& out) noexcept {
    if (auto err = require(1, "read byte"); err != Error::Ok) {
        return err;
    }
    out = data_[pos_++];
    WIREBIN_LOG_TRACE("decode: read byte %u (0x%02x)", out, out);
    return Error::Ok;
}

Error ByteReader::read_bool(bool& out) noexcept {
    if (auto err = require(1, "read bool"); err != Error::Ok) {
        return err;
    }
    out = data_[pos_++] != 0;
    WIREBIN_LOG_TRACE("decode: read bool %d", out ? 1 : 0);
    return Error::Ok;
}

Error ByteReader::read_uint8(std::uint8_t& out) noexcept {
    return read_byte(out);
}

Error ByteReader::read_int8(std::int8_t& out) noexcept {
    std::uint8_t b = 0;
    if (auto err = read_byte(b); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int8_t>(b);
    return Error::Ok;
}

Error ByteReader::read_uint16(ByteOrder order, std::uint16_t& out) noexcept {
    if (auto err = require(2, "read uint16"); err != Error::Ok) {
        return err;
    }
    out = load16(data_ + pos_, order);
    pos_ += 2;
    WIREBIN_LOG_TRACE("decode: read uint16 %u", out);
    return Error::Ok;
}

Error ByteReader::read_int16(ByteOrder order, std::int16_t& out) noexcept {
    std::uint16_t n = 0;
    if (auto err = read_uint16(order, n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int16_t>(n);
    return Error::Ok;
}

Error ByteReader::read_uint32(ByteOrder order, std::uint32_t& out) noexcept {
    if (auto err = require(4, "read uint32"); err != Error::Ok) {
        return err;
    }
    out = load32(data_ + pos_, order);
    pos_ += 4;
    WIREBIN_LOG_TRACE("decode: read uint32 %" PRIu32, out);
    return Error::Ok;
}

Error ByteReader::read_int32(ByteOrder order, std::int32_t& out) noexcept {
    std::uint32_t n = 0;
    if (auto err = read_uint32(order, n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int32_t>(n);
    return Error::Ok;
}

Error ByteReader::read_uint64(ByteOrder order, std::uint64_t& out) noexcept {
    if (auto err = require(8, "read uint64"); err != Error::Ok) {
        return err;
    }
    out = load64(data_ + pos_, order);
    pos_ += 8;
    WIREBIN_LOG_TRACE("decode: read uint64 %" PRIu64, out);
    return Error::Ok;
}

Error ByteReader::read_int64(ByteOrder order, std::int64_t& out) noexcept {
    std::uint64_t n = 0;
    if (auto err = read_uint64(order, n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int64_t>(n);
    return Error::Ok;
}

Error ByteReader::read_uint128(ByteOrder order, Uint128& out) noexcept {
    if (auto err = require(UINT128_SIZE, "read uint128"); err != Error::Ok) {
        return err;
    }
    const std::uint8_t* p = data_ + pos_;
    if (order == ByteOrder::Little) {
        out.lo = load64(p, order);
        out.hi = load64(p + 8, order);
    } else {
        // Word order for big-endian is unverified against reference vectors.
        out.hi = load64(p, order);
        out.lo = load64(p + 8, order);
    }
    pos_ += UINT128_SIZE;
    WIREBIN_LOG_TRACE("decode: read uint128 hi=0x%016" PRIx64 " lo=0x%016" PRIx64, out.hi,
                      out.lo);
    return Error::Ok;
}

Error ByteReader::read_int128(ByteOrder order, Int128& out) noexcept {
    Uint128 v;
    if (auto err = read_uint128(order, v); err != Error::Ok) {
        return err;
    }
    out.lo = v.lo;
    out.hi = v.hi;
    return Error::Ok;
}

Error ByteReader::read_float32(ByteOrder order, float& out) noexcept {
    if (auto err = require(4, "read float32"); err != Error::Ok) {
        return err;
    }
    out = std::bit_cast<float>(load32(data_ + pos_, order));
    pos_ += 4;
    WIREBIN_LOG_TRACE("decode: read float32 %g", static_cast<double>(out));
    return Error::Ok;
}

Error ByteReader::read_float64(ByteOrder order, double& out) noexcept {
    if (auto err = require(8, "read float64"); err != Error::Ok) {
        return err;
    }
    out = std::bit_cast<double>(load64(data_ + pos_, order));
    pos_ += 8;
    WIREBIN_LOG_TRACE("decode: read float64 %g", out);
    return Error::Ok;
}

Error ByteReader::read_uvarint64(std::uint64_t& out) noexcept {
    std::uint64_t x = 0;
    unsigned shift = 0;
    const std::size_t avail = remaining();

    for (std::size_t i = 0; i < avail; ++i) {
        if (i == MAX_VARINT_LEN64) {
            return fail(Error::InvalidVarint, "read uvarint64");
        }
        std::uint8_t b = data_[pos_ + i];
        if (b < 0x80) {
            if (i == MAX_VARINT_LEN64 - 1 && b > 1) {
                return fail(Error::InvalidVarint, "read uvarint64");
            }
            out = x | (static_cast<std::uint64_t>(b) << shift);
            pos_ += i + 1;
            WIREBIN_LOG_TRACE("decode: read uvarint64 %" PRIu64, out);
            return Error::Ok;
        }
        x |= static_cast<std::uint64_t>(b & 0x7F) << shift;
        shift += 7;
    }

    // Empty buffer or no terminating byte
    return fail(Error::InvalidVarint, "read uvarint64");
}

Error ByteReader::read_varint64(std::int64_t& out) noexcept {
    std::uint64_t ux = 0;
    if (auto err = read_uvarint64(ux); err != Error::Ok) {
        return err;
    }
    std::int64_t x = static_cast<std::int64_t>(ux >> 1);
    if ((ux & 1U) != 0) {
        x = ~x;
    }
    out = x;
    WIREBIN_LOG_TRACE("decode: read varint64 %" PRId64, out);
    return Error::Ok;
}

Error ByteReader::read_uvarint32(std::uint32_t& out) noexcept {
    std::uint64_t n = 0;
    if (auto err = read_uvarint64(n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::uint32_t>(n);
    return Error::Ok;
}

Error ByteReader::read_varint32(std::int32_t& out) noexcept {
    std::int64_t n = 0;
    if (auto err = read_varint64(n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int32_t>(n);
    return Error::Ok;
}

Error ByteReader::read_uvarint16(std::uint16_t& out) noexcept {
    std::uint64_t n = 0;
    if (auto err = read_uvarint64(n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::uint16_t>(n);
    return Error::Ok;
}

Error ByteReader::read_varint16(std::int16_t& out) noexcept {
    std::int64_t n = 0;
    if (auto err = read_varint64(n); err != Error::Ok) {
        return err;
    }
    out = static_cast<std::int16_t>(n);
    return Error::Ok;
}

Error ByteReader::read_n_bytes(std::size_t n, std::vector<std::uint8_t>& out) {
    if (auto err = require(n, "read bytes"); err != Error::Ok) {
        return err;
    }
    out.assign(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return Error::Ok;
}

Error ByteReader::read_type_id(TypeID& out) noexcept {
    if (auto err = require(TYPE_ID_SIZE, "read type id"); err != Error::Ok) {
        return err;
    }
    std::memcpy(out.data(), data_ + pos_, TYPE_ID_SIZE);
    pos_ += TYPE_ID_SIZE;
    return Error::Ok;
}

Error ByteReader::read_rust_string(std::string& out) {
    const std::size_t start = pos_;
    std::uint64_t length = 0;
    if (auto err = read_uint64(ByteOrder::Little, length); err != Error::Ok) {
        return err;
    }
    if (remaining() < length) {
        auto err = fail(Error::TruncatedInput, "read rust string",
                        static_cast<std::size_t>(length));
        pos_ = start;
        return err;
    }
    out.assign(reinterpret_cast<const char*>(data_ + pos_), static_cast<std::size_t>(length));
    pos_ += static_cast<std::size_t>(length);
    WIREBIN_LOG_TRACE("decode: read rust string len=%zu", out.size());
    return Error::Ok;
}

Error ByteReader::peek(std::size_t n, std::span<const std::uint8_t>& out) noexcept {
    if (auto err = require(n, "peek"); err != Error::Ok) {
        return err;
    }
    out = std::span<const std::uint8_t>(data_ + pos_, n);
    return Error::Ok;
}

Error ByteReader::skip(std::size_t n) noexcept {
    if (auto err = require(n, "skip"); err != Error::Ok) {
        return err;
    }
    pos_ += n;
    return Error::Ok;
}

Error ByteReader::set_position(std::size_t pos) noexcept {
    if (pos > size_) {
        return fail(Error::InvalidPosition, "set position");
    }
    pos_ = pos;
    return Error::Ok;
}

} // namespace wirebin
