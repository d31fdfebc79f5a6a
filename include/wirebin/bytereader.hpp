/**
 * @file bytereader.hpp
 * @brief Bounds-checked sequential reads over a byte buffer.
 *
 * The byte reader owns the read cursor of a decode session. Every read
 * checks the remaining byte count before touching the cursor, so a
 * failed read never moves it. Fixed-width reads take an explicit byte
 * order; the reader itself has no default.
 *
 * @par Variable-length integers
 * Unsigned values use LEB128. Signed values use zig-zag mapping on top
 * of LEB128. Encodings longer than ten bytes, or whose tenth byte
 * carries more than the final bit, are rejected as overflow.
 */

#ifndef WIREBIN_BYTEREADER_HPP
#define WIREBIN_BYTEREADER_HPP

#include "config.hpp"
#include "error.hpp"
#include "uint128.hpp"

#include <array>
#include <span>
#include <string>
#include <vector>

namespace wirebin {

/// 8-byte type discriminator
using TypeID = std::array<std::uint8_t, TYPE_ID_SIZE>;

/**
 * @brief Sequential byte reader with a bounds-checked cursor.
 *
 * Does not own the buffer; the caller keeps it alive for the lifetime
 * of the reader. Not safe for concurrent use.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    explicit ByteReader(std::span<const std::uint8_t> data) noexcept
        : ByteReader(data.data(), data.size()) {}

    /**
     * @brief Read a single byte.
     *
     * @param[out] out Byte value
     * @return Error::Ok, or Error::TruncatedInput at the buffer end
     */
    Error read_byte(std::uint8_t& out) noexcept;

    /**
     * @brief Read a boolean byte.
     *
     * Any non-zero byte is true.
     *
     * @param[out] out Decoded flag
     * @return Error::Ok, or Error::TruncatedInput at the buffer end
     */
    Error read_bool(bool& out) noexcept;

    /// Same as read_byte()
    Error read_uint8(std::uint8_t& out) noexcept;

    /// Single byte as two's complement
    Error read_int8(std::int8_t& out) noexcept;

    /**
     * @brief Read a 16-bit unsigned integer.
     *
     * @param order Byte order of the two bytes
     * @param[out] out Decoded value
     * @return Error::Ok, or Error::TruncatedInput if fewer than 2 bytes remain
     */
    Error read_uint16(ByteOrder order, std::uint16_t& out) noexcept;

    /// Two's complement counterpart of read_uint16()
    Error read_int16(ByteOrder order, std::int16_t& out) noexcept;

    /**
     * @brief Read a 32-bit unsigned integer.
     *
     * @param order Byte order of the four bytes
     * @param[out] out Decoded value
     * @return Error::Ok, or Error::TruncatedInput if fewer than 4 bytes remain
     */
    Error read_uint32(ByteOrder order, std::uint32_t& out) noexcept;

    /// Two's complement counterpart of read_uint32()
    Error read_int32(ByteOrder order, std::int32_t& out) noexcept;

    /**
     * @brief Read a 64-bit unsigned integer.
     *
     * @param order Byte order of the eight bytes
     * @param[out] out Decoded value
     * @return Error::Ok, or Error::TruncatedInput if fewer than 8 bytes remain
     */
    Error read_uint64(ByteOrder order, std::uint64_t& out) noexcept;

    /// Two's complement counterpart of read_uint64()
    Error read_int64(ByteOrder order, std::int64_t& out) noexcept;

    /**
     * @brief Read a 128-bit value as two 64-bit words.
     *
     * Little-endian: first word is the low half. Big-endian: first word
     * is the high half.
     */
    Error read_uint128(ByteOrder order, Uint128& out) noexcept;

    /// Signed view of read_uint128()
    Error read_int128(ByteOrder order, Int128& out) noexcept;

    /**
     * @brief Read an IEEE-754 single.
     *
     * Raw bit pattern, NaN is not checked here.
     *
     * @param order Byte order of the four bytes
     * @param[out] out Decoded value
     * @return Error::Ok, or Error::TruncatedInput if fewer than 4 bytes remain
     */
    Error read_float32(ByteOrder order, float& out) noexcept;

    /// Double counterpart of read_float32()
    Error read_float64(ByteOrder order, double& out) noexcept;

    /**
     * @brief Read an unsigned LEB128 varint.
     *
     * @param[out] out Decoded value
     * @return Error::Ok, or Error::InvalidVarint if the encoding does not
     *         terminate within the buffer or overflows 64 bits
     */
    Error read_uvarint64(std::uint64_t& out) noexcept;

    /// Zig-zag LEB128 signed varint
    Error read_varint64(std::int64_t& out) noexcept;

    // Truncating conveniences; range checking is up to the caller.
    Error read_uvarint32(std::uint32_t& out) noexcept;
    Error read_varint32(std::int32_t& out) noexcept;
    Error read_uvarint16(std::uint16_t& out) noexcept;
    Error read_varint16(std::int16_t& out) noexcept;

    /**
     * @brief Copy the next n bytes.
     *
     * @param n Byte count
     * @param[out] out Replaced with the bytes read
     * @return Error::Ok, or Error::TruncatedInput if fewer than n bytes remain
     */
    Error read_n_bytes(std::size_t n, std::vector<std::uint8_t>& out);

    /// 8-byte type discriminator
    Error read_type_id(TypeID& out) noexcept;

    /**
     * @brief Read a string with an 8-byte little-endian length prefix.
     *
     * The prefix format is fixed regardless of the session encoding and
     * the content is copied verbatim.
     */
    Error read_rust_string(std::string& out);

    /**
     * @brief View the next n bytes without consuming them.
     */
    Error peek(std::size_t n, std::span<const std::uint8_t>& out) noexcept;

    Error skip(std::size_t n) noexcept;

    /**
     * @brief Move the cursor.
     *
     * @param pos New position, at most size()
     * @return Error::Ok, or Error::InvalidPosition if beyond the buffer end
     */
    Error set_position(std::size_t pos) noexcept;

    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

    [[nodiscard]] bool has_remaining() const noexcept {
        return pos_ < size_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_;
    }

    /// Details of the most recent failure
    [[nodiscard]] const ErrorInfo& last_error() const noexcept {
        return last_error_;
    }

    /// Number of failures recorded so far
    [[nodiscard]] std::size_t failure_count() const noexcept {
        return failure_count_;
    }

    /**
     * @brief Record a failure at the current position and return its code.
     *
     * @param code Error code
     * @param context Static description of the failed read
     * @param required Bytes the read needed (TruncatedInput only)
     */
    Error fail(Error code, const char* context, std::size_t required = 0) noexcept;

    /// Name the record field that subsequent failures belong to
    void set_field(std::string_view field) noexcept {
        field_ = field;
    }

    [[nodiscard]] std::string_view field() const noexcept {
        return field_;
    }

protected:
    /// Move the cursor to a position already known to be valid
    void rewind_to(std::size_t pos) noexcept {
        pos_ = pos;
    }

    /// Advance over bytes already known to be available
    void advance(std::size_t n) noexcept {
        pos_ += n;
    }

private:
    Error require(std::size_t n, const char* context) noexcept {
        if (remaining() < n) [[unlikely]] {
            return fail(Error::TruncatedInput, context, n);
        }
        return Error::Ok;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
    std::string_view field_;
    ErrorInfo last_error_;
    std::size_t failure_count_ = 0;
};

} // namespace wirebin

#endif // WIREBIN_BYTEREADER_HPP
