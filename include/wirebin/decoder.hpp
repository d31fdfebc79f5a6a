/**
 * @file decoder.hpp
 * @brief Decode session: byte reader plus wire encoding.
 *
 * A Decoder is created for one buffer and one encoding and is then
 * passed through every step of a decode. The encoding decides the
 * length prefix of byte slices and strings (read_length()) and whether
 * floats may be NaN. It cannot change after construction.
 *
 * Custom decoders receive the live Decoder and read from it directly.
 */

#ifndef WIREBIN_DECODER_HPP
#define WIREBIN_DECODER_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "uint128.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wirebin {

/**
 * @brief Decode session over an in-memory buffer.
 *
 * The buffer is not copied and must outlive the session. A session is
 * not safe for concurrent use.
 */
class Decoder : public ByteReader {
public:
    Decoder(std::span<const std::uint8_t> data, Encoding encoding) noexcept
        : ByteReader(data), encoding_(encoding) {}

    Decoder(const std::uint8_t* data, std::size_t size, Encoding encoding) noexcept
        : ByteReader(data, size), encoding_(encoding) {}

    static Decoder bin(std::span<const std::uint8_t> data) noexcept {
        return Decoder(data, Encoding::Bin);
    }

    static Decoder borsh(std::span<const std::uint8_t> data) noexcept {
        return Decoder(data, Encoding::Borsh);
    }

    static Decoder compact_u16(std::span<const std::uint8_t> data) noexcept {
        return Decoder(data, Encoding::CompactU16);
    }

    [[nodiscard]] Encoding encoding() const noexcept {
        return encoding_;
    }

    [[nodiscard]] bool is_bin() const noexcept {
        return encoding_ == Encoding::Bin;
    }

    [[nodiscard]] bool is_borsh() const noexcept {
        return encoding_ == Encoding::Borsh;
    }

    [[nodiscard]] bool is_compact_u16() const noexcept {
        return encoding_ == Encoding::CompactU16;
    }

    /**
     * @brief Read the length prefix of a byte slice or string.
     *
     * - Bin: unsigned LEB128
     * - Borsh: 4-byte little-endian
     * - CompactU16: compact-u16
     *
     * @param[out] length Decoded length
     * @return Error::Ok on success
     */
    Error read_length(std::size_t& length) noexcept;

    /**
     * @brief Read a length-prefixed byte slice.
     *
     * The cursor is left unmoved if the content is truncated.
     */
    Error read_byte_slice(std::vector<std::uint8_t>& out);

    /// Length-prefixed string, bytes copied as-is
    Error read_string(std::string& out);

    /**
     * @brief Length-prefixed string with invalid UTF-8 replaced.
     *
     * Each byte that does not start a valid UTF-8 sequence becomes
     * U+FFFD.
     */
    Error read_utf8_string(std::string& out);

    /// Compact-u16 length regardless of the session encoding
    Error read_compact_u16_length(std::size_t& length) noexcept;

    /**
     * @brief Read a float32; Borsh sessions reject NaN.
     *
     * @return Error::Ok, Error::TruncatedInput, or Error::DisallowedNaN
     */
    Error read_float32(ByteOrder order, float& out) noexcept;

    /// Float64 counterpart of read_float32()
    Error read_float64(ByteOrder order, double& out) noexcept;

    Error read_float128(ByteOrder order, Float128& out) noexcept;

private:
    Encoding encoding_;
};

/**
 * @brief Replace invalid UTF-8 sequences with U+FFFD.
 *
 * @param bytes Raw bytes
 * @return Sanitized string
 */
std::string sanitize_utf8(std::string_view bytes);

} // namespace wirebin

#endif // WIREBIN_DECODER_HPP
