/**
 * @file compact_u16.hpp
 * @brief Compact-u16 length prefix decoding.
 *
 * A compact-u16 is a 16-bit length stored in one to three bytes, seven
 * bits per byte, least significant group first. The high bit of each
 * byte flags a following byte.
 *
 * @par Canonical form
 * - A continuation byte of zero after the first byte is an alias of a
 *   shorter encoding and is rejected.
 * - The third byte may only carry the top two bits (value <= 0x03).
 */

#ifndef WIREBIN_COMPACT_U16_HPP
#define WIREBIN_COMPACT_U16_HPP

#include "config.hpp"
#include "error.hpp"

#include <algorithm>
#include <span>

namespace wirebin {

/**
 * @brief Decode a compact-u16 from the start of a byte span.
 *
 * @param bytes Available input bytes
 * @param[out] value Decoded length
 * @param[out] consumed Number of bytes the encoding occupies
 * @return Error::Ok, Error::TruncatedInput if the input ends inside the
 *         encoding, Error::InvalidCompactU16 for an alias or overflow
 */
Error decode_compact_u16(std::span<const std::uint8_t> bytes, std::size_t& value,
                         std::size_t& consumed) noexcept;

/**
 * @brief Read a compact-u16 length from a peekable byte source.
 *
 * The source is only advanced on success.
 *
 * @tparam Source Type providing remaining(), peek(), skip() and fail()
 * @param src Byte source positioned at the length
 * @param[out] length Decoded length
 * @return Error::Ok on success
 */
template <class Source> Error read_compact_u16(Source& src, std::size_t& length) noexcept {
    std::size_t avail = std::min(src.remaining(), COMPACT_U16_MAX_BYTES);
    std::span<const std::uint8_t> window;
    if (auto err = src.peek(avail, window); err != Error::Ok) {
        return err;
    }

    std::size_t consumed = 0;
    auto err = decode_compact_u16(window, length, consumed);
    if (err != Error::Ok) {
        return src.fail(err, "read compact-u16 length", consumed + 1);
    }
    return src.skip(consumed);
}

} // namespace wirebin

#endif // WIREBIN_COMPACT_U16_HPP
