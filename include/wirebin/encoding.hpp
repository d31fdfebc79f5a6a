/**
 * @file encoding.hpp
 * @brief Supported wire encodings.
 */

#ifndef WIREBIN_ENCODING_HPP
#define WIREBIN_ENCODING_HPP

#include "config.hpp"

namespace wirebin {

/**
 * @brief Wire encoding of a decode session.
 *
 * The encodings differ in the length prefix of byte slices and strings
 * and in whether NaN floats are accepted:
 * - Bin: unsigned LEB128 length, NaN accepted
 * - Borsh: 4-byte little-endian length, NaN rejected
 * - CompactU16: compact-u16 length, NaN accepted
 */
enum class Encoding : std::uint8_t {
    Bin = 0,
    Borsh = 1,
    CompactU16 = 2
};

inline constexpr bool is_valid_encoding(Encoding encoding) noexcept {
    return encoding == Encoding::Bin || encoding == Encoding::Borsh ||
           encoding == Encoding::CompactU16;
}

inline constexpr const char* encoding_name(Encoding encoding) noexcept {
    switch (encoding) {
    case Encoding::Bin:
        return "Bin";
    case Encoding::Borsh:
        return "Borsh";
    case Encoding::CompactU16:
        return "CompactU16";
    default:
        return "Unknown";
    }
}

} // namespace wirebin

#endif // WIREBIN_ENCODING_HPP
