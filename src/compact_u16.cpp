/**
 * @file compact_u16.cpp
 * @brief Compact-u16 decoding.
 */

#include <wirebin/compact_u16.hpp>

namespace wirebin {

Error decode_compact_u16(std::span<const std::uint8_t> bytes, std::size_t& value,
                         std::size_t& consumed) noexcept {
    std::size_t result = 0;

    for (std::size_t i = 0; i < COMPACT_U16_MAX_BYTES; ++i) {
        if (i >= bytes.size()) {
            consumed = i;
            return Error::TruncatedInput;
        }

        std::uint8_t elem = bytes[i];
        if (elem == 0 && i != 0) {
            consumed = i;
            return Error::InvalidCompactU16;
        }
        if (i == COMPACT_U16_MAX_BYTES - 1 && elem > 0x03) {
            consumed = i;
            return Error::InvalidCompactU16;
        }

        result |= static_cast<std::size_t>(elem & 0x7F) << (i * 7);
        if ((elem & 0x80) == 0) {
            value = result;
            consumed = i + 1;
            return Error::Ok;
        }
    }

    // Unreachable: the third byte cannot carry a continuation bit
    consumed = COMPACT_U16_MAX_BYTES;
    return Error::InvalidCompactU16;
}

} // namespace wirebin
