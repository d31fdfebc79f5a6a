/**
 * @file uint128.hpp
 * @brief 128-bit value holders.
 *
 * Plain two-word containers for 128-bit integers and quad floats as
 * they appear on the wire. No arithmetic is provided.
 */

#ifndef WIREBIN_UINT128_HPP
#define WIREBIN_UINT128_HPP

#include "config.hpp"
#include "error.hpp"

namespace wirebin {

/**
 * @brief Unsigned 128-bit integer as two 64-bit words.
 *
 * Decodes itself using the byte order of the active directive.
 */
struct Uint128 {
    std::uint64_t lo = 0;
    std::uint64_t hi = 0;

    template <class Decoder, class Directive>
    Error unmarshal_binary(Decoder& dec, const Directive& directive) {
        return dec.read_uint128(directive.byte_order, *this);
    }

    friend bool operator==(const Uint128&, const Uint128&) = default;
};

/**
 * @brief Signed 128-bit integer (two's complement words).
 */
struct Int128 {
    std::uint64_t lo = 0;
    std::uint64_t hi = 0;

    [[nodiscard]] bool negative() const noexcept {
        return (hi >> 63) != 0;
    }

    template <class Decoder, class Directive>
    Error unmarshal_binary(Decoder& dec, const Directive& directive) {
        return dec.read_int128(directive.byte_order, *this);
    }

    friend bool operator==(const Int128&, const Int128&) = default;
};

/**
 * @brief IEEE quad-precision float, kept as raw bits.
 */
struct Float128 {
    Uint128 bits;

    template <class Decoder, class Directive>
    Error unmarshal_binary(Decoder& dec, const Directive& directive) {
        return dec.read_float128(directive.byte_order, *this);
    }

    friend bool operator==(const Float128&, const Float128&) = default;
};

} // namespace wirebin

#endif // WIREBIN_UINT128_HPP
