/**
 * @file wirebin.hpp
 * @brief High-level wirebin decoding API.
 *
 * Provides one-call decoding of a whole buffer in each supported wire
 * encoding, plus exception-throwing variants.
 */

#ifndef WIREBIN_HPP
#define WIREBIN_HPP

#include "bytereader.hpp"
#include "compact_u16.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "encoding.hpp"
#include "engine.hpp"
#include "error.hpp"
#include "indirect.hpp"
#include "log.hpp"
#include "record.hpp"
#include "tag.hpp"
#include "uint128.hpp"

#include <span>

namespace wirebin {

/**
 * @brief Decode a value from a buffer in the given encoding.
 *
 * @param data Input buffer
 * @param encoding Wire encoding
 * @param[out] value Destination
 * @param[out] info Failure details (optional)
 * @return Error::Ok on success
 */
template <class T>
Error unmarshal(std::span<const std::uint8_t> data, Encoding encoding, T& value,
                ErrorInfo* info = nullptr) {
    Decoder dec(data, encoding);
    auto err = decode(dec, value);
    if (err != Error::Ok && info != nullptr) {
        *info = dec.last_error();
    }
    return err;
}

template <class T>
Error unmarshal_bin(std::span<const std::uint8_t> data, T& value, ErrorInfo* info = nullptr) {
    return unmarshal(data, Encoding::Bin, value, info);
}

template <class T>
Error unmarshal_borsh(std::span<const std::uint8_t> data, T& value, ErrorInfo* info = nullptr) {
    return unmarshal(data, Encoding::Borsh, value, info);
}

template <class T>
Error unmarshal_compact_u16(std::span<const std::uint8_t> data, T& value,
                            ErrorInfo* info = nullptr) {
    return unmarshal(data, Encoding::CompactU16, value, info);
}

#if !WIREBIN_NO_EXCEPTIONS

/**
 * @brief Decode a value, throwing on failure.
 *
 * @throws TruncatedInputException, MalformedInputException,
 *         DefinitionException or WirebinException
 */
template <class T> void decode_or_throw(Decoder& dec, T& value) {
    if (decode(dec, value) != Error::Ok) {
        throw_error(dec.last_error());
    }
}

template <class T> T unmarshal_or_throw(std::span<const std::uint8_t> data, Encoding encoding) {
    T value{};
    Decoder dec(data, encoding);
    decode_or_throw(dec, value);
    return value;
}

#endif // !WIREBIN_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace wirebin

#endif // WIREBIN_HPP
