/**
 * @file config.hpp
 * @brief wirebin compile-time configuration.
 *
 * Version information, wire-format constants and the feature switches
 * that select exception support and the initial trace state.
 */

#ifndef WIREBIN_CONFIG_HPP
#define WIREBIN_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace wirebin {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest LEB128 encoding of a 64-bit value
inline constexpr std::size_t MAX_VARINT_LEN64 = 10U;

/// Longest compact-u16 encoding
inline constexpr std::size_t COMPACT_U16_MAX_BYTES = 3U;

/// Size of a type discriminator
inline constexpr std::size_t TYPE_ID_SIZE = 8U;

/// Size of a 128-bit value on the wire
inline constexpr std::size_t UINT128_SIZE = 16U;

/// Byte order of fixed-width integers and floats
enum class ByteOrder : std::uint8_t {
    Little,
    Big
};

/// Order used when a field carries no order tag
inline constexpr ByteOrder DEFAULT_BYTE_ORDER = ByteOrder::Little;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define WIREBIN_NO_EXCEPTIONS=1 to drop the exception types and the
 * throwing helpers. The core API reports through Error either way.
 * @{
 */
#ifndef WIREBIN_NO_EXCEPTIONS
#define WIREBIN_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @defgroup trace Trace Configuration
 *
 * Initial state of the runtime trace switch (see log.hpp).
 * @{
 */
#ifndef WIREBIN_TRACE
#define WIREBIN_TRACE 0
#endif
/** @} */

} // namespace wirebin

#endif // WIREBIN_CONFIG_HPP
