/**
 * @file error.hpp
 * @brief wirebin error handling.
 *
 * Every decode operation returns an Error code. The failing read also
 * leaves an ErrorInfo on its session with the cursor position and the
 * byte counts involved. Exception types are provided on top of the
 * codes for callers that prefer them (disabled by WIREBIN_NO_EXCEPTIONS).
 */

#ifndef WIREBIN_ERROR_HPP
#define WIREBIN_ERROR_HPP

#include "config.hpp"

#include <string>
#include <string_view>

#if !WIREBIN_NO_EXCEPTIONS
#include <stdexcept>
#endif

namespace wirebin {

/**
 * @brief Error codes returned by all decode operations.
 */
enum class Error {
    Ok = 0,                    ///< Success
    TruncatedInput = -1,       ///< Fewer bytes remain than the read requires
    InvalidVarint = -2,        ///< LEB128 value did not terminate or overflows 64 bits
    DisallowedNaN = -3,        ///< Borsh float decoded as NaN
    UnsupportedType = -4,      ///< Destination has no decode rule
    UnaddressableField = -5,   ///< Record field cannot be addressed
    InvalidDestination = -6,   ///< Top-level target is not a usable location
    TagOrderingViolation = -7, ///< Extension field followed by a regular field
    InvalidCompactU16 = -8,    ///< Malformed compact-u16 length
    InvalidPosition = -9,      ///< Position outside the buffer
    InvalidArgument = -10,     ///< Invalid argument
    InvalidFieldTag = -11,     ///< Tag that cannot apply to its field
    CustomDecode = -12         ///< Custom decoder failed
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::TruncatedInput:
        return "Truncated input";
    case Error::InvalidVarint:
        return "Invalid varint";
    case Error::DisallowedNaN:
        return "NaN for float not allowed";
    case Error::UnsupportedType:
        return "Unsupported type";
    case Error::UnaddressableField:
        return "Field cannot be addressed";
    case Error::InvalidDestination:
        return "Invalid decode destination";
    case Error::TagOrderingViolation:
        return "binary_extension fields must be packed together at the end of the record";
    case Error::InvalidCompactU16:
        return "Invalid compact-u16 length";
    case Error::InvalidPosition:
        return "Position outside of buffer";
    case Error::InvalidArgument:
        return "Invalid argument";
    case Error::InvalidFieldTag:
        return "Invalid field tag";
    case Error::CustomDecode:
        return "Custom decoder failed";
    default:
        return "Unknown error";
    }
}

/**
 * @brief True for errors caused by a broken type definition rather
 *        than by the input bytes.
 */
inline bool is_definition_error(Error error) noexcept {
    return error == Error::TagOrderingViolation || error == Error::InvalidFieldTag ||
           error == Error::UnaddressableField;
}

/**
 * @brief Details of the last failure on a session.
 *
 * `required` and `available` are byte counts and are only meaningful
 * for TruncatedInput. `context` names the read that failed and `field`
 * the innermost record field being decoded. Both refer to static storage.
 */
struct ErrorInfo {
    Error code = Error::Ok;
    std::size_t position = 0;
    std::size_t required = 0;
    std::size_t available = 0;
    const char* context = "";
    std::string_view field;

    /// Format as "field <f>: <context>: <message> at position N (required X, remaining Y)"
    [[nodiscard]] std::string describe() const;
};

#if !WIREBIN_NO_EXCEPTIONS

/**
 * @brief Base exception for wirebin errors.
 */
class WirebinException : public std::runtime_error {
public:
    explicit WirebinException(const std::string& message, Error code = Error::InvalidArgument)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for input that ended early.
 */
class TruncatedInputException : public WirebinException {
public:
    explicit TruncatedInputException(const std::string& message)
        : WirebinException(message, Error::TruncatedInput) {}
};

/**
 * @brief Exception for malformed input bytes.
 */
class MalformedInputException : public WirebinException {
public:
    MalformedInputException(const std::string& message, Error code)
        : WirebinException(message, code) {}
};

/**
 * @brief Exception for a type definition that cannot be decoded.
 */
class DefinitionException : public WirebinException {
public:
    DefinitionException(const std::string& message, Error code)
        : WirebinException(message, code) {}
};

/**
 * @brief Throw the exception matching a failed decode.
 *
 * @param info Failure details from the session
 */
[[noreturn]] void throw_error(const ErrorInfo& info);

#endif // !WIREBIN_NO_EXCEPTIONS

} // namespace wirebin

#endif // WIREBIN_ERROR_HPP
