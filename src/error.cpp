/**
 * @file error.cpp
 * @brief Error formatting and exception mapping.
 */

#include <wirebin/error.hpp>

namespace wirebin {

std::string ErrorInfo::describe() const {
    std::string out;
    if (!field.empty()) {
        out += "field ";
        out += field;
        out += ": ";
    }
    if (context != nullptr && *context != '\0') {
        out += context;
        out += ": ";
    }
    out += error_string(code);
    out += " at position ";
    out += std::to_string(position);
    if (code == Error::TruncatedInput) {
        out += " (required ";
        out += std::to_string(required);
        out += ", remaining ";
        out += std::to_string(available);
        out += ")";
    }
    return out;
}

#if !WIREBIN_NO_EXCEPTIONS

void throw_error(const ErrorInfo& info) {
    switch (info.code) {
    case Error::TruncatedInput:
        throw TruncatedInputException(info.describe());
    case Error::InvalidVarint:
    case Error::DisallowedNaN:
    case Error::InvalidCompactU16:
    case Error::InvalidPosition:
        throw MalformedInputException(info.describe(), info.code);
    case Error::TagOrderingViolation:
    case Error::InvalidFieldTag:
    case Error::UnaddressableField:
    case Error::UnsupportedType:
        throw DefinitionException(info.describe(), info.code);
    default:
        throw WirebinException(info.describe(), info.code);
    }
}

#endif // !WIREBIN_NO_EXCEPTIONS

} // namespace wirebin
