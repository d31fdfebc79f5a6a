/**
 * @file tag.hpp
 * @brief Field tags and decode directives.
 *
 * A field tag is a space-separated list of tokens attached to a record
 * field descriptor:
 * - `-`                skip the field, it is never on the wire
 * - `optional`         a presence byte precedes the value
 * - `binary_extension` trailing field that older buffers may omit
 * - `big` / `little`   byte order of fixed-width numbers
 * - `sizeof=<Name>`    this field's value is the element count of <Name>
 *
 * Unknown tokens are ignored.
 */

#ifndef WIREBIN_TAG_HPP
#define WIREBIN_TAG_HPP

#include "config.hpp"

#include <optional>
#include <string_view>

namespace wirebin {

/**
 * @brief Parsed field tag.
 */
struct FieldTag {
    bool skip = false;
    bool optional = false;
    bool binary_extension = false;
    ByteOrder order = DEFAULT_BYTE_ORDER;
    std::string_view size_of; ///< Target field name, empty if none
};

/**
 * @brief Parse a field tag string.
 *
 * @param tag Tag text, e.g. "sizeof=Items big"
 * @return Parsed tag
 */
constexpr FieldTag parse_field_tag(std::string_view tag) noexcept {
    constexpr std::string_view sizeof_prefix = "sizeof=";

    FieldTag out;
    std::size_t i = 0;
    while (i < tag.size()) {
        while (i < tag.size() && tag[i] == ' ') {
            ++i;
        }
        std::size_t end = i;
        while (end < tag.size() && tag[end] != ' ') {
            ++end;
        }

        std::string_view token = tag.substr(i, end - i);
        if (token == "-") {
            out.skip = true;
        } else if (token == "optional") {
            out.optional = true;
        } else if (token == "binary_extension") {
            out.binary_extension = true;
        } else if (token == "big") {
            out.order = ByteOrder::Big;
        } else if (token == "little") {
            out.order = ByteOrder::Little;
        } else if (token.starts_with(sizeof_prefix)) {
            out.size_of = token.substr(sizeof_prefix.size());
        }
        i = end;
    }
    return out;
}

/**
 * @brief Decode instructions for a single value.
 *
 * Built fresh for each record field and passed by value down the
 * recursion; array and sequence elements inherit their container's
 * directive unchanged.
 */
struct FieldDirective {
    bool skip = false;
    bool is_binary_extension = false;
    bool is_optional = false;
    ByteOrder byte_order = DEFAULT_BYTE_ORDER;
    std::optional<std::string_view> size_of_target;
    std::optional<std::size_t> linked_size; ///< Element count from a sizeof field

    /// Directive for a field with the given tag
    static constexpr FieldDirective from_tag(const FieldTag& tag) noexcept {
        FieldDirective d;
        d.skip = tag.skip;
        d.is_binary_extension = tag.binary_extension;
        d.is_optional = tag.optional;
        d.byte_order = tag.order;
        if (!tag.size_of.empty()) {
            d.size_of_target = tag.size_of;
        }
        return d;
    }
};

} // namespace wirebin

#endif // WIREBIN_TAG_HPP
