/**
 * @file engine.hpp
 * @brief Type-driven decode engine.
 *
 * decode_value() decodes one located value:
 * 1. Resolve indirection (stopping at the last wrapper for optionals).
 * 2. For optional values read a presence byte; 0 stores the empty value
 *    and ends the decode without invoking any custom decoder.
 * 3. Hand the value to its custom decoder if it has one.
 * 4. Otherwise dispatch on the structural category:
 *    - scalars: bool, 8/16/32/64-bit integers, float, double, string
 *    - opaque (std::any): nothing is read
 *    - fixed arrays: every element with the same directive
 *    - sequences (std::vector): element count from the directive's
 *      linked size or from an unsigned LEB128 varint, then every element
 *      with the same directive
 *    - records: decode_record()
 *    - anything else: Error::UnsupportedType
 *
 * The first failure aborts the decode and is returned unchanged.
 */

#ifndef WIREBIN_ENGINE_HPP
#define WIREBIN_ENGINE_HPP

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "indirect.hpp"
#include "log.hpp"
#include "record.hpp"
#include "tag.hpp"

#include <any>
#include <array>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

namespace wirebin {

template <class T> Error decode_value(Decoder& dec, T& value, const FieldDirective& directive);

template <class Record> Error decode_record(Decoder& dec, Record& record);

namespace detail {

template <class T> struct is_std_array : std::false_type {};
template <class T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <class T> struct is_std_vector : std::false_type {};
template <class T, class A> struct is_std_vector<std::vector<T, A>> : std::true_type {};

template <class T>
inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                     (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 ||
                                      sizeof(T) == 8);

template <class T>
inline constexpr bool is_scalar_v = std::is_same_v<T, bool> || is_integer_v<T> ||
                                    std::is_same_v<T, float> || std::is_same_v<T, double> ||
                                    std::is_same_v<T, std::string>;

template <class T>
inline constexpr bool is_fixed_array_v = is_std_array<T>::value || std::is_array_v<T>;

/// Nesting levels the minimum-size walk descends; deeper levels count as 0 bytes
inline constexpr int MIN_SIZE_DEPTH = 4;

constexpr std::size_t saturating_add(std::size_t a, std::size_t b) noexcept {
    return b > std::numeric_limits<std::size_t>::max() - a ? std::numeric_limits<std::size_t>::max()
                                                           : a + b;
}

constexpr std::size_t saturating_mul(std::size_t a, std::size_t b) noexcept {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) {
        return std::numeric_limits<std::size_t>::max();
    }
    return a * b;
}

/**
 * @brief Fewest bytes a value of type T can occupy on the wire.
 *
 * A lower bound used to reject element counts the remaining input
 * cannot hold. Custom decoders and opaque values count as 0 bytes.
 *
 * @param directive Directive the value is decoded with
 */
template <class T, int Depth = MIN_SIZE_DEPTH>
constexpr std::size_t min_wire_size(const FieldDirective& directive) noexcept;

/// min_wire_size() without the presence byte of an optional value
template <class T, int Depth>
constexpr std::size_t min_value_size(const FieldDirective& directive) noexcept;

/// True if a field of Record names `name` as its sizeof target
template <class Record> constexpr bool is_size_linked(std::string_view name) noexcept {
    bool linked = false;
    std::apply(
        [&](const auto&... f) {
            ((linked = linked || (!f.tag.skip && f.tag.size_of == name)), ...);
        },
        record_traits<Record>::fields());
    return linked;
}

template <class Record, int Depth, class Owner, class Member>
constexpr std::size_t min_field_size(const Field<Owner, Member>& f) noexcept {
    // Extension fields may be absent, unaddressable ones fail before reading
    if (f.tag.skip || f.tag.binary_extension || f.member == nullptr) {
        return 0;
    }
    if constexpr (is_std_vector<Member>::value) {
        if (is_size_linked<Record>(f.name)) {
            return 0;
        }
    }
    return min_wire_size<Member, Depth>(FieldDirective::from_tag(f.tag));
}

template <class T, int Depth>
constexpr std::size_t min_wire_size(const FieldDirective& directive) noexcept {
    if (directive.is_optional) {
        return 1;
    }
    return min_value_size<T, Depth>(directive);
}

template <class T, int Depth>
constexpr std::size_t min_value_size(const FieldDirective& directive) noexcept {
    if constexpr (Depth <= 0 || is_unmarshaler_v<T>) {
        return 0;
    } else if constexpr (is_indirection_v<T>) {
        return min_value_size<typename indirection_traits<T>::element_type, Depth - 1>(directive);
    } else if constexpr (std::is_same_v<T, bool> || is_integer_v<T> || std::is_same_v<T, float> ||
                         std::is_same_v<T, double>) {
        return sizeof(T);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return 1; // length prefix
    } else if constexpr (is_std_array<T>::value) {
        return saturating_mul(std::tuple_size_v<T>,
                              min_wire_size<typename T::value_type, Depth - 1>(directive));
    } else if constexpr (std::is_array_v<T>) {
        return saturating_mul(std::extent_v<T>,
                              min_wire_size<std::remove_extent_t<T>, Depth - 1>(directive));
    } else if constexpr (is_std_vector<T>::value) {
        if (directive.linked_size.has_value()) {
            return saturating_mul(*directive.linked_size,
                                  min_wire_size<typename T::value_type, Depth - 1>(directive));
        }
        return 1; // element count varint
    } else if constexpr (is_record_v<T>) {
        std::size_t total = 0;
        std::apply(
            [&](const auto&... f) {
                ((total = saturating_add(total, min_field_size<T, Depth - 1>(f))), ...);
            },
            record_traits<T>::fields());
        return total;
    } else {
        return 0;
    }
}

/// Size-linkage table of one record decode
using SizeLinks = std::map<std::string_view, std::size_t>;

/// Names the record field being decoded until the scope ends
class FieldScope {
public:
    FieldScope(Decoder& dec, std::string_view name) noexcept : dec_(dec), outer_(dec.field()) {
        dec_.set_field(name);
    }

    ~FieldScope() {
        dec_.set_field(outer_);
    }

    FieldScope(const FieldScope&) = delete;
    FieldScope& operator=(const FieldScope&) = delete;

private:
    Decoder& dec_;
    std::string_view outer_;
};

template <class T> Error decode_integer(Decoder& dec, T& value, ByteOrder order) {
    if constexpr (sizeof(T) == 1) {
        std::uint8_t n = 0;
        if (auto err = dec.read_byte(n); err != Error::Ok) {
            return err;
        }
        value = static_cast<T>(n);
    } else if constexpr (sizeof(T) == 2) {
        std::uint16_t n = 0;
        if (auto err = dec.read_uint16(order, n); err != Error::Ok) {
            return err;
        }
        value = static_cast<T>(n);
    } else if constexpr (sizeof(T) == 4) {
        std::uint32_t n = 0;
        if (auto err = dec.read_uint32(order, n); err != Error::Ok) {
            return err;
        }
        value = static_cast<T>(n);
    } else {
        std::uint64_t n = 0;
        if (auto err = dec.read_uint64(order, n); err != Error::Ok) {
            return err;
        }
        value = static_cast<T>(n);
    }
    return Error::Ok;
}

template <class T> Error decode_scalar(Decoder& dec, T& value, const FieldDirective& directive) {
    if constexpr (std::is_same_v<T, bool>) {
        return dec.read_bool(value);
    } else if constexpr (is_integer_v<T>) {
        return decode_integer(dec, value, directive.byte_order);
    } else if constexpr (std::is_same_v<T, float>) {
        return dec.read_float32(directive.byte_order, value);
    } else if constexpr (std::is_same_v<T, double>) {
        return dec.read_float64(directive.byte_order, value);
    } else {
        return dec.read_utf8_string(value);
    }
}

template <class E, class A>
Error decode_sequence(Decoder& dec, std::vector<E, A>& value, const FieldDirective& directive) {
    std::size_t length = 0;
    if (directive.linked_size.has_value()) {
        length = *directive.linked_size;
    } else {
        std::uint64_t n = 0;
        if (auto err = dec.read_uvarint64(n); err != Error::Ok) {
            return err;
        }
        length = static_cast<std::size_t>(n);
    }

    WIREBIN_LOG_TRACE("decode: reading sequence len=%zu", length);

    // Reject counts the remaining input cannot hold before allocating
    const std::size_t min_size = min_wire_size<E>(directive);
    if (min_size > 0 && length > dec.remaining() / min_size) {
        return dec.fail(Error::TruncatedInput, "read sequence", saturating_mul(length, min_size));
    }

    // Zero-size elements grow one at a time so memory follows what was decoded
    value.clear();
    if (min_size > 0) {
        value.reserve(length);
    }
    for (std::size_t i = 0; i < length; ++i) {
        if constexpr (std::is_same_v<E, bool>) {
            bool b = false;
            if (auto err = decode_value(dec, b, directive); err != Error::Ok) {
                return err;
            }
            value.push_back(b);
        } else {
            value.emplace_back();
            if (auto err = decode_value(dec, value.back(), directive); err != Error::Ok) {
                return err;
            }
        }
    }
    return Error::Ok;
}

template <class T> Error dispatch(Decoder& dec, T& value, const FieldDirective& directive) {
    if constexpr (is_scalar_v<T>) {
        return decode_scalar(dec, value, directive);
    } else if constexpr (std::is_same_v<T, std::any>) {
        // Opaque: nothing to read
        return Error::Ok;
    } else if constexpr (is_fixed_array_v<T>) {
        WIREBIN_LOG_TRACE("decode: reading array len=%zu", std::size(value));
        for (auto& element : value) {
            if (auto err = decode_value(dec, element, directive); err != Error::Ok) {
                return err;
            }
        }
        return Error::Ok;
    } else if constexpr (is_std_vector<T>::value) {
        return decode_sequence(dec, value, directive);
    } else if constexpr (is_record_v<T>) {
        return decode_record(dec, value);
    } else {
        return dec.fail(Error::UnsupportedType, "decode: unsupported type");
    }
}

template <class T>
Error run_unmarshaler(Decoder& dec, T& value, const FieldDirective& directive) {
    WIREBIN_LOG_TRACE("decode: using unmarshal_binary to decode type");
    const std::size_t failures = dec.failure_count();
    auto err = invoke_unmarshaler(value, dec, directive);
    // A propagated read failure is the latest one recorded and sits at the cursor
    const bool recorded = dec.failure_count() != failures && dec.last_error().code == err &&
                          dec.last_error().position == dec.position();
    if (err != Error::Ok && !recorded) {
        return dec.fail(err, "unmarshal_binary");
    }
    return err;
}

template <class T>
Error decode_resolved(Decoder& dec, T& value, const FieldDirective& directive) {
    return indirect(value, [&](auto& target, auto is_override) -> Error {
        if constexpr (decltype(is_override)::value) {
            return run_unmarshaler(dec, target, directive);
        } else {
            return dispatch(dec, target, directive);
        }
    });
}

template <class Record, class Owner, class Member>
Error decode_field(Decoder& dec, Record& record, const Field<Owner, Member>& f,
                   SizeLinks& links) {
    if (f.tag.skip) {
        WIREBIN_LOG_TRACE("decode: skipping struct field %.*s with skip flag",
                          static_cast<int>(f.name.size()), f.name.data());
        return Error::Ok;
    }

    if (f.tag.binary_extension && !dec.has_remaining()) {
        WIREBIN_LOG_TRACE("decode: no bytes left for binary_extension field %.*s",
                          static_cast<int>(f.name.size()), f.name.data());
        return Error::Ok;
    }

    FieldScope scope(dec, f.name);

    if (f.member == nullptr) {
        return dec.fail(Error::UnaddressableField, "decode record field");
    }
    Member& target = record.*(f.member);

    FieldDirective directive = FieldDirective::from_tag(f.tag);
    if (auto it = links.find(f.name); it != links.end()) {
        directive.linked_size = it->second;
    }

    WIREBIN_LOG_TRACE("decode: struct field %.*s optional=%d big=%d", static_cast<int>(f.name.size()),
                      f.name.data(), directive.is_optional ? 1 : 0,
                      directive.byte_order == ByteOrder::Big ? 1 : 0);

    if (auto err = decode_value(dec, target, directive); err != Error::Ok) {
        return err;
    }

    if (!f.tag.size_of.empty()) {
        if constexpr (is_size_source_type_v<Member>) {
            std::size_t size = 0;
            if constexpr (std::is_signed_v<Member>) {
                size = target < 0 ? 0 : static_cast<std::size_t>(target);
            } else {
                size = static_cast<std::size_t>(target);
            }
            WIREBIN_LOG_TRACE("decode: setting size of field %.*s to %zu",
                              static_cast<int>(f.tag.size_of.size()), f.tag.size_of.data(), size);
            links[f.tag.size_of] = size;
        } else {
            return dec.fail(Error::InvalidFieldTag, "sizeof on non-integer field");
        }
    }
    return Error::Ok;
}

/// Reject record definitions that can never decode, before reading
template <class Record> Error check_record_definition(Decoder& dec) {
    constexpr int misordered = misordered_field_index<Record>();
    if constexpr (misordered >= 0) {
        constexpr std::string_view name = field_name_at<Record>(misordered);
        WIREBIN_LOG_ERROR("the binary_extension tags must be packed together at the end of "
                          "record fields, problematic field %.*s",
                          static_cast<int>(name.size()), name.data());
        FieldScope scope(dec, name);
        return dec.fail(Error::TagOrderingViolation, "record definition");
    }

    constexpr int bad_size_of = invalid_size_of_index<Record>();
    if constexpr (bad_size_of >= 0) {
        constexpr std::string_view name = field_name_at<Record>(bad_size_of);
        WIREBIN_LOG_ERROR("sizeof tag on non-integer field %.*s", static_cast<int>(name.size()),
                          name.data());
        FieldScope scope(dec, name);
        return dec.fail(Error::InvalidFieldTag, "record definition");
    }

    return Error::Ok;
}

} // namespace detail

/**
 * @brief Decode a located value under a directive.
 *
 * Entry point of the recursion; custom decoders call it to decode
 * nested values with the engine.
 *
 * @param dec Decode session
 * @param value Destination
 * @param directive Directive for this value
 * @return Error::Ok on success, otherwise the first failure
 */
template <class T> Error decode_value(Decoder& dec, T& value, const FieldDirective& directive) {
    if (!directive.is_optional) {
        return detail::decode_resolved(dec, value, directive);
    }

    return indirect_optional_tail(value, [&](auto& tail) -> Error {
        std::uint8_t present = 0;
        if (auto err = dec.read_byte(present); err != Error::Ok) {
            return err;
        }
        if (present == 0) {
            WIREBIN_LOG_TRACE("decode: skipping optional value");
            set_zero(tail);
            return Error::Ok;
        }
        return detail::decode_resolved(dec, tail, directive);
    });
}

/**
 * @brief Decode the fields of a record in declaration order.
 *
 * Honors the skip, binary_extension, optional, byte order and sizeof
 * tags. The size-linkage table lives only for this call.
 *
 * @param dec Decode session
 * @param record Destination record
 * @return Error::Ok on success
 */
template <class Record> Error decode_record(Decoder& dec, Record& record) {
    if (auto err = detail::check_record_definition<Record>(dec); err != Error::Ok) {
        return err;
    }

    constexpr auto fields = record_traits<Record>::fields();
    WIREBIN_LOG_TRACE("decode: struct fields=%zu",
                      std::tuple_size_v<std::remove_cv_t<decltype(fields)>>);

    detail::SizeLinks links;
    Error result = Error::Ok;
    std::apply(
        [&](const auto&... f) {
            static_cast<void>(
                (... && ((result = detail::decode_field(dec, record, f, links)) == Error::Ok)));
        },
        fields);
    return result;
}

/**
 * @brief Decode a whole value from a session.
 *
 * @param dec Decode session
 * @param value Destination
 * @return Error::Ok on success
 */
template <class T> Error decode(Decoder& dec, T& value) {
    if (!is_valid_encoding(dec.encoding())) {
        return dec.fail(Error::InvalidArgument, "decode: encoding not implemented");
    }
    WIREBIN_LOG_TRACE("decode: start (%s, %zu bytes)", encoding_name(dec.encoding()), dec.size());
    return decode_value(dec, value, FieldDirective{});
}

/**
 * @brief Decode through a destination pointer.
 *
 * @return Error::InvalidDestination if dest is null
 */
template <class T> Error decode(Decoder& dec, T* dest) {
    if (dest == nullptr) {
        return dec.fail(Error::InvalidDestination, "decode: null destination");
    }
    return decode(dec, *dest);
}

} // namespace wirebin

#endif // WIREBIN_ENGINE_HPP
