/**
 * @file record.hpp
 * @brief Record field descriptors.
 *
 * A record type lists its wire fields, in order, as a tuple of field
 * descriptors:
 *
 * @code
 * struct Transfer {
 *     std::uint8_t count = 0;
 *     std::vector<std::uint64_t> amounts;
 *     std::optional<std::string> memo;
 *
 *     static constexpr auto binary_fields() {
 *         return std::make_tuple(
 *             wirebin::field("Count", &Transfer::count, "sizeof=Amounts"),
 *             wirebin::field("Amounts", &Transfer::amounts),
 *             wirebin::field("Memo", &Transfer::memo, "optional"));
 *     }
 * };
 * @endcode
 *
 * Types that cannot be modified specialize record_traits<T> instead.
 */

#ifndef WIREBIN_RECORD_HPP
#define WIREBIN_RECORD_HPP

#include "config.hpp"
#include "tag.hpp"

#include <string_view>
#include <tuple>
#include <type_traits>

namespace wirebin {

/**
 * @brief Descriptor of one record field.
 *
 * @tparam Record Owning record type
 * @tparam Member Field type
 */
template <class Record, class Member> struct Field {
    using record_type = Record;
    using member_type = Member;

    std::string_view name;
    Member Record::*member;
    FieldTag tag;
};

/**
 * @brief Make a field descriptor.
 *
 * @param name Field name, referenced by sizeof tags
 * @param member Pointer to the data member
 * @param tag Tag string (see tag.hpp)
 */
template <class Record, class Member>
constexpr Field<Record, Member> field(std::string_view name, Member Record::*member,
                                      std::string_view tag = {}) noexcept {
    return Field<Record, Member>{name, member, parse_field_tag(tag)};
}

/**
 * @brief Field list of a record type.
 *
 * The default picks up a static binary_fields() member.
 */
template <class T> struct record_traits {};

template <class T>
    requires requires { T::binary_fields(); }
struct record_traits<T> {
    static constexpr auto fields() {
        return T::binary_fields();
    }
};

template <class T>
inline constexpr bool is_record_v = requires { record_traits<T>::fields(); };

template <class T> inline constexpr bool is_size_source_type_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool>;

/**
 * @brief Index of the first field breaking the extension ordering.
 *
 * Once a binary_extension field appears, every later field that is not
 * skipped must also be binary_extension.
 *
 * @return Field index, or -1 if the order is valid
 */
template <class T> constexpr int misordered_field_index() {
    int index = -1;
    int i = 0;
    bool seen_extension = false;
    std::apply(
        [&](const auto&... f) {
            (
                [&] {
                    if (!f.tag.skip) {
                        if (!f.tag.binary_extension && seen_extension && index < 0) {
                            index = i;
                        }
                        seen_extension = seen_extension || f.tag.binary_extension;
                    }
                    ++i;
                }(),
                ...);
        },
        record_traits<T>::fields());
    return index;
}

/**
 * @brief Index of the first sizeof tag placed on a non-integer field.
 *
 * @return Field index, or -1 if all sizeof tags are valid
 */
template <class T> constexpr int invalid_size_of_index() {
    int index = -1;
    int i = 0;
    std::apply(
        [&](const auto&... f) {
            (
                [&] {
                    using M = typename std::remove_cvref_t<decltype(f)>::member_type;
                    if (!f.tag.skip && !f.tag.size_of.empty() && !is_size_source_type_v<M> &&
                        index < 0) {
                        index = i;
                    }
                    ++i;
                }(),
                ...);
        },
        record_traits<T>::fields());
    return index;
}

/// True if extension fields of T are all at the end
template <class T> constexpr bool has_valid_field_order() {
    return misordered_field_index<T>() < 0;
}

/// Name of the field at `index` in T's field list
template <class T> constexpr std::string_view field_name_at(int index) {
    std::string_view name;
    int i = 0;
    std::apply(
        [&](const auto&... f) {
            (
                [&] {
                    if (i == index) {
                        name = f.name;
                    }
                    ++i;
                }(),
                ...);
        },
        record_traits<T>::fields());
    return name;
}

} // namespace wirebin

#endif // WIREBIN_RECORD_HPP
