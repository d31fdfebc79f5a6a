/**
 * @file indirect.hpp
 * @brief Indirection resolution and custom-decode detection.
 *
 * A destination may be wrapped in any number of indirection levels
 * (std::optional, std::unique_ptr). Resolving walks those levels
 * outermost first, allocating a value-initialized content for every
 * empty wrapper, until it reaches either
 * - a type that decodes itself (has unmarshal_binary), or
 * - a plain value the engine can dispatch on.
 *
 * The wrapper types cannot contain themselves, so resolution always
 * terminates after as many steps as the type has wrapper levels.
 */

#ifndef WIREBIN_INDIRECT_HPP
#define WIREBIN_INDIRECT_HPP

#include "decoder.hpp"
#include "error.hpp"
#include "tag.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>

namespace wirebin {

/**
 * @brief Opt-in interface for types that decode themselves.
 *
 * Deriving is optional: any type with a matching unmarshal_binary()
 * member is detected the same way.
 */
class BinaryUnmarshaler {
public:
    virtual ~BinaryUnmarshaler() = default;
    virtual Error unmarshal_binary(Decoder& dec) = 0;
};

/**
 * @brief Describes one level of indirection.
 *
 * Specialized for each supported wrapper. `ensure()` returns the
 * content, allocating it if the wrapper is empty; `reset()` empties it.
 */
template <class T> struct indirection_traits {
    static constexpr bool is_wrapper = false;
};

template <class T> struct indirection_traits<std::optional<T>> {
    static constexpr bool is_wrapper = true;
    using element_type = T;

    static T& ensure(std::optional<T>& v) {
        if (!v.has_value()) {
            v.emplace();
        }
        return *v;
    }

    static void reset(std::optional<T>& v) noexcept {
        v.reset();
    }
};

template <class T> struct indirection_traits<std::unique_ptr<T>> {
    static constexpr bool is_wrapper = true;
    using element_type = T;

    static T& ensure(std::unique_ptr<T>& v) {
        if (!v) {
            v = std::make_unique<T>();
        }
        return *v;
    }

    static void reset(std::unique_ptr<T>& v) noexcept {
        v.reset();
    }
};

template <class T>
inline constexpr bool is_indirection_v = indirection_traits<std::remove_cv_t<T>>::is_wrapper;

template <class T>
inline constexpr bool has_unmarshal_binary_v = requires(T& t, Decoder& dec) {
    { t.unmarshal_binary(dec) } -> std::same_as<Error>;
};

template <class T>
inline constexpr bool has_directive_unmarshal_binary_v =
    requires(T& t, Decoder& dec, const FieldDirective& directive) {
        { t.unmarshal_binary(dec, directive) } -> std::same_as<Error>;
    };

/// True if T replaces structural dispatch with its own decoding
template <class T>
inline constexpr bool is_unmarshaler_v =
    has_unmarshal_binary_v<T> || has_directive_unmarshal_binary_v<T>;

/**
 * @brief Run a type's custom decoder.
 *
 * The directive-aware form is preferred when both exist.
 */
template <class T> Error invoke_unmarshaler(T& value, Decoder& dec, const FieldDirective& directive) {
    static_assert(is_unmarshaler_v<T>, "type has no unmarshal_binary()");
    if constexpr (has_directive_unmarshal_binary_v<T>) {
        return value.unmarshal_binary(dec, directive);
    } else {
        return value.unmarshal_binary(dec);
    }
}

/**
 * @brief Resolve all indirection levels of a location.
 *
 * Calls `fn(target, std::true_type{})` with the first level that is a
 * custom decoder, or `fn(target, std::false_type{})` with the final
 * plain value. Nothing below a custom decoder is traversed.
 *
 * @param value Location to resolve
 * @param fn Callback receiving the resolved location
 * @return Result of fn
 */
template <class T, class Fn> Error indirect(T& value, Fn&& fn) {
    if constexpr (is_unmarshaler_v<T>) {
        return fn(value, std::true_type{});
    } else if constexpr (is_indirection_v<T>) {
        return indirect(indirection_traits<T>::ensure(value), std::forward<Fn>(fn));
    } else {
        return fn(value, std::false_type{});
    }
}

/**
 * @brief Resolve indirection, stopping at the last wrapper.
 *
 * Used for optional values: the caller receives the innermost wrapper
 * (or the value itself when there is none) so an absent value can be
 * stored by emptying it. Also stops at a custom decoder.
 *
 * @param value Location to resolve
 * @param fn Callback receiving the tail location
 * @return Result of fn
 */
template <class T, class Fn> Error indirect_optional_tail(T& value, Fn&& fn) {
    if constexpr (is_unmarshaler_v<T>) {
        return fn(value);
    } else if constexpr (is_indirection_v<T>) {
        using Element = typename indirection_traits<T>::element_type;
        if constexpr (is_indirection_v<Element>) {
            return indirect_optional_tail(indirection_traits<T>::ensure(value),
                                          std::forward<Fn>(fn));
        } else {
            return fn(value);
        }
    } else {
        return fn(value);
    }
}

/**
 * @brief Store the empty value of a location.
 *
 * Wrappers are emptied; anything else is value-initialized.
 */
template <class T> void set_zero(T& value) {
    if constexpr (is_indirection_v<T>) {
        indirection_traits<T>::reset(value);
    } else if constexpr (std::is_array_v<T>) {
        for (auto& element : value) {
            set_zero(element);
        }
    } else {
        value = T{};
    }
}

} // namespace wirebin

#endif // WIREBIN_INDIRECT_HPP
