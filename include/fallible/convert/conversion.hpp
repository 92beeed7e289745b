#pragma once
#include "fallible/convert/transform.hpp"
#include "fallible/core/option.hpp"
#include "fallible/core/result.hpp"
#include <concepts>
#include <utility>
namespace fallible::convert {
using core::Option;
using core::Result;

/**
 * Conversion shapes a type can opt into.
 *
 * From<T, S>:  T has a static factory `T::From(const S&)` returning T.
 * Into<S, T>:  S has a const member `Into()` yielding something convertible to T.
 * AsRef<S, T>: S has a const member `AsRef()` returning `const T&` into itself.
 */
template<typename T, typename S>
concept From = requires(const S& source) {
    { T::From(source) } -> std::same_as<T>;
};

template<typename S, typename T>
concept Into = requires(const S& source) {
    { source.Into() } -> std::convertible_to<T>;
};

template<typename S, typename T>
concept AsRef = requires(const S& source) {
    { source.AsRef() } -> std::same_as<const T&>;
};

template<typename S, typename T>
concept ConvertibleTo = From<T, S> || Into<S, T>;

// The target's factory takes precedence over the source's Into.
template<typename T, typename S>
    requires ConvertibleTo<S, T>
[[nodiscard]] T Convert(const S& source) {
    if constexpr (From<T, S>) {
        return T::From(source);
    } else {
        return static_cast<T>(source.Into());
    }
}

template<typename T, typename S>
    requires AsRef<S, T>
[[nodiscard]] const T& ViewAs(const S& source) {
    return source.AsRef();
}

template<typename U, typename T, typename E>
    requires ConvertibleTo<T, U>
[[nodiscard]] Result<U, E> ConvertSuccess(const Result<T, E>& result) {
    return Transform(result, [](const T& value) { return Convert<U>(value); });
}

template<typename F, typename T, typename E>
    requires ConvertibleTo<E, F>
[[nodiscard]] Result<T, F> ConvertFailure(const Result<T, E>& result) {
    return TransformErr(result, [](const E& error) { return Convert<F>(error); });
}

template<typename U, typename T>
    requires ConvertibleTo<T, U>
[[nodiscard]] Option<U> ConvertOption(const Option<T>& opt) {
    return TransformOption(opt, [](const T& value) { return Convert<U>(value); });
}
}
