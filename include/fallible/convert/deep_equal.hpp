#pragma once
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
namespace fallible::core {
template<typename T>
class Option;
template<typename T, typename E>
class Result;
}
namespace fallible::convert {
namespace detail {
    template<typename T>
    struct IsOption : std::false_type {};
    template<typename T>
    struct IsOption<core::Option<T>> : std::true_type {};

    template<typename T>
    struct IsResult : std::false_type {};
    template<typename T, typename E>
    struct IsResult<core::Result<T, E>> : std::true_type {};

    template<typename T>
    struct IsStdOptional : std::false_type {};
    template<typename T>
    struct IsStdOptional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct IsSmartPointer : std::false_type {};
    template<typename T, typename D>
    struct IsSmartPointer<std::unique_ptr<T, D>> : std::true_type {};
    template<typename T>
    struct IsSmartPointer<std::shared_ptr<T>> : std::true_type {};

    template<typename T>
    concept PointerLike = std::is_pointer_v<T> || IsSmartPointer<T>::value;

    template<typename T>
    concept StringLike = std::is_convertible_v<const T&, std::string_view>;

    template<typename T>
    concept TupleLike = requires { std::tuple_size<T>::value; };

    template<typename T>
    concept UnorderedAssociative = requires {
        typename T::key_type;
        typename T::hasher;
        typename T::key_equal;
    };

    template<typename T>
    concept HasMappedType = requires { typename T::mapped_type; };

    template<typename T>
    concept Dereferenceable = requires(const T& p) { *p; } &&
        !std::is_void_v<std::remove_pointer_t<T>> &&
        !std::is_function_v<std::remove_pointer_t<T>>;
}

/**
 * Structural equality used for membership tests (Option::Contains,
 * Result::Contains). Pointers are equal when identical or when both point
 * at deep-equal values; containers and tuple-likes compare member-wise;
 * hashed containers compare by key lookup, independent of iteration order;
 * Option and Result compare state first, then payload. Anything else falls
 * back to operator==.
 */
template<typename T>
[[nodiscard]] bool DeepEquals(const T& lhs, const T& rhs) {
    if constexpr (detail::PointerLike<T>) {
        if (lhs == rhs) {
            return true;
        }
        if (lhs == nullptr || rhs == nullptr) {
            return false;
        }
        if constexpr (detail::StringLike<T>) {
            return std::string_view(lhs) == std::string_view(rhs);
        } else if constexpr (detail::Dereferenceable<T>) {
            return DeepEquals(*lhs, *rhs);
        } else {
            return false;
        }
    } else if constexpr (detail::IsOption<T>::value) {
        if (lhs.IsAbsent() || rhs.IsAbsent()) {
            return lhs.IsAbsent() == rhs.IsAbsent();
        }
        return DeepEquals(lhs.Unwrap(), rhs.Unwrap());
    } else if constexpr (detail::IsStdOptional<T>::value) {
        if (!lhs.has_value() || !rhs.has_value()) {
            return lhs.has_value() == rhs.has_value();
        }
        return DeepEquals(*lhs, *rhs);
    } else if constexpr (detail::IsResult<T>::value) {
        if (lhs.IsSuccess() != rhs.IsSuccess()) {
            return false;
        }
        if (lhs.IsSuccess()) {
            return DeepEquals(lhs.Unwrap(), rhs.Unwrap());
        }
        return DeepEquals(lhs.UnwrapFailure(), rhs.UnwrapFailure());
    } else if constexpr (detail::StringLike<T>) {
        return std::string_view(lhs) == std::string_view(rhs);
    } else if constexpr (detail::UnorderedAssociative<T>) {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (auto it = lhs.begin(); it != lhs.end();) {
            const auto& key = [&]() -> const typename T::key_type& {
                if constexpr (detail::HasMappedType<T>) {
                    return it->first;
                } else {
                    return *it;
                }
            }();
            const auto [lhs_first, lhs_last] = lhs.equal_range(key);
            const auto [rhs_first, rhs_last] = rhs.equal_range(key);
            if constexpr (detail::HasMappedType<T>) {
                const bool same_values = std::is_permutation(
                    lhs_first, lhs_last, rhs_first, rhs_last,
                    [](const auto& a, const auto& b) { return DeepEquals(a.second, b.second); });
                if (!same_values) {
                    return false;
                }
            } else if (std::distance(lhs_first, lhs_last) != std::distance(rhs_first, rhs_last)) {
                return false;
            }
            it = lhs_last;
        }
        return true;
    } else if constexpr (std::ranges::sized_range<const T>) {
        if (std::ranges::size(lhs) != std::ranges::size(rhs)) {
            return false;
        }
        auto rhs_it = std::ranges::begin(rhs);
        for (const auto& element : lhs) {
            if (!DeepEquals(element, *rhs_it)) {
                return false;
            }
            ++rhs_it;
        }
        return true;
    } else if constexpr (detail::TupleLike<T>) {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (DeepEquals(std::get<I>(lhs), std::get<I>(rhs)) && ...);
        }(std::make_index_sequence<std::tuple_size_v<T>>{});
    } else {
        static_assert(std::equality_comparable<T>,
                      "DeepEquals requires an equality-comparable type");
        return lhs == rhs;
    }
}

/**
 * Predicate form of DeepEquals, bound to an expected value.
 */
template<typename T>
[[nodiscard]] auto DeepEqualTo(T expected) {
    return [expected = std::move(expected)](const T& candidate) {
        return DeepEquals(candidate, expected);
    };
}
}
