#pragma once
#include "fallible/core/constants.hpp"
#include "fallible/core/contract.hpp"
#include "fallible/convert/deep_equal.hpp"
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
namespace fallible::core {
/**
 * A value of type T, or nothing.
 *
 * Instances are immutable: every combinator returns a new Option and leaves
 * the receiver untouched. Expect/Unwrap are the only operations that can
 * fail, and they fail by raising ContractViolation.
 */
template<typename T>
class Option {
private:
    std::optional<T> value_;
public:
    using value_type = T;
    Option(const Option&) = default;
    Option(Option&&) noexcept(std::is_nothrow_move_constructible_v<T>) = default;
    Option& operator=(const Option&) = default;
    Option& operator=(Option&&) noexcept(std::is_nothrow_move_assignable_v<T>) = default;
    ~Option() = default;
    [[nodiscard]] static Option Present(T value) {
        return Option(std::in_place, std::move(value));
    }
    [[nodiscard]] static Option Absent() {
        return Option();
    }
    [[nodiscard]] static Option FromStdOptional(std::optional<T> opt) {
        if (opt.has_value()) {
            return Present(std::move(*opt));
        }
        return Absent();
    }
    [[nodiscard]] bool IsPresent() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool IsAbsent() const noexcept { return !value_.has_value(); }
    template<typename Pred>
    [[nodiscard]] bool IsPresentAnd(Pred&& pred) const {
        return IsPresent() && std::invoke(std::forward<Pred>(pred), *value_);
    }
    /**
     * Returns the receiver when present, otherwise `other`: the first
     * present Option wins. Unlike Result::And, `other` is only consulted on
     * the absent path. OrElseKeep is the same operation under a name that
     * says what it does.
     */
    [[nodiscard]] Option And(Option other) const {
        return OrElseKeep(std::move(other));
    }
    [[nodiscard]] Option OrElseKeep(Option other) const {
        if (IsPresent()) {
            return *this;
        }
        return other;
    }
    template<typename F>
    [[nodiscard]] Option AndThen(F&& func) const {
        static_assert(std::is_same_v<std::invoke_result_t<F, const T&>, Option>,
                      "AndThen function must return Option<T>");
        if (IsPresent()) {
            return std::invoke(std::forward<F>(func), *value_);
        }
        return *this;
    }
    template<typename F>
    [[nodiscard]] Option Map(F&& func) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<F, const T&>, T>,
                      "Map function must return T; use convert::TransformOption to change type");
        if (IsPresent()) {
            return Present(std::invoke(std::forward<F>(func), *value_));
        }
        return *this;
    }
    template<typename Pred>
    [[nodiscard]] Option Filter(Pred&& pred) const {
        if (IsPresent() && std::invoke(std::forward<Pred>(pred), *value_)) {
            return *this;
        }
        return Absent();
    }
    [[nodiscard]] bool Contains(const T& value) const {
        return IsPresent() && convert::DeepEquals(*value_, value);
    }
    [[nodiscard]] const T& Expect(const std::string_view message) const& {
        if (IsAbsent()) {
            RaiseContractViolation(ContractViolationType::ExpectedPresent, message);
        }
        return *value_;
    }
    [[nodiscard]] T Expect(const std::string_view message) && {
        if (IsAbsent()) {
            RaiseContractViolation(ContractViolationType::ExpectedPresent, message);
        }
        return std::move(*value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        return Expect(ErrorMessages::OPTION_UNWRAP_NONE);
    }
    [[nodiscard]] T Unwrap() && {
        return std::move(*this).Expect(ErrorMessages::OPTION_UNWRAP_NONE);
    }
    [[nodiscard]] T UnwrapOr(T default_value) const& {
        if (IsPresent()) {
            return *value_;
        }
        return default_value;
    }
    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsPresent()) {
            return std::move(*value_);
        }
        return default_value;
    }
    [[nodiscard]] std::optional<T> ToStdOptional() const& { return value_; }
    [[nodiscard]] std::optional<T> ToStdOptional() && { return std::move(value_); }
private:
    Option() = default;
    template<typename... Args>
    explicit Option(std::in_place_t tag, Args&&... args)
        : value_(tag, std::forward<Args>(args)...) {}
};
template<typename T>
[[nodiscard]] Option<std::decay_t<T>> Some(T&& value) {
    return Option<std::decay_t<T>>::Present(std::forward<T>(value));
}
template<typename T>
[[nodiscard]] Option<T> None() {
    return Option<T>::Absent();
}
}
