#pragma once
#include "fallible/core/constants.hpp"
#include "fallible/core/contract.hpp"
#include "fallible/core/failures.hpp"
#include "fallible/core/option.hpp"
#include "fallible/convert/deep_equal.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
namespace fallible::core {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
/**
 * A success value of type T, or a failure value of type E.
 *
 * Exactly one channel is populated, chosen at construction and never
 * changed. The payload is addressed by variant index, so T and E may be the
 * same type.
 */
template<typename T, typename E>
class Result {
private:
    static constexpr std::size_t kSuccessIndex = 0;
    static constexpr std::size_t kFailureIndex = 1;
    std::variant<T, E> value_;
public:
    using value_type = T;
    using error_type = E;
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    [[nodiscard]] static Result Success(T value) {
        return Result(std::in_place_index<kSuccessIndex>, std::move(value));
    }
    [[nodiscard]] static Result Failure(E error) {
        return Result(std::in_place_index<kFailureIndex>, std::move(error));
    }
    [[nodiscard]] static Result FromOptional(Option<T> opt, E error_if_absent) {
        if (opt.IsPresent()) {
            return Success(std::move(opt).Unwrap());
        }
        return Failure(std::move(error_if_absent));
    }
    [[nodiscard]] static Result FromOptional(std::optional<T> opt, E error_if_absent) {
        if (opt.has_value()) {
            return Success(std::move(*opt));
        }
        return Failure(std::move(error_if_absent));
    }
    /**
     * Runs `func` and captures a thrown std::exception as a failure through
     * `on_error`. A void `func` yields Result<Unit, E>. ContractViolation
     * is rethrown untouched: a broken contract is not a domain failure.
     */
    template<typename Func, typename ErrorFunc>
    [[nodiscard]] static Result Try(Func&& func, ErrorFunc&& on_error) {
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
                static_assert(std::is_same_v<T, Unit>,
                              "Try with a void function requires Result<Unit, E>");
                std::invoke(std::forward<Func>(func));
                return Success(Unit{});
            } else {
                return Success(std::invoke(std::forward<Func>(func)));
            }
        } catch (const ContractViolation&) {
            throw;
        } catch (const std::exception& ex) {
            return Failure(std::invoke(std::forward<ErrorFunc>(on_error), ex));
        }
    }
    [[nodiscard]] bool IsSuccess() const noexcept { return value_.index() == kSuccessIndex; }
    [[nodiscard]] bool IsFailure() const noexcept { return value_.index() == kFailureIndex; }
    template<typename Pred>
    [[nodiscard]] bool IsSuccessAnd(Pred&& pred) const {
        return IsSuccess() && std::invoke(std::forward<Pred>(pred), SuccessRef());
    }
    template<typename Pred>
    [[nodiscard]] bool IsFailureAnd(Pred&& pred) const {
        return IsFailure() && std::invoke(std::forward<Pred>(pred), FailureRef());
    }
    [[nodiscard]] Result And(Result other) const {
        if (IsSuccess()) {
            return other;
        }
        return *this;
    }
    template<typename F>
    [[nodiscard]] Result AndThen(F&& func) const {
        static_assert(std::is_same_v<std::invoke_result_t<F, const T&>, Result>,
                      "AndThen function must return Result<T, E>; use convert::Bind to change type");
        if (IsSuccess()) {
            return std::invoke(std::forward<F>(func), SuccessRef());
        }
        return *this;
    }
    [[nodiscard]] Result Or(Result other) const {
        if (IsSuccess()) {
            return *this;
        }
        return other;
    }
    template<typename F>
    [[nodiscard]] Result OrElse(F&& func) const {
        static_assert(std::is_same_v<std::invoke_result_t<F, const E&>, Result>,
                      "OrElse function must return Result<T, E>");
        if (IsFailure()) {
            return std::invoke(std::forward<F>(func), FailureRef());
        }
        return *this;
    }
    [[nodiscard]] bool Contains(const T& value) const {
        return IsSuccess() && convert::DeepEquals(SuccessRef(), value);
    }
    template<typename F>
    [[nodiscard]] Result Map(F&& func) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<F, const T&>, T>,
                      "Map function must return T; use convert::Transform to change type");
        if (IsSuccess()) {
            return Success(std::invoke(std::forward<F>(func), SuccessRef()));
        }
        return *this;
    }
    template<typename F>
    [[nodiscard]] Result MapErr(F&& func) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<F, const E&>, E>,
                      "MapErr function must return E; use convert::TransformErr to change type");
        if (IsFailure()) {
            return Failure(std::invoke(std::forward<F>(func), FailureRef()));
        }
        return *this;
    }
    template<typename F>
    [[nodiscard]] T MapOr(T default_value, F&& func) const {
        if (IsSuccess()) {
            return std::invoke(std::forward<F>(func), SuccessRef());
        }
        return default_value;
    }
    template<typename F>
    const Result& Inspect(F&& func) const {
        if (IsSuccess()) {
            std::invoke(std::forward<F>(func), SuccessRef());
        }
        return *this;
    }
    template<typename F>
    const Result& InspectErr(F&& func) const {
        if (IsFailure()) {
            std::invoke(std::forward<F>(func), FailureRef());
        }
        return *this;
    }
    [[nodiscard]] Option<T> ToSuccessOptional() const& {
        if (IsSuccess()) {
            return Option<T>::Present(SuccessRef());
        }
        return Option<T>::Absent();
    }
    [[nodiscard]] Option<T> ToSuccessOptional() && {
        if (IsSuccess()) {
            return Option<T>::Present(std::get<kSuccessIndex>(std::move(value_)));
        }
        return Option<T>::Absent();
    }
    [[nodiscard]] Option<E> ToFailureOptional() const& {
        if (IsFailure()) {
            return Option<E>::Present(FailureRef());
        }
        return Option<E>::Absent();
    }
    [[nodiscard]] Option<E> ToFailureOptional() && {
        if (IsFailure()) {
            return Option<E>::Present(std::get<kFailureIndex>(std::move(value_)));
        }
        return Option<E>::Absent();
    }
    [[nodiscard]] const T& Expect(const std::string_view message) const& {
        if (IsFailure()) {
            RaiseContractViolation(ContractViolationType::ExpectedSuccess, message);
        }
        return SuccessRef();
    }
    [[nodiscard]] T Expect(const std::string_view message) && {
        if (IsFailure()) {
            RaiseContractViolation(ContractViolationType::ExpectedSuccess, message);
        }
        return std::get<kSuccessIndex>(std::move(value_));
    }
    [[nodiscard]] const E& ExpectFailure(const std::string_view message) const& {
        if (IsSuccess()) {
            RaiseContractViolation(ContractViolationType::ExpectedFailure, message);
        }
        return FailureRef();
    }
    [[nodiscard]] E ExpectFailure(const std::string_view message) && {
        if (IsSuccess()) {
            RaiseContractViolation(ContractViolationType::ExpectedFailure, message);
        }
        return std::get<kFailureIndex>(std::move(value_));
    }
    [[nodiscard]] const T& Unwrap() const& {
        return Expect(ErrorMessages::RESULT_UNWRAP_FAILURE);
    }
    [[nodiscard]] T Unwrap() && {
        return std::move(*this).Expect(ErrorMessages::RESULT_UNWRAP_FAILURE);
    }
    [[nodiscard]] const E& UnwrapFailure() const& {
        return ExpectFailure(ErrorMessages::RESULT_UNWRAP_SUCCESS);
    }
    [[nodiscard]] E UnwrapFailure() && {
        return std::move(*this).ExpectFailure(ErrorMessages::RESULT_UNWRAP_SUCCESS);
    }
    [[nodiscard]] T UnwrapOr(T default_value) const& {
        if (IsSuccess()) {
            return SuccessRef();
        }
        return default_value;
    }
    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsSuccess()) {
            return std::get<kSuccessIndex>(std::move(value_));
        }
        return default_value;
    }
    template<typename F>
    [[nodiscard]] T UnwrapOrElse(F&& func) const {
        if (IsSuccess()) {
            return SuccessRef();
        }
        return std::invoke(std::forward<F>(func), FailureRef());
    }
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
    [[nodiscard]] const T& SuccessRef() const { return std::get<kSuccessIndex>(value_); }
    [[nodiscard]] const E& FailureRef() const { return std::get<kFailureIndex>(value_); }
};
}
