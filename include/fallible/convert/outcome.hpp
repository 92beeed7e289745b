#pragma once
#include "fallible/core/failures.hpp"
#include "fallible/core/result.hpp"
#include <optional>
#include <system_error>
#include <utility>
namespace fallible::convert {
using core::Result;

/**
 * Absorbs a conventional "(value, error-or-absent)" outcome into a Result.
 * An error that is present always wins; the value is then discarded.
 */
template<typename T, typename E>
[[nodiscard]] Result<T, E> FromOutcome(T value, std::optional<E> err) {
    if (err.has_value()) {
        return Result<T, E>::Failure(std::move(*err));
    }
    return Result<T, E>::Success(std::move(value));
}

template<typename T, typename E>
[[nodiscard]] Result<T, E> FromOutcome(std::pair<T, std::optional<E>> outcome) {
    return FromOutcome<T, E>(std::move(outcome.first), std::move(outcome.second));
}

// A null `err` means no error; otherwise the pointee is copied.
template<typename T, typename E>
[[nodiscard]] Result<T, E> FromOutcome(T value, const E* err) {
    if (err != nullptr) {
        return Result<T, E>::Failure(*err);
    }
    return Result<T, E>::Success(std::move(value));
}

template<typename T>
[[nodiscard]] Result<T, std::error_code> FromOutcome(T value, const std::error_code ec) {
    if (ec) {
        return Result<T, std::error_code>::Failure(ec);
    }
    return Result<T, std::error_code>::Success(std::move(value));
}

template<typename T>
[[nodiscard]] Result<T, core::OutcomeFailure> FromErrorCode(T value, const std::error_code ec) {
    if (ec) {
        return Result<T, core::OutcomeFailure>::Failure(core::OutcomeFailure::FromErrorCode(ec));
    }
    return Result<T, core::OutcomeFailure>::Success(std::move(value));
}
}
