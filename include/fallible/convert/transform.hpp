#pragma once
#include "fallible/core/option.hpp"
#include "fallible/core/result.hpp"
#include <functional>
#include <type_traits>
#include <utility>
namespace fallible::convert {
using core::Option;
using core::Result;

// Type-changing counterparts of the member combinators, which keep T and E fixed.

template<typename T, typename E, typename F>
[[nodiscard]] auto Transform(const Result<T, E>& result, F&& func)
    -> Result<std::decay_t<std::invoke_result_t<F, const T&>>, E> {
    using U = std::decay_t<std::invoke_result_t<F, const T&>>;
    if (result.IsSuccess()) {
        return Result<U, E>::Success(std::invoke(std::forward<F>(func), result.Unwrap()));
    }
    return Result<U, E>::Failure(result.UnwrapFailure());
}

template<typename T, typename E, typename F>
[[nodiscard]] auto TransformErr(const Result<T, E>& result, F&& func)
    -> Result<T, std::decay_t<std::invoke_result_t<F, const E&>>> {
    using U = std::decay_t<std::invoke_result_t<F, const E&>>;
    if (result.IsFailure()) {
        return Result<T, U>::Failure(std::invoke(std::forward<F>(func), result.UnwrapFailure()));
    }
    return Result<T, U>::Success(result.Unwrap());
}

template<typename T, typename F>
[[nodiscard]] auto TransformOption(const Option<T>& opt, F&& func)
    -> Option<std::decay_t<std::invoke_result_t<F, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<F, const T&>>;
    if (opt.IsPresent()) {
        return Option<U>::Present(std::invoke(std::forward<F>(func), opt.Unwrap()));
    }
    return Option<U>::Absent();
}

template<typename T, typename E, typename F>
[[nodiscard]] auto Bind(const Result<T, E>& result, F&& func)
    -> std::invoke_result_t<F, const T&> {
    using ResultType = std::invoke_result_t<F, const T&>;
    static_assert(std::is_same_v<typename ResultType::error_type, E>,
                  "Bind function must return Result with same error type");
    if (result.IsSuccess()) {
        return std::invoke(std::forward<F>(func), result.Unwrap());
    }
    return ResultType::Failure(result.UnwrapFailure());
}
}
