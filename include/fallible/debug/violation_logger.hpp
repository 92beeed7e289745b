#pragma once

/**
 * @file violation_logger.hpp
 * @brief Diagnostic trace for contract violations raised by Expect/Unwrap.
 *
 * Lines go to stderr, prefixed with [FALLIBLE-DEBUG], and only when the
 * library is compiled with FALLIBLE_DEBUG_TRACE. Without it every macro
 * and function here compiles to nothing.
 *
 * Enable via CMake: -DFALLIBLE_DEBUG_TRACE=ON
 */

#include "fallible/core/constants.hpp"
#include <cstdio>
#include <string_view>

namespace fallible::debug {

#ifdef FALLIBLE_DEBUG_TRACE

inline int ClampForLog(std::string_view text) {
    constexpr auto limit = core::ViolationConstants::MAX_LOGGED_MESSAGE_LENGTH;
    return static_cast<int>(text.size() < limit ? text.size() : limit);
}

#define FALLIBLE_LOG_MSG(operation, message) \
    do { \
        const std::string_view fallible_log_op_ = (operation); \
        const std::string_view fallible_log_msg_ = (message); \
        fprintf(stderr, "%s %.*s: %.*s\n", \
            ::fallible::core::ViolationConstants::LOG_PREFIX.data(), \
            ::fallible::debug::ClampForLog(fallible_log_op_), fallible_log_op_.data(), \
            ::fallible::debug::ClampForLog(fallible_log_msg_), fallible_log_msg_.data()); \
        fflush(stderr); \
    } while(0)

#define FALLIBLE_LOG_SECTION(section_name) \
    do { \
        fprintf(stderr, "%s ========== %s ==========\n", \
            ::fallible::core::ViolationConstants::LOG_PREFIX.data(), \
            section_name); \
        fflush(stderr); \
    } while(0)

inline void LogContractViolation(std::string_view operation, std::string_view message) {
    FALLIBLE_LOG_SECTION("CONTRACT VIOLATION");
    FALLIBLE_LOG_MSG(operation, message);
}

#else // !FALLIBLE_DEBUG_TRACE

#define FALLIBLE_LOG_MSG(operation, message) ((void)0)
#define FALLIBLE_LOG_SECTION(section_name) ((void)0)

inline void LogContractViolation(std::string_view, std::string_view) {}

#endif // FALLIBLE_DEBUG_TRACE

} // namespace fallible::debug
