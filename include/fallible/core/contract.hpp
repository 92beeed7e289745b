#pragma once
#include "fallible/core/failures.hpp"
#include <string_view>
namespace fallible::core {
/**
 * Logs the violation through the debug logger, then throws
 * ContractViolation with `message` as its what().
 */
[[noreturn]] void RaiseContractViolation(ContractViolationType type, std::string_view message);
[[nodiscard]] std::string_view DescribeViolation(ContractViolationType type) noexcept;
}
