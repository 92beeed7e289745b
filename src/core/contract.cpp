#include "fallible/core/contract.hpp"
#include "fallible/core/constants.hpp"
#include "fallible/debug/violation_logger.hpp"
#include <string>
namespace fallible::core {
std::string_view DescribeViolation(const ContractViolationType type) noexcept {
    switch (type) {
        case ContractViolationType::ExpectedPresent:
            return ViolationConstants::OPERATION_OPTION_EXPECT;
        case ContractViolationType::ExpectedSuccess:
            return ViolationConstants::OPERATION_RESULT_EXPECT;
        case ContractViolationType::ExpectedFailure:
            return ViolationConstants::OPERATION_RESULT_EXPECT_FAILURE;
    }
    return ViolationConstants::OPERATION_RESULT_EXPECT;
}
void RaiseContractViolation(const ContractViolationType type, const std::string_view message) {
    debug::LogContractViolation(DescribeViolation(type), message);
    throw ContractViolation(type, std::string(message));
}
}
