#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
namespace fallible::core {
enum class ContractViolationType : uint8_t {
    ExpectedPresent,
    ExpectedSuccess,
    ExpectedFailure
};
/**
 * Raised by the Expect/Unwrap family when the container holds the other
 * state. It signals a programming error, never a domain failure, and never
 * enters the Result algebra (Result::Try rethrows it).
 */
class ContractViolation : public std::logic_error {
public:
    ContractViolation(const ContractViolationType type, const std::string& message)
        : std::logic_error(message), type_(type) {}
    [[nodiscard]] ContractViolationType GetType() const noexcept { return type_; }
private:
    ContractViolationType type_;
};
enum class OutcomeFailureType {
    Generic,
    NotFound,
    InvalidInput,
    InvalidState,
    Io,
    Exception
};
class OutcomeFailure {
public:
    OutcomeFailureType type;
    std::string message;
    OutcomeFailure(const OutcomeFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static OutcomeFailure Generic(std::string msg) {
        return {OutcomeFailureType::Generic, std::move(msg)};
    }
    static OutcomeFailure NotFound(std::string msg) {
        return {OutcomeFailureType::NotFound, std::move(msg)};
    }
    static OutcomeFailure InvalidInput(std::string msg) {
        return {OutcomeFailureType::InvalidInput, std::move(msg)};
    }
    static OutcomeFailure InvalidState(std::string msg) {
        return {OutcomeFailureType::InvalidState, std::move(msg)};
    }
    static OutcomeFailure Io(std::string msg) {
        return {OutcomeFailureType::Io, std::move(msg)};
    }
    static OutcomeFailure FromException(const std::exception& ex) {
        return {OutcomeFailureType::Exception, ex.what()};
    }
    static OutcomeFailure FromErrorCode(const std::error_code& ec);
    static OutcomeFailure From(const std::error_code& ec) { return FromErrorCode(ec); }
    bool operator==(const OutcomeFailure& other) const {
        return type == other.type && message == other.message;
    }
};
}
