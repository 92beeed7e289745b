#include "fallible/core/failures.hpp"
#include "fallible/core/constants.hpp"
#include "fallible/core/format.hpp"
namespace fallible::core {
OutcomeFailure OutcomeFailure::FromErrorCode(const std::error_code& ec) {
    if (!ec) {
        return InvalidState(std::string(ErrorMessages::ERROR_CODE_UNSET));
    }
    const auto message = compat::format("{}: {}", ec.category().name(), ec.message());
    if (ec == std::errc::no_such_file_or_directory) {
        return NotFound(message);
    }
    if (ec == std::errc::invalid_argument) {
        return InvalidInput(message);
    }
    if (ec == std::errc::io_error) {
        return Io(message);
    }
    return Generic(message);
}
}
