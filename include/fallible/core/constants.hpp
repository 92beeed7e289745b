#pragma once
#include <cstddef>
#include <string_view>
namespace fallible::core {
struct ErrorMessages {
    static constexpr std::string_view OPTION_UNWRAP_NONE = "unwrapped a none";
    static constexpr std::string_view RESULT_UNWRAP_FAILURE = "attempted to unwrap an error";
    static constexpr std::string_view RESULT_UNWRAP_SUCCESS = "attempted to unwrap a success";
    static constexpr std::string_view ERROR_CODE_UNSET = "Error code carried no error";
};
struct ViolationConstants {
    static constexpr std::string_view LOG_PREFIX = "[FALLIBLE-DEBUG]";
    static constexpr std::string_view OPERATION_OPTION_EXPECT = "Option::Expect";
    static constexpr std::string_view OPERATION_RESULT_EXPECT = "Result::Expect";
    static constexpr std::string_view OPERATION_RESULT_EXPECT_FAILURE = "Result::ExpectFailure";
    static constexpr size_t MAX_LOGGED_MESSAGE_LENGTH = 512;
};
}
