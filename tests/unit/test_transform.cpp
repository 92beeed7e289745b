#include <catch2/catch_test_macros.hpp>
#include "fallible/convert/transform.hpp"
#include "fallible/core/failures.hpp"
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>
using namespace fallible;
using convert::Bind;
using convert::Transform;
using convert::TransformErr;
using convert::TransformOption;
using core::None;
using core::OutcomeFailure;
using core::Result;
using core::Some;

TEST_CASE("Transform - Changes the success type", "[transform][result]") {
    using IntResult = Result<int, std::string>;

    SECTION("Success is mapped to a new type") {
        const auto r = Transform(IntResult::Success(12), [](int v) { return std::to_string(v); });
        STATIC_REQUIRE(std::is_same_v<std::decay_t<decltype(r)>, Result<std::string, std::string>>);
        REQUIRE(r.Unwrap() == "12");
    }

    SECTION("Failure passes through without invoking the function") {
        int calls = 0;
        const auto r = Transform(IntResult::Failure("bad"), [&calls](int v) {
            ++calls;
            return std::vector<int>(static_cast<std::size_t>(v), 0);
        });
        REQUIRE(r.UnwrapFailure() == "bad");
        REQUIRE(calls == 0);
    }
}

TEST_CASE("TransformErr - Changes the failure type", "[transform][result]") {
    using IntResult = Result<int, std::string>;
    const auto to_failure = [](const std::string& e) { return OutcomeFailure::InvalidInput(e); };

    SECTION("Failure is mapped to a new error type") {
        const auto r = TransformErr(IntResult::Failure("bad digit"), to_failure);
        REQUIRE(r.UnwrapFailure().type == core::OutcomeFailureType::InvalidInput);
        REQUIRE(r.UnwrapFailure().message == "bad digit");
    }

    SECTION("Success passes through") {
        REQUIRE(TransformErr(IntResult::Success(3), to_failure).Unwrap() == 3);
    }
}

TEST_CASE("TransformOption - Changes the carried type", "[transform][option]") {
    const auto length = [](const std::string& s) { return s.size(); };
    REQUIRE(TransformOption(Some(std::string("four")), length).Unwrap() == 4);
    REQUIRE(TransformOption(None<std::string>(), length).IsAbsent());
}

TEST_CASE("Bind - Type-changing AndThen", "[transform][result]") {
    using TextResult = Result<std::string, std::string>;
    using IntResult = Result<int, std::string>;
    const auto parse = [](const std::string& text) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return IntResult::Failure("not a number: " + text);
        }
        return IntResult::Success(std::stoi(text));
    };

    SECTION("Success feeds the next step") {
        REQUIRE(Bind(TextResult::Success("31"), parse).Unwrap() == 31);
    }

    SECTION("Failure of the next step is returned") {
        REQUIRE(Bind(TextResult::Success("3a"), parse).UnwrapFailure() == "not a number: 3a");
    }

    SECTION("Earlier failure short-circuits") {
        REQUIRE(Bind(TextResult::Failure("read error"), parse).UnwrapFailure() == "read error");
    }
}
