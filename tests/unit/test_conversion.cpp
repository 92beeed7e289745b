#include <catch2/catch_test_macros.hpp>
#include "fallible/convert/conversion.hpp"
#include "fallible/core/failures.hpp"
#include <string>
#include <system_error>
#include <type_traits>
using namespace fallible;
using convert::Convert;
using convert::ConvertFailure;
using convert::ConvertOption;
using convert::ConvertSuccess;
using convert::ViewAs;
using core::None;
using core::OutcomeFailure;
using core::OutcomeFailureType;
using core::Result;
using core::Some;

namespace {
    struct Celsius {
        double degrees;
    };

    struct Fahrenheit {
        double degrees;
        static Fahrenheit From(const Celsius& c) { return {c.degrees * 9.0 / 5.0 + 32.0}; }
    };

    struct UserId {
        int raw;
        [[nodiscard]] std::string Into() const { return "user-" + std::to_string(raw); }
    };

    class Envelope {
    public:
        explicit Envelope(std::string body) : body_(std::move(body)) {}
        [[nodiscard]] const std::string& AsRef() const { return body_; }
    private:
        std::string body_;
    };
}

TEST_CASE("Conversion - Concepts recognise each shape", "[conversion]") {
    STATIC_REQUIRE(convert::From<Fahrenheit, Celsius>);
    STATIC_REQUIRE_FALSE(convert::From<Celsius, Fahrenheit>);
    STATIC_REQUIRE(convert::From<OutcomeFailure, std::error_code>);

    STATIC_REQUIRE(convert::Into<UserId, std::string>);
    STATIC_REQUIRE_FALSE(convert::Into<Celsius, std::string>);

    STATIC_REQUIRE(convert::AsRef<Envelope, std::string>);
    STATIC_REQUIRE_FALSE(convert::AsRef<UserId, std::string>);
}

TEST_CASE("Conversion - Convert and ViewAs", "[conversion]") {
    SECTION("Target factory") {
        REQUIRE(Convert<Fahrenheit>(Celsius{100.0}).degrees == 212.0);
    }

    SECTION("Source Into") {
        REQUIRE(Convert<std::string>(UserId{7}) == "user-7");
    }

    SECTION("AsRef views the source without copying") {
        const Envelope envelope("payload");
        const std::string& body = ViewAs<std::string>(envelope);
        REQUIRE(body == "payload");
        REQUIRE(&body == &envelope.AsRef());
    }
}

TEST_CASE("Conversion - Lifting into containers", "[conversion][result][option]") {
    SECTION("ConvertFailure classifies error codes") {
        using CodeResult = Result<int, std::error_code>;
        const auto failed = ConvertFailure<OutcomeFailure>(
            CodeResult::Failure(std::make_error_code(std::errc::no_such_file_or_directory)));
        STATIC_REQUIRE(std::is_same_v<std::decay_t<decltype(failed)>, Result<int, OutcomeFailure>>);
        REQUIRE(failed.UnwrapFailure().type == OutcomeFailureType::NotFound);

        const auto passed = ConvertFailure<OutcomeFailure>(CodeResult::Success(3));
        REQUIRE(passed.Contains(3));
    }

    SECTION("ConvertSuccess leaves failures untouched") {
        using IdResult = Result<UserId, std::string>;
        REQUIRE(ConvertSuccess<std::string>(IdResult::Success(UserId{1})).Contains("user-1"));
        REQUIRE(ConvertSuccess<std::string>(IdResult::Failure("gone")).UnwrapFailure() == "gone");
    }

    SECTION("ConvertOption") {
        const auto hot = ConvertOption<Fahrenheit>(Some(Celsius{0.0}));
        REQUIRE(hot.Unwrap().degrees == 32.0);
        REQUIRE(ConvertOption<Fahrenheit>(None<Celsius>()).IsAbsent());
    }
}
