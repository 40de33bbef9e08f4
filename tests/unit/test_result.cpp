#include <catch2/catch_test_macros.hpp>
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
using namespace tvremote;

namespace {
    Result<int, std::string> ParsePositive(const int value) {
        if (value <= 0) {
            return Result<int, std::string>::Err("not positive");
        }
        return Result<int, std::string>::Ok(value);
    }

    Result<std::string, std::string> Describe(const int value) {
        TVREMOTE_TRY(ParsePositive(value));
        return Result<std::string, std::string>::Ok("value " + std::to_string(value));
    }
}

TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
}

TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto mapped = Result<int, std::string>::Err("error").MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind short-circuits on Err") {
        auto bound = Result<int, std::string>::Ok(-3).Bind(ParsePositive);
        REQUIRE(bound.IsErr());
        REQUIRE(bound.UnwrapErr() == "not positive");
    }
    SECTION("UnwrapOr") {
        REQUIRE(Result<int, std::string>::Ok(42).UnwrapOr(0) == 42);
        REQUIRE(Result<int, std::string>::Err("error").UnwrapOr(7) == 7);
    }
}

TEST_CASE("Result<T, E> - Error propagation", "[result][core]") {
    SECTION("TRY passes through on Ok") {
        auto result = Describe(5);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "value 5");
    }
    SECTION("TRY returns the error into a different value type") {
        auto result = Describe(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "not positive");
    }
}

TEST_CASE("RemoteFailure - Causes", "[result][core]") {
    SECTION("Pairing wraps the underlying failure") {
        auto failure = RemoteFailure::Pairing("Pairing failed",
            RemoteFailure::Authentication("Bad proof"));
        REQUIRE(failure.Is(RemoteFailureType::Pairing));
        REQUIRE(failure.RootCause().Is(RemoteFailureType::Authentication));
        REQUIRE(failure.Describe() == "Pairing failed: Bad proof");
    }
    SECTION("A failure without cause is its own root") {
        auto failure = RemoteFailure::Timeout("No response");
        REQUIRE(&failure.RootCause() == &failure);
        REQUIRE(failure.Describe() == "No response");
    }
    SECTION("Back-off keeps the wait time") {
        auto failure = RemoteFailure::BackOff("Wait", 30);
        REQUIRE(failure.backoff_seconds == 30u);
        REQUIRE(ToString(failure.type) == "BackOff");
    }
}
