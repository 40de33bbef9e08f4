#include <catch2/catch_test_macros.hpp>
#include "tvremote/auth/credentials.hpp"
using namespace tvremote;
using namespace tvremote::auth;

TEST_CASE("Credentials - Serialization", "[auth][credentials]") {
    Credentials credentials;
    credentials.ltpk = {0x01, 0xAB};
    credentials.ltsk = {0xFF};
    credentials.device_id = {'D', 'E', 'V'};
    credentials.client_id = {0x00, 0x10};

    SECTION("Four lower-case hex fields") {
        REQUIRE(credentials.ToString() == "01ab:ff:444556:0010");
    }
    SECTION("Parse restores every field") {
        auto parsed = Credentials::Parse(credentials.ToString());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap() == credentials);
    }
    SECTION("Upper-case hex is accepted") {
        auto parsed = Credentials::Parse("01AB:FF:444556:0010");
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap() == credentials);
    }
}

TEST_CASE("Credentials - Invalid input", "[auth][credentials]") {
    SECTION("Too few fields") {
        auto parsed = Credentials::Parse("aa:bb:cc");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().Is(RemoteFailureType::InvalidInput));
    }
    SECTION("Too many fields") {
        REQUIRE(Credentials::Parse("aa:bb:cc:dd:ee").IsErr());
    }
    SECTION("Odd-length hex") {
        REQUIRE(Credentials::Parse("aaa:bb:cc:dd").IsErr());
    }
    SECTION("Non-hex characters") {
        auto parsed = Credentials::Parse("zz:bb:cc:dd");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().Is(RemoteFailureType::InvalidInput));
    }
    SECTION("Empty string") {
        REQUIRE(Credentials::Parse("").IsErr());
    }
}
