#include <catch2/catch_test_macros.hpp>
#include "tvremote/facade/capability_relay.hpp"
#include "helpers/async_runner.hpp"
#include "helpers/fake_backends.hpp"
#include <boost/asio/io_context.hpp>
#include <stdexcept>
using namespace tvremote;
using namespace tvremote::facade;
using namespace tvremote::test_helpers;
using interfaces::ProtocolTag;

TEST_CASE("CapabilityRelay - Priority resolution", "[facade][relay]") {
    boost::asio::io_context io;
    CallLog log;
    CapabilityRelay<interfaces::RemoteControl> relay(interfaces::kDefaultPriorities);
    auto mrp = std::make_shared<RecordingRemote>("mrp", std::initializer_list<std::string_view>{"play", "up"}, log);
    auto dmap = std::make_shared<RecordingRemote>("dmap", std::initializer_list<std::string_view>{"play", "pause"}, log);
    REQUIRE(relay.Register(dmap, ProtocolTag::Dmap).IsOk());
    REQUIRE(relay.Register(mrp, ProtocolTag::Mrp).IsOk());

    SECTION("Highest priority backend wins") {
        auto target = relay.Resolve("play");
        REQUIRE(target.IsOk());
        REQUIRE(target.Unwrap() == mrp);
        REQUIRE(RunAsync(io, target.Unwrap()->Play()).IsOk());
        REQUIRE(log == CallLog{"mrp:play"});
    }
    SECTION("Falls back to a lower priority backend that implements the method") {
        auto target = relay.Resolve("pause");
        REQUIRE(target.IsOk());
        REQUIRE(target.Unwrap() == dmap);
    }
    SECTION("Nobody implements the method") {
        auto target = relay.Resolve("stop");
        REQUIRE(target.IsErr());
        REQUIRE(target.UnwrapErr().Is(RemoteFailureType::NotSupported));
        REQUIRE(target.UnwrapErr().message == "stop is not supported");
    }
    SECTION("Unknown method names are a programming error") {
        REQUIRE_THROWS_AS((void)relay.Resolve("rewind"), std::runtime_error);
    }
    SECTION("Explicit priority replaces the configured order") {
        const std::array<ProtocolTag, 2> order = {ProtocolTag::Dmap, ProtocolTag::Mrp};
        auto target = relay.Resolve("play", order);
        REQUIRE(target.IsOk());
        REQUIRE(target.Unwrap() == dmap);
    }
    SECTION("Main instance and ordering") {
        REQUIRE(relay.MainProtocol().Unwrap() == ProtocolTag::Mrp);
        REQUIRE(relay.MainInstance().Unwrap() == mrp);
        const auto instances = relay.Instances();
        REQUIRE(instances.size() == 2);
        REQUIRE(instances[0] == mrp);
        REQUIRE(instances[1] == dmap);
        REQUIRE(relay.Get(ProtocolTag::Companion) == nullptr);
    }
    SECTION("Clear drops every backend") {
        relay.Clear();
        REQUIRE(relay.Count() == 0);
        REQUIRE(relay.MainInstance().UnwrapErr().Is(RemoteFailureType::NotSupported));
        REQUIRE(relay.Resolve("play").UnwrapErr().Is(RemoteFailureType::NotSupported));
    }
}

TEST_CASE("CapabilityRelay - Takeover", "[facade][relay]") {
    CallLog log;
    CapabilityRelay<interfaces::RemoteControl> relay(interfaces::kDefaultPriorities);
    auto mrp = std::make_shared<RecordingRemote>("mrp", std::initializer_list<std::string_view>{"play"}, log);
    auto airplay = std::make_shared<RecordingRemote>("airplay", std::initializer_list<std::string_view>{"play"}, log);
    REQUIRE(relay.Register(mrp, ProtocolTag::Mrp).IsOk());
    REQUIRE(relay.Register(airplay, ProtocolTag::AirPlay).IsOk());

    SECTION("Takeover protocol ranks first until released") {
        REQUIRE(relay.Takeover(ProtocolTag::AirPlay).IsOk());
        REQUIRE(relay.TakeoverProtocol() == ProtocolTag::AirPlay);
        REQUIRE(relay.Resolve("play").Unwrap() == airplay);
        REQUIRE(relay.MainInstance().Unwrap() == airplay);

        relay.Release();
        REQUIRE_FALSE(relay.TakeoverProtocol().has_value());
        REQUIRE(relay.Resolve("play").Unwrap() == mrp);
    }
    SECTION("Second takeover is refused") {
        REQUIRE(relay.Takeover(ProtocolTag::AirPlay).IsOk());
        auto again = relay.Takeover(ProtocolTag::Mrp);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().Is(RemoteFailureType::InvalidState));
        REQUIRE(relay.TakeoverProtocol() == ProtocolTag::AirPlay);
    }
    SECTION("Takeover by a protocol without the method falls through") {
        REQUIRE(relay.Takeover(ProtocolTag::Companion).IsOk());
        REQUIRE(relay.Resolve("play").Unwrap() == mrp);
    }
}

TEST_CASE("CapabilityRelay - Registration", "[facade][relay]") {
    CallLog log;
    const std::array<ProtocolTag, 1> only_mrp = {ProtocolTag::Mrp};
    CapabilityRelay<interfaces::RemoteControl> relay(only_mrp);
    auto backend = std::make_shared<RecordingRemote>("dmap", std::initializer_list<std::string_view>{"play"}, log);

    SECTION("Protocols outside the priority list are rejected") {
        auto registered = relay.Register(backend, ProtocolTag::Dmap);
        REQUIRE(registered.IsErr());
        REQUIRE(registered.UnwrapErr().Is(RemoteFailureType::InvalidInput));
        REQUIRE(relay.Count() == 0);
    }
    SECTION("Registering the same protocol replaces the backend") {
        auto other = std::make_shared<RecordingRemote>("other", std::initializer_list<std::string_view>{"play"}, log);
        REQUIRE(relay.Register(backend, ProtocolTag::Mrp).IsOk());
        REQUIRE(relay.Register(other, ProtocolTag::Mrp).IsOk());
        REQUIRE(relay.Count() == 1);
        REQUIRE(relay.Resolve("play").Unwrap() == other);
    }
}

TEST_CASE("Capability - Override declarations", "[interfaces][capability]") {
    CallLog log;
    RecordingRemote remote("mrp", {"play"}, log);
    REQUIRE(remote.Overrides("play"));
    REQUIRE_FALSE(remote.Overrides("pause"));
    REQUIRE(remote.HasMethod("set_repeat"));
    REQUIRE_FALSE(remote.HasMethod("rewind"));
    REQUIRE_THROWS_AS((void)remote.Overrides("rewind"), std::logic_error);

    SECTION("Methods that are not overridden fail with NotSupported") {
        boost::asio::io_context io;
        auto result = RunAsync(io, remote.Next());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RemoteFailureType::NotSupported));
    }
}
