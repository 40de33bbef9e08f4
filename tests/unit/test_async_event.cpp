#include <catch2/catch_test_macros.hpp>
#include "tvremote/core/async_event.hpp"
#include "helpers/async_runner.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
using namespace tvremote;
using namespace tvremote::test_helpers;

namespace {
    boost::asio::awaitable<bool> SetAfter(std::shared_ptr<AsyncEvent> event, std::chrono::milliseconds delay) {
        co_await Sleep(delay);
        event->Set();
        co_return true;
    }
}

TEST_CASE("AsyncEvent - Bounded wait", "[core][event]") {
    boost::asio::io_context io;
    auto event = std::make_shared<AsyncEvent>();

    SECTION("Times out when nobody sets it") {
        REQUIRE_FALSE(RunAsync(io, event->Wait(std::chrono::milliseconds{20})));
        REQUIRE_FALSE(event->IsSet());
        REQUIRE(event->WaiterCount() == 0);
    }
    SECTION("Set wakes a parked waiter") {
        boost::asio::co_spawn(io, SetAfter(event, std::chrono::milliseconds{10}), boost::asio::detached);
        REQUIRE(RunAsync(io, event->Wait(std::chrono::seconds{5})));
        REQUIRE(event->WaiterCount() == 0);
    }
    SECTION("Stays set") {
        event->Set();
        REQUIRE(RunAsync(io, event->Wait(std::chrono::milliseconds{1})));
    }
}

TEST_CASE("AsyncEvent - Waiter destroyed while parked", "[core][event]") {
    auto event = std::make_shared<AsyncEvent>();
    {
        boost::asio::io_context io;
        boost::asio::co_spawn(io,
            [event]() -> boost::asio::awaitable<void> {
                co_await event->Wait();
            },
            boost::asio::detached);
        io.poll();
        REQUIRE(event->WaiterCount() == 1);
    }
    // Tearing down the io_context destroyed the suspended frame.
    REQUIRE(event->WaiterCount() == 0);
    event->Set();
    REQUIRE(event->IsSet());
}
