/**
 * @file remote_example.cpp
 * @brief Pair with a device, or connect with stored credentials and send a command
 *
 *   remote_example <host> <port> pair
 *   remote_example <host> <port> <credentials> [play|pause|menu|up|down|select|playing]
 */

#include "tvremote/facade/device_facade.hpp"
#include "tvremote/mrp/pairing_handler.hpp"
#include "tvremote/mrp/setup.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <iostream>
#include <string>

using namespace tvremote;

namespace {

boost::asio::awaitable<int> Pair(boost::asio::io_context& io, std::string host, uint16_t port) {
    mrp::MrpPairingHandler handler(io, host, port, configuration::SessionConfig::Default());

    std::cout << "1. Asking the device for a PIN..." << std::endl;
    auto begun = co_await handler.Begin();
    if (begun.IsErr()) {
        std::cerr << "Pairing failed: " << begun.UnwrapErr().Describe() << std::endl;
        co_return 1;
    }

    std::cout << "2. Enter the PIN shown on screen: " << std::flush;
    std::string pin;
    std::getline(std::cin, pin);
    handler.Pin(pin);

    auto finished = co_await handler.Finish();
    co_await handler.Close();
    if (finished.IsErr()) {
        std::cerr << "Pairing failed: " << finished.UnwrapErr().Describe() << std::endl;
        co_return 1;
    }
    std::cout << "3. Paired. Credentials:" << std::endl;
    std::cout << "   " << handler.Credentials().value_or("") << std::endl;
    co_return 0;
}

AsyncResult<Unit> RunCommand(facade::DeviceFacade& device, const std::string& command) {
    auto& remote = device.RemoteControl();
    if (command == "play") co_return co_await remote.Play();
    if (command == "pause") co_return co_await remote.Pause();
    if (command == "menu") co_return co_await remote.Menu();
    if (command == "up") co_return co_await remote.Up();
    if (command == "down") co_return co_await remote.Down();
    if (command == "select") co_return co_await remote.Select();
    if (command == "playing") {
        auto playing = co_await device.Metadata().Playing();
        TVREMOTE_CO_TRY(playing);
        const auto& info = playing.Unwrap();
        std::cout << "   State: " << interfaces::ToString(info.device_state) << std::endl;
        std::cout << "   Title: " << info.title.value_or("-") << std::endl;
        std::cout << "   Artist: " << info.artist.value_or("-") << std::endl;
        co_return RemoteResult<Unit>::Ok(unit);
    }
    co_return RemoteResult<Unit>::Err(RemoteFailure::InvalidInput("Unknown command: " + command));
}

boost::asio::awaitable<int> Control(boost::asio::io_context& io, std::string host, uint16_t port,
                                    std::string credentials, std::string command) {
    configuration::DeviceConfig config;
    config.address = std::move(host);
    config.identifier = config.address;
    configuration::ServiceInfo service;
    service.port = port;
    service.credentials = std::move(credentials);
    config.services.push_back(std::move(service));

    auto setup = mrp::CreateSetup(io, config, config.services.front(), configuration::SessionConfig::Default());
    if (setup.IsErr()) {
        std::cerr << "Invalid setup: " << setup.UnwrapErr().Describe() << std::endl;
        co_return 1;
    }

    facade::DeviceFacade device;
    if (auto added = device.AddProtocol(std::move(setup).Unwrap()); added.IsErr()) {
        std::cerr << "Invalid setup: " << added.UnwrapErr().Describe() << std::endl;
        co_return 1;
    }

    std::cout << "1. Connecting..." << std::endl;
    auto connected = co_await device.Connect();
    if (connected.IsErr() || device.ConnectedProtocols().empty()) {
        std::cerr << "Could not connect to the device" << std::endl;
        co_return 1;
    }
    for (const auto& [key, value] : device.DeviceInfo()) {
        std::cout << "   " << key << ": " << value << std::endl;
    }

    std::cout << "2. Sending '" << command << "'..." << std::endl;
    auto result = co_await RunCommand(device, command);
    device.Close();
    if (result.IsErr()) {
        std::cerr << "Command failed: " << result.UnwrapErr().Describe() << std::endl;
        co_return 1;
    }
    std::cout << "   Done" << std::endl;
    co_return 0;
}

}

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <host> <port> pair" << std::endl;
        std::cerr << "       " << argv[0] << " <host> <port> <credentials> [command]" << std::endl;
        return 2;
    }
    const std::string host = argv[1];
    const auto port = static_cast<uint16_t>(std::stoul(argv[2]));
    const std::string mode = argv[3];

    boost::asio::io_context io;
    int exit_code = 1;
    auto task = mode == "pair"
        ? Pair(io, host, port)
        : Control(io, host, port, mode, argc > 4 ? argv[4] : "playing");
    boost::asio::co_spawn(io, std::move(task), [&exit_code](std::exception_ptr error, const int code) {
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& ex) {
                std::cerr << "Unexpected error: " << ex.what() << std::endl;
            }
            return;
        }
        exit_code = code;
    });
    io.run();
    return exit_code;
}
