#include <catch2/catch_test_macros.hpp>
#include "tvremote/mrp/capabilities.hpp"
#include "tvremote/mrp/messages.hpp"
#include "tvremote/mrp/player_state.hpp"
#include "tvremote/mrp/protocol_session.hpp"
#include "helpers/async_runner.hpp"
#include "helpers/fake_device.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <optional>
#include <set>
using namespace tvremote;
using namespace tvremote::mrp;
using namespace tvremote::test_helpers;
using configuration::SessionConfig;
using interfaces::PowerState;

namespace {
    struct LifecycleRecorder final : interfaces::DeviceListener {
        std::vector<RemoteFailure> lost;
        size_t closed = 0;
        void OnConnectionLost(const RemoteFailure& failure) override { lost.push_back(failure); }
        void OnConnectionClosed() override { ++closed; }
    };

    std::shared_ptr<ProtocolSession> VerifiedSession(boost::asio::io_context& io, FakeDevice& device,
                                                     SessionConfig config = SessionConfig::ForTesting()) {
        return ProtocolSession::Create(io, "127.0.0.1", device.Port(), std::move(config),
                                       device.IssueCredentials());
    }
}

TEST_CASE("Session Workflow - Start sequence", "[integration][session]") {
    boost::asio::io_context io;
    FakeDevice device(io);

    SECTION("Verified session is encrypted and ready") {
        auto session = VerifiedSession(io, device);
        REQUIRE(session->State() == SessionState::NotStarted);
        auto started = RunAsync(io, session->Start());
        REQUIRE(started.IsOk());
        REQUIRE(session->State() == SessionState::Ready);
        REQUIRE(session->IsEncrypted());
        REQUIRE(device.IsEncrypted());
        REQUIRE(session->PairingId() == "TEST-CLIENT-ID");

        REQUIRE(session->DeviceInfo().has_value());
        REQUIRE(session->DeviceInfo()->deviceinfomessage().name() == "Fake TV");
        REQUIRE(device.CountReceived(pb::ProtocolMessage::DEVICE_INFO_MESSAGE) == 1);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::CRYPTO_PAIRING_MESSAGE) == 2);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::SET_CONNECTION_STATE_MESSAGE) == 1);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::CLIENT_UPDATES_CONFIG_MESSAGE) == 1);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GET_KEYBOARD_SESSION_MESSAGE) == 1);
        REQUIRE(session->PendingCount() == 0);
    }
    SECTION("Requests carry unique identifiers") {
        auto session = VerifiedSession(io, device);
        REQUIRE(RunAsync(io, session->Start()).IsOk());
        const auto& received = device.Received();
        std::set<std::string> identifiers;
        for (const auto& message : received) {
            if (message.type() == pb::ProtocolMessage::CRYPTO_PAIRING_MESSAGE
                || message.type() == pb::ProtocolMessage::SET_CONNECTION_STATE_MESSAGE) {
                continue;
            }
            REQUIRE(message.identifier().size() == 36);
            REQUIRE(identifiers.insert(message.identifier()).second);
        }
    }
    SECTION("Start on a ready session is a no-op") {
        auto session = VerifiedSession(io, device);
        REQUIRE(RunAsync(io, session->Start()).IsOk());
        REQUIRE(RunAsync(io, session->Start()).IsOk());
        REQUIRE(device.Connections() == 1);
    }
    SECTION("Unknown client is refused") {
        auto credentials = device.IssueCredentials();
        credentials.client_id = {'N', 'O', 'B', 'O', 'D', 'Y'};
        auto session = ProtocolSession::Create(io, "127.0.0.1", device.Port(),
                                               SessionConfig::ForTesting(), credentials);
        auto started = RunAsync(io, session->Start());
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().Is(RemoteFailureType::ConnectionFailed));
        REQUIRE(session->State() == SessionState::Failed);
        REQUIRE_FALSE(device.IsEncrypted());

        SECTION("Failed session cannot restart") {
            auto again = RunAsync(io, session->Start());
            REQUIRE(again.IsErr());
            REQUIRE(again.UnwrapErr().Is(RemoteFailureType::InvalidState));
        }
    }
    SECTION("Requests are refused until start completes") {
        auto session = VerifiedSession(io, device);
        auto early = session->Send(messages::Generic());
        REQUIRE(early.IsErr());
        REQUIRE(early.UnwrapErr().Is(RemoteFailureType::InvalidState));

        std::optional<RemoteResult<Unit>> started;
        io.restart();
        boost::asio::co_spawn(io,
            [&started, session]() -> boost::asio::awaitable<void> {
                started.emplace(co_await session->Start());
            },
            boost::asio::detached);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (!started && session->State() != SessionState::Connected
               && std::chrono::steady_clock::now() < deadline) {
            io.run_one_for(std::chrono::milliseconds{20});
        }
        REQUIRE(session->State() == SessionState::Connected);
        auto midway = session->Send(messages::Generic());
        REQUIRE(midway.IsErr());
        REQUIRE(midway.UnwrapErr().Is(RemoteFailureType::InvalidState));

        while (!started && std::chrono::steady_clock::now() < deadline) {
            io.run_one_for(std::chrono::milliseconds{20});
        }
        REQUIRE(started.has_value());
        REQUIRE(started->IsOk());
        REQUIRE(session->Send(messages::Generic()).IsOk());
    }
    SECTION("Pairing session accepts requests once connected") {
        auto session = ProtocolSession::Create(io, "127.0.0.1", device.Port(), SessionConfig::ForTesting());
        REQUIRE(RunAsync(io, session->Start(true)).IsOk());
        REQUIRE(session->State() == SessionState::Connected);
        REQUIRE(session->Send(messages::Generic()).IsOk());
        session->Stop();
    }
    SECTION("Stop cancels and refuses further requests") {
        auto session = VerifiedSession(io, device);
        REQUIRE(RunAsync(io, session->Start()).IsOk());
        session->Stop();
        session->Stop();
        REQUIRE(session->State() == SessionState::Stopped);
        auto sent = session->Send(messages::Generic());
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().Is(RemoteFailureType::InvalidState));
        RunFor(io, std::chrono::milliseconds{50});
        REQUIRE_FALSE(device.HasClient());
    }
}

TEST_CASE("Session Workflow - Unreachable or refusing device", "[integration][session]") {
    boost::asio::io_context io;

    SECTION("Device closes on accept") {
        FakeDeviceOptions options;
        options.close_on_accept = true;
        FakeDevice device(io, options);
        auto session = ProtocolSession::Create(io, "127.0.0.1", device.Port(), SessionConfig::ForTesting());
        auto started = RunAsync(io, session->Start());
        REQUIRE(started.IsErr());
        REQUIRE(session->State() == SessionState::Failed);
    }
    SECTION("Nothing is listening") {
        uint16_t port = 0;
        {
            FakeDevice device(io);
            port = device.Port();
        }
        auto session = ProtocolSession::Create(io, "127.0.0.1", port, SessionConfig::ForTesting());
        auto started = RunAsync(io, session->Start());
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().Is(RemoteFailureType::ConnectionFailed));
    }
}

TEST_CASE("Session Workflow - Remote control", "[integration][session][remote]") {
    boost::asio::io_context io;
    FakeDeviceOptions options;
    options.logical_device_count = 0;
    FakeDevice device(io, options);
    auto session = VerifiedSession(io, device);
    REQUIRE(RunAsync(io, session->Start()).IsOk());
    auto player_state = std::make_shared<PlayerStateManager>(session);
    MrpRemoteControl remote(session, player_state);

    SECTION("Commands round trip") {
        REQUIRE(RunAsync(io, remote.Play()).IsOk());
        REQUIRE(RunAsync(io, remote.SkipForward()).IsOk());
        const auto commands = device.ReceivedOfType(pb::ProtocolMessage::SEND_COMMAND_MESSAGE);
        REQUIRE(commands.size() == 2);
        REQUIRE(commands[0].sendcommandmessage().command() == pb::Play);
        REQUIRE(commands[1].sendcommandmessage().command() == pb::SkipForward);
        REQUIRE(commands[1].sendcommandmessage().options().skipinterval() == kDefaultSkipInterval);
    }
    SECTION("Command rejected by the device") {
        device.Options().command_error = pb::SendCommandResultMessage::NoCommandHandlers;
        auto result = RunAsync(io, remote.Next());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RemoteFailureType::Command));
        REQUIRE(result.UnwrapErr().message.find("NoCommandHandlers") != std::string::npos);
    }
    SECTION("Key press sends down and up then flushes") {
        const auto generic_before = device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE);
        REQUIRE(RunAsync(io, remote.Up()).IsOk());
        const auto events = device.ReceivedOfType(pb::ProtocolMessage::SEND_HID_EVENT_MESSAGE);
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].sendhideventmessage().hideventdata() != events[1].sendhideventmessage().hideventdata());
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE) == generic_before + 1);
    }
    SECTION("Double tap") {
        REQUIRE(RunAsync(io, remote.Select(interfaces::InputAction::DoubleTap)).IsOk());
        REQUIRE(device.CountReceived(pb::ProtocolMessage::SEND_HID_EVENT_MESSAGE) == 4);
    }
    SECTION("Volume keys are not flushed") {
        const auto generic_before = device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE);
        REQUIRE(RunAsync(io, remote.VolumeUp()).IsOk());
        RunFor(io, std::chrono::milliseconds{50});
        REQUIRE(device.CountReceived(pb::ProtocolMessage::SEND_HID_EVENT_MESSAGE) == 2);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE) == generic_before);
    }
    SECTION("Play-pause follows the pushed state") {
        pb::SetStateMessage state;
        state.set_playbackstate(pb::Playing);
        state.mutable_nowplayinginfo()->set_title("Track");
        device.PushPlayerState(state);
        RunFor(io, std::chrono::milliseconds{50});
        REQUIRE(player_state->HasReceivedState());

        REQUIRE(RunAsync(io, remote.PlayPause()).IsOk());
        const auto commands = device.ReceivedOfType(pb::ProtocolMessage::SEND_COMMAND_MESSAGE);
        REQUIRE(commands.size() == 1);
        REQUIRE(commands[0].sendcommandmessage().command() == pb::Pause);
    }
    session->Stop();
}

TEST_CASE("Session Workflow - Power", "[integration][session][power]") {
    boost::asio::io_context io;
    FakeDeviceOptions options;
    options.logical_device_count = 0;
    FakeDevice device(io, options);
    auto session = VerifiedSession(io, device);
    REQUIRE(RunAsync(io, session->Start()).IsOk());
    MrpPower power(session);
    REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::Off);

    SECTION("Turn on waits for the device to report") {
        REQUIRE(RunAsync(io, power.TurnOn(true)).IsOk());
        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::On);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::WAKE_DEVICE_MESSAGE) == 1);
    }
    SECTION("Turn on times out when the device stays silent") {
        device.Options().report_power_on_wake = false;
        auto result = RunAsync(io, power.TurnOn(true));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RemoteFailureType::Timeout));
        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::Off);
    }
    SECTION("Turn off holds home then selects") {
        device.PushLogicalDeviceCount(1);
        RunFor(io, std::chrono::milliseconds{50});
        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::On);

        REQUIRE(RunAsync(io, power.TurnOff()).IsOk());
        REQUIRE(device.CountReceived(pb::ProtocolMessage::SEND_HID_EVENT_MESSAGE) == 4);
        device.PushLogicalDeviceCount(0);
        RunFor(io, std::chrono::milliseconds{50});
        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::Off);
    }
    session->Stop();
}

TEST_CASE("Session Workflow - Connection loss", "[integration][session]") {
    boost::asio::io_context io;
    FakeDevice device(io);
    LifecycleRecorder recorder;

    SECTION("Unanswered heartbeats drop the connection") {
        device.Options().answer_heartbeats = false;
        auto config = SessionConfig::ForTesting();
        config.heartbeat_interval = std::chrono::milliseconds{50};
        config.request_timeout = std::chrono::milliseconds{200};
        auto session = VerifiedSession(io, device, config);
        session->SetDeviceListener(&recorder);
        REQUIRE(RunAsync(io, session->Start()).IsOk());

        RunFor(io, std::chrono::milliseconds{1000});
        REQUIRE(recorder.lost.size() == 1);
        REQUIRE(recorder.lost[0].Is(RemoteFailureType::ConnectionLost));
        REQUIRE(recorder.closed == 0);
        REQUIRE(session->State() == SessionState::Stopped);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE) == 2);
        session->ClearDeviceListener();
    }
    SECTION("Answered heartbeats keep the connection") {
        auto config = SessionConfig::ForTesting();
        config.heartbeat_interval = std::chrono::milliseconds{50};
        auto session = VerifiedSession(io, device, config);
        session->SetDeviceListener(&recorder);
        REQUIRE(RunAsync(io, session->Start()).IsOk());

        RunFor(io, std::chrono::milliseconds{300});
        REQUIRE(recorder.lost.empty());
        REQUIRE(session->State() == SessionState::Ready);
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE) >= 2);
        session->ClearDeviceListener();
        session->Stop();
    }
    SECTION("Device hangs up") {
        auto session = VerifiedSession(io, device);
        session->SetDeviceListener(&recorder);
        REQUIRE(RunAsync(io, session->Start()).IsOk());

        device.DropClient();
        RunFor(io, std::chrono::milliseconds{100});
        REQUIRE(recorder.lost.size() == 1);
        REQUIRE(session->State() == SessionState::Stopped);
        session->ClearDeviceListener();
    }
    SECTION("Abandoned session releases the connection") {
        auto config = SessionConfig::ForTesting();
        config.heartbeat_interval = std::chrono::milliseconds{50};
        auto session = VerifiedSession(io, device, config);
        REQUIRE(RunAsync(io, session->Start()).IsOk());
        RunFor(io, std::chrono::milliseconds{120});
        REQUIRE(device.CountReceived(pb::ProtocolMessage::GENERIC_MESSAGE) >= 1);

        const std::weak_ptr<ProtocolSession> weak = session;
        session.reset();
        RunFor(io, std::chrono::milliseconds{100});
        REQUIRE(weak.expired());
        REQUIRE_FALSE(device.HasClient());
    }
}
