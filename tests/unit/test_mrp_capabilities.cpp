#include <catch2/catch_test_macros.hpp>
#include "tvremote/mrp/capabilities.hpp"
#include "tvremote/mrp/messages.hpp"
#include "helpers/async_runner.hpp"
#include <boost/asio/io_context.hpp>
using namespace tvremote;
using namespace tvremote::mrp;
using namespace tvremote::test_helpers;
using interfaces::FeatureName;
using interfaces::FeatureState;
using interfaces::PowerState;
namespace pb = tvremote::proto::mrp;

namespace {
    struct MrpFixture {
        boost::asio::io_context io;
        std::shared_ptr<ProtocolSession> session =
            ProtocolSession::Create(io, "127.0.0.1", 1, configuration::SessionConfig::ForTesting());
        std::shared_ptr<PlayerStateManager> player_state = std::make_shared<PlayerStateManager>(session);

        void PushCommands(std::initializer_list<std::pair<pb::Command, bool>> commands) {
            auto message = messages::Create(pb::ProtocolMessage::SET_STATE_MESSAGE);
            auto* supported = message.mutable_setstatemessage()->mutable_supportedcommands();
            for (const auto& [command, enabled] : commands) {
                auto* info = supported->add_supportedcommands();
                info->set_command(command);
                info->set_enabled(enabled);
            }
            session->OnMessage(message);
        }

        void PushNowPlaying(const pb::NowPlayingInfo& info, const pb::PlaybackState playback = pb::Playing) {
            auto message = messages::Create(pb::ProtocolMessage::SET_STATE_MESSAGE);
            message.mutable_setstatemessage()->set_playbackstate(playback);
            *message.mutable_setstatemessage()->mutable_nowplayinginfo() = info;
            session->OnMessage(message);
        }

        void PushLogicalDevices(const uint32_t count) {
            auto message = messages::Create(pb::ProtocolMessage::DEVICE_INFO_UPDATE_MESSAGE);
            message.mutable_deviceinfomessage()->set_logicaldevicecount(count);
            session->OnMessage(message);
        }
    };

    FeatureState StateOf(const MrpFeatures& features, const FeatureName name) {
        auto info = features.GetFeature(name);
        REQUIRE(info.IsOk());
        return info.Unwrap().state;
    }

    struct PowerRecorder final : interfaces::PowerListener {
        std::vector<std::pair<PowerState, PowerState>> updates;
        void OnPowerStateUpdate(PowerState old_state, PowerState new_state) override {
            updates.emplace_back(old_state, new_state);
        }
    };

    struct PushRecorder final : interfaces::PushListener {
        std::vector<interfaces::PlayingInfo> updates;
        void OnPlaystatusUpdate(interfaces::PushUpdater&, const interfaces::PlayingInfo& playing) override {
            updates.push_back(playing);
        }
        void OnPlaystatusError(interfaces::PushUpdater&, const RemoteFailure&) override {}
    };
}

TEST_CASE("MrpFeatures - Availability", "[mrp][features]") {
    MrpFixture fixture;
    const MrpFeatures features(fixture.player_state);

    SECTION("Navigation and power are always available") {
        for (const auto name : {FeatureName::Up, FeatureName::Select, FeatureName::Home, FeatureName::TurnOn,
                                FeatureName::TurnOff, FeatureName::PowerState, FeatureName::VolumeUp}) {
            REQUIRE(StateOf(features, name) == FeatureState::Available);
        }
    }
    SECTION("Commands follow the supported command list") {
        REQUIRE(StateOf(features, FeatureName::Next) == FeatureState::Unavailable);
        fixture.PushCommands({{pb::NextTrack, true}, {pb::Stop, false}, {pb::ChangeShuffleMode, true}});
        REQUIRE(StateOf(features, FeatureName::Next) == FeatureState::Available);
        REQUIRE(StateOf(features, FeatureName::Stop) == FeatureState::Unavailable);
        REQUIRE(StateOf(features, FeatureName::SetShuffle) == FeatureState::Available);
        REQUIRE(StateOf(features, FeatureName::Shuffle) == FeatureState::Available);
        REQUIRE(StateOf(features, FeatureName::Previous) == FeatureState::Unavailable);
    }
    SECTION("Play-pause from toggle") {
        fixture.PushCommands({{pb::TogglePlayPause, true}});
        REQUIRE(StateOf(features, FeatureName::PlayPause) == FeatureState::Available);
    }
    SECTION("Play-pause from play and pause together") {
        fixture.PushCommands({{pb::Play, true}});
        REQUIRE(StateOf(features, FeatureName::PlayPause) == FeatureState::Unavailable);
        fixture.PushCommands({{pb::Play, true}, {pb::Pause, true}});
        REQUIRE(StateOf(features, FeatureName::PlayPause) == FeatureState::Available);
    }
    SECTION("Metadata fields follow now-playing") {
        REQUIRE(StateOf(features, FeatureName::Title) == FeatureState::Unavailable);
        pb::NowPlayingInfo info;
        info.set_title("Track");
        info.set_duration(100.0);
        fixture.PushNowPlaying(info);
        REQUIRE(StateOf(features, FeatureName::Title) == FeatureState::Available);
        REQUIRE(StateOf(features, FeatureName::TotalTime) == FeatureState::Available);
        REQUIRE(StateOf(features, FeatureName::Artist) == FeatureState::Unavailable);
        REQUIRE(StateOf(features, FeatureName::Position) == FeatureState::Unavailable);
    }
    SECTION("Unknown to this backend") {
        REQUIRE(StateOf(features, FeatureName::Volume) == FeatureState::Unsupported);
        REQUIRE(StateOf(features, FeatureName::PushUpdates) == FeatureState::Unsupported);
    }
}

TEST_CASE("MrpPower - Logical device count", "[mrp][power]") {
    SECTION("Derived from device info") {
        auto message = messages::Create(pb::ProtocolMessage::DEVICE_INFO_MESSAGE);
        REQUIRE(MrpPower::FromDeviceInfo(message) == PowerState::Unknown);
        message.mutable_deviceinfomessage()->set_uniqueidentifier("id");
        REQUIRE(MrpPower::FromDeviceInfo(message) == PowerState::Unknown);
        message.mutable_deviceinfomessage()->set_logicaldevicecount(0);
        REQUIRE(MrpPower::FromDeviceInfo(message) == PowerState::Off);
        message.mutable_deviceinfomessage()->set_logicaldevicecount(2);
        REQUIRE(MrpPower::FromDeviceInfo(message) == PowerState::On);
    }
    SECTION("Updates notify the listener once per change") {
        MrpFixture fixture;
        MrpPower power(fixture.session);
        PowerRecorder recorder;
        power.SetListener(&recorder);
        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::Unknown);

        fixture.PushLogicalDevices(1);
        fixture.PushLogicalDevices(1);
        fixture.PushLogicalDevices(0);

        REQUIRE(power.CurrentPowerState().Unwrap() == PowerState::Off);
        REQUIRE(recorder.updates.size() == 2);
        REQUIRE(recorder.updates[0] == std::pair{PowerState::Unknown, PowerState::On});
        REQUIRE(recorder.updates[1] == std::pair{PowerState::On, PowerState::Off});
        power.ClearListener();
    }
    SECTION("Turn on without a connection") {
        MrpFixture fixture;
        MrpPower power(fixture.session);
        auto result = RunAsync(fixture.io, power.TurnOn());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RemoteFailureType::InvalidState));
    }
}

TEST_CASE("MrpPushUpdater - Player state forwarding", "[mrp][push]") {
    MrpFixture fixture;
    auto updater = std::make_shared<MrpPushUpdater>(fixture.player_state);

    SECTION("Start requires a listener") {
        auto started = updater->Start();
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().Is(RemoteFailureType::InvalidState));
        REQUIRE_FALSE(updater->Active().Unwrap());
    }
    SECTION("Start posts the current state and later changes") {
        PushRecorder recorder;
        updater->SetListener(&recorder);
        REQUIRE(updater->Start().IsOk());
        REQUIRE(updater->Active().Unwrap());
        RunFor(fixture.io, std::chrono::milliseconds{30});
        REQUIRE(recorder.updates.size() == 1);
        REQUIRE(recorder.updates[0].device_state == interfaces::DeviceState::Idle);

        pb::NowPlayingInfo info;
        info.set_title("Track");
        fixture.PushNowPlaying(info);
        RunFor(fixture.io, std::chrono::milliseconds{30});
        REQUIRE(recorder.updates.size() == 2);
        REQUIRE(recorder.updates[1].title == "Track");

        SECTION("Identical updates are dropped") {
            fixture.PushNowPlaying(info);
            RunFor(fixture.io, std::chrono::milliseconds{30});
            REQUIRE(recorder.updates.size() == 2);
        }
        SECTION("Stop detaches from the player state") {
            REQUIRE(updater->Stop().IsOk());
            REQUIRE_FALSE(updater->Active().Unwrap());
            REQUIRE(fixture.player_state->Listener() == nullptr);
            info.set_title("Other");
            fixture.PushNowPlaying(info);
            RunFor(fixture.io, std::chrono::milliseconds{30});
            REQUIRE(recorder.updates.size() == 2);
        }
        updater->ClearListener();
    }
}

TEST_CASE("MrpRemoteControl - Requires a running session", "[mrp][remote]") {
    MrpFixture fixture;
    MrpRemoteControl remote(fixture.session, fixture.player_state);

    REQUIRE(remote.Overrides("play"));
    REQUIRE(remote.Overrides("set_repeat"));

    auto played = RunAsync(fixture.io, remote.Play());
    REQUIRE(played.IsErr());
    auto pressed = RunAsync(fixture.io, remote.Up());
    REQUIRE(pressed.IsErr());
}

TEST_CASE("MrpAudio - Only volume keys", "[mrp][audio]") {
    MrpFixture fixture;
    MrpAudio audio(fixture.session);

    REQUIRE(audio.Overrides("volume_up"));
    REQUIRE(audio.Overrides("volume_down"));
    REQUIRE_FALSE(audio.Overrides("set_volume"));
    auto result = RunAsync(fixture.io, audio.SetVolume(10.0f));
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().Is(RemoteFailureType::NotSupported));
}
