#include "tvremote/mrp/capabilities.hpp"
#include "tvremote/debug/log.hpp"
#include "tvremote/mrp/messages.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <format>

namespace tvremote::mrp {

namespace pb = proto::mrp;
using interfaces::FeatureInfo;
using interfaces::FeatureName;
using interfaces::FeatureState;
using interfaces::InputAction;
using interfaces::PowerState;

namespace {

    AsyncResult<Unit> SendKeyEvents(ProtocolSession& session, const HidKey key, const bool hold) {
        TVREMOTE_CO_TRY(session.Send(messages::SendHidEvent(key.page, key.usage, true)));
        if (hold) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(kKeyHoldDuration);
            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        TVREMOTE_CO_TRY(session.Send(messages::SendHidEvent(key.page, key.usage, false)));
        co_return RemoteResult<Unit>::Ok(unit);
    }

    pb::ShuffleMode ToShuffleMode(const interfaces::ShuffleState state) {
        switch (state) {
            case interfaces::ShuffleState::Off: return pb::ShuffleOff;
            case interfaces::ShuffleState::Albums: return pb::ShuffleAlbums;
            case interfaces::ShuffleState::Songs: return pb::ShuffleSongs;
        }
        return pb::ShuffleOff;
    }

    pb::RepeatMode ToRepeatMode(const interfaces::RepeatState state) {
        switch (state) {
            case interfaces::RepeatState::Off: return pb::RepeatOff;
            case interfaces::RepeatState::Track: return pb::RepeatOne;
            case interfaces::RepeatState::All: return pb::RepeatAll;
        }
        return pb::RepeatOff;
    }

    pb::CommandOptions SkipOptions(const float seconds) {
        pb::CommandOptions options;
        options.set_skipinterval(seconds > 0.0f ? seconds : kDefaultSkipInterval);
        return options;
    }

    struct CommandFeature {
        FeatureName feature;
        pb::Command command;
    };

    constexpr std::array kCommandFeatures = {
        CommandFeature{FeatureName::Next, pb::NextTrack},
        CommandFeature{FeatureName::Pause, pb::Pause},
        CommandFeature{FeatureName::Play, pb::Play},
        CommandFeature{FeatureName::Previous, pb::PreviousTrack},
        CommandFeature{FeatureName::Stop, pb::Stop},
        CommandFeature{FeatureName::SetPosition, pb::SeekToPlaybackPosition},
        CommandFeature{FeatureName::SetRepeat, pb::ChangeRepeatMode},
        CommandFeature{FeatureName::SetShuffle, pb::ChangeShuffleMode},
        CommandFeature{FeatureName::Repeat, pb::ChangeRepeatMode},
        CommandFeature{FeatureName::Shuffle, pb::ChangeShuffleMode},
        CommandFeature{FeatureName::SkipForward, pb::SkipForward},
        CommandFeature{FeatureName::SkipBackward, pb::SkipBackward},
    };

    constexpr std::array kAlwaysAvailable = {
        FeatureName::Up, FeatureName::Down, FeatureName::Left, FeatureName::Right,
        FeatureName::Select, FeatureName::Menu, FeatureName::Home, FeatureName::HomeHold,
        FeatureName::TopMenu, FeatureName::Suspend, FeatureName::WakeUp,
        FeatureName::TurnOn, FeatureName::TurnOff, FeatureName::PowerState,
        FeatureName::VolumeUp, FeatureName::VolumeDown,
    };

    FeatureInfo MakeFeature(const FeatureState state) {
        FeatureInfo info;
        info.state = state;
        return info;
    }

}

    AsyncResult<Unit> PressKey(ProtocolSession& session, const HidKey key, const InputAction action, const bool flush) {
        switch (action) {
            case InputAction::SingleTap:
                TVREMOTE_CO_TRY(co_await SendKeyEvents(session, key, false));
                break;
            case InputAction::DoubleTap:
                TVREMOTE_CO_TRY(co_await SendKeyEvents(session, key, false));
                TVREMOTE_CO_TRY(co_await SendKeyEvents(session, key, false));
                break;
            case InputAction::Hold:
                TVREMOTE_CO_TRY(co_await SendKeyEvents(session, key, true));
                break;
        }
        if (flush) {
            TVREMOTE_CO_TRY(co_await session.SendAndReceive(messages::Generic()));
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<Unit> SendCommand(ProtocolSession& session, const pb::Command command,
                                  std::optional<pb::CommandOptions> options) {
        auto response = co_await session.SendAndReceive(messages::Command(command, std::move(options)));
        TVREMOTE_CO_TRY(response);
        const auto& reply = response.Unwrap();
        if (reply.has_sendcommandresultmessage()) {
            const auto error = reply.sendcommandresultmessage().senderror();
            if (error != pb::SendCommandResultMessage::NoError) {
                co_return RemoteResult<Unit>::Err(RemoteFailure::Command(std::format(
                    "Command {} failed: {}",
                    pb::Command_Name(command),
                    pb::SendCommandResultMessage::SendError_Name(error))));
            }
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    MrpRemoteControl::MrpRemoteControl(std::shared_ptr<ProtocolSession> session,
                                       std::shared_ptr<PlayerStateManager> player_state)
        : session_(std::move(session))
        , player_state_(std::move(player_state)) {
        DeclareAllOverrides();
    }

    AsyncResult<Unit> MrpRemoteControl::Up(const InputAction action) {
        return PressKey(*session_, keys::kUp, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Down(const InputAction action) {
        return PressKey(*session_, keys::kDown, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Left(const InputAction action) {
        return PressKey(*session_, keys::kLeft, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Right(const InputAction action) {
        return PressKey(*session_, keys::kRight, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Play() {
        return SendCommand(*session_, pb::Play);
    }

    AsyncResult<Unit> MrpRemoteControl::Pause() {
        return SendCommand(*session_, pb::Pause);
    }

    AsyncResult<Unit> MrpRemoteControl::PlayPause() {
        const auto& state = player_state_->Playing();
        if (state.IsCommandEnabled(pb::TogglePlayPause)) {
            return SendCommand(*session_, pb::TogglePlayPause);
        }
        // Some apps only advertise discrete play and pause.
        if (state.EffectiveState() == interfaces::DeviceState::Playing) {
            return SendCommand(*session_, pb::Pause);
        }
        return SendCommand(*session_, pb::Play);
    }

    AsyncResult<Unit> MrpRemoteControl::Stop() {
        return SendCommand(*session_, pb::Stop);
    }

    AsyncResult<Unit> MrpRemoteControl::Next() {
        return SendCommand(*session_, pb::NextTrack);
    }

    AsyncResult<Unit> MrpRemoteControl::Previous() {
        return SendCommand(*session_, pb::PreviousTrack);
    }

    AsyncResult<Unit> MrpRemoteControl::Select(const InputAction action) {
        return PressKey(*session_, keys::kSelect, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Menu(const InputAction action) {
        return PressKey(*session_, keys::kMenu, action);
    }

    AsyncResult<Unit> MrpRemoteControl::Home(const InputAction action) {
        return PressKey(*session_, keys::kHome, action);
    }

    AsyncResult<Unit> MrpRemoteControl::TopMenu() {
        return PressKey(*session_, keys::kTopMenu);
    }

    AsyncResult<Unit> MrpRemoteControl::Suspend() {
        return PressKey(*session_, keys::kSuspend);
    }

    AsyncResult<Unit> MrpRemoteControl::WakeUp() {
        return PressKey(*session_, keys::kWakeUp);
    }

    AsyncResult<Unit> MrpRemoteControl::VolumeUp() {
        return PressKey(*session_, keys::kVolumeUp, InputAction::SingleTap, false);
    }

    AsyncResult<Unit> MrpRemoteControl::VolumeDown() {
        return PressKey(*session_, keys::kVolumeDown, InputAction::SingleTap, false);
    }

    AsyncResult<Unit> MrpRemoteControl::SkipForward(const float seconds) {
        return SendCommand(*session_, pb::SkipForward, SkipOptions(seconds));
    }

    AsyncResult<Unit> MrpRemoteControl::SkipBackward(const float seconds) {
        return SendCommand(*session_, pb::SkipBackward, SkipOptions(seconds));
    }

    AsyncResult<Unit> MrpRemoteControl::SetPosition(const uint32_t seconds) {
        pb::CommandOptions options;
        options.set_playbackposition(static_cast<double>(seconds));
        return SendCommand(*session_, pb::SeekToPlaybackPosition, options);
    }

    AsyncResult<Unit> MrpRemoteControl::SetShuffle(const interfaces::ShuffleState state) {
        pb::CommandOptions options;
        options.set_shufflemode(ToShuffleMode(state));
        return SendCommand(*session_, pb::ChangeShuffleMode, options);
    }

    AsyncResult<Unit> MrpRemoteControl::SetRepeat(const interfaces::RepeatState state) {
        pb::CommandOptions options;
        options.set_repeatmode(ToRepeatMode(state));
        return SendCommand(*session_, pb::ChangeRepeatMode, options);
    }

    MrpMetadata::MrpMetadata(std::string device_id, std::shared_ptr<PlayerStateManager> player_state)
        : device_id_(std::move(device_id))
        , player_state_(std::move(player_state)) {
        DeclareAllOverrides();
    }

    RemoteResult<std::string> MrpMetadata::DeviceId() const {
        return RemoteResult<std::string>::Ok(device_id_);
    }

    AsyncResult<interfaces::PlayingInfo> MrpMetadata::Playing() {
        co_return RemoteResult<interfaces::PlayingInfo>::Ok(BuildPlayingInfo(player_state_->Playing()));
    }

    MrpPower::MrpPower(std::shared_ptr<ProtocolSession> session)
        : session_(std::move(session)) {
        DeclareAllOverrides();
        if (session_->DeviceInfo()) {
            state_ = FromDeviceInfo(*session_->DeviceInfo());
        }
        auto handler = [this](const pb::ProtocolMessage& message) { HandleDeviceInfo(message); };
        info_token_ = session_->ListenTo(pb::ProtocolMessage::DEVICE_INFO_MESSAGE, handler);
        update_token_ = session_->ListenTo(pb::ProtocolMessage::DEVICE_INFO_UPDATE_MESSAGE, handler);
    }

    MrpPower::~MrpPower() {
        session_->StopListening(info_token_);
        session_->StopListening(update_token_);
    }

    PowerState MrpPower::FromDeviceInfo(const pb::ProtocolMessage& message) {
        if (!message.has_deviceinfomessage() || !message.deviceinfomessage().has_logicaldevicecount()) {
            return PowerState::Unknown;
        }
        return message.deviceinfomessage().logicaldevicecount() >= 1 ? PowerState::On : PowerState::Off;
    }

    RemoteResult<PowerState> MrpPower::CurrentPowerState() const {
        return RemoteResult<PowerState>::Ok(state_);
    }

    AsyncResult<Unit> MrpPower::TurnOn(const bool await_new_state) {
        TVREMOTE_CO_TRY(co_await session_->SendAndReceive(messages::WakeDevice()));
        if (await_new_state) {
            co_return co_await AwaitState(PowerState::On);
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<Unit> MrpPower::TurnOff(const bool await_new_state) {
        TVREMOTE_CO_TRY(co_await PressKey(*session_, keys::kHome, InputAction::Hold));
        TVREMOTE_CO_TRY(co_await PressKey(*session_, keys::kSelect));
        if (await_new_state) {
            co_return co_await AwaitState(PowerState::Off);
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<Unit> MrpPower::AwaitState(const PowerState target) {
        if (state_ == target) {
            co_return RemoteResult<Unit>::Ok(unit);
        }
        auto& event = waiters_[target];
        if (!event) {
            event = std::make_shared<AsyncEvent>();
        }
        const auto waiter = event;
        if (!co_await waiter->Wait(session_->Config().request_timeout)) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::Timeout(std::format(
                "Device did not report power state {}", interfaces::ToString(target))));
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    void MrpPower::HandleDeviceInfo(const pb::ProtocolMessage& message) {
        const PowerState new_state = FromDeviceInfo(message);
        if (new_state == PowerState::Unknown || new_state == state_) {
            return;
        }
        const PowerState old_state = state_;
        state_ = new_state;
        TVREMOTE_LOG_MSG("POWER", std::format("Power state changed from {} to {}",
            interfaces::ToString(old_state), interfaces::ToString(new_state)));

        if (const auto it = waiters_.find(new_state); it != waiters_.end()) {
            const auto event = it->second;
            waiters_.erase(it);
            event->Set();
        }
        Notify([&](interfaces::PowerListener& listener) {
            listener.OnPowerStateUpdate(old_state, new_state);
        });
    }

    MrpPushUpdater::MrpPushUpdater(std::shared_ptr<PlayerStateManager> player_state)
        : player_state_(std::move(player_state)) {
        DeclareAllOverrides();
    }

    MrpPushUpdater::~MrpPushUpdater() {
        if (IsActive()) {
            player_state_->ClearListener();
        }
    }

    bool MrpPushUpdater::IsActive() const noexcept {
        return player_state_->Listener() == static_cast<const PlayerStateListener*>(this);
    }

    RemoteResult<Unit> MrpPushUpdater::Start(std::chrono::seconds) {
        if (!HasListener()) {
            return RemoteResult<Unit>::Err(RemoteFailure::InvalidState("No push listener has been set"));
        }
        player_state_->SetListener(this);
        last_update_.reset();
        PostUpdate(BuildPlayingInfo(player_state_->Playing()));
        return RemoteResult<Unit>::Ok(unit);
    }

    RemoteResult<Unit> MrpPushUpdater::Stop() {
        if (IsActive()) {
            player_state_->ClearListener();
        }
        return RemoteResult<Unit>::Ok(unit);
    }

    RemoteResult<bool> MrpPushUpdater::Active() const {
        return RemoteResult<bool>::Ok(IsActive());
    }

    void MrpPushUpdater::OnStateUpdated(const PlayerState& state) {
        PostUpdate(BuildPlayingInfo(state));
    }

    void MrpPushUpdater::PostUpdate(interfaces::PlayingInfo playing) {
        boost::asio::post(player_state_->Session().IoContext(),
            [weak = weak_from_this(), playing = std::move(playing)]() {
                const auto self = weak.lock();
                if (!self || !self->IsActive()) {
                    return;
                }
                if (self->last_update_ && *self->last_update_ == playing) {
                    return;
                }
                self->last_update_ = playing;
                self->Notify([&](interfaces::PushListener& listener) {
                    listener.OnPlaystatusUpdate(*self, playing);
                });
            });
    }

    MrpAudio::MrpAudio(std::shared_ptr<ProtocolSession> session)
        : session_(std::move(session)) {
        DeclareOverrides({"volume_up", "volume_down"});
    }

    AsyncResult<Unit> MrpAudio::VolumeUp() {
        return PressKey(*session_, keys::kVolumeUp, InputAction::SingleTap, false);
    }

    AsyncResult<Unit> MrpAudio::VolumeDown() {
        return PressKey(*session_, keys::kVolumeDown, InputAction::SingleTap, false);
    }

    MrpFeatures::MrpFeatures(std::shared_ptr<PlayerStateManager> player_state)
        : player_state_(std::move(player_state)) {
        DeclareAllOverrides();
    }

    RemoteResult<FeatureInfo> MrpFeatures::GetFeature(const FeatureName name) const {
        using FeatureResult = RemoteResult<FeatureInfo>;
        for (const auto available : kAlwaysAvailable) {
            if (available == name) {
                return FeatureResult::Ok(MakeFeature(FeatureState::Available));
            }
        }

        const PlayerState& state = player_state_->Playing();
        if (name == FeatureName::PlayPause) {
            const bool toggle = state.IsCommandEnabled(pb::TogglePlayPause)
                || (state.IsCommandEnabled(pb::Play) && state.IsCommandEnabled(pb::Pause));
            return FeatureResult::Ok(MakeFeature(toggle ? FeatureState::Available : FeatureState::Unavailable));
        }

        for (const auto& [feature, command] : kCommandFeatures) {
            if (feature == name) {
                return FeatureResult::Ok(MakeFeature(
                    state.IsCommandEnabled(command) ? FeatureState::Available : FeatureState::Unavailable));
            }
        }

        const auto field_state = [](const bool present) {
            return MakeFeature(present ? FeatureState::Available : FeatureState::Unavailable);
        };
        const auto& info = state.now_playing;
        switch (name) {
            case FeatureName::Title:
                return FeatureResult::Ok(field_state(info && info->has_title()));
            case FeatureName::Artist:
                return FeatureResult::Ok(field_state(info && info->has_artist()));
            case FeatureName::Album:
                return FeatureResult::Ok(field_state(info && info->has_album()));
            case FeatureName::Genre:
                return FeatureResult::Ok(field_state(info && info->has_genre()));
            case FeatureName::TotalTime:
                return FeatureResult::Ok(field_state(info && info->has_duration()));
            case FeatureName::Position:
                return FeatureResult::Ok(field_state(info && info->has_elapsedtime()));
            default:
                break;
        }
        return FeatureResult::Ok(MakeFeature(FeatureState::Unsupported));
    }

}
