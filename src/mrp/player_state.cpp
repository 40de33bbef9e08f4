#include "tvremote/mrp/player_state.hpp"
#include "tvremote/debug/log.hpp"
#include <algorithm>
#include <cmath>

namespace tvremote::mrp {

namespace pb = proto::mrp;

namespace {

    bool IsClose(const double a, const double b) {
        return std::fabs(a - b) < 1e-9;
    }

    std::optional<std::string> OptionalText(const bool present, const std::string& value) {
        if (!present || value.empty()) {
            return std::nullopt;
        }
        return value;
    }

}

    const pb::CommandInfo* PlayerState::FindCommand(const pb::Command command) const {
        for (const auto& info : supported_commands) {
            if (info.command() == command) {
                return &info;
            }
        }
        return nullptr;
    }

    bool PlayerState::IsCommandEnabled(const pb::Command command) const {
        const auto* info = FindCommand(command);
        return info != nullptr && info->enabled();
    }

    interfaces::DeviceState PlayerState::EffectiveState() const {
        using interfaces::DeviceState;
        if (!playback_state) {
            return DeviceState::Idle;
        }
        switch (*playback_state) {
            case pb::Paused:
                return now_playing ? DeviceState::Paused : DeviceState::Idle;
            case pb::Playing:
                if (now_playing && now_playing->has_playbackrate()) {
                    const double rate = now_playing->playbackrate();
                    if (IsClose(rate, 0.0) || IsClose(rate, 1.0)) {
                        return DeviceState::Playing;
                    }
                    return DeviceState::Seeking;
                }
                return DeviceState::Playing;
            case pb::Stopped:
                return DeviceState::Stopped;
            case pb::Seeking:
                return DeviceState::Seeking;
            case pb::Interrupted:
                return DeviceState::Loading;
            case pb::PlaybackUnknown:
                return DeviceState::Idle;
        }
        return DeviceState::Idle;
    }

    interfaces::PlayingInfo BuildPlayingInfo(const PlayerState& state) {
        interfaces::PlayingInfo playing;
        playing.device_state = state.EffectiveState();
        if (!state.now_playing) {
            return playing;
        }
        const auto& info = *state.now_playing;
        playing.title = OptionalText(info.has_title(), info.title());
        playing.artist = OptionalText(info.has_artist(), info.artist());
        playing.album = OptionalText(info.has_album(), info.album());
        playing.genre = OptionalText(info.has_genre(), info.genre());
        if (info.has_duration() && info.duration() > 0) {
            playing.total_time = static_cast<uint32_t>(info.duration());
        }
        if (info.has_elapsedtime()) {
            playing.position = static_cast<uint32_t>(std::max(0.0, info.elapsedtime()));
        }
        if (info.has_shufflemode()) {
            switch (info.shufflemode()) {
                case pb::ShuffleAlbums: playing.shuffle = interfaces::ShuffleState::Albums; break;
                case pb::ShuffleSongs: playing.shuffle = interfaces::ShuffleState::Songs; break;
                default: playing.shuffle = interfaces::ShuffleState::Off; break;
            }
        }
        if (info.has_repeatmode()) {
            switch (info.repeatmode()) {
                case pb::RepeatOne: playing.repeat = interfaces::RepeatState::Track; break;
                case pb::RepeatAll: playing.repeat = interfaces::RepeatState::All; break;
                default: playing.repeat = interfaces::RepeatState::Off; break;
            }
        }
        return playing;
    }

    PlayerStateManager::PlayerStateManager(std::shared_ptr<ProtocolSession> session)
        : session_(std::move(session)) {
        token_ = session_->ListenTo(pb::ProtocolMessage::SET_STATE_MESSAGE,
            [this](const pb::ProtocolMessage& message) { HandleSetState(message); });
    }

    PlayerStateManager::~PlayerStateManager() {
        session_->StopListening(token_);
    }

    boost::asio::awaitable<bool> PlayerStateManager::WaitForInitialState(const std::chrono::milliseconds timeout) {
        auto event = initial_state_;
        co_return co_await event->Wait(timeout);
    }

    void PlayerStateManager::HandleSetState(const pb::ProtocolMessage& message) {
        if (!message.has_setstatemessage()) {
            return;
        }
        const auto& update = message.setstatemessage();
        if (update.has_playbackstate()) {
            state_.playback_state = update.playbackstate();
        }
        if (update.has_nowplayinginfo()) {
            state_.now_playing = update.nowplayinginfo();
        }
        if (update.has_supportedcommands()) {
            const auto& commands = update.supportedcommands().supportedcommands();
            state_.supported_commands.assign(commands.begin(), commands.end());
        }
        if (update.has_displayname()) {
            state_.display_name = update.displayname();
        }
        if (update.has_playerpath() && update.playerpath().has_client()) {
            state_.bundle_identifier = update.playerpath().client().bundleidentifier();
        }
        TVREMOTE_LOG_MSG("PLAYER", "State updated: " + std::string(interfaces::ToString(state_.EffectiveState())));

        initial_state_->Set();
        listener_.Notify([this](PlayerStateListener& listener) { listener.OnStateUpdated(state_); });
    }

}
