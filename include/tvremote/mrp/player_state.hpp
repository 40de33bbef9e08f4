#pragma once
#include "tvremote/core/async_event.hpp"
#include "tvremote/interfaces/listeners.hpp"
#include "tvremote/interfaces/playing.hpp"
#include "tvremote/mrp/protocol_session.hpp"
#include "mrp/protocol_message.pb.h"
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tvremote::mrp {

/// Latest state pushed by the device for the active player.
struct PlayerState {
    std::optional<proto::mrp::PlaybackState> playback_state;
    std::optional<proto::mrp::NowPlayingInfo> now_playing;
    std::vector<proto::mrp::CommandInfo> supported_commands;
    std::string display_name;
    std::string bundle_identifier;

    [[nodiscard]] const proto::mrp::CommandInfo* FindCommand(proto::mrp::Command command) const;
    [[nodiscard]] bool IsCommandEnabled(proto::mrp::Command command) const;

    /// Playback state adjusted for playback rate and empty queues.
    [[nodiscard]] interfaces::DeviceState EffectiveState() const;
};

[[nodiscard]] interfaces::PlayingInfo BuildPlayingInfo(const PlayerState& state);

class PlayerStateListener {
public:
    virtual ~PlayerStateListener() = default;
    virtual void OnStateUpdated(const PlayerState& state) = 0;
};

/**
 * @brief Tracks SET_STATE pushes from the device
 *
 * Holds a non-owning listener handle; the listener's owner calls
 * ClearListener() before it goes away.
 */
class PlayerStateManager {
public:
    explicit PlayerStateManager(std::shared_ptr<ProtocolSession> session);
    ~PlayerStateManager();

    [[nodiscard]] const PlayerState& Playing() const noexcept { return state_; }
    [[nodiscard]] bool HasReceivedState() const noexcept { return initial_state_->IsSet(); }

    void SetListener(PlayerStateListener* listener) noexcept { listener_.SetListener(listener); }
    void ClearListener() noexcept { listener_.ClearListener(); }
    [[nodiscard]] PlayerStateListener* Listener() const noexcept { return listener_.GetListener(); }

    /**
     * @brief Wait, best effort, for the first state push
     * @return false when @p timeout passed first; that is not an error
     */
    boost::asio::awaitable<bool> WaitForInitialState(std::chrono::milliseconds timeout);

    [[nodiscard]] ProtocolSession& Session() const noexcept { return *session_; }

    PlayerStateManager(const PlayerStateManager&) = delete;
    PlayerStateManager& operator=(const PlayerStateManager&) = delete;

private:
    void HandleSetState(const proto::mrp::ProtocolMessage& message);

    std::shared_ptr<ProtocolSession> session_;
    CorrelationEngine::ListenerToken token_;
    PlayerState state_;
    std::shared_ptr<AsyncEvent> initial_state_ = std::make_shared<AsyncEvent>();
    interfaces::ListenerSlot<PlayerStateListener> listener_;
};

}  // namespace tvremote::mrp
