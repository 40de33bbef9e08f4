#pragma once
#include "tvremote/interfaces/capabilities.hpp"
#include "tvremote/mrp/player_state.hpp"
#include "tvremote/mrp/protocol_session.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tvremote::mrp {

/// HID usage page and usage of one remote key.
struct HidKey {
    uint16_t page;
    uint16_t usage;
};

namespace keys {
inline constexpr HidKey kUp{1, 0x8C};
inline constexpr HidKey kDown{1, 0x8D};
inline constexpr HidKey kLeft{1, 0x8B};
inline constexpr HidKey kRight{1, 0x8A};
inline constexpr HidKey kSelect{1, 0x89};
inline constexpr HidKey kMenu{1, 0x86};
inline constexpr HidKey kSuspend{1, 0x82};
inline constexpr HidKey kWakeUp{1, 0x83};
inline constexpr HidKey kTopMenu{12, 0x60};
inline constexpr HidKey kHome{12, 0x40};
inline constexpr HidKey kVolumeUp{12, 0xE9};
inline constexpr HidKey kVolumeDown{12, 0xEA};
}

inline constexpr float kDefaultSkipInterval = 15.0f;

/**
 * @brief Sends HID key presses over a session
 *
 * A press is key down followed by key up. Unless @p flush is false a
 * GENERIC_MESSAGE request follows so the call returns once the device
 * has handled the key.
 */
AsyncResult<Unit> PressKey(
    ProtocolSession& session,
    HidKey key,
    interfaces::InputAction action = interfaces::InputAction::SingleTap,
    bool flush = true);

/// SEND_COMMAND round trip; a sendError other than NoError fails with Command.
AsyncResult<Unit> SendCommand(
    ProtocolSession& session,
    proto::mrp::Command command,
    std::optional<proto::mrp::CommandOptions> options = std::nullopt);

class MrpRemoteControl final : public interfaces::RemoteControl {
public:
    MrpRemoteControl(std::shared_ptr<ProtocolSession> session,
                     std::shared_ptr<PlayerStateManager> player_state);

    AsyncResult<Unit> Up(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Down(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Left(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Right(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Play() override;
    AsyncResult<Unit> Pause() override;
    AsyncResult<Unit> PlayPause() override;
    AsyncResult<Unit> Stop() override;
    AsyncResult<Unit> Next() override;
    AsyncResult<Unit> Previous() override;
    AsyncResult<Unit> Select(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Menu(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> Home(interfaces::InputAction action = interfaces::InputAction::SingleTap) override;
    AsyncResult<Unit> TopMenu() override;
    AsyncResult<Unit> Suspend() override;
    AsyncResult<Unit> WakeUp() override;
    AsyncResult<Unit> VolumeUp() override;
    AsyncResult<Unit> VolumeDown() override;
    AsyncResult<Unit> SkipForward(float seconds = 0.0f) override;
    AsyncResult<Unit> SkipBackward(float seconds = 0.0f) override;
    AsyncResult<Unit> SetPosition(uint32_t seconds) override;
    AsyncResult<Unit> SetShuffle(interfaces::ShuffleState state) override;
    AsyncResult<Unit> SetRepeat(interfaces::RepeatState state) override;

private:
    std::shared_ptr<ProtocolSession> session_;
    std::shared_ptr<PlayerStateManager> player_state_;
};

class MrpMetadata final : public interfaces::Metadata {
public:
    MrpMetadata(std::string device_id, std::shared_ptr<PlayerStateManager> player_state);

    [[nodiscard]] RemoteResult<std::string> DeviceId() const override;
    AsyncResult<interfaces::PlayingInfo> Playing() override;

private:
    std::string device_id_;
    std::shared_ptr<PlayerStateManager> player_state_;
};

/**
 * @brief Power state derived from the device's logical device count
 *
 * The device reports zero logical devices while in standby. Updates arrive
 * with DEVICE_INFO and DEVICE_INFO_UPDATE messages.
 */
class MrpPower final : public interfaces::Power {
public:
    explicit MrpPower(std::shared_ptr<ProtocolSession> session);
    ~MrpPower() override;

    [[nodiscard]] RemoteResult<interfaces::PowerState> CurrentPowerState() const override;
    AsyncResult<Unit> TurnOn(bool await_new_state = false) override;
    AsyncResult<Unit> TurnOff(bool await_new_state = false) override;

    [[nodiscard]] static interfaces::PowerState FromDeviceInfo(const proto::mrp::ProtocolMessage& message);

    MrpPower(const MrpPower&) = delete;
    MrpPower& operator=(const MrpPower&) = delete;

private:
    void HandleDeviceInfo(const proto::mrp::ProtocolMessage& message);
    AsyncResult<Unit> AwaitState(interfaces::PowerState target);

    std::shared_ptr<ProtocolSession> session_;
    interfaces::PowerState state_ = interfaces::PowerState::Unknown;
    std::map<interfaces::PowerState, std::shared_ptr<AsyncEvent>> waiters_;
    CorrelationEngine::ListenerToken info_token_{};
    CorrelationEngine::ListenerToken update_token_{};
};

class MrpPushUpdater final : public interfaces::PushUpdater,
                             public PlayerStateListener,
                             public std::enable_shared_from_this<MrpPushUpdater> {
public:
    explicit MrpPushUpdater(std::shared_ptr<PlayerStateManager> player_state);
    ~MrpPushUpdater() override;

    /// @return InvalidState when no listener is set
    RemoteResult<Unit> Start(std::chrono::seconds initial_delay = std::chrono::seconds{0}) override;
    RemoteResult<Unit> Stop() override;
    [[nodiscard]] RemoteResult<bool> Active() const override;

    void OnStateUpdated(const PlayerState& state) override;

    MrpPushUpdater(const MrpPushUpdater&) = delete;
    MrpPushUpdater& operator=(const MrpPushUpdater&) = delete;

private:
    [[nodiscard]] bool IsActive() const noexcept;
    void PostUpdate(interfaces::PlayingInfo playing);

    std::shared_ptr<PlayerStateManager> player_state_;
    std::optional<interfaces::PlayingInfo> last_update_;
};

/// Volume keys only; the absolute level is not exposed by this backend.
class MrpAudio final : public interfaces::Audio {
public:
    explicit MrpAudio(std::shared_ptr<ProtocolSession> session);

    AsyncResult<Unit> VolumeUp() override;
    AsyncResult<Unit> VolumeDown() override;

private:
    std::shared_ptr<ProtocolSession> session_;
};

class MrpFeatures final : public interfaces::Features {
public:
    explicit MrpFeatures(std::shared_ptr<PlayerStateManager> player_state);

    [[nodiscard]] RemoteResult<interfaces::FeatureInfo> GetFeature(interfaces::FeatureName name) const override;

private:
    std::shared_ptr<PlayerStateManager> player_state_;
};

}  // namespace tvremote::mrp
