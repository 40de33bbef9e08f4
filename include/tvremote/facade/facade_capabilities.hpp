#pragma once
#include "tvremote/facade/capability_relay.hpp"
#include "tvremote/interfaces/capabilities.hpp"
#include <map>

namespace tvremote::facade {

class FacadeRemoteControl final : public interfaces::RemoteControl {
public:
    explicit FacadeRemoteControl(CapabilityRelay<interfaces::RemoteControl>& relay);

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
    CapabilityRelay<interfaces::RemoteControl>& relay_;
};

class FacadeMetadata final : public interfaces::Metadata {
public:
    explicit FacadeMetadata(CapabilityRelay<interfaces::Metadata>& relay);

    [[nodiscard]] RemoteResult<std::string> DeviceId() const override;
    AsyncResult<interfaces::PlayingInfo> Playing() override;

private:
    CapabilityRelay<interfaces::Metadata>& relay_;
};

/// Forwards power-state changes of every registered backend.
class FacadePower final : public interfaces::Power, public interfaces::PowerListener {
public:
    explicit FacadePower(CapabilityRelay<interfaces::Power>& relay);

    [[nodiscard]] RemoteResult<interfaces::PowerState> CurrentPowerState() const override;
    AsyncResult<Unit> TurnOn(bool await_new_state = false) override;
    AsyncResult<Unit> TurnOff(bool await_new_state = false) override;

    void OnPowerStateUpdate(interfaces::PowerState old_state, interfaces::PowerState new_state) override;

private:
    CapabilityRelay<interfaces::Power>& relay_;
};

/**
 * @brief Push updates from whichever backend currently ranks first
 *
 * Every backend updater is started with this object as its listener.
 * Updates and errors are forwarded only when they come from the relay's
 * main instance, so a lower-priority backend never overrides the state
 * reported by a higher-priority one.
 */
class FacadePushUpdater final : public interfaces::PushUpdater, public interfaces::PushListener {
public:
    explicit FacadePushUpdater(CapabilityRelay<interfaces::PushUpdater>& relay);

    RemoteResult<Unit> Start(std::chrono::seconds initial_delay = std::chrono::seconds{0}) override;
    RemoteResult<Unit> Stop() override;
    [[nodiscard]] RemoteResult<bool> Active() const override;

    void OnPlaystatusUpdate(interfaces::PushUpdater& updater, const interfaces::PlayingInfo& playing) override;
    void OnPlaystatusError(interfaces::PushUpdater& updater, const RemoteFailure& failure) override;

private:
    [[nodiscard]] bool IsMainInstance(const interfaces::PushUpdater& updater) const;

    CapabilityRelay<interfaces::PushUpdater>& relay_;
};

/// Enforces the 0 to 100 volume range before relaying.
class FacadeAudio final : public interfaces::Audio {
public:
    explicit FacadeAudio(CapabilityRelay<interfaces::Audio>& relay);

    [[nodiscard]] RemoteResult<float> Volume() const override;
    AsyncResult<Unit> SetVolume(float level) override;
    AsyncResult<Unit> VolumeUp() override;
    AsyncResult<Unit> VolumeDown() override;

private:
    CapabilityRelay<interfaces::Audio>& relay_;
};

/**
 * @brief Feature states answered by the backend that declared each feature
 *
 * The mapping is rebuilt by the facade after connect: per feature, the
 * highest-priority backend listing it wins.
 */
class FacadeFeatures final : public interfaces::Features {
public:
    FacadeFeatures(CapabilityRelay<interfaces::Features>& relay,
                   const CapabilityRelay<interfaces::PushUpdater>& push_relay);

    [[nodiscard]] RemoteResult<interfaces::FeatureInfo> GetFeature(interfaces::FeatureName name) const override;

    void MapFeature(interfaces::FeatureName name, interfaces::ProtocolTag protocol);
    void ClearMapping() noexcept { feature_map_.clear(); }

private:
    CapabilityRelay<interfaces::Features>& relay_;
    const CapabilityRelay<interfaces::PushUpdater>& push_relay_;
    std::map<interfaces::FeatureName, interfaces::ProtocolTag> feature_map_;
};

}  // namespace tvremote::facade
