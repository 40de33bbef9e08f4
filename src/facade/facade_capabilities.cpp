#include "tvremote/facade/facade_capabilities.hpp"
#include "tvremote/debug/log.hpp"
#include <format>

namespace tvremote::facade {

using interfaces::FeatureInfo;
using interfaces::FeatureName;
using interfaces::FeatureState;
using interfaces::InputAction;

namespace {

    template<typename R, typename Capability, typename Call>
    AsyncResult<R> RelayCall(CapabilityRelay<Capability>& relay, const std::string_view method, Call call) {
        auto target = relay.Resolve(method);
        TVREMOTE_CO_TRY(target);
        const std::shared_ptr<Capability> instance = std::move(target).Unwrap();
        co_return co_await call(*instance);
    }

    template<typename Call>
    AsyncResult<Unit> Remote(CapabilityRelay<interfaces::RemoteControl>& relay,
                             const std::string_view method, Call call) {
        return RelayCall<Unit>(relay, method, std::move(call));
    }

}

    FacadeRemoteControl::FacadeRemoteControl(CapabilityRelay<interfaces::RemoteControl>& relay)
        : relay_(relay) {
        DeclareAllOverrides();
    }

    AsyncResult<Unit> FacadeRemoteControl::Up(const InputAction action) {
        return Remote(relay_, "up", [action](auto& rc) { return rc.Up(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Down(const InputAction action) {
        return Remote(relay_, "down", [action](auto& rc) { return rc.Down(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Left(const InputAction action) {
        return Remote(relay_, "left", [action](auto& rc) { return rc.Left(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Right(const InputAction action) {
        return Remote(relay_, "right", [action](auto& rc) { return rc.Right(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Play() {
        return Remote(relay_, "play", [](auto& rc) { return rc.Play(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Pause() {
        return Remote(relay_, "pause", [](auto& rc) { return rc.Pause(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::PlayPause() {
        return Remote(relay_, "play_pause", [](auto& rc) { return rc.PlayPause(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Stop() {
        return Remote(relay_, "stop", [](auto& rc) { return rc.Stop(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Next() {
        return Remote(relay_, "next", [](auto& rc) { return rc.Next(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Previous() {
        return Remote(relay_, "previous", [](auto& rc) { return rc.Previous(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Select(const InputAction action) {
        return Remote(relay_, "select", [action](auto& rc) { return rc.Select(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Menu(const InputAction action) {
        return Remote(relay_, "menu", [action](auto& rc) { return rc.Menu(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Home(const InputAction action) {
        return Remote(relay_, "home", [action](auto& rc) { return rc.Home(action); });
    }

    AsyncResult<Unit> FacadeRemoteControl::TopMenu() {
        return Remote(relay_, "top_menu", [](auto& rc) { return rc.TopMenu(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::Suspend() {
        return Remote(relay_, "suspend", [](auto& rc) { return rc.Suspend(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::WakeUp() {
        return Remote(relay_, "wakeup", [](auto& rc) { return rc.WakeUp(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::VolumeUp() {
        return Remote(relay_, "volume_up", [](auto& rc) { return rc.VolumeUp(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::VolumeDown() {
        return Remote(relay_, "volume_down", [](auto& rc) { return rc.VolumeDown(); });
    }

    AsyncResult<Unit> FacadeRemoteControl::SkipForward(const float seconds) {
        return Remote(relay_, "skip_forward", [seconds](auto& rc) { return rc.SkipForward(seconds); });
    }

    AsyncResult<Unit> FacadeRemoteControl::SkipBackward(const float seconds) {
        return Remote(relay_, "skip_backward", [seconds](auto& rc) { return rc.SkipBackward(seconds); });
    }

    AsyncResult<Unit> FacadeRemoteControl::SetPosition(const uint32_t seconds) {
        return Remote(relay_, "set_position", [seconds](auto& rc) { return rc.SetPosition(seconds); });
    }

    AsyncResult<Unit> FacadeRemoteControl::SetShuffle(const interfaces::ShuffleState state) {
        return Remote(relay_, "set_shuffle", [state](auto& rc) { return rc.SetShuffle(state); });
    }

    AsyncResult<Unit> FacadeRemoteControl::SetRepeat(const interfaces::RepeatState state) {
        return Remote(relay_, "set_repeat", [state](auto& rc) { return rc.SetRepeat(state); });
    }

    FacadeMetadata::FacadeMetadata(CapabilityRelay<interfaces::Metadata>& relay)
        : relay_(relay) {
        DeclareAllOverrides();
    }

    RemoteResult<std::string> FacadeMetadata::DeviceId() const {
        auto target = relay_.Resolve("device_id");
        if (target.IsErr()) {
            return std::move(target).Propagate();
        }
        return target.Unwrap()->DeviceId();
    }

    AsyncResult<interfaces::PlayingInfo> FacadeMetadata::Playing() {
        return RelayCall<interfaces::PlayingInfo>(relay_, "playing", [](auto& metadata) {
            return metadata.Playing();
        });
    }

    FacadePower::FacadePower(CapabilityRelay<interfaces::Power>& relay)
        : relay_(relay) {
        DeclareAllOverrides();
    }

    RemoteResult<interfaces::PowerState> FacadePower::CurrentPowerState() const {
        auto target = relay_.Resolve("power_state");
        if (target.IsErr()) {
            return std::move(target).Propagate();
        }
        return target.Unwrap()->CurrentPowerState();
    }

    AsyncResult<Unit> FacadePower::TurnOn(const bool await_new_state) {
        return RelayCall<Unit>(relay_, "turn_on", [await_new_state](auto& power) {
            return power.TurnOn(await_new_state);
        });
    }

    AsyncResult<Unit> FacadePower::TurnOff(const bool await_new_state) {
        return RelayCall<Unit>(relay_, "turn_off", [await_new_state](auto& power) {
            return power.TurnOff(await_new_state);
        });
    }

    void FacadePower::OnPowerStateUpdate(const interfaces::PowerState old_state,
                                         const interfaces::PowerState new_state) {
        if (old_state == new_state) {
            return;
        }
        Notify([old_state, new_state](interfaces::PowerListener& listener) {
            listener.OnPowerStateUpdate(old_state, new_state);
        });
    }

    FacadePushUpdater::FacadePushUpdater(CapabilityRelay<interfaces::PushUpdater>& relay)
        : relay_(relay) {
        DeclareAllOverrides();
    }

    RemoteResult<Unit> FacadePushUpdater::Start(const std::chrono::seconds initial_delay) {
        if (!HasListener()) {
            return RemoteResult<Unit>::Err(RemoteFailure::InvalidState("No push listener has been set"));
        }
        if (relay_.Count() == 0) {
            return RemoteResult<Unit>::Err(RemoteFailure::NotSupported("start is not supported"));
        }
        for (const auto& instance : relay_.Instances()) {
            if (!instance->Overrides("start")) {
                continue;
            }
            instance->SetListener(this);
            TVREMOTE_TRY(instance->Start(initial_delay));
        }
        return RemoteResult<Unit>::Ok(unit);
    }

    RemoteResult<Unit> FacadePushUpdater::Stop() {
        for (const auto& instance : relay_.Instances()) {
            if (!instance->Overrides("stop")) {
                continue;
            }
            TVREMOTE_TRY(instance->Stop());
            instance->ClearListener();
        }
        return RemoteResult<Unit>::Ok(unit);
    }

    RemoteResult<bool> FacadePushUpdater::Active() const {
        auto target = relay_.Resolve("active");
        if (target.IsErr()) {
            return std::move(target).Propagate();
        }
        return target.Unwrap()->Active();
    }

    bool FacadePushUpdater::IsMainInstance(const interfaces::PushUpdater& updater) const {
        const auto main = relay_.MainInstance();
        return main.IsOk() && main.Unwrap().get() == &updater;
    }

    void FacadePushUpdater::OnPlaystatusUpdate(interfaces::PushUpdater& updater,
                                               const interfaces::PlayingInfo& playing) {
        if (!IsMainInstance(updater)) {
            return;
        }
        Notify([this, &playing](interfaces::PushListener& listener) {
            listener.OnPlaystatusUpdate(*this, playing);
        });
    }

    void FacadePushUpdater::OnPlaystatusError(interfaces::PushUpdater& updater, const RemoteFailure& failure) {
        if (!IsMainInstance(updater)) {
            return;
        }
        Notify([this, &failure](interfaces::PushListener& listener) {
            listener.OnPlaystatusError(*this, failure);
        });
    }

    FacadeAudio::FacadeAudio(CapabilityRelay<interfaces::Audio>& relay)
        : relay_(relay) {
        DeclareAllOverrides();
    }

    RemoteResult<float> FacadeAudio::Volume() const {
        auto target = relay_.Resolve("volume");
        if (target.IsErr()) {
            return std::move(target).Propagate();
        }
        return target.Unwrap()->Volume();
    }

    AsyncResult<Unit> FacadeAudio::SetVolume(const float level) {
        if (!(level >= 0.0f && level <= 100.0f)) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::InvalidInput(
                std::format("Volume {} is outside 0 to 100", level)));
        }
        co_return co_await RelayCall<Unit>(relay_, "set_volume", [level](auto& audio) {
            return audio.SetVolume(level);
        });
    }

    AsyncResult<Unit> FacadeAudio::VolumeUp() {
        return RelayCall<Unit>(relay_, "volume_up", [](auto& audio) { return audio.VolumeUp(); });
    }

    AsyncResult<Unit> FacadeAudio::VolumeDown() {
        return RelayCall<Unit>(relay_, "volume_down", [](auto& audio) { return audio.VolumeDown(); });
    }

    FacadeFeatures::FacadeFeatures(CapabilityRelay<interfaces::Features>& relay,
                                   const CapabilityRelay<interfaces::PushUpdater>& push_relay)
        : relay_(relay)
        , push_relay_(push_relay) {
        DeclareAllOverrides();
    }

    void FacadeFeatures::MapFeature(const FeatureName name, const interfaces::ProtocolTag protocol) {
        feature_map_.emplace(name, protocol);
    }

    RemoteResult<FeatureInfo> FacadeFeatures::GetFeature(const FeatureName name) const {
        FeatureInfo info;
        if (name == FeatureName::PushUpdates) {
            info.state = push_relay_.Count() > 0 ? FeatureState::Available : FeatureState::Unsupported;
            return RemoteResult<FeatureInfo>::Ok(std::move(info));
        }
        const auto mapped = feature_map_.find(name);
        if (mapped == feature_map_.end()) {
            return RemoteResult<FeatureInfo>::Ok(std::move(info));
        }
        const auto instance = relay_.Get(mapped->second);
        if (!instance) {
            TVREMOTE_LOG_WARN("FACADE", std::format("Feature backend {} is gone",
                interfaces::ToString(mapped->second)));
            return RemoteResult<FeatureInfo>::Ok(std::move(info));
        }
        return instance->GetFeature(name);
    }

}
