#include "tvremote/interfaces/capabilities.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace tvremote::interfaces {

namespace {

    RemoteFailure NotImplemented(const std::string_view method) {
        return RemoteFailure::NotSupported(std::format("{} is not supported", method));
    }

    template<typename T>
    AsyncResult<T> NotImplementedAsync(const std::string_view method) {
        co_return RemoteResult<T>::Err(NotImplemented(method));
    }

}

    std::string_view ToString(const CapabilityKind kind) {
        switch (kind) {
            case CapabilityKind::RemoteControl: return "RemoteControl";
            case CapabilityKind::Metadata: return "Metadata";
            case CapabilityKind::Power: return "Power";
            case CapabilityKind::PushUpdater: return "PushUpdater";
            case CapabilityKind::Audio: return "Audio";
            case CapabilityKind::Features: return "Features";
        }
        return "Unknown";
    }

    std::string_view ToString(const DeviceState state) {
        switch (state) {
            case DeviceState::Idle: return "Idle";
            case DeviceState::Loading: return "Loading";
            case DeviceState::Paused: return "Paused";
            case DeviceState::Playing: return "Playing";
            case DeviceState::Stopped: return "Stopped";
            case DeviceState::Seeking: return "Seeking";
        }
        return "Unknown";
    }

    std::string_view ToString(const PowerState state) {
        switch (state) {
            case PowerState::Unknown: return "Unknown";
            case PowerState::Off: return "Off";
            case PowerState::On: return "On";
        }
        return "Unknown";
    }

    bool Capability::HasMethod(const std::string_view method) const noexcept {
        const auto methods = Methods();
        return std::find(methods.begin(), methods.end(), method) != methods.end();
    }

    bool Capability::Overrides(const std::string_view method) const {
        if (!HasMethod(method)) {
            throw std::logic_error(std::format("Capability has no method named '{}'", method));
        }
        return overrides_.contains(method);
    }

    void Capability::DeclareOverrides(const std::initializer_list<std::string_view> methods) {
        for (const auto method : methods) {
            if (!HasMethod(method)) {
                throw std::logic_error(std::format("Cannot override unknown method '{}'", method));
            }
            overrides_.emplace(method);
        }
    }

    void Capability::DeclareAllOverrides() {
        for (const auto method : Methods()) {
            overrides_.emplace(method);
        }
    }

    AsyncResult<Unit> RemoteControl::Up(InputAction) { return NotImplementedAsync<Unit>("up"); }
    AsyncResult<Unit> RemoteControl::Down(InputAction) { return NotImplementedAsync<Unit>("down"); }
    AsyncResult<Unit> RemoteControl::Left(InputAction) { return NotImplementedAsync<Unit>("left"); }
    AsyncResult<Unit> RemoteControl::Right(InputAction) { return NotImplementedAsync<Unit>("right"); }
    AsyncResult<Unit> RemoteControl::Play() { return NotImplementedAsync<Unit>("play"); }
    AsyncResult<Unit> RemoteControl::Pause() { return NotImplementedAsync<Unit>("pause"); }
    AsyncResult<Unit> RemoteControl::PlayPause() { return NotImplementedAsync<Unit>("play_pause"); }
    AsyncResult<Unit> RemoteControl::Stop() { return NotImplementedAsync<Unit>("stop"); }
    AsyncResult<Unit> RemoteControl::Next() { return NotImplementedAsync<Unit>("next"); }
    AsyncResult<Unit> RemoteControl::Previous() { return NotImplementedAsync<Unit>("previous"); }
    AsyncResult<Unit> RemoteControl::Select(InputAction) { return NotImplementedAsync<Unit>("select"); }
    AsyncResult<Unit> RemoteControl::Menu(InputAction) { return NotImplementedAsync<Unit>("menu"); }
    AsyncResult<Unit> RemoteControl::Home(InputAction) { return NotImplementedAsync<Unit>("home"); }
    AsyncResult<Unit> RemoteControl::TopMenu() { return NotImplementedAsync<Unit>("top_menu"); }
    AsyncResult<Unit> RemoteControl::Suspend() { return NotImplementedAsync<Unit>("suspend"); }
    AsyncResult<Unit> RemoteControl::WakeUp() { return NotImplementedAsync<Unit>("wakeup"); }
    AsyncResult<Unit> RemoteControl::VolumeUp() { return NotImplementedAsync<Unit>("volume_up"); }
    AsyncResult<Unit> RemoteControl::VolumeDown() { return NotImplementedAsync<Unit>("volume_down"); }
    AsyncResult<Unit> RemoteControl::SkipForward(float) { return NotImplementedAsync<Unit>("skip_forward"); }
    AsyncResult<Unit> RemoteControl::SkipBackward(float) { return NotImplementedAsync<Unit>("skip_backward"); }
    AsyncResult<Unit> RemoteControl::SetPosition(uint32_t) { return NotImplementedAsync<Unit>("set_position"); }
    AsyncResult<Unit> RemoteControl::SetShuffle(ShuffleState) { return NotImplementedAsync<Unit>("set_shuffle"); }
    AsyncResult<Unit> RemoteControl::SetRepeat(RepeatState) { return NotImplementedAsync<Unit>("set_repeat"); }

    RemoteResult<std::string> Metadata::DeviceId() const {
        return RemoteResult<std::string>::Err(NotImplemented("device_id"));
    }

    AsyncResult<PlayingInfo> Metadata::Playing() {
        return NotImplementedAsync<PlayingInfo>("playing");
    }

    RemoteResult<PowerState> Power::CurrentPowerState() const {
        return RemoteResult<PowerState>::Err(NotImplemented("power_state"));
    }

    AsyncResult<Unit> Power::TurnOn(bool) { return NotImplementedAsync<Unit>("turn_on"); }
    AsyncResult<Unit> Power::TurnOff(bool) { return NotImplementedAsync<Unit>("turn_off"); }

    RemoteResult<Unit> PushUpdater::Start(std::chrono::seconds) {
        return RemoteResult<Unit>::Err(NotImplemented("start"));
    }

    RemoteResult<Unit> PushUpdater::Stop() {
        return RemoteResult<Unit>::Err(NotImplemented("stop"));
    }

    RemoteResult<bool> PushUpdater::Active() const {
        return RemoteResult<bool>::Err(NotImplemented("active"));
    }

    RemoteResult<float> Audio::Volume() const {
        return RemoteResult<float>::Err(NotImplemented("volume"));
    }

    AsyncResult<Unit> Audio::SetVolume(float) { return NotImplementedAsync<Unit>("set_volume"); }
    AsyncResult<Unit> Audio::VolumeUp() { return NotImplementedAsync<Unit>("volume_up"); }
    AsyncResult<Unit> Audio::VolumeDown() { return NotImplementedAsync<Unit>("volume_down"); }

    RemoteResult<FeatureInfo> Features::GetFeature(FeatureName) const {
        return RemoteResult<FeatureInfo>::Err(NotImplemented("get_feature"));
    }

    std::map<FeatureName, FeatureInfo> Features::AllFeatures(const bool include_unsupported) const {
        std::map<FeatureName, FeatureInfo> features;
        for (const auto& entry : kFeatureTable) {
            auto info = GetFeature(entry.name);
            FeatureInfo resolved = info.IsOk() ? std::move(info).Unwrap() : FeatureInfo{};
            if (include_unsupported || resolved.state != FeatureState::Unsupported) {
                features.emplace(entry.name, std::move(resolved));
            }
        }
        return features;
    }

    bool Features::InState(const std::initializer_list<FeatureName> names, const FeatureState state) const {
        return std::all_of(names.begin(), names.end(), [this, state](const FeatureName name) {
            const auto info = GetFeature(name);
            return info.IsOk() && info.Unwrap().state == state;
        });
    }

}
