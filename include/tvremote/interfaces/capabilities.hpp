#pragma once
#include "tvremote/core/async_result.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/interfaces/features.hpp"
#include "tvremote/interfaces/listeners.hpp"
#include "tvremote/interfaces/playing.hpp"
#include <array>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <map>
#include <set>
#include <span>
#include <string>
#include <string_view>

namespace tvremote::interfaces {

enum class CapabilityKind : uint8_t {
    RemoteControl,
    Metadata,
    Power,
    PushUpdater,
    Audio,
    Features
};

std::string_view ToString(CapabilityKind kind);

/**
 * @brief Base of every capability interface
 *
 * Each interface publishes a closed method table. A backend lists the
 * methods it implements with DeclareOverrides(); every other method keeps
 * the interface default, which fails with NotSupported. The relay reads
 * this declaration instead of inspecting the object at call time.
 */
class Capability {
public:
    virtual ~Capability() = default;

    [[nodiscard]] virtual std::span<const std::string_view> Methods() const noexcept = 0;

    [[nodiscard]] bool HasMethod(std::string_view method) const noexcept;

    /// @throws std::logic_error if @p method is not in Methods()
    [[nodiscard]] bool Overrides(std::string_view method) const;

protected:
    Capability() = default;

    /// @throws std::logic_error for a name missing from Methods()
    void DeclareOverrides(std::initializer_list<std::string_view> methods);
    void DeclareAllOverrides();

private:
    std::set<std::string, std::less<>> overrides_;
};

class RemoteControl : public Capability {
public:
    static constexpr std::array<std::string_view, 23> kMethods = {
        "up", "down", "left", "right", "play", "pause", "play_pause", "stop",
        "next", "previous", "select", "menu", "home", "top_menu", "suspend",
        "wakeup", "volume_up", "volume_down", "skip_forward", "skip_backward",
        "set_position", "set_shuffle", "set_repeat"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    virtual AsyncResult<Unit> Up(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Down(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Left(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Right(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Play();
    virtual AsyncResult<Unit> Pause();
    virtual AsyncResult<Unit> PlayPause();
    virtual AsyncResult<Unit> Stop();
    virtual AsyncResult<Unit> Next();
    virtual AsyncResult<Unit> Previous();
    virtual AsyncResult<Unit> Select(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Menu(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> Home(InputAction action = InputAction::SingleTap);
    virtual AsyncResult<Unit> TopMenu();
    virtual AsyncResult<Unit> Suspend();
    virtual AsyncResult<Unit> WakeUp();
    virtual AsyncResult<Unit> VolumeUp();
    virtual AsyncResult<Unit> VolumeDown();
    /// @param seconds 0 lets the device pick its default interval
    virtual AsyncResult<Unit> SkipForward(float seconds = 0.0f);
    virtual AsyncResult<Unit> SkipBackward(float seconds = 0.0f);
    virtual AsyncResult<Unit> SetPosition(uint32_t seconds);
    virtual AsyncResult<Unit> SetShuffle(ShuffleState state);
    virtual AsyncResult<Unit> SetRepeat(RepeatState state);
};

class Metadata : public Capability {
public:
    static constexpr std::array<std::string_view, 2> kMethods = {"device_id", "playing"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    [[nodiscard]] virtual RemoteResult<std::string> DeviceId() const;
    virtual AsyncResult<PlayingInfo> Playing();
};

class Power : public Capability, public ListenerSlot<PowerListener> {
public:
    static constexpr std::array<std::string_view, 3> kMethods = {"power_state", "turn_on", "turn_off"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    [[nodiscard]] virtual RemoteResult<PowerState> CurrentPowerState() const;
    virtual AsyncResult<Unit> TurnOn(bool await_new_state = false);
    virtual AsyncResult<Unit> TurnOff(bool await_new_state = false);
};

class PushUpdater : public Capability, public ListenerSlot<PushListener> {
public:
    static constexpr std::array<std::string_view, 3> kMethods = {"start", "stop", "active"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    virtual RemoteResult<Unit> Start(std::chrono::seconds initial_delay = std::chrono::seconds{0});
    virtual RemoteResult<Unit> Stop();
    [[nodiscard]] virtual RemoteResult<bool> Active() const;
};

class Audio : public Capability {
public:
    static constexpr std::array<std::string_view, 4> kMethods = {
        "volume", "set_volume", "volume_up", "volume_down"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    /// Volume level in percent, 0 to 100.
    [[nodiscard]] virtual RemoteResult<float> Volume() const;
    virtual AsyncResult<Unit> SetVolume(float level);
    virtual AsyncResult<Unit> VolumeUp();
    virtual AsyncResult<Unit> VolumeDown();
};

class Features : public Capability {
public:
    static constexpr std::array<std::string_view, 1> kMethods = {"get_feature"};

    [[nodiscard]] std::span<const std::string_view> Methods() const noexcept final {
        return kMethods;
    }

    [[nodiscard]] virtual RemoteResult<FeatureInfo> GetFeature(FeatureName name) const;

    /// Every feature from the static table, resolved through GetFeature().
    [[nodiscard]] std::map<FeatureName, FeatureInfo> AllFeatures(bool include_unsupported = false) const;

    [[nodiscard]] bool InState(std::initializer_list<FeatureName> names, FeatureState state) const;
};

}  // namespace tvremote::interfaces
