#pragma once
#include "tvremote/core/async_result.hpp"
#include "tvremote/facade/capability_relay.hpp"
#include "tvremote/facade/facade_capabilities.hpp"
#include "tvremote/facade/setup_descriptor.hpp"
#include "tvremote/interfaces/listeners.hpp"
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tvremote::facade {

enum class FacadeState {
    Unconfigured,
    Connected,
    Closed
};

std::string_view ToString(FacadeState state);

/**
 * @brief One device reachable over several backends
 *
 * Backends are added as setup descriptors before Connect(). Connect()
 * starts each of them once; the ones that came up register their
 * capabilities with the shared relays and the facade capabilities route
 * every call to the best backend.
 *
 * A backend that fails to connect is left out. Connect() still succeeds
 * and calls that nothing else serves fail with NotSupported.
 */
class DeviceFacade final : public interfaces::DeviceListener {
public:
    DeviceFacade();
    ~DeviceFacade() override;

    /// @return InvalidState once Connect() has run
    [[nodiscard]] Result<Unit, RemoteFailure> AddProtocol(SetupDescriptor descriptor);

    /// @return NoService without descriptors, InvalidState when already connected
    AsyncResult<Unit> Connect();

    /**
     * @brief Close every connected backend; idempotent
     * @return cleanup still running; a repeated call returns what is left of
     *         the same set
     */
    PendingTasks Close();

    /**
     * @brief Route the named capabilities to @p protocol until released
     *
     * All or nothing: when one relay refuses, relays already taken over by
     * this call are released again before the error is returned.
     *
     * @return a function that releases the takeover
     */
    [[nodiscard]] Result<std::function<void()>, RemoteFailure> Takeover(
        interfaces::ProtocolTag protocol,
        std::initializer_list<interfaces::CapabilityKind> capabilities);

    [[nodiscard]] interfaces::RemoteControl& RemoteControl() noexcept { return remote_control_; }
    [[nodiscard]] interfaces::Metadata& Metadata() noexcept { return metadata_; }
    [[nodiscard]] interfaces::Power& Power() noexcept { return power_; }
    [[nodiscard]] interfaces::PushUpdater& PushUpdater() noexcept { return push_updater_; }
    [[nodiscard]] interfaces::Audio& Audio() noexcept { return audio_; }
    [[nodiscard]] interfaces::Features& Features() noexcept { return features_; }

    [[nodiscard]] const std::map<std::string, std::string>& DeviceInfo() const noexcept { return device_info_; }
    [[nodiscard]] FacadeState State() const noexcept { return state_; }
    [[nodiscard]] std::vector<interfaces::ProtocolTag> ConnectedProtocols() const;

    [[nodiscard]] const CapabilityRelay<interfaces::RemoteControl>& RemoteControlRelay() const noexcept {
        return remote_control_relay_;
    }

    void SetListener(interfaces::DeviceListener* listener) noexcept { listener_.SetListener(listener); }
    void ClearListener() noexcept { listener_.ClearListener(); }

    void OnConnectionLost(const RemoteFailure& failure) override;
    void OnConnectionClosed() override;

    DeviceFacade(const DeviceFacade&) = delete;
    DeviceFacade& operator=(const DeviceFacade&) = delete;

private:
    [[nodiscard]] Result<Unit, RemoteFailure> RegisterCapabilities(const SetupDescriptor& descriptor);
    void BuildFeatureMap();
    void DetachBackends() noexcept;
    [[nodiscard]] RelayControl& RelayFor(interfaces::CapabilityKind kind);

    FacadeState state_ = FacadeState::Unconfigured;
    bool connecting_ = false;
    bool lifecycle_reported_ = false;
    std::map<std::string, std::string> device_info_;
    std::optional<PendingTasks> pending_close_;
    interfaces::ListenerSlot<interfaces::DeviceListener> listener_;

    CapabilityRelay<interfaces::RemoteControl> remote_control_relay_{interfaces::kDefaultPriorities};
    CapabilityRelay<interfaces::Metadata> metadata_relay_{interfaces::kDefaultPriorities};
    CapabilityRelay<interfaces::Power> power_relay_{interfaces::kPowerPriorities};
    CapabilityRelay<interfaces::PushUpdater> push_updater_relay_{interfaces::kDefaultPriorities};
    CapabilityRelay<interfaces::Audio> audio_relay_{interfaces::kDefaultPriorities};
    CapabilityRelay<interfaces::Features> features_relay_{interfaces::kDefaultPriorities};

    FacadeRemoteControl remote_control_{remote_control_relay_};
    FacadeMetadata metadata_{metadata_relay_};
    FacadePower power_{power_relay_};
    FacadePushUpdater push_updater_{push_updater_relay_};
    FacadeAudio audio_{audio_relay_};
    FacadeFeatures features_{features_relay_, push_updater_relay_};

    // Destroyed first: backends hold raw pointers to the members above.
    std::vector<SetupDescriptor> descriptors_;
    std::vector<size_t> connected_;
};

}  // namespace tvremote::facade
