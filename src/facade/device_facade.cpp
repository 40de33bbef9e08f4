#include "tvremote/facade/device_facade.hpp"
#include "tvremote/debug/log.hpp"
#include <algorithm>
#include <format>
#include <set>
#include <stdexcept>

namespace tvremote::facade {

using interfaces::CapabilityKind;
using interfaces::ProtocolTag;

    std::string_view ToString(const FacadeState state) {
        switch (state) {
            case FacadeState::Unconfigured: return "Unconfigured";
            case FacadeState::Connected: return "Connected";
            case FacadeState::Closed: return "Closed";
        }
        return "Unknown";
    }

    DeviceFacade::DeviceFacade() = default;

    DeviceFacade::~DeviceFacade() {
        DetachBackends();
    }

    void DeviceFacade::DetachBackends() noexcept {
        for (const auto& descriptor : descriptors_) {
            if (descriptor.set_device_listener) {
                descriptor.set_device_listener(nullptr);
            }
            if (descriptor.capabilities.power) {
                descriptor.capabilities.power->ClearListener();
            }
            if (descriptor.capabilities.push_updater) {
                descriptor.capabilities.push_updater->ClearListener();
            }
        }
    }

    Result<Unit, RemoteFailure> DeviceFacade::AddProtocol(SetupDescriptor descriptor) {
        if (state_ != FacadeState::Unconfigured || connecting_) {
            return Result<Unit, RemoteFailure>::Err(RemoteFailure::InvalidState(
                std::format("Cannot add a protocol to a {} device", ToString(state_))));
        }
        if (!descriptor.connect) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Setup descriptor has no connect function"));
        }
        descriptors_.push_back(std::move(descriptor));
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    AsyncResult<Unit> DeviceFacade::Connect() {
        if (state_ != FacadeState::Unconfigured || connecting_) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::InvalidState(
                std::format("Device is already {}", ToString(state_))));
        }
        if (descriptors_.empty()) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::NoService("No protocol has been added"));
        }

        connecting_ = true;
        std::set<ProtocolTag> seen;
        for (size_t index = 0; index < descriptors_.size(); ++index) {
            const ProtocolTag protocol = descriptors_[index].protocol;
            if (!seen.insert(protocol).second) {
                TVREMOTE_LOG_WARN("FACADE", std::format("Ignoring duplicate {} setup", interfaces::ToString(protocol)));
                continue;
            }
            if (descriptors_[index].set_device_listener) {
                descriptors_[index].set_device_listener(this);
            }

            auto connected = co_await descriptors_[index].connect();
            if (connected.IsErr()) {
                TVREMOTE_LOG_WARN("FACADE", std::format("{} failed to connect: {}",
                    interfaces::ToString(protocol), connected.UnwrapErr().Describe()));
                continue;
            }

            const auto& descriptor = descriptors_[index];
            auto registered = RegisterCapabilities(descriptor);
            if (registered.IsErr()) {
                connecting_ = false;
                co_return registered;
            }
            if (descriptor.device_info) {
                for (auto& [key, value] : descriptor.device_info()) {
                    device_info_.emplace(key, std::move(value));
                }
            }
            connected_.push_back(index);
            TVREMOTE_LOG_MSG("FACADE", std::format("{} connected", interfaces::ToString(protocol)));
        }

        BuildFeatureMap();
        connecting_ = false;
        state_ = FacadeState::Connected;
        co_return RemoteResult<Unit>::Ok(unit);
    }

    Result<Unit, RemoteFailure> DeviceFacade::RegisterCapabilities(const SetupDescriptor& descriptor) {
        const auto& capabilities = descriptor.capabilities;
        const ProtocolTag protocol = descriptor.protocol;
        if (capabilities.remote_control) {
            TVREMOTE_TRY(remote_control_relay_.Register(capabilities.remote_control, protocol));
        }
        if (capabilities.metadata) {
            TVREMOTE_TRY(metadata_relay_.Register(capabilities.metadata, protocol));
        }
        if (capabilities.power) {
            TVREMOTE_TRY(power_relay_.Register(capabilities.power, protocol));
            capabilities.power->SetListener(&power_);
        }
        if (capabilities.push_updater) {
            TVREMOTE_TRY(push_updater_relay_.Register(capabilities.push_updater, protocol));
        }
        if (capabilities.audio) {
            TVREMOTE_TRY(audio_relay_.Register(capabilities.audio, protocol));
        }
        if (capabilities.features) {
            TVREMOTE_TRY(features_relay_.Register(capabilities.features, protocol));
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    void DeviceFacade::BuildFeatureMap() {
        features_.ClearMapping();
        for (const auto protocol : interfaces::kDefaultPriorities) {
            for (const auto index : connected_) {
                const auto& descriptor = descriptors_[index];
                if (descriptor.protocol != protocol || !descriptor.capabilities.features) {
                    continue;
                }
                for (const auto feature : descriptor.features) {
                    features_.MapFeature(feature, protocol);
                }
            }
        }
    }

    PendingTasks DeviceFacade::Close() {
        if (pending_close_) {
            auto& pending = *pending_close_;
            pending.erase(std::remove_if(pending.begin(), pending.end(),
                [](const std::shared_ptr<AsyncEvent>& task) { return task->IsSet(); }), pending.end());
            return pending;
        }

        const bool was_connected = state_ == FacadeState::Connected;
        state_ = FacadeState::Closed;
        PendingTasks tasks;
        if (was_connected) {
            if (push_updater_relay_.Count() > 0) {
                if (auto stopped = push_updater_.Stop(); stopped.IsErr()) {
                    TVREMOTE_LOG_WARN("FACADE", "Stopping push updates failed: " + stopped.UnwrapErr().Describe());
                }
            }
            for (const auto index : connected_) {
                const auto& descriptor = descriptors_[index];
                if (!descriptor.close) {
                    continue;
                }
                for (auto& task : descriptor.close()) {
                    if (task && !task->IsSet()) {
                        tasks.push_back(std::move(task));
                    }
                }
            }
        }
        DetachBackends();
        for (auto* relay : {static_cast<RelayControl*>(&remote_control_relay_),
                            static_cast<RelayControl*>(&metadata_relay_),
                            static_cast<RelayControl*>(&power_relay_),
                            static_cast<RelayControl*>(&push_updater_relay_),
                            static_cast<RelayControl*>(&audio_relay_),
                            static_cast<RelayControl*>(&features_relay_)}) {
            relay->Clear();
        }
        features_.ClearMapping();
        device_info_.clear();
        pending_close_ = tasks;
        return tasks;
    }

    RelayControl& DeviceFacade::RelayFor(const CapabilityKind kind) {
        switch (kind) {
            case CapabilityKind::RemoteControl: return remote_control_relay_;
            case CapabilityKind::Metadata: return metadata_relay_;
            case CapabilityKind::Power: return power_relay_;
            case CapabilityKind::PushUpdater: return push_updater_relay_;
            case CapabilityKind::Audio: return audio_relay_;
            case CapabilityKind::Features: return features_relay_;
        }
        throw std::logic_error("Unknown capability kind");
    }

    Result<std::function<void()>, RemoteFailure> DeviceFacade::Takeover(
        const ProtocolTag protocol,
        const std::initializer_list<CapabilityKind> capabilities) {
        std::vector<RelayControl*> taken;
        for (const auto kind : capabilities) {
            RelayControl& relay = RelayFor(kind);
            auto result = relay.Takeover(protocol);
            if (result.IsErr()) {
                for (auto* done : taken) {
                    done->Release();
                }
                return std::move(result).Propagate();
            }
            taken.push_back(&relay);
        }
        TVREMOTE_LOG_MSG("FACADE", std::format("{} took over {} capabilities",
            interfaces::ToString(protocol), taken.size()));
        return Result<std::function<void()>, RemoteFailure>::Ok([taken = std::move(taken)]() {
            for (auto* relay : taken) {
                relay->Release();
            }
        });
    }

    std::vector<ProtocolTag> DeviceFacade::ConnectedProtocols() const {
        std::vector<ProtocolTag> protocols;
        protocols.reserve(connected_.size());
        for (const auto index : connected_) {
            protocols.push_back(descriptors_[index].protocol);
        }
        return protocols;
    }

    void DeviceFacade::OnConnectionLost(const RemoteFailure& failure) {
        if (lifecycle_reported_) {
            return;
        }
        lifecycle_reported_ = true;
        TVREMOTE_LOG_WARN("FACADE", "Connection lost: " + failure.Describe());
        listener_.Notify([&failure](interfaces::DeviceListener& listener) {
            listener.OnConnectionLost(failure);
        });
    }

    void DeviceFacade::OnConnectionClosed() {
        if (lifecycle_reported_) {
            return;
        }
        lifecycle_reported_ = true;
        listener_.Notify([](interfaces::DeviceListener& listener) {
            listener.OnConnectionClosed();
        });
    }

}
