#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/interfaces/protocol_tag.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tvremote::facade {

/// Takeover control shared by every relay regardless of capability type.
class RelayControl {
public:
    virtual ~RelayControl() = default;
    [[nodiscard]] virtual Result<Unit, RemoteFailure> Takeover(interfaces::ProtocolTag protocol) = 0;
    virtual void Release() noexcept = 0;
    /// Drop every registration and any takeover.
    virtual void Clear() noexcept = 0;
    [[nodiscard]] virtual std::optional<interfaces::ProtocolTag> TakeoverProtocol() const noexcept = 0;
};

/**
 * @brief Routes calls on one capability to the best registered backend
 *
 * Backends are ranked by a fixed protocol priority list. A method resolves
 * to the first backend, in that order, that declared an override for it.
 * While a takeover is active the takeover protocol ranks first.
 *
 * The override table of each backend is captured at registration.
 *
 * @tparam Capability interface type exposing a static kMethods table
 */
template<typename Capability>
class CapabilityRelay final : public RelayControl {
public:
    explicit CapabilityRelay(std::span<const interfaces::ProtocolTag> priorities)
        : priorities_(priorities.begin(), priorities.end()) {}

    /// @return InvalidInput if @p protocol is not in the priority list
    [[nodiscard]] Result<Unit, RemoteFailure> Register(
        std::shared_ptr<Capability> instance,
        const interfaces::ProtocolTag protocol) {
        if (std::find(priorities_.begin(), priorities_.end(), protocol) == priorities_.end()) {
            return Result<Unit, RemoteFailure>::Err(RemoteFailure::InvalidInput(
                std::format("Protocol {} is not in the priority list", interfaces::ToString(protocol))));
        }
        Registration registration;
        for (const auto method : instance->Methods()) {
            registration.overrides.emplace(std::string(method), instance->Overrides(method));
        }
        registration.instance = std::move(instance);
        registrations_.insert_or_assign(protocol, std::move(registration));
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    /**
     * @brief Backend that answers @p method right now
     * @param priority replaces the configured order when not empty
     * @throws std::runtime_error if @p method is not part of the capability
     *         or a registered backend does not know it
     */
    [[nodiscard]] Result<std::shared_ptr<Capability>, RemoteFailure> Resolve(
        const std::string_view method,
        std::span<const interfaces::ProtocolTag> priority = {}) const {
        if (std::find(Capability::kMethods.begin(), Capability::kMethods.end(), method)
            == Capability::kMethods.end()) {
            throw std::runtime_error(std::format("No method named '{}' on this capability", method));
        }
        for (const auto protocol : Ordered(priority)) {
            const auto it = registrations_.find(protocol);
            if (it == registrations_.end()) {
                continue;
            }
            const auto entry = it->second.overrides.find(method);
            if (entry == it->second.overrides.end()) {
                throw std::runtime_error(std::format(
                    "Backend {} does not define '{}'", interfaces::ToString(protocol), method));
            }
            if (entry->second) {
                return Result<std::shared_ptr<Capability>, RemoteFailure>::Ok(it->second.instance);
            }
        }
        return Result<std::shared_ptr<Capability>, RemoteFailure>::Err(
            RemoteFailure::NotSupported(std::format("{} is not supported", method)));
    }

    [[nodiscard]] Result<Unit, RemoteFailure> Takeover(const interfaces::ProtocolTag protocol) override {
        if (takeover_) {
            return Result<Unit, RemoteFailure>::Err(RemoteFailure::InvalidState(std::format(
                "{} has already taken over", interfaces::ToString(*takeover_))));
        }
        takeover_ = protocol;
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    void Release() noexcept override { takeover_.reset(); }

    [[nodiscard]] std::optional<interfaces::ProtocolTag> TakeoverProtocol() const noexcept override {
        return takeover_;
    }

    [[nodiscard]] Result<std::shared_ptr<Capability>, RemoteFailure> MainInstance() const {
        auto protocol = MainProtocol();
        if (protocol.IsErr()) {
            return std::move(protocol).Propagate();
        }
        return Result<std::shared_ptr<Capability>, RemoteFailure>::Ok(
            registrations_.at(protocol.Unwrap()).instance);
    }

    [[nodiscard]] Result<interfaces::ProtocolTag, RemoteFailure> MainProtocol() const {
        for (const auto protocol : Ordered({})) {
            if (registrations_.contains(protocol)) {
                return Result<interfaces::ProtocolTag, RemoteFailure>::Ok(protocol);
            }
        }
        return Result<interfaces::ProtocolTag, RemoteFailure>::Err(
            RemoteFailure::NotSupported("No backend is registered"));
    }

    [[nodiscard]] std::shared_ptr<Capability> Get(const interfaces::ProtocolTag protocol) const {
        const auto it = registrations_.find(protocol);
        return it == registrations_.end() ? nullptr : it->second.instance;
    }

    /// Registered instances in priority order.
    [[nodiscard]] std::vector<std::shared_ptr<Capability>> Instances() const {
        std::vector<std::shared_ptr<Capability>> instances;
        for (const auto protocol : priorities_) {
            if (const auto it = registrations_.find(protocol); it != registrations_.end()) {
                instances.push_back(it->second.instance);
            }
        }
        return instances;
    }

    [[nodiscard]] size_t Count() const noexcept { return registrations_.size(); }
    [[nodiscard]] std::span<const interfaces::ProtocolTag> Priorities() const noexcept { return priorities_; }

    void Clear() noexcept override {
        registrations_.clear();
        takeover_.reset();
    }

private:
    struct Registration {
        std::shared_ptr<Capability> instance;
        std::map<std::string, bool, std::less<>> overrides;
    };

    [[nodiscard]] std::vector<interfaces::ProtocolTag> Ordered(
        std::span<const interfaces::ProtocolTag> priority) const {
        const auto base = priority.empty()
            ? std::span<const interfaces::ProtocolTag>(priorities_)
            : priority;
        std::vector<interfaces::ProtocolTag> ordered;
        ordered.reserve(base.size() + 1);
        if (takeover_) {
            ordered.push_back(*takeover_);
        }
        for (const auto protocol : base) {
            if (!takeover_ || protocol != *takeover_) {
                ordered.push_back(protocol);
            }
        }
        return ordered;
    }

    std::vector<interfaces::ProtocolTag> priorities_;
    std::map<interfaces::ProtocolTag, Registration> registrations_;
    std::optional<interfaces::ProtocolTag> takeover_;
};

}  // namespace tvremote::facade
