#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/debug/log.hpp"
#include "tvremote/interfaces/playing.hpp"
#include <exception>

namespace tvremote::interfaces {

class PushUpdater;

class DeviceListener {
public:
    virtual ~DeviceListener() = default;
    /// Connection dropped without Close() being called.
    virtual void OnConnectionLost(const RemoteFailure& failure) = 0;
    virtual void OnConnectionClosed() = 0;
};

class PushListener {
public:
    virtual ~PushListener() = default;
    virtual void OnPlaystatusUpdate(PushUpdater& updater, const PlayingInfo& playing) = 0;
    virtual void OnPlaystatusError(PushUpdater& updater, const RemoteFailure& failure) = 0;
};

class PowerListener {
public:
    virtual ~PowerListener() = default;
    virtual void OnPowerStateUpdate(PowerState old_state, PowerState new_state) = 0;
};

/**
 * @brief Optional, non-owning listener handle
 *
 * The owner of the listener calls ClearListener() before the listener is
 * destroyed. Notify() logs and drops exceptions thrown by the listener so
 * one misbehaving subscriber cannot break the caller's loop.
 */
template<typename Listener>
class ListenerSlot {
public:
    void SetListener(Listener* listener) noexcept { listener_ = listener; }
    void ClearListener() noexcept { listener_ = nullptr; }
    [[nodiscard]] Listener* GetListener() const noexcept { return listener_; }
    [[nodiscard]] bool HasListener() const noexcept { return listener_ != nullptr; }

    template<typename F>
    void Notify(F&& callback) const {
        if (listener_ == nullptr) {
            return;
        }
        try {
            callback(*listener_);
        } catch (const std::exception& ex) {
            TVREMOTE_LOG_WARN("LISTENER", std::string("Listener callback failed: ") + ex.what());
        }
    }

private:
    Listener* listener_ = nullptr;
};

}  // namespace tvremote::interfaces
