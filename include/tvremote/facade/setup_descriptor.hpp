#pragma once
#include "tvremote/core/async_event.hpp"
#include "tvremote/core/async_result.hpp"
#include "tvremote/interfaces/capabilities.hpp"
#include "tvremote/interfaces/features.hpp"
#include "tvremote/interfaces/listeners.hpp"
#include "tvremote/interfaces/protocol_tag.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tvremote::facade {

/// One optional instance per capability kind offered by a backend.
struct CapabilitySet {
    std::shared_ptr<interfaces::RemoteControl> remote_control;
    std::shared_ptr<interfaces::Metadata> metadata;
    std::shared_ptr<interfaces::Power> power;
    std::shared_ptr<interfaces::PushUpdater> push_updater;
    std::shared_ptr<interfaces::Audio> audio;
    std::shared_ptr<interfaces::Features> features;
};

/// Cleanup still running after close; each event is set when its task ends.
using PendingTasks = std::vector<std::shared_ptr<AsyncEvent>>;

/**
 * @brief Everything the facade needs to drive one backend
 *
 * Built by a backend's setup function. `connect` is awaited once by the
 * facade; `close` must be safe to call when connect failed or never ran.
 * `device_info` is read after a successful connect.
 */
struct SetupDescriptor {
    interfaces::ProtocolTag protocol = interfaces::ProtocolTag::Mrp;
    std::function<AsyncResult<Unit>()> connect;
    std::function<PendingTasks()> close;
    std::function<std::map<std::string, std::string>()> device_info;
    std::function<void(interfaces::DeviceListener*)> set_device_listener;
    CapabilitySet capabilities;
    std::set<interfaces::FeatureName> features;
};

}  // namespace tvremote::facade
