#pragma once
#include "tvremote/configuration/device_config.hpp"
#include "tvremote/configuration/session_config.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/facade/setup_descriptor.hpp"
#include "mrp/protocol_message.pb.h"
#include <boost/asio/io_context.hpp>
#include <map>
#include <string>

namespace tvremote::mrp {

/**
 * @brief Setup descriptor for the protobuf remote-control service of @p device
 *
 * Stored credentials in @p service are parsed up front; a malformed string
 * fails here with InvalidInput rather than at connect time.
 */
[[nodiscard]] RemoteResult<facade::SetupDescriptor> CreateSetup(
    boost::asio::io_context& io_context,
    const configuration::DeviceConfig& device,
    const configuration::ServiceInfo& service,
    const configuration::SessionConfig& config);

/// Device details reported in the device-info reply of a session.
[[nodiscard]] std::map<std::string, std::string> DeviceInfoFields(const proto::mrp::ProtocolMessage& message);

}  // namespace tvremote::mrp
