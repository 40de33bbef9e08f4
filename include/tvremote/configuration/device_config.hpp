#pragma once

#include "tvremote/interfaces/protocol_tag.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tvremote::configuration {

/// One protocol endpoint offered by a device, as found by discovery.
struct ServiceInfo {
    interfaces::ProtocolTag protocol = interfaces::ProtocolTag::Mrp;
    uint16_t port = 0;
    std::map<std::string, std::string> properties{};
    /// Serialized credentials from an earlier pairing, empty if unpaired.
    std::string credentials{};
};

struct DeviceConfig {
    std::string address;
    std::string name;
    std::string identifier;
    std::vector<ServiceInfo> services{};

    [[nodiscard]] const ServiceInfo* GetService(const interfaces::ProtocolTag protocol) const {
        for (const auto& service : services) {
            if (service.protocol == protocol) {
                return &service;
            }
        }
        return nullptr;
    }

    [[nodiscard]] ServiceInfo* GetService(const interfaces::ProtocolTag protocol) {
        for (auto& service : services) {
            if (service.protocol == protocol) {
                return &service;
            }
        }
        return nullptr;
    }
};

}  // namespace tvremote::configuration
