#pragma once
#include "tvremote/auth/tlv8.hpp"
#include "tvremote/configuration/session_config.hpp"
#include "mrp/protocol_message.pb.h"
#include <cstdint>
#include <optional>
#include <string>

namespace tvremote::mrp::messages {

using proto::mrp::ProtocolMessage;

/// Empty payload of @p type. Requests get their identifier from the session.
[[nodiscard]] ProtocolMessage Create(ProtocolMessage::Type type);

/// @param pairing_id announced as the unique identifier of this client
[[nodiscard]] ProtocolMessage DeviceInformation(
    const configuration::ClientIdentity& identity,
    const std::string& pairing_id);

/// @param is_pairing true while running pair-setup, false for pair-verify
[[nodiscard]] ProtocolMessage CryptoPairing(const auth::Tlv8& tlv, bool is_pairing = false);

[[nodiscard]] ProtocolMessage SetConnectionState();

[[nodiscard]] ProtocolMessage ClientUpdatesConfig(
    bool artwork = true,
    bool now_playing = false,
    bool volume = true,
    bool keyboard = true,
    bool output_device = true);

[[nodiscard]] ProtocolMessage GetKeyboardSession();

[[nodiscard]] ProtocolMessage SendHidEvent(uint16_t usage_page, uint16_t usage, bool down);

[[nodiscard]] ProtocolMessage Command(
    proto::mrp::Command command,
    std::optional<proto::mrp::CommandOptions> options = std::nullopt);

[[nodiscard]] ProtocolMessage WakeDevice();

[[nodiscard]] ProtocolMessage Generic(std::string key = {});

/// Pairing data carried by a crypto pairing reply, decoded.
[[nodiscard]] Result<auth::Tlv8, RemoteFailure> ReadPairingData(const ProtocolMessage& message);

}  // namespace tvremote::mrp::messages
