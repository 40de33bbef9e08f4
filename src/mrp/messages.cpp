#include "tvremote/mrp/messages.hpp"
#include <array>

namespace tvremote::mrp::messages {

namespace pb = proto::mrp;

namespace {

    // Mach absolute time placeholder followed by the fixed event header the
    // device expects in front of the usage page, usage and button state.
    constexpr std::array<uint8_t, 43> kHidEventPrefix = {
        0x43, 0x89, 0x22, 0xcf, 0x08, 0x02, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x02, 0x00, 0x00, 0x00, 0x20, 0x00, 0x00, 0x00,
        0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00};

    constexpr std::array<uint8_t, 11> kHidEventSuffix = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
        0x00, 0x00, 0x00};

    void AppendBigEndian16(std::string& out, const uint16_t value) {
        out.push_back(static_cast<char>((value >> 8) & 0xFF));
        out.push_back(static_cast<char>(value & 0xFF));
    }

}

    ProtocolMessage Create(const ProtocolMessage::Type type) {
        ProtocolMessage message;
        message.set_type(type);
        message.set_errorcode(0);
        return message;
    }

    ProtocolMessage DeviceInformation(
        const configuration::ClientIdentity& identity,
        const std::string& pairing_id) {
        auto message = Create(ProtocolMessage::DEVICE_INFO_MESSAGE);
        auto* info = message.mutable_deviceinfomessage();
        info->set_allowspairing(true);
        info->set_applicationbundleidentifier(identity.bundle_identifier);
        info->set_applicationbundleversion(identity.bundle_version);
        info->set_lastsupportedmessagetype(identity.last_supported_message_type);
        info->set_localizedmodelname(identity.localized_model_name);
        info->set_name(identity.name);
        info->set_protocolversion(identity.protocol_version);
        info->set_sharedqueueversion(identity.shared_queue_version);
        info->set_supportsacl(true);
        info->set_supportsextendedmotion(true);
        info->set_supportssharedqueue(true);
        info->set_supportssystempairing(true);
        info->set_systembuildversion(identity.system_build_version);
        info->set_systemmediaapplication(identity.media_application);
        info->set_uniqueidentifier(pairing_id);
        info->set_deviceclass(pb::DeviceInfoMessage::iPhone);
        info->set_logicaldevicecount(1);
        return message;
    }

    ProtocolMessage CryptoPairing(const auth::Tlv8& tlv, const bool is_pairing) {
        auto message = Create(ProtocolMessage::CRYPTO_PAIRING_MESSAGE);
        auto* crypto = message.mutable_cryptopairingmessage();
        const auto encoded = tlv.Encode();
        crypto->set_status(0);
        crypto->set_pairingdata(std::string(encoded.begin(), encoded.end()));
        crypto->set_isretrying(false);
        crypto->set_isusingsystempairing(false);
        crypto->set_state(is_pairing ? 2 : 0);
        return message;
    }

    ProtocolMessage SetConnectionState() {
        auto message = Create(ProtocolMessage::SET_CONNECTION_STATE_MESSAGE);
        message.mutable_setconnectionstatemessage()->set_state(pb::SetConnectionStateMessage::Connected);
        return message;
    }

    ProtocolMessage ClientUpdatesConfig(
        const bool artwork,
        const bool now_playing,
        const bool volume,
        const bool keyboard,
        const bool output_device) {
        auto message = Create(ProtocolMessage::CLIENT_UPDATES_CONFIG_MESSAGE);
        auto* config = message.mutable_clientupdatesconfigmessage();
        config->set_artworkupdates(artwork);
        config->set_nowplayingupdates(now_playing);
        config->set_volumeupdates(volume);
        config->set_keyboardupdates(keyboard);
        config->set_outputdeviceupdates(output_device);
        return message;
    }

    ProtocolMessage GetKeyboardSession() {
        auto message = Create(ProtocolMessage::GET_KEYBOARD_SESSION_MESSAGE);
        message.mutable_getkeyboardsessionmessage();
        return message;
    }

    ProtocolMessage SendHidEvent(const uint16_t usage_page, const uint16_t usage, const bool down) {
        auto message = Create(ProtocolMessage::SEND_HID_EVENT_MESSAGE);
        std::string data(kHidEventPrefix.begin(), kHidEventPrefix.end());
        AppendBigEndian16(data, usage_page);
        AppendBigEndian16(data, usage);
        AppendBigEndian16(data, down ? 1 : 0);
        data.append(kHidEventSuffix.begin(), kHidEventSuffix.end());
        message.mutable_sendhideventmessage()->set_hideventdata(std::move(data));
        return message;
    }

    ProtocolMessage Command(const pb::Command command, std::optional<pb::CommandOptions> options) {
        auto message = Create(ProtocolMessage::SEND_COMMAND_MESSAGE);
        auto* send_command = message.mutable_sendcommandmessage();
        send_command->set_command(command);
        if (options) {
            *send_command->mutable_options() = std::move(*options);
        }
        return message;
    }

    ProtocolMessage WakeDevice() {
        auto message = Create(ProtocolMessage::WAKE_DEVICE_MESSAGE);
        message.mutable_wakedevicemessage();
        return message;
    }

    ProtocolMessage Generic(std::string key) {
        auto message = Create(ProtocolMessage::GENERIC_MESSAGE);
        if (!key.empty()) {
            message.mutable_genericmessage()->set_key(std::move(key));
        }
        return message;
    }

    Result<auth::Tlv8, RemoteFailure> ReadPairingData(const ProtocolMessage& message) {
        if (!message.has_cryptopairingmessage()) {
            return Result<auth::Tlv8, RemoteFailure>::Err(
                RemoteFailure::Decode("Reply carries no pairing data"));
        }
        const auto& data = message.cryptopairingmessage().pairingdata();
        return auth::Tlv8::Decode(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    }

}
