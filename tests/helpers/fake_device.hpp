#pragma once

#include <catch2/catch_test_macros.hpp>
#include "tvremote/auth/credentials.hpp"
#include "tvremote/auth/tlv8.hpp"
#include "tvremote/core/constants.hpp"
#include "tvremote/crypto/chacha20_poly1305.hpp"
#include "tvremote/crypto/hkdf.hpp"
#include "tvremote/crypto/nonce.hpp"
#include "tvremote/crypto/sodium_interop.hpp"
#include "tvremote/crypto/srp.hpp"
#include "tvremote/mrp/frame_transport.hpp"
#include "tvremote/mrp/messages.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tvremote::test_helpers {
    namespace pb = proto::mrp;

    struct FakeDeviceOptions {
        std::string pin = "1234";
        bool close_on_accept = false;
        bool answer_heartbeats = true;
        bool report_power_on_wake = true;
        std::optional<uint32_t> backoff_seconds;
        uint32_t logical_device_count = 1;
        std::optional<pb::SetStateMessage> initial_state;
        pb::SendCommandResultMessage::SendError command_error = pb::SendCommandResultMessage::NoError;
    };

    /**
     * Loopback accessory speaking the framed protobuf protocol.
     *
     * Answers the start sequence, runs the accessory side of pair-setup and
     * pair-verify, switches to encrypted frames after a successful verify
     * and records every message it receives. One client at a time; a new
     * connection replaces the previous one.
     */
    class FakeDevice final : public mrp::TransportListener {
    public:
        explicit FakeDevice(boost::asio::io_context& io, FakeDeviceOptions options = {})
            : io_(io)
            , options_(std::move(options))
            , acceptor_(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            device_id_ = ToBytes("FAKE-DEVICE-ID");
            auto keys = crypto::SodiumInterop::Ed25519FromSeed(
                crypto::SodiumInterop::GetRandomBytes(kEd25519SeedBytes));
            REQUIRE(keys.IsOk());
            signing_keys_ = std::move(keys).Unwrap();
            boost::asio::co_spawn(io_, AcceptLoop(), boost::asio::detached);
        }

        ~FakeDevice() override {
            DropClient();
            boost::system::error_code ignored;
            acceptor_.close(ignored);
        }

        FakeDevice(const FakeDevice&) = delete;
        FakeDevice& operator=(const FakeDevice&) = delete;

        [[nodiscard]] uint16_t Port() const { return acceptor_.local_endpoint().port(); }
        [[nodiscard]] const std::vector<uint8_t>& DeviceId() const { return device_id_; }
        [[nodiscard]] const std::vector<uint8_t>& PublicKey() const { return signing_keys_.public_key; }
        [[nodiscard]] FakeDeviceOptions& Options() { return options_; }
        [[nodiscard]] size_t Connections() const { return connections_; }
        [[nodiscard]] bool IsEncrypted() const { return transport_ && transport_->IsEncrypted(); }
        [[nodiscard]] bool HasClient() const { return transport_ && transport_->IsOpen(); }

        [[nodiscard]] const std::vector<pb::ProtocolMessage>& Received() const { return received_; }

        [[nodiscard]] size_t CountReceived(const pb::ProtocolMessage::Type type) const {
            return static_cast<size_t>(std::count_if(received_.begin(), received_.end(),
                [type](const pb::ProtocolMessage& m) { return m.type() == type; }));
        }

        [[nodiscard]] std::vector<pb::ProtocolMessage> ReceivedOfType(const pb::ProtocolMessage::Type type) const {
            std::vector<pb::ProtocolMessage> matching;
            for (const auto& message : received_) {
                if (message.type() == type) {
                    matching.push_back(message);
                }
            }
            return matching;
        }

        [[nodiscard]] bool HasPairing(const std::vector<uint8_t>& client_id) const {
            return paired_clients_.contains(client_id);
        }

        /// Credentials of a client this device already knows.
        auth::Credentials IssueCredentials(const std::string& client_id = "TEST-CLIENT-ID") {
            const auto seed = crypto::SodiumInterop::GetRandomBytes(kEd25519SeedBytes);
            auto client_keys = crypto::SodiumInterop::Ed25519FromSeed(seed);
            REQUIRE(client_keys.IsOk());
            auth::Credentials credentials;
            credentials.ltpk = signing_keys_.public_key;
            credentials.ltsk = seed;
            credentials.device_id = device_id_;
            credentials.client_id = ToBytes(client_id);
            paired_clients_[credentials.client_id] = client_keys.Unwrap().public_key;
            return credentials;
        }

        void Push(pb::ProtocolMessage message) {
            REQUIRE(transport_ != nullptr);
            CHECK(transport_->Send(message).IsOk());
        }

        void PushPlayerState(const pb::SetStateMessage& state) {
            auto message = mrp::messages::Create(pb::ProtocolMessage::SET_STATE_MESSAGE);
            *message.mutable_setstatemessage() = state;
            Push(std::move(message));
        }

        void PushLogicalDeviceCount(const uint32_t count) {
            options_.logical_device_count = count;
            auto message = DeviceInfoMessage();
            message.set_type(pb::ProtocolMessage::DEVICE_INFO_UPDATE_MESSAGE);
            Push(std::move(message));
        }

        void DropClient() {
            if (transport_) {
                transport_->ClearListener();
                transport_->Close();
                transport_.reset();
            }
        }

        void OnMessage(const pb::ProtocolMessage& message) override {
            received_.push_back(message);
            switch (message.type()) {
                case pb::ProtocolMessage::DEVICE_INFO_MESSAGE:
                    Reply(message, DeviceInfoMessage());
                    break;
                case pb::ProtocolMessage::CRYPTO_PAIRING_MESSAGE:
                    HandleCryptoPairing(message);
                    break;
                case pb::ProtocolMessage::CLIENT_UPDATES_CONFIG_MESSAGE:
                    Reply(message, mrp::messages::Create(pb::ProtocolMessage::CLIENT_UPDATES_CONFIG_MESSAGE));
                    break;
                case pb::ProtocolMessage::GET_KEYBOARD_SESSION_MESSAGE:
                    Reply(message, mrp::messages::Create(pb::ProtocolMessage::KEYBOARD_MESSAGE));
                    if (options_.initial_state) {
                        PushPlayerState(*options_.initial_state);
                    }
                    break;
                case pb::ProtocolMessage::GENERIC_MESSAGE:
                    if (options_.answer_heartbeats) {
                        Reply(message, mrp::messages::Create(pb::ProtocolMessage::GENERIC_MESSAGE));
                    }
                    break;
                case pb::ProtocolMessage::SEND_COMMAND_MESSAGE: {
                    auto result = mrp::messages::Create(pb::ProtocolMessage::SEND_COMMAND_RESULT_MESSAGE);
                    result.mutable_sendcommandresultmessage()->set_senderror(options_.command_error);
                    Reply(message, std::move(result));
                    break;
                }
                case pb::ProtocolMessage::WAKE_DEVICE_MESSAGE:
                    Reply(message, mrp::messages::Create(pb::ProtocolMessage::WAKE_DEVICE_MESSAGE));
                    if (options_.report_power_on_wake) {
                        PushLogicalDeviceCount(1);
                    }
                    break;
                default:
                    break;
            }
        }

        void OnConnectionLost(const RemoteFailure&) override {
            ResetPairingState();
        }

        void OnConnectionClosed() override {
            ResetPairingState();
        }

    private:
        static std::vector<uint8_t> ToBytes(const std::string& text) {
            return {text.begin(), text.end()};
        }

        static std::vector<uint8_t> Concat(std::initializer_list<std::span<const uint8_t>> parts) {
            std::vector<uint8_t> out;
            for (const auto part : parts) {
                out.insert(out.end(), part.begin(), part.end());
            }
            return out;
        }

        static std::vector<uint8_t> Derive(std::span<const uint8_t> secret,
                                           std::string_view salt, std::string_view info) {
            auto key = crypto::Hkdf::DeriveKeyBytes(secret, kSessionKeyBytes, salt, info);
            REQUIRE(key.IsOk());
            return std::move(key).Unwrap();
        }

        boost::asio::awaitable<void> AcceptLoop() {
            for (;;) {
                boost::system::error_code ec;
                auto socket = co_await acceptor_.async_accept(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec) {
                    co_return;
                }
                ++connections_;
                if (options_.close_on_accept) {
                    boost::system::error_code ignored;
                    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
                    socket.close(ignored);
                    continue;
                }
                DropClient();
                ResetPairingState();
                transport_ = mrp::FrameTransport::Create(io_, kDefaultMaxFrameBytes);
                transport_->SetListener(this);
                CHECK(transport_->Attach(std::move(socket)).IsOk());
            }
        }

        void ResetPairingState() {
            srp_.reset();
            verify_public_.clear();
            verify_private_.clear();
            client_verify_public_.clear();
            verify_shared_.clear();
        }

        pb::ProtocolMessage DeviceInfoMessage() const {
            auto message = mrp::messages::Create(pb::ProtocolMessage::DEVICE_INFO_MESSAGE);
            auto* info = message.mutable_deviceinfomessage();
            info->set_uniqueidentifier(std::string(device_id_.begin(), device_id_.end()));
            info->set_name("Fake TV");
            info->set_localizedmodelname("Apple TV");
            info->set_systembuildversion("17K449");
            info->set_modelid("AppleTV6,2");
            info->set_protocolversion(1);
            info->set_logicaldevicecount(options_.logical_device_count);
            return message;
        }

        void Reply(const pb::ProtocolMessage& request, pb::ProtocolMessage reply) {
            if (!request.identifier().empty() && request.type() != pb::ProtocolMessage::CRYPTO_PAIRING_MESSAGE) {
                reply.set_identifier(request.identifier());
            }
            if (transport_) {
                CHECK(transport_->Send(reply).IsOk());
            }
        }

        void ReplyPairing(const pb::ProtocolMessage& request, const auth::Tlv8& tlv) {
            Reply(request, mrp::messages::CryptoPairing(tlv));
        }

        static auth::Tlv8 ErrorTlv(const auth::PairingState state, const auth::TlvErrorCode code) {
            auth::Tlv8 tlv;
            tlv.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(state))
               .Add(auth::TlvTag::Error, static_cast<uint8_t>(code));
            return tlv;
        }

        void HandleCryptoPairing(const pb::ProtocolMessage& message) {
            auto decoded = mrp::messages::ReadPairingData(message);
            REQUIRE(decoded.IsOk());
            const auth::Tlv8& tlv = decoded.Unwrap();
            const auto* seqno = tlv.Find(auth::TlvTag::SeqNo);
            REQUIRE(seqno != nullptr);
            REQUIRE(seqno->size() == 1);
            switch (static_cast<auth::PairingState>((*seqno)[0])) {
                case auth::PairingState::M1:
                    if (tlv.Contains(auth::TlvTag::Method)) {
                        SetupStart(message);
                    } else {
                        VerifyStart(message, tlv);
                    }
                    break;
                case auth::PairingState::M3:
                    if (tlv.Contains(auth::TlvTag::Proof)) {
                        SetupProof(message, tlv);
                    } else {
                        VerifyFinish(message, tlv);
                    }
                    break;
                case auth::PairingState::M5:
                    SetupExchange(message, tlv);
                    break;
                default:
                    FAIL("Unexpected pairing state");
            }
        }

        void SetupStart(const pb::ProtocolMessage& request) {
            if (options_.backoff_seconds) {
                auto tlv = ErrorTlv(auth::PairingState::M2, auth::TlvErrorCode::BackOff);
                const uint32_t seconds = *options_.backoff_seconds;
                const std::vector<uint8_t> wait = {
                    static_cast<uint8_t>(seconds & 0xFF), static_cast<uint8_t>((seconds >> 8) & 0xFF)};
                tlv.Add(auth::TlvTag::BackOff, wait);
                ReplyPairing(request, tlv);
                return;
            }
            const auto salt = crypto::SodiumInterop::GetRandomBytes(kSrpSaltBytes);
            const auto secret = crypto::SodiumInterop::GetRandomBytes(32);
            auto server = crypto::SrpServer::Create(kSrpUsername, options_.pin, salt, secret);
            REQUIRE(server.IsOk());
            srp_ = std::move(server).Unwrap();

            auth::Tlv8 reply;
            reply.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(auth::PairingState::M2))
                 .Add(auth::TlvTag::Salt, srp_->Salt())
                 .Add(auth::TlvTag::PublicKey, srp_->PublicKey());
            ReplyPairing(request, reply);
        }

        void SetupProof(const pb::ProtocolMessage& request, const auth::Tlv8& tlv) {
            REQUIRE(srp_ != nullptr);
            auto client_public = tlv.Require(auth::TlvTag::PublicKey);
            auto client_proof = tlv.Require(auth::TlvTag::Proof);
            REQUIRE(client_public.IsOk());
            REQUIRE(client_proof.IsOk());
            REQUIRE(srp_->Process(client_public.Unwrap()).IsOk());
            auto server_proof = srp_->VerifyClientProof(client_proof.Unwrap());
            if (server_proof.IsErr()) {
                ReplyPairing(request, ErrorTlv(auth::PairingState::M4, auth::TlvErrorCode::Authentication));
                return;
            }
            auth::Tlv8 reply;
            reply.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(auth::PairingState::M4))
                 .Add(auth::TlvTag::Proof, server_proof.Unwrap());
            ReplyPairing(request, reply);
        }

        void SetupExchange(const pb::ProtocolMessage& request, const auth::Tlv8& tlv) {
            REQUIRE(srp_ != nullptr);
            const auto& session_key = srp_->SessionKey();
            const auto encryption_key = Derive(session_key, kPairSetupEncryptSalt, kPairSetupEncryptInfo);

            auto encrypted = tlv.Require(auth::TlvTag::EncryptedData);
            REQUIRE(encrypted.IsOk());
            auto plaintext = crypto::ChaCha20Poly1305::Decrypt(
                encryption_key, crypto::CounterNonce::FromLabel(kPairSetupMsg05Nonce), encrypted.Unwrap());
            REQUIRE(plaintext.IsOk());
            auto inner = auth::Tlv8::Decode(plaintext.Unwrap());
            REQUIRE(inner.IsOk());
            auto client_id = inner.Unwrap().Require(auth::TlvTag::Identifier);
            auto client_ltpk = inner.Unwrap().Require(auth::TlvTag::PublicKey);
            auto client_signature = inner.Unwrap().Require(auth::TlvTag::Signature);
            REQUIRE(client_id.IsOk());
            REQUIRE(client_ltpk.IsOk());
            REQUIRE(client_signature.IsOk());

            const auto client_x = Derive(session_key, kPairSetupSignSalt, kPairSetupSignInfo);
            const auto client_info = Concat({client_x, client_id.Unwrap(), client_ltpk.Unwrap()});
            if (crypto::SodiumInterop::Ed25519Verify(client_ltpk.Unwrap(), client_info,
                                                     client_signature.Unwrap()).IsErr()) {
                ReplyPairing(request, ErrorTlv(auth::PairingState::M6, auth::TlvErrorCode::Authentication));
                return;
            }
            paired_clients_[client_id.Unwrap()] = client_ltpk.Unwrap();

            const auto accessory_x = Derive(session_key, kPairSetupAccessorySignSalt, kPairSetupAccessorySignInfo);
            const auto accessory_info = Concat({accessory_x, device_id_, signing_keys_.public_key});
            auto signature = crypto::SodiumInterop::Ed25519Sign(signing_keys_.secret_key, accessory_info);
            REQUIRE(signature.IsOk());
            auth::Tlv8 reply_inner;
            reply_inner.Add(auth::TlvTag::Identifier, device_id_)
                       .Add(auth::TlvTag::PublicKey, signing_keys_.public_key)
                       .Add(auth::TlvTag::Signature, signature.Unwrap());
            auto sealed = crypto::ChaCha20Poly1305::Encrypt(
                encryption_key, crypto::CounterNonce::FromLabel(kPairSetupMsg06Nonce), reply_inner.Encode());
            REQUIRE(sealed.IsOk());

            auth::Tlv8 reply;
            reply.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(auth::PairingState::M6))
                 .Add(auth::TlvTag::EncryptedData, sealed.Unwrap());
            ReplyPairing(request, reply);
            srp_.reset();
        }

        void VerifyStart(const pb::ProtocolMessage& request, const auth::Tlv8& tlv) {
            auto client_public = tlv.Require(auth::TlvTag::PublicKey);
            REQUIRE(client_public.IsOk());
            client_verify_public_ = std::move(client_public).Unwrap();

            auto ephemeral = crypto::SodiumInterop::GenerateX25519KeyPair();
            verify_public_ = ephemeral.public_key;
            verify_private_ = ephemeral.private_key;
            auto shared = crypto::SodiumInterop::ComputeX25519SharedSecret(verify_private_, client_verify_public_);
            REQUIRE(shared.IsOk());
            verify_shared_ = std::move(shared).Unwrap();

            const auto device_info = Concat({verify_public_, device_id_, client_verify_public_});
            auto signature = crypto::SodiumInterop::Ed25519Sign(signing_keys_.secret_key, device_info);
            REQUIRE(signature.IsOk());
            auth::Tlv8 inner;
            inner.Add(auth::TlvTag::Identifier, device_id_)
                 .Add(auth::TlvTag::Signature, signature.Unwrap());
            const auto key = Derive(verify_shared_, kPairVerifyEncryptSalt, kPairVerifyEncryptInfo);
            auto sealed = crypto::ChaCha20Poly1305::Encrypt(
                key, crypto::CounterNonce::FromLabel(kPairVerifyMsg02Nonce), inner.Encode());
            REQUIRE(sealed.IsOk());

            auth::Tlv8 reply;
            reply.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(auth::PairingState::M2))
                 .Add(auth::TlvTag::PublicKey, verify_public_)
                 .Add(auth::TlvTag::EncryptedData, sealed.Unwrap());
            ReplyPairing(request, reply);
        }

        void VerifyFinish(const pb::ProtocolMessage& request, const auth::Tlv8& tlv) {
            REQUIRE_FALSE(verify_shared_.empty());
            const auto key = Derive(verify_shared_, kPairVerifyEncryptSalt, kPairVerifyEncryptInfo);
            auto encrypted = tlv.Require(auth::TlvTag::EncryptedData);
            REQUIRE(encrypted.IsOk());
            auto plaintext = crypto::ChaCha20Poly1305::Decrypt(
                key, crypto::CounterNonce::FromLabel(kPairVerifyMsg03Nonce), encrypted.Unwrap());
            REQUIRE(plaintext.IsOk());
            auto inner = auth::Tlv8::Decode(plaintext.Unwrap());
            REQUIRE(inner.IsOk());
            auto client_id = inner.Unwrap().Require(auth::TlvTag::Identifier);
            auto signature = inner.Unwrap().Require(auth::TlvTag::Signature);
            REQUIRE(client_id.IsOk());
            REQUIRE(signature.IsOk());

            const auto known = paired_clients_.find(client_id.Unwrap());
            const auto client_info = Concat({client_verify_public_, client_id.Unwrap(), verify_public_});
            if (known == paired_clients_.end() ||
                crypto::SodiumInterop::Ed25519Verify(known->second, client_info, signature.Unwrap()).IsErr()) {
                ReplyPairing(request, ErrorTlv(auth::PairingState::M4, auth::TlvErrorCode::Authentication));
                return;
            }

            auth::Tlv8 reply;
            reply.Add(auth::TlvTag::SeqNo, static_cast<uint8_t>(auth::PairingState::M4));
            ReplyPairing(request, reply);

            // Our write direction is the client's read direction.
            crypto::SessionKeys keys;
            keys.write_key = Derive(verify_shared_, kSessionKeySalt, kSessionReadKeyInfo);
            keys.read_key = Derive(verify_shared_, kSessionKeySalt, kSessionWriteKeyInfo);
            CHECK(transport_->EnableEncryption(std::move(keys)).IsOk());
        }

        boost::asio::io_context& io_;
        FakeDeviceOptions options_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::shared_ptr<mrp::FrameTransport> transport_;
        std::vector<uint8_t> device_id_;
        crypto::Ed25519KeyPair signing_keys_;
        std::map<std::vector<uint8_t>, std::vector<uint8_t>> paired_clients_;
        std::unique_ptr<crypto::SrpServer> srp_;
        std::vector<uint8_t> verify_public_;
        std::vector<uint8_t> verify_private_;
        std::vector<uint8_t> client_verify_public_;
        std::vector<uint8_t> verify_shared_;
        std::vector<pb::ProtocolMessage> received_;
        size_t connections_ = 0;
    };
}
