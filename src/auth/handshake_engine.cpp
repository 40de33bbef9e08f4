#include "tvremote/auth/handshake_engine.hpp"
#include "tvremote/core/constants.hpp"
#include "tvremote/crypto/chacha20_poly1305.hpp"
#include "tvremote/crypto/hkdf.hpp"
#include "tvremote/crypto/nonce.hpp"
#include "tvremote/crypto/sodium_interop.hpp"
#include "tvremote/crypto/srp.hpp"
#include "tvremote/debug/log.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cctype>
#include <format>

namespace tvremote::auth {
    using crypto::ChaCha20Poly1305;
    using crypto::CounterNonce;
    using crypto::Hkdf;
    using crypto::SodiumInterop;
    using crypto::SrpClient;

    namespace {
        constexpr const char* kSetupLog = "PAIR-SETUP";
        constexpr const char* kVerifyLog = "PAIR-VERIFY";

        std::vector<uint8_t> Concat(std::initializer_list<std::span<const uint8_t>> parts) {
            std::vector<uint8_t> out;
            for (const auto part : parts) {
                out.insert(out.end(), part.begin(), part.end());
            }
            return out;
        }

        Result<std::vector<uint8_t>, RemoteFailure> Seal(
            std::span<const uint8_t> key,
            std::string_view nonce_label,
            std::span<const uint8_t> plaintext) {
            const auto nonce = CounterNonce::FromLabel(nonce_label);
            return ChaCha20Poly1305::Encrypt(key, nonce, plaintext);
        }

        Result<Tlv8, RemoteFailure> OpenTlv(
            std::span<const uint8_t> key,
            std::string_view nonce_label,
            std::span<const uint8_t> ciphertext) {
            const auto nonce = CounterNonce::FromLabel(nonce_label);
            auto plaintext = ChaCha20Poly1305::Decrypt(key, nonce, ciphertext);
            if (plaintext.IsErr()) {
                return Result<Tlv8, RemoteFailure>::Err(
                    RemoteFailure::Authentication(
                        std::format("Cannot open {} payload: {}", nonce_label,
                            plaintext.UnwrapErr().message)));
            }
            return Tlv8::Decode(plaintext.Unwrap());
        }

        Result<Unit, RemoteFailure> CheckSeqNo(const Tlv8& response, PairingState expected) {
            const auto* seqno = response.Find(TlvTag::SeqNo);
            if (seqno != nullptr && (seqno->size() != 1 ||
                                     (*seqno)[0] != static_cast<uint8_t>(expected))) {
                return Result<Unit, RemoteFailure>::Err(
                    RemoteFailure::Authentication(
                        std::format("Unexpected pairing state, expected M{}",
                            static_cast<unsigned>(expected))));
            }
            return Result<Unit, RemoteFailure>::Ok(unit);
        }
    }

    PairingIdentity PairingIdentity::Generate() {
        boost::uuids::random_generator generator;
        std::string id = boost::uuids::to_string(generator());
        std::transform(id.begin(), id.end(), id.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        PairingIdentity identity;
        identity.pairing_id.assign(id.begin(), id.end());
        identity.signing_seed = SodiumInterop::GetRandomBytes(kEd25519SeedBytes);
        return identity;
    }

    // ========================================================================
    // Pair-setup
    // ========================================================================

    struct PairSetupClient::State {
        PairSetupStage stage = PairSetupStage::Idle;
        PairingIdentity identity;
        crypto::Ed25519KeyPair signing_keys;
        std::unique_ptr<SrpClient> srp;
        std::vector<uint8_t> salt;
        std::vector<uint8_t> server_public;
        std::vector<uint8_t> encryption_key;
    };

    PairSetupClient::PairSetupClient() = default;

    PairSetupClient::~PairSetupClient() {
        if (state_) {
            SodiumInterop::SecureWipe(state_->identity.signing_seed);
            SodiumInterop::SecureWipe(state_->signing_keys.secret_key);
            SodiumInterop::SecureWipe(state_->encryption_key);
        }
    }

    Result<std::unique_ptr<PairSetupClient>, RemoteFailure> PairSetupClient::Create(
        PairingIdentity identity) {
        if (identity.pairing_id.empty()) {
            return Result<std::unique_ptr<PairSetupClient>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Pairing identifier cannot be empty"));
        }
        auto keys = SodiumInterop::Ed25519FromSeed(identity.signing_seed);
        if (keys.IsErr()) {
            return Result<std::unique_ptr<PairSetupClient>, RemoteFailure>::Err(
                std::move(keys).UnwrapErr());
        }
        auto srp = SrpClient::Create(identity.signing_seed);
        if (srp.IsErr()) {
            return Result<std::unique_ptr<PairSetupClient>, RemoteFailure>::Err(
                std::move(srp).UnwrapErr());
        }

        std::unique_ptr<PairSetupClient> client(new PairSetupClient());
        client->state_ = std::make_unique<State>();
        client->state_->identity = std::move(identity);
        client->state_->signing_keys = std::move(keys).Unwrap();
        client->state_->srp = std::move(srp).Unwrap();
        return Result<std::unique_ptr<PairSetupClient>, RemoteFailure>::Ok(std::move(client));
    }

    template<typename T>
    Result<T, RemoteFailure> PairSetupClient::Fail(RemoteFailure failure) {
        state_->stage = PairSetupStage::Failed;
        TVREMOTE_LOG_MSG(kSetupLog, failure.message);
        return Result<T, RemoteFailure>::Err(std::move(failure));
    }

    Result<Unit, RemoteFailure> PairSetupClient::Expect(
        const PairSetupStage stage,
        std::string_view step) const {
        if (state_->stage != stage) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidState(std::format("Pair-setup step '{}' called out of order", step)));
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<Tlv8, RemoteFailure> PairSetupClient::StartRequest() {
        TVREMOTE_TRY(Expect(PairSetupStage::Idle, "start"));
        TVREMOTE_LOG_SECTION(kSetupLog, "M1");
        Tlv8 request;
        request.Add(TlvTag::Method, static_cast<uint8_t>(PairingMethod::PairSetup))
               .Add(TlvTag::SeqNo, static_cast<uint8_t>(PairingState::M1));
        state_->stage = PairSetupStage::Started;
        return Result<Tlv8, RemoteFailure>::Ok(std::move(request));
    }

    Result<Unit, RemoteFailure> PairSetupClient::HandleStartResponse(const Tlv8& response) {
        TVREMOTE_TRY(Expect(PairSetupStage::Started, "start response"));
        if (auto error = response.CheckError(); error.IsErr()) {
            return Fail<Unit>(std::move(error).UnwrapErr());
        }
        if (auto seqno = CheckSeqNo(response, PairingState::M2); seqno.IsErr()) {
            return Fail<Unit>(std::move(seqno).UnwrapErr());
        }
        auto salt = response.Require(TlvTag::Salt);
        auto server_public = response.Require(TlvTag::PublicKey);
        if (salt.IsErr() || server_public.IsErr()) {
            return Fail<Unit>(RemoteFailure::Authentication("M2 lacks salt or public key"));
        }
        state_->salt = std::move(salt).Unwrap();
        state_->server_public = std::move(server_public).Unwrap();
        TVREMOTE_LOG_BYTES(kSetupLog, "salt", state_->salt);
        state_->stage = PairSetupStage::AwaitingPin;
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<Tlv8, RemoteFailure> PairSetupClient::ProofRequest(std::string_view pin) {
        TVREMOTE_TRY(Expect(PairSetupStage::AwaitingPin, "proof"));
        TVREMOTE_LOG_SECTION(kSetupLog, "M3");
        auto processed = state_->srp->Process(kSrpUsername, pin, state_->salt, state_->server_public);
        if (processed.IsErr()) {
            return Fail<Tlv8>(std::move(processed).UnwrapErr());
        }
        Tlv8 request;
        request.Add(TlvTag::SeqNo, static_cast<uint8_t>(PairingState::M3))
               .Add(TlvTag::PublicKey, state_->srp->PublicKey())
               .Add(TlvTag::Proof, state_->srp->Proof());
        state_->stage = PairSetupStage::ProofSent;
        return Result<Tlv8, RemoteFailure>::Ok(std::move(request));
    }

    Result<Unit, RemoteFailure> PairSetupClient::HandleProofResponse(const Tlv8& response) {
        TVREMOTE_TRY(Expect(PairSetupStage::ProofSent, "proof response"));
        if (auto error = response.CheckError(); error.IsErr()) {
            return Fail<Unit>(std::move(error).UnwrapErr());
        }
        const auto* proof = response.Find(TlvTag::Proof);
        if (proof == nullptr) {
            return Fail<Unit>(RemoteFailure::Authentication("M4 lacks server proof"));
        }
        if (auto verified = state_->srp->VerifyServerProof(*proof); verified.IsErr()) {
            return Fail<Unit>(std::move(verified).UnwrapErr());
        }
        TVREMOTE_LOG_BYTES(kSetupLog, "srp_session_key", state_->srp->SessionKey());
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<Tlv8, RemoteFailure> PairSetupClient::ExchangeRequest() {
        TVREMOTE_TRY(Expect(PairSetupStage::ProofSent, "exchange"));
        TVREMOTE_LOG_SECTION(kSetupLog, "M5");
        const auto& session_key = state_->srp->SessionKey();
        if (session_key.empty()) {
            return Fail<Tlv8>(RemoteFailure::InvalidState("Server proof has not been verified"));
        }

        auto device_x = Hkdf::DeriveKeyBytes(session_key, kSessionKeyBytes,
                                             kPairSetupSignSalt, kPairSetupSignInfo);
        auto encryption_key = Hkdf::DeriveKeyBytes(session_key, kSessionKeyBytes,
                                                   kPairSetupEncryptSalt, kPairSetupEncryptInfo);
        if (device_x.IsErr() || encryption_key.IsErr()) {
            return Fail<Tlv8>(RemoteFailure::Generic("Pair-setup key derivation failed"));
        }
        state_->encryption_key = std::move(encryption_key).Unwrap();

        const auto& keys = state_->signing_keys;
        const auto device_info = Concat({device_x.Unwrap(), state_->identity.pairing_id, keys.public_key});
        auto signature = SodiumInterop::Ed25519Sign(keys.secret_key, device_info);
        if (signature.IsErr()) {
            return Fail<Tlv8>(std::move(signature).UnwrapErr());
        }

        Tlv8 inner;
        inner.Add(TlvTag::Identifier, state_->identity.pairing_id)
             .Add(TlvTag::PublicKey, keys.public_key)
             .Add(TlvTag::Signature, signature.Unwrap());
        auto encrypted = Seal(state_->encryption_key, kPairSetupMsg05Nonce, inner.Encode());
        if (encrypted.IsErr()) {
            return Fail<Tlv8>(std::move(encrypted).UnwrapErr());
        }

        Tlv8 request;
        request.Add(TlvTag::SeqNo, static_cast<uint8_t>(PairingState::M5))
               .Add(TlvTag::EncryptedData, encrypted.Unwrap());
        state_->stage = PairSetupStage::ExchangeSent;
        return Result<Tlv8, RemoteFailure>::Ok(std::move(request));
    }

    Result<Credentials, RemoteFailure> PairSetupClient::HandleExchangeResponse(const Tlv8& response) {
        TVREMOTE_TRY(Expect(PairSetupStage::ExchangeSent, "exchange response"));
        if (auto error = response.CheckError(); error.IsErr()) {
            return Fail<Credentials>(std::move(error).UnwrapErr());
        }
        auto encrypted = response.Require(TlvTag::EncryptedData);
        if (encrypted.IsErr()) {
            return Fail<Credentials>(RemoteFailure::Authentication("M6 lacks encrypted data"));
        }
        auto inner = OpenTlv(state_->encryption_key, kPairSetupMsg06Nonce, encrypted.Unwrap());
        if (inner.IsErr()) {
            return Fail<Credentials>(std::move(inner).UnwrapErr());
        }
        auto device_id = inner.Unwrap().Require(TlvTag::Identifier);
        auto device_ltpk = inner.Unwrap().Require(TlvTag::PublicKey);
        auto device_signature = inner.Unwrap().Require(TlvTag::Signature);
        if (device_id.IsErr() || device_ltpk.IsErr() || device_signature.IsErr()) {
            return Fail<Credentials>(RemoteFailure::Authentication("M6 payload is incomplete"));
        }

        auto accessory_x = Hkdf::DeriveKeyBytes(state_->srp->SessionKey(), kSessionKeyBytes,
                                                kPairSetupAccessorySignSalt, kPairSetupAccessorySignInfo);
        if (accessory_x.IsErr()) {
            return Fail<Credentials>(std::move(accessory_x).UnwrapErr());
        }
        const auto accessory_info = Concat({accessory_x.Unwrap(), device_id.Unwrap(), device_ltpk.Unwrap()});
        if (auto verified = SodiumInterop::Ed25519Verify(device_ltpk.Unwrap(), accessory_info,
                                                         device_signature.Unwrap());
            verified.IsErr()) {
            return Fail<Credentials>(std::move(verified).UnwrapErr());
        }

        Credentials credentials;
        credentials.ltpk = std::move(device_ltpk).Unwrap();
        credentials.ltsk = state_->identity.signing_seed;
        credentials.device_id = std::move(device_id).Unwrap();
        credentials.client_id = state_->identity.pairing_id;
        state_->stage = PairSetupStage::Finished;
        TVREMOTE_LOG_MSG(kSetupLog, "pairing finished");
        return Result<Credentials, RemoteFailure>::Ok(std::move(credentials));
    }

    PairSetupStage PairSetupClient::Stage() const noexcept {
        return state_->stage;
    }

    // ========================================================================
    // Pair-verify
    // ========================================================================

    struct PairVerifyClient::State {
        PairVerifyStage stage = PairVerifyStage::Idle;
        Credentials credentials;
        crypto::Ed25519KeyPair signing_keys;
        crypto::X25519KeyPair ephemeral;
        std::vector<uint8_t> shared_secret;
    };

    PairVerifyClient::PairVerifyClient() = default;

    PairVerifyClient::~PairVerifyClient() {
        if (state_) {
            SodiumInterop::SecureWipe(state_->signing_keys.secret_key);
            SodiumInterop::SecureWipe(state_->ephemeral.private_key);
            SodiumInterop::SecureWipe(state_->shared_secret);
        }
    }

    Result<std::unique_ptr<PairVerifyClient>, RemoteFailure> PairVerifyClient::Create(
        Credentials credentials) {
        if (credentials.ltpk.size() != kEd25519PublicKeyBytes) {
            return Result<std::unique_ptr<PairVerifyClient>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Credentials carry a malformed device public key"));
        }
        auto keys = SodiumInterop::Ed25519FromSeed(credentials.ltsk);
        if (keys.IsErr()) {
            return Result<std::unique_ptr<PairVerifyClient>, RemoteFailure>::Err(
                std::move(keys).UnwrapErr());
        }
        std::unique_ptr<PairVerifyClient> client(new PairVerifyClient());
        client->state_ = std::make_unique<State>();
        client->state_->credentials = std::move(credentials);
        client->state_->signing_keys = std::move(keys).Unwrap();
        return Result<std::unique_ptr<PairVerifyClient>, RemoteFailure>::Ok(std::move(client));
    }

    template<typename T>
    Result<T, RemoteFailure> PairVerifyClient::Fail(RemoteFailure failure) {
        state_->stage = PairVerifyStage::Failed;
        TVREMOTE_LOG_MSG(kVerifyLog, failure.message);
        return Result<T, RemoteFailure>::Err(std::move(failure));
    }

    Result<Tlv8, RemoteFailure> PairVerifyClient::StartRequest() {
        if (state_->stage != PairVerifyStage::Idle) {
            return Result<Tlv8, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Pair-verify already started"));
        }
        TVREMOTE_LOG_SECTION(kVerifyLog, "M1");
        state_->ephemeral = SodiumInterop::GenerateX25519KeyPair();
        Tlv8 request;
        request.Add(TlvTag::SeqNo, static_cast<uint8_t>(PairingState::M1))
               .Add(TlvTag::PublicKey, state_->ephemeral.public_key);
        state_->stage = PairVerifyStage::Started;
        return Result<Tlv8, RemoteFailure>::Ok(std::move(request));
    }

    Result<Tlv8, RemoteFailure> PairVerifyClient::HandleStartResponse(const Tlv8& response) {
        if (state_->stage != PairVerifyStage::Started) {
            return Result<Tlv8, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Pair-verify response out of order"));
        }
        if (auto error = response.CheckError(); error.IsErr()) {
            return Fail<Tlv8>(std::move(error).UnwrapErr());
        }
        auto session_public = response.Require(TlvTag::PublicKey);
        auto encrypted = response.Require(TlvTag::EncryptedData);
        if (session_public.IsErr() || encrypted.IsErr()) {
            return Fail<Tlv8>(RemoteFailure::Authentication("M2 lacks public key or encrypted data"));
        }

        auto shared = SodiumInterop::ComputeX25519SharedSecret(state_->ephemeral.private_key,
                                                               session_public.Unwrap());
        if (shared.IsErr()) {
            return Fail<Tlv8>(std::move(shared).UnwrapErr());
        }
        state_->shared_secret = std::move(shared).Unwrap();
        TVREMOTE_LOG_BYTES(kVerifyLog, "shared_secret", state_->shared_secret);

        auto verify_key = Hkdf::DeriveKeyBytes(state_->shared_secret, kSessionKeyBytes,
                                               kPairVerifyEncryptSalt, kPairVerifyEncryptInfo);
        if (verify_key.IsErr()) {
            return Fail<Tlv8>(std::move(verify_key).UnwrapErr());
        }

        auto inner = OpenTlv(verify_key.Unwrap(), kPairVerifyMsg02Nonce, encrypted.Unwrap());
        if (inner.IsErr()) {
            return Fail<Tlv8>(std::move(inner).UnwrapErr());
        }
        auto identifier = inner.Unwrap().Require(TlvTag::Identifier);
        auto signature = inner.Unwrap().Require(TlvTag::Signature);
        if (identifier.IsErr() || signature.IsErr()) {
            return Fail<Tlv8>(RemoteFailure::Authentication("M2 payload is incomplete"));
        }
        if (identifier.Unwrap() != state_->credentials.device_id) {
            return Fail<Tlv8>(RemoteFailure::Authentication("Device identifier does not match credentials"));
        }

        const auto device_info = Concat({session_public.Unwrap(), identifier.Unwrap(),
                                         state_->ephemeral.public_key});
        if (auto verified = SodiumInterop::Ed25519Verify(state_->credentials.ltpk, device_info,
                                                         signature.Unwrap());
            verified.IsErr()) {
            return Fail<Tlv8>(std::move(verified).UnwrapErr());
        }

        TVREMOTE_LOG_SECTION(kVerifyLog, "M3");
        const auto our_info = Concat({state_->ephemeral.public_key, state_->credentials.client_id,
                                      session_public.Unwrap()});
        auto our_signature = SodiumInterop::Ed25519Sign(state_->signing_keys.secret_key, our_info);
        if (our_signature.IsErr()) {
            return Fail<Tlv8>(std::move(our_signature).UnwrapErr());
        }
        Tlv8 reply_inner;
        reply_inner.Add(TlvTag::Identifier, state_->credentials.client_id)
                   .Add(TlvTag::Signature, our_signature.Unwrap());
        auto sealed = Seal(verify_key.Unwrap(), kPairVerifyMsg03Nonce, reply_inner.Encode());
        if (sealed.IsErr()) {
            return Fail<Tlv8>(std::move(sealed).UnwrapErr());
        }

        Tlv8 request;
        request.Add(TlvTag::SeqNo, static_cast<uint8_t>(PairingState::M3))
               .Add(TlvTag::EncryptedData, sealed.Unwrap());
        state_->stage = PairVerifyStage::AwaitingConfirmation;
        return Result<Tlv8, RemoteFailure>::Ok(std::move(request));
    }

    Result<Unit, RemoteFailure> PairVerifyClient::HandleFinishResponse(const Tlv8& response) {
        if (state_->stage != PairVerifyStage::AwaitingConfirmation) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Pair-verify confirmation out of order"));
        }
        if (auto error = response.CheckError(); error.IsErr()) {
            return Fail<Unit>(std::move(error).UnwrapErr());
        }
        state_->stage = PairVerifyStage::Verified;
        TVREMOTE_LOG_MSG(kVerifyLog, "verified");
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<crypto::SessionKeys, RemoteFailure> PairVerifyClient::SessionKeys() const {
        if (state_->stage != PairVerifyStage::Verified) {
            return Result<crypto::SessionKeys, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Session keys requested before verification"));
        }
        auto write_key = Hkdf::DeriveKeyBytes(state_->shared_secret, kSessionKeyBytes,
                                              kSessionKeySalt, kSessionWriteKeyInfo);
        auto read_key = Hkdf::DeriveKeyBytes(state_->shared_secret, kSessionKeyBytes,
                                             kSessionKeySalt, kSessionReadKeyInfo);
        if (write_key.IsErr() || read_key.IsErr()) {
            return Result<crypto::SessionKeys, RemoteFailure>::Err(
                RemoteFailure::Generic("Session key derivation failed"));
        }
        TVREMOTE_LOG_BYTES(kVerifyLog, "write_key", write_key.Unwrap());
        TVREMOTE_LOG_BYTES(kVerifyLog, "read_key", read_key.Unwrap());
        return Result<crypto::SessionKeys, RemoteFailure>::Ok(
            crypto::SessionKeys{std::move(write_key).Unwrap(), std::move(read_key).Unwrap()});
    }

    PairVerifyStage PairVerifyClient::Stage() const noexcept {
        return state_->stage;
    }

}
