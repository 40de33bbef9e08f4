#include "tvremote/crypto/symmetric_channel.hpp"
#include "tvremote/crypto/chacha20_poly1305.hpp"
#include "tvremote/crypto/sodium_interop.hpp"

namespace tvremote::crypto {

    SymmetricChannel::SymmetricChannel(SessionKeys keys)
        : keys_(std::move(keys)) {
    }

    SymmetricChannel::~SymmetricChannel() {
        SodiumInterop::SecureWipe(keys_.write_key);
        SodiumInterop::SecureWipe(keys_.read_key);
    }

    Result<std::unique_ptr<SymmetricChannel>, RemoteFailure> SymmetricChannel::Create(
        SessionKeys keys) {
        if (keys.write_key.size() != kSessionKeyBytes || keys.read_key.size() != kSessionKeyBytes) {
            return Result<std::unique_ptr<SymmetricChannel>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Session keys must be 32 bytes each"));
        }
        if (SodiumInterop::ConstantTimeEquals(keys.write_key, keys.read_key)) {
            return Result<std::unique_ptr<SymmetricChannel>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Write and read keys must differ"));
        }
        return Result<std::unique_ptr<SymmetricChannel>, RemoteFailure>::Ok(
            std::unique_ptr<SymmetricChannel>(new SymmetricChannel(std::move(keys))));
    }

    Result<std::vector<uint8_t>, RemoteFailure> SymmetricChannel::Encrypt(
        std::span<const uint8_t> plaintext) {
        auto nonce = send_nonce_.Next();
        if (nonce.IsErr()) {
            return Result<std::vector<uint8_t>, RemoteFailure>::Err(std::move(nonce).UnwrapErr());
        }
        return ChaCha20Poly1305::Encrypt(keys_.write_key, nonce.Unwrap(), plaintext);
    }

    Result<std::vector<uint8_t>, RemoteFailure> SymmetricChannel::Decrypt(
        std::span<const uint8_t> ciphertext) {
        CounterNonce candidate = receive_nonce_;
        auto nonce = candidate.Next();
        if (nonce.IsErr()) {
            return Result<std::vector<uint8_t>, RemoteFailure>::Err(std::move(nonce).UnwrapErr());
        }
        auto plaintext = ChaCha20Poly1305::Decrypt(keys_.read_key, nonce.Unwrap(), ciphertext);
        if (plaintext.IsOk()) {
            receive_nonce_ = candidate;
        }
        return plaintext;
    }

}
