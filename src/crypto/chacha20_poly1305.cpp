#include "tvremote/crypto/chacha20_poly1305.hpp"
#include "tvremote/core/constants.hpp"
#include <sodium.h>
#include <format>
namespace tvremote::crypto {
namespace {
    Result<Unit, RemoteFailure> CheckSizes(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kChaChaKeyBytes) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput(
                    std::format("ChaCha20-Poly1305 key must be {} bytes, got {}",
                        kChaChaKeyBytes, key.size())));
        }
        if (nonce.size() != kChaChaNonceBytes) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput(
                    std::format("ChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        kChaChaNonceBytes, nonce.size())));
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, RemoteFailure>
ChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    TVREMOTE_TRY(CheckSizes(key, nonce));
    std::vector<uint8_t> output(plaintext.size() + kChaChaTagBytes);
    unsigned long long written = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            output.data(), &written,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nullptr, nonce.data(), key.data()) != 0) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::Generic("ChaCha20-Poly1305 encryption failed"));
    }
    output.resize(static_cast<size_t>(written));
    return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, RemoteFailure>
ChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    TVREMOTE_TRY(CheckSizes(key, nonce));
    if (ciphertext_with_tag.size() < kChaChaTagBytes) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::Decryption(
                std::format("Ciphertext shorter than tag: {} bytes", ciphertext_with_tag.size())));
    }
    std::vector<uint8_t> output(ciphertext_with_tag.size() - kChaChaTagBytes);
    unsigned long long written = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            output.data(), &written,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nonce.data(), key.data()) != 0) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::Decryption("Authentication tag mismatch"));
    }
    output.resize(static_cast<size_t>(written));
    return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(output));
}
}
