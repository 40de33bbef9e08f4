#include "tvremote/crypto/sodium_interop.hpp"

#include <format>

namespace tvremote::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, RemoteFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Generic("libsodium initialization failed"));
    }

    return Result<Unit, RemoteFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Memory helpers
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

// ============================================================================
// Key agreement (X25519)
// ============================================================================

X25519KeyPair SodiumInterop::GenerateX25519KeyPair() {
    X25519KeyPair pair;
    pair.private_key = GetRandomBytes(kX25519PrivateKeyBytes);
    pair.public_key.resize(kX25519PublicKeyBytes);
    crypto_scalarmult_base(pair.public_key.data(), pair.private_key.data());
    return pair;
}

Result<std::vector<uint8_t>, RemoteFailure> SodiumInterop::ComputeX25519SharedSecret(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> peer_public_key) {
    if (private_key.size() != kX25519PrivateKeyBytes ||
        peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::InvalidInput(
                std::format("Invalid X25519 key size: private {}, public {}",
                    private_key.size(), peer_public_key.size())));
    }
    std::vector<uint8_t> shared(kX25519SharedSecretBytes);
    if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data()) != 0) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::Authentication("X25519 produced a degenerate shared secret"));
    }
    return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(shared));
}

// ============================================================================
// Signatures (Ed25519)
// ============================================================================

Result<Ed25519KeyPair, RemoteFailure> SodiumInterop::Ed25519FromSeed(
    std::span<const uint8_t> seed) {
    if (seed.size() != kEd25519SeedBytes) {
        return Result<Ed25519KeyPair, RemoteFailure>::Err(
            RemoteFailure::InvalidInput(
                std::format("Ed25519 seed must be {} bytes, got {}", kEd25519SeedBytes, seed.size())));
    }
    Ed25519KeyPair pair;
    pair.public_key.resize(kEd25519PublicKeyBytes);
    pair.secret_key.resize(kEd25519SecretKeyBytes);
    if (crypto_sign_seed_keypair(pair.public_key.data(), pair.secret_key.data(), seed.data()) != 0) {
        return Result<Ed25519KeyPair, RemoteFailure>::Err(
            RemoteFailure::Generic("Ed25519 key expansion failed"));
    }
    return Result<Ed25519KeyPair, RemoteFailure>::Ok(std::move(pair));
}

Result<std::vector<uint8_t>, RemoteFailure> SodiumInterop::Ed25519Sign(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> message) {
    if (secret_key.size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            RemoteFailure::InvalidInput(
                std::format("Ed25519 secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, secret_key.size())));
    }
    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(), secret_key.data());
    return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(signature));
}

Result<Unit, RemoteFailure> SodiumInterop::Ed25519Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Authentication("Malformed Ed25519 key or signature"));
    }
    if (crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                    public_key.data()) != 0) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Authentication("Ed25519 signature mismatch"));
    }
    return Result<Unit, RemoteFailure>::Ok(unit);
}

}  // namespace tvremote::crypto
