#pragma once

#include "tvremote/core/result.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace tvremote::crypto {

struct Ed25519KeyPair {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> secret_key;
};

struct X25519KeyPair {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> private_key;
};

/**
 * @brief Interop layer for libsodium primitives used by the pairing protocols
 *
 * All methods require Initialize() to have succeeded once per process.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, RemoteFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Memory helpers
    // ========================================================================

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    [[nodiscard]] static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Key agreement (X25519)
    // ========================================================================

    [[nodiscard]] static X25519KeyPair GenerateX25519KeyPair();

    [[nodiscard]] static Result<std::vector<uint8_t>, RemoteFailure> ComputeX25519SharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Expand a 32-byte seed into an Ed25519 key pair
     *
     * The seed is what long-term credentials persist as the private key.
     */
    [[nodiscard]] static Result<Ed25519KeyPair, RemoteFailure> Ed25519FromSeed(
        std::span<const uint8_t> seed);

    [[nodiscard]] static Result<std::vector<uint8_t>, RemoteFailure> Ed25519Sign(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message);

    /**
     * @return Ok if the signature verifies, Authentication failure otherwise
     */
    [[nodiscard]] static Result<Unit, RemoteFailure> Ed25519Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

private:
    SodiumInterop() = delete;

    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;
};

}  // namespace tvremote::crypto
