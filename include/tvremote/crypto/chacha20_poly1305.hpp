#pragma once
#include "tvremote/core/result.hpp"
#include "tvremote/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace tvremote::crypto {

/**
 * ChaCha20-Poly1305 (IETF, 96-bit nonce) authenticated encryption.
 *
 * Stateless primitive; the 16-byte tag is appended to the ciphertext.
 * Nonce discipline belongs to the caller: SymmetricChannel for session
 * traffic, fixed message labels for the single-use handshake keys.
 */
class ChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, RemoteFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, RemoteFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    ChaCha20Poly1305() = delete;
};
}
