#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/crypto/nonce.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tvremote::crypto {

/// Directional keys produced by pair-verify for one connection.
struct SessionKeys {
    std::vector<uint8_t> write_key;
    std::vector<uint8_t> read_key;
};

/**
 * @brief Session-scoped AEAD channel with independent send and receive counters
 *
 * Each direction starts at nonce counter 0 and advances by one per frame.
 * There is no rekeying: a channel lives exactly as long as one connection.
 */
class SymmetricChannel {
public:
    [[nodiscard]] static Result<std::unique_ptr<SymmetricChannel>, RemoteFailure> Create(
        SessionKeys keys);

    [[nodiscard]] Result<std::vector<uint8_t>, RemoteFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    /**
     * @brief Decrypt the next inbound frame
     *
     * The receive counter advances only when the tag verifies, so a failed
     * frame leaves the channel state untouched (the caller drops the
     * connection anyway).
     */
    [[nodiscard]] Result<std::vector<uint8_t>, RemoteFailure> Decrypt(
        std::span<const uint8_t> ciphertext);

    [[nodiscard]] uint64_t SendCounter() const noexcept { return send_nonce_.Counter(); }
    [[nodiscard]] uint64_t ReceiveCounter() const noexcept { return receive_nonce_.Counter(); }

    SymmetricChannel(const SymmetricChannel&) = delete;
    SymmetricChannel& operator=(const SymmetricChannel&) = delete;
    ~SymmetricChannel();

private:
    explicit SymmetricChannel(SessionKeys keys);

    SessionKeys keys_;
    CounterNonce send_nonce_;
    CounterNonce receive_nonce_;
};

}  // namespace tvremote::crypto
