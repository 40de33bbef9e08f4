#pragma once

#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace tvremote::crypto {

/**
 * @brief SRP-6a client over the RFC 5054 3072-bit group (g = 5) with SHA-512
 *
 * Conventions:
 * - k = H(N | PAD(g)), u = H(PAD(A) | PAD(B)), x = H(s | H(I ":" P))
 * - K = H(S), M1 = H(H(N) ^ H(g) | H(I) | s | A | B | K), M2 = H(A | M1 | K)
 *
 * The private exponent is supplied by the caller; pair-setup derives it from
 * the long-term signing seed.
 */
class SrpClient {
public:
    [[nodiscard]] static Result<std::unique_ptr<SrpClient>, RemoteFailure> Create(
        std::span<const uint8_t> private_value);

    /**
     * @brief Combine server salt and public value with the password
     *
     * Fails with Authentication when B mod N is zero.
     */
    [[nodiscard]] Result<Unit, RemoteFailure> Process(
        std::string_view username,
        std::string_view password,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> server_public);

    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const;
    [[nodiscard]] const std::vector<uint8_t>& Proof() const;
    [[nodiscard]] const std::vector<uint8_t>& SessionKey() const;

    [[nodiscard]] Result<Unit, RemoteFailure> VerifyServerProof(
        std::span<const uint8_t> server_proof) const;

    SrpClient(const SrpClient&) = delete;
    SrpClient& operator=(const SrpClient&) = delete;
    ~SrpClient();

private:
    SrpClient();

    struct State;
    std::unique_ptr<State> state_;
};

/**
 * @brief Verifier side of the same exchange
 *
 * Used by accessory emulators; holds the password verifier v = g^x.
 */
class SrpServer {
public:
    [[nodiscard]] static Result<std::unique_ptr<SrpServer>, RemoteFailure> Create(
        std::string_view username,
        std::string_view password,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> private_value);

    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const;
    [[nodiscard]] const std::vector<uint8_t>& Salt() const;

    [[nodiscard]] Result<Unit, RemoteFailure> Process(std::span<const uint8_t> client_public);

    /// @return M2 when the client proof matches, Authentication failure otherwise
    [[nodiscard]] Result<std::vector<uint8_t>, RemoteFailure> VerifyClientProof(
        std::span<const uint8_t> client_proof) const;

    [[nodiscard]] const std::vector<uint8_t>& SessionKey() const;

    SrpServer(const SrpServer&) = delete;
    SrpServer& operator=(const SrpServer&) = delete;
    ~SrpServer();

private:
    SrpServer();

    struct State;
    std::unique_ptr<State> state_;
};

}  // namespace tvremote::crypto
