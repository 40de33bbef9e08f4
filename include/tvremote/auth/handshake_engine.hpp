#pragma once
#include "tvremote/auth/credentials.hpp"
#include "tvremote/auth/tlv8.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/crypto/symmetric_channel.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tvremote::auth {

/// Our side of a pairing: stable identifier plus long-term signing seed.
struct PairingIdentity {
    std::vector<uint8_t> pairing_id;
    std::vector<uint8_t> signing_seed;

    /// Random upper-case UUID identifier and fresh Ed25519 seed.
    [[nodiscard]] static PairingIdentity Generate();
};

enum class PairSetupStage {
    Idle,
    Started,
    AwaitingPin,
    ProofSent,
    ExchangeSent,
    Finished,
    Failed
};

/**
 * @brief Client side of SRP pair-setup (M1 through M6)
 *
 * Transport-agnostic: each step returns the TLV to send or consumes the TLV
 * the device answered with. Any failed step moves the engine to Failed and
 * it cannot be reused.
 */
class PairSetupClient {
public:
    [[nodiscard]] static Result<std::unique_ptr<PairSetupClient>, RemoteFailure> Create(
        PairingIdentity identity);

    /// M1: method and sequence markers.
    [[nodiscard]] Result<Tlv8, RemoteFailure> StartRequest();

    /// M2: stores salt and server public key.
    [[nodiscard]] Result<Unit, RemoteFailure> HandleStartResponse(const Tlv8& response);

    /// M3: client public key and proof derived from @p pin.
    [[nodiscard]] Result<Tlv8, RemoteFailure> ProofRequest(std::string_view pin);

    /// M4: verifies the server proof.
    [[nodiscard]] Result<Unit, RemoteFailure> HandleProofResponse(const Tlv8& response);

    /// M5: our identifier and long-term public key, signed and encrypted.
    [[nodiscard]] Result<Tlv8, RemoteFailure> ExchangeRequest();

    /// M6: the device's identifier and long-term public key.
    [[nodiscard]] Result<Credentials, RemoteFailure> HandleExchangeResponse(const Tlv8& response);

    [[nodiscard]] PairSetupStage Stage() const noexcept;

    PairSetupClient(const PairSetupClient&) = delete;
    PairSetupClient& operator=(const PairSetupClient&) = delete;
    ~PairSetupClient();

private:
    PairSetupClient();

    template<typename T>
    Result<T, RemoteFailure> Fail(RemoteFailure failure);
    Result<Unit, RemoteFailure> Expect(PairSetupStage stage, std::string_view step) const;

    struct State;
    std::unique_ptr<State> state_;
};

enum class PairVerifyStage {
    Idle,
    Started,
    AwaitingConfirmation,
    Verified,
    Failed
};

/**
 * @brief Client side of pair-verify using stored credentials
 *
 * Produces the two directional session keys once the device accepted our
 * signed identity.
 */
class PairVerifyClient {
public:
    [[nodiscard]] static Result<std::unique_ptr<PairVerifyClient>, RemoteFailure> Create(
        Credentials credentials);

    /// M1: ephemeral X25519 public key.
    [[nodiscard]] Result<Tlv8, RemoteFailure> StartRequest();

    /// M2 in, M3 out: checks the device signature and signs our reply.
    [[nodiscard]] Result<Tlv8, RemoteFailure> HandleStartResponse(const Tlv8& response);

    /// M4: device acknowledgement.
    [[nodiscard]] Result<Unit, RemoteFailure> HandleFinishResponse(const Tlv8& response);

    [[nodiscard]] Result<crypto::SessionKeys, RemoteFailure> SessionKeys() const;

    [[nodiscard]] PairVerifyStage Stage() const noexcept;

    PairVerifyClient(const PairVerifyClient&) = delete;
    PairVerifyClient& operator=(const PairVerifyClient&) = delete;
    ~PairVerifyClient();

private:
    PairVerifyClient();

    template<typename T>
    Result<T, RemoteFailure> Fail(RemoteFailure failure);

    struct State;
    std::unique_ptr<State> state_;
};

}  // namespace tvremote::auth
