#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace tvremote::auth {

enum class TlvTag : uint8_t {
    Method = 0x00,
    Identifier = 0x01,
    Salt = 0x02,
    PublicKey = 0x03,
    Proof = 0x04,
    EncryptedData = 0x05,
    SeqNo = 0x06,
    Error = 0x07,
    BackOff = 0x08,
    Certificate = 0x09,
    Signature = 0x0A,
    Permissions = 0x0B,
    FragmentData = 0x0C,
    FragmentLast = 0x0D,
    Name = 0x11,
    Flags = 0x13
};

enum class TlvErrorCode : uint8_t {
    Unknown = 0x01,
    Authentication = 0x02,
    BackOff = 0x03,
    MaxPeers = 0x04,
    MaxTries = 0x05,
    Unavailable = 0x06,
    Busy = 0x07
};

enum class PairingMethod : uint8_t {
    PairSetup = 0x00,
    PairSetupWithAuth = 0x01,
    PairVerify = 0x02,
    AddPairing = 0x03,
    RemovePairing = 0x04,
    ListPairing = 0x05
};

enum class PairingState : uint8_t {
    M1 = 0x01,
    M2 = 0x02,
    M3 = 0x03,
    M4 = 0x04,
    M5 = 0x05,
    M6 = 0x06
};

/**
 * @brief Ordered TLV8 container
 *
 * Entries are written in insertion order. Values longer than 255 bytes are
 * split into consecutive chunks with the same tag and joined again on read.
 */
class Tlv8 {
public:
    Tlv8() = default;

    Tlv8& Add(TlvTag tag, std::span<const uint8_t> value);
    Tlv8& Add(TlvTag tag, uint8_t value);
    Tlv8& Add(TlvTag tag, const std::string& value);

    [[nodiscard]] bool Contains(TlvTag tag) const;
    [[nodiscard]] const std::vector<uint8_t>* Find(TlvTag tag) const;

    /// Fails with Decode when the tag is absent.
    [[nodiscard]] Result<std::vector<uint8_t>, RemoteFailure> Require(TlvTag tag) const;

    [[nodiscard]] std::vector<uint8_t> Encode() const;
    [[nodiscard]] static Result<Tlv8, RemoteFailure> Decode(std::span<const uint8_t> data);

    /**
     * @brief Map an Error entry in a handshake reply to a failure
     *
     * BackOff errors carry the wait time from the BackOff tag; every other
     * code is an Authentication failure. Ok when no Error tag is present.
     */
    [[nodiscard]] Result<Unit, RemoteFailure> CheckError() const;

    [[nodiscard]] size_t Size() const noexcept { return order_.size(); }

private:
    std::vector<TlvTag> order_;
    std::map<TlvTag, std::vector<uint8_t>> values_;
};

[[nodiscard]] std::string_view ToString(TlvErrorCode code);

}  // namespace tvremote::auth
