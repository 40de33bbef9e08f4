#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tvremote::auth {

/**
 * @brief Long-lived pairing output
 *
 * - ltpk: the device's long-term Ed25519 public key
 * - ltsk: our long-term Ed25519 seed
 * - device_id: identifier the device announced during pair-setup
 * - client_id: our pairing identifier
 *
 * Serialized as four colon-separated hex fields in that order.
 */
struct Credentials {
    std::vector<uint8_t> ltpk;
    std::vector<uint8_t> ltsk;
    std::vector<uint8_t> device_id;
    std::vector<uint8_t> client_id;

    [[nodiscard]] static Result<Credentials, RemoteFailure> Parse(std::string_view text);
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Credentials&) const = default;
};

}  // namespace tvremote::auth
