#pragma once

#include "tvremote/core/result.hpp"
#include "tvremote/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tvremote::crypto {

/**
 * @brief HKDF (RFC 5869) over SHA-512
 *
 * Every key in the pairing and session protocols is derived with a fixed
 * ASCII salt and info pair, so the string overload is the common entry point.
 */
class Hkdf {
public:
    /**
     * @brief Derive key using HKDF-SHA512
     *
     * @param ikm Input key material (SRP session key or X25519 shared secret)
     * @param output Output buffer to fill with derived key
     * @param salt Optional salt (can be empty for no salt)
     * @param info Optional context/application-specific info
     */
    static Result<Unit, RemoteFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, RemoteFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::string_view salt,
        std::string_view info);

    static constexpr size_t HASH_LEN = 64;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace tvremote::crypto
