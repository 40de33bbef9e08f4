#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace tvremote::codec {

/**
 * @brief Protobuf-style base-128 varint used as the frame length prefix
 *
 * Each byte carries seven data bits, least significant group first. The
 * high bit is set on every byte except the last.
 */
class VariantCodec {
public:
    struct Decoded {
        uint64_t value = 0;
        std::span<const uint8_t> remaining;
    };

    [[nodiscard]] static std::vector<uint8_t> Encode(uint64_t value);

    static void EncodeTo(uint64_t value, std::vector<uint8_t>& out);

    /**
     * @brief Decode a varint from the start of @p data
     *
     * Fails with MalformedLength when the input ends before a terminating
     * byte, or when the value does not fit in 64 bits.
     */
    [[nodiscard]] static Result<Decoded, RemoteFailure> Decode(std::span<const uint8_t> data);

    [[nodiscard]] static size_t EncodedSize(uint64_t value) noexcept;

private:
    VariantCodec() = delete;
};

}  // namespace tvremote::codec
