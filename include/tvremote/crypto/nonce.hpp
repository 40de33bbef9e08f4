#pragma once
#include "tvremote/core/constants.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include <array>
#include <cstdint>
#include <string_view>

namespace tvremote::crypto {

using Nonce = std::array<uint8_t, kChaChaNonceBytes>;

/// Per-direction nonce: four zero bytes followed by a little-endian counter.
class CounterNonce {
public:
    CounterNonce() = default;

    [[nodiscard]] Result<Nonce, RemoteFailure> Next();

    [[nodiscard]] uint64_t Counter() const noexcept { return counter_; }

    /// Left-pads a short ASCII label ("PS-Msg05") with zeros to nonce size.
    [[nodiscard]] static Nonce FromLabel(std::string_view label);

private:
    uint64_t counter_ = 0;
    bool exhausted_ = false;
};

}  // namespace tvremote::crypto
