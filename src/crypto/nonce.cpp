#include "tvremote/crypto/nonce.hpp"
#include <algorithm>
#include <limits>

namespace tvremote::crypto {

    namespace {
        static_assert(kNoncePrefixBytes + kNonceCounterBytes == kChaChaNonceBytes,
                      "Nonce layout must match ChaCha20-Poly1305 IETF nonce size");
    }

    Result<Nonce, RemoteFailure> CounterNonce::Next() {
        if (exhausted_) {
            return Result<Nonce, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Nonce counter overflow - reconnect to rekey"));
        }

        Nonce nonce{};
        for (size_t i = 0; i < kNonceCounterBytes; ++i) {
            nonce[kNoncePrefixBytes + i] = static_cast<uint8_t>((counter_ >> (i * 8)) & 0xFF);
        }

        if (counter_ == std::numeric_limits<uint64_t>::max()) {
            exhausted_ = true;
        } else {
            counter_ += 1;
        }
        return Result<Nonce, RemoteFailure>::Ok(nonce);
    }

    Nonce CounterNonce::FromLabel(std::string_view label) {
        Nonce nonce{};
        const size_t length = std::min(label.size(), nonce.size());
        std::copy_n(label.begin(), length, nonce.end() - static_cast<std::ptrdiff_t>(length));
        return nonce;
    }

}
