#pragma once
#include "tvremote/core/async_result.hpp"
#include "tvremote/core/result.hpp"
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>

namespace tvremote::interfaces {

/**
 * @brief One pairing attempt against one device service
 *
 * Begin() asks the device to show a PIN, Pin() stores what the user typed
 * and Finish() completes the exchange. Every failure surfaced from Begin()
 * and Finish() is of type Pairing; its cause carries the underlying reason
 * (Authentication for a wrong PIN, BackOff when the device rate limits).
 */
class IPairingHandler {
public:
    virtual ~IPairingHandler() = default;

    virtual AsyncResult<Unit> Begin() = 0;
    virtual void Pin(std::string pin) = 0;
    virtual AsyncResult<Unit> Finish() = 0;
    [[nodiscard]] virtual bool HasPaired() const noexcept = 0;
    virtual boost::asio::awaitable<void> Close() = 0;

    /// Serialized credentials once HasPaired() is true.
    [[nodiscard]] virtual std::optional<std::string> Credentials() const = 0;
};

}  // namespace tvremote::interfaces
