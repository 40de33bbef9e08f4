#pragma once
#include "tvremote/core/async_event.hpp"
#include "tvremote/core/async_result.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "mrp/protocol_message.pb.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tvremote::mrp {

using MessageType = proto::mrp::ProtocolMessage::Type;
using MessageCallback = std::function<void(const proto::mrp::ProtocolMessage&)>;

/**
 * @brief Matches responses to outstanding requests and fans out the rest
 *
 * Requests are keyed by their identifier. Crypto pairing messages carry no
 * identifier and are keyed by a synthetic `type_<N>` instead, so only one
 * such request can be outstanding at a time.
 *
 * An incoming message first completes the pending request with the same
 * key. Otherwise it goes to persistent listeners for its type, then to
 * one-shot listeners (which are removed before they run). Messages nobody
 * asked for are dropped.
 */
class CorrelationEngine {
public:
    using ListenerToken = uint64_t;
    using Sender = std::function<Result<Unit, RemoteFailure>(const proto::mrp::ProtocolMessage&)>;

    explicit CorrelationEngine(Sender sender);

    ListenerToken RegisterListener(MessageType type, MessageCallback callback, bool one_shot = false);
    bool RemoveListener(ListenerToken token);

    [[nodiscard]] Result<Unit, RemoteFailure> Send(const proto::mrp::ProtocolMessage& message);

    /**
     * @brief Send @p message and suspend until its response arrives
     *
     * Assigns a fresh identifier unless the message is correlated by type.
     * On timeout the pending entry is removed before the error is returned.
     */
    AsyncResult<proto::mrp::ProtocolMessage> SendAndReceive(
        proto::mrp::ProtocolMessage message,
        std::chrono::milliseconds timeout);

    void Dispatch(const proto::mrp::ProtocolMessage& message);

    /// Listener fan-out only, bypassing the pending table.
    void DispatchToListeners(const proto::mrp::ProtocolMessage& message);

    /// Resolves every waiting request with @p failure.
    void CancelAll(const RemoteFailure& failure);

    void ClearListeners();

    [[nodiscard]] size_t PendingCount() const noexcept { return pending_.size(); }
    [[nodiscard]] size_t ListenerCount(MessageType type) const;

    [[nodiscard]] static std::string CorrelationKey(const proto::mrp::ProtocolMessage& message);
    [[nodiscard]] static std::string NewIdentifier();
    [[nodiscard]] static bool IsCorrelatedByType(MessageType type) noexcept;

    CorrelationEngine(const CorrelationEngine&) = delete;
    CorrelationEngine& operator=(const CorrelationEngine&) = delete;

private:
    struct PendingRequest {
        std::shared_ptr<AsyncEvent> completed = std::make_shared<AsyncEvent>();
        std::optional<proto::mrp::ProtocolMessage> response;
        std::optional<RemoteFailure> failure;
    };

    struct Listener {
        ListenerToken token;
        MessageType type;
        MessageCallback callback;
        bool one_shot;
    };

    Sender sender_;
    std::map<std::string, std::shared_ptr<PendingRequest>> pending_;
    std::vector<Listener> listeners_;
    ListenerToken next_token_ = 1;
};

}  // namespace tvremote::mrp
