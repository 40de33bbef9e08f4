#include "tvremote/mrp/correlation_engine.hpp"
#include "tvremote/debug/log.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cctype>
#include <format>

namespace tvremote::mrp {

using proto::mrp::ProtocolMessage;

    CorrelationEngine::CorrelationEngine(Sender sender)
        : sender_(std::move(sender)) {
    }

    CorrelationEngine::ListenerToken CorrelationEngine::RegisterListener(
        const MessageType type,
        MessageCallback callback,
        const bool one_shot) {
        const ListenerToken token = next_token_++;
        listeners_.push_back(Listener{token, type, std::move(callback), one_shot});
        return token;
    }

    bool CorrelationEngine::RemoveListener(const ListenerToken token) {
        const auto it = std::find_if(listeners_.begin(), listeners_.end(),
            [token](const Listener& listener) { return listener.token == token; });
        if (it == listeners_.end()) {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    Result<Unit, RemoteFailure> CorrelationEngine::Send(const ProtocolMessage& message) {
        return sender_(message);
    }

    AsyncResult<ProtocolMessage> CorrelationEngine::SendAndReceive(
        ProtocolMessage message,
        const std::chrono::milliseconds timeout) {
        std::string key;
        if (IsCorrelatedByType(message.type())) {
            key = CorrelationKey(message);
        } else {
            if (message.identifier().empty()) {
                message.set_identifier(NewIdentifier());
            }
            key = message.identifier();
        }
        if (pending_.contains(key)) {
            co_return RemoteResult<ProtocolMessage>::Err(RemoteFailure::InvalidState(
                std::format("A request keyed {} is already outstanding", key)));
        }

        auto pending = std::make_shared<PendingRequest>();
        pending_.emplace(key, pending);

        auto sent = sender_(message);
        if (sent.IsErr()) {
            pending_.erase(key);
            co_return std::move(sent).Propagate();
        }

        const bool completed = co_await pending->completed->Wait(timeout);

        const auto it = pending_.find(key);
        if (it != pending_.end() && it->second == pending) {
            pending_.erase(it);
        }
        if (pending->failure) {
            co_return RemoteResult<ProtocolMessage>::Err(std::move(*pending->failure));
        }
        if (!completed || !pending->response) {
            co_return RemoteResult<ProtocolMessage>::Err(RemoteFailure::Timeout(
                std::format("No response to {} within {} ms",
                    ProtocolMessage::Type_Name(message.type()), timeout.count())));
        }
        co_return RemoteResult<ProtocolMessage>::Ok(std::move(*pending->response));
    }

    void CorrelationEngine::Dispatch(const ProtocolMessage& message) {
        const auto it = pending_.find(CorrelationKey(message));
        if (it != pending_.end()) {
            auto pending = it->second;
            pending_.erase(it);
            pending->response = message;
            pending->completed->Set();
            return;
        }
        DispatchToListeners(message);
    }

    void CorrelationEngine::DispatchToListeners(const ProtocolMessage& message) {
        std::vector<Listener> persistent;
        std::vector<Listener> one_shot;
        for (auto it = listeners_.begin(); it != listeners_.end();) {
            if (it->type != message.type()) {
                ++it;
                continue;
            }
            if (it->one_shot) {
                one_shot.push_back(std::move(*it));
                it = listeners_.erase(it);
            } else {
                persistent.push_back(*it);
                ++it;
            }
        }
        if (persistent.empty() && one_shot.empty()) {
            TVREMOTE_LOG_MSG("CORRELATION", "Dropping unhandled " + ProtocolMessage::Type_Name(message.type()));
            return;
        }

        const auto invoke = [&message](const Listener& listener) {
            try {
                listener.callback(message);
            } catch (const std::exception& ex) {
                TVREMOTE_LOG_WARN("CORRELATION", std::format("Listener for {} failed: {}",
                    ProtocolMessage::Type_Name(message.type()), ex.what()));
            }
        };
        for (const auto& listener : persistent) {
            invoke(listener);
        }
        for (const auto& listener : one_shot) {
            invoke(listener);
        }
    }

    void CorrelationEngine::CancelAll(const RemoteFailure& failure) {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& [key, request] : pending) {
            request->failure = failure;
            request->completed->Set();
        }
    }

    void CorrelationEngine::ClearListeners() {
        listeners_.clear();
    }

    size_t CorrelationEngine::ListenerCount(const MessageType type) const {
        return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
            [type](const Listener& listener) { return listener.type == type; }));
    }

    std::string CorrelationEngine::CorrelationKey(const ProtocolMessage& message) {
        if (!message.identifier().empty()) {
            return message.identifier();
        }
        return "type_" + std::to_string(static_cast<int>(message.type()));
    }

    std::string CorrelationEngine::NewIdentifier() {
        static thread_local boost::uuids::random_generator generator;
        std::string identifier = boost::uuids::to_string(generator());
        std::transform(identifier.begin(), identifier.end(), identifier.begin(),
            [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return identifier;
    }

    bool CorrelationEngine::IsCorrelatedByType(const MessageType type) noexcept {
        return type == ProtocolMessage::CRYPTO_PAIRING_MESSAGE;
    }

}
