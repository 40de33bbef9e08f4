#pragma once
#include "tvremote/auth/credentials.hpp"
#include "tvremote/auth/handshake_engine.hpp"
#include "tvremote/configuration/session_config.hpp"
#include "tvremote/core/async_result.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/crypto/symmetric_channel.hpp"
#include "tvremote/interfaces/listeners.hpp"
#include "tvremote/mrp/correlation_engine.hpp"
#include "tvremote/mrp/frame_transport.hpp"
#include "mrp/protocol_message.pb.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tvremote::mrp {

enum class SessionState {
    NotStarted,
    Connecting,
    Connected,
    Verifying,
    Ready,
    Stopped,
    Failed
};

std::string_view ToString(SessionState state);

/**
 * @brief One protobuf remote-control connection to a device
 *
 * Start() connects, announces this client with DEVICE_INFO, runs
 * pair-verify when credentials are present, switches the transport to
 * encrypted frames and subscribes to updates. After that the session is
 * Ready and callers may exchange messages.
 *
 * A session is single use: once stopped or failed, create a new one.
 */
class ProtocolSession : public TransportListener,
                        public std::enable_shared_from_this<ProtocolSession> {
public:
    [[nodiscard]] static std::shared_ptr<ProtocolSession> Create(
        boost::asio::io_context& io_context,
        std::string host,
        uint16_t port,
        configuration::SessionConfig config,
        std::optional<auth::Credentials> credentials = std::nullopt);

    /**
     * @param skip_initial_messages stop after the device-info exchange,
     *        leaving the session Connected; used while pairing
     */
    AsyncResult<Unit> Start(bool skip_initial_messages = false);

    /// Idempotent. Pending requests resolve with Cancelled.
    void Stop();

    /// InvalidState until Start() completes, except on a session started
    /// with skip_initial_messages.
    [[nodiscard]] Result<Unit, RemoteFailure> Send(const proto::mrp::ProtocolMessage& message);

    AsyncResult<proto::mrp::ProtocolMessage> SendAndReceive(
        proto::mrp::ProtocolMessage message,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Pair-verify with @p credentials over this connection.
    AsyncResult<crypto::SessionKeys> VerifyCredentials(const auth::Credentials& credentials);

    CorrelationEngine::ListenerToken ListenTo(
        MessageType type,
        MessageCallback callback,
        bool one_shot = false);
    bool StopListening(CorrelationEngine::ListenerToken token);

    void SetDeviceListener(interfaces::DeviceListener* listener) noexcept {
        device_listener_.SetListener(listener);
    }
    void ClearDeviceListener() noexcept { device_listener_.ClearListener(); }

    [[nodiscard]] SessionState State() const noexcept { return state_; }
    [[nodiscard]] const std::optional<proto::mrp::ProtocolMessage>& DeviceInfo() const noexcept {
        return device_info_;
    }
    [[nodiscard]] const auth::PairingIdentity& Identity() const noexcept { return identity_; }
    [[nodiscard]] std::string PairingId() const;
    [[nodiscard]] const configuration::SessionConfig& Config() const noexcept { return config_; }
    [[nodiscard]] boost::asio::io_context& IoContext() const noexcept { return io_context_; }
    [[nodiscard]] size_t PendingCount() const noexcept { return engine_.PendingCount(); }
    [[nodiscard]] bool IsEncrypted() const noexcept { return transport_ && transport_->IsEncrypted(); }

    void OnMessage(const proto::mrp::ProtocolMessage& message) override;
    void OnConnectionLost(const RemoteFailure& failure) override;
    void OnConnectionClosed() override;

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;
    ~ProtocolSession() override;

private:
    ProtocolSession(
        boost::asio::io_context& io_context,
        std::string host,
        uint16_t port,
        configuration::SessionConfig config,
        std::optional<auth::Credentials> credentials);

    AsyncResult<Unit> RunStartSequence(bool skip_initial_messages);
    AsyncResult<Unit> EnableEncryption();
    static boost::asio::awaitable<void> HeartbeatLoop(
        std::weak_ptr<ProtocolSession> weak_self,
        std::shared_ptr<boost::asio::steady_timer> timer);
    [[nodiscard]] Result<Unit, RemoteFailure> RequireMessaging() const;

    boost::asio::io_context& io_context_;
    std::string host_;
    uint16_t port_;
    configuration::SessionConfig config_;
    std::optional<auth::Credentials> credentials_;
    auth::PairingIdentity identity_;
    SessionState state_ = SessionState::NotStarted;
    bool pairing_channel_ = false;
    std::shared_ptr<FrameTransport> transport_;
    CorrelationEngine engine_;
    std::optional<proto::mrp::ProtocolMessage> device_info_;
    std::shared_ptr<boost::asio::steady_timer> heartbeat_timer_;
    interfaces::ListenerSlot<interfaces::DeviceListener> device_listener_;
};

}  // namespace tvremote::mrp
