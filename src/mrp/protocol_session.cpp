#include "tvremote/mrp/protocol_session.hpp"
#include "tvremote/crypto/sodium_interop.hpp"
#include "tvremote/debug/log.hpp"
#include "tvremote/mrp/messages.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <format>

namespace tvremote::mrp {

using proto::mrp::ProtocolMessage;

    std::string_view ToString(const SessionState state) {
        switch (state) {
            case SessionState::NotStarted: return "NotStarted";
            case SessionState::Connecting: return "Connecting";
            case SessionState::Connected: return "Connected";
            case SessionState::Verifying: return "Verifying";
            case SessionState::Ready: return "Ready";
            case SessionState::Stopped: return "Stopped";
            case SessionState::Failed: return "Failed";
        }
        return "Unknown";
    }

    std::shared_ptr<ProtocolSession> ProtocolSession::Create(
        boost::asio::io_context& io_context,
        std::string host,
        const uint16_t port,
        configuration::SessionConfig config,
        std::optional<auth::Credentials> credentials) {
        return std::shared_ptr<ProtocolSession>(new ProtocolSession(
            io_context, std::move(host), port, std::move(config), std::move(credentials)));
    }

    ProtocolSession::ProtocolSession(
        boost::asio::io_context& io_context,
        std::string host,
        const uint16_t port,
        configuration::SessionConfig config,
        std::optional<auth::Credentials> credentials)
        : io_context_(io_context)
        , host_(std::move(host))
        , port_(port)
        , config_(std::move(config))
        , credentials_(std::move(credentials))
        , engine_([this](const ProtocolMessage& message) -> Result<Unit, RemoteFailure> {
            if (!transport_) {
                return Result<Unit, RemoteFailure>::Err(
                    RemoteFailure::InvalidState("Session has no connection"));
            }
            return transport_->Send(message);
        })
        , heartbeat_timer_(std::make_shared<boost::asio::steady_timer>(io_context)) {
        if (credentials_) {
            identity_.pairing_id = credentials_->client_id;
            identity_.signing_seed = credentials_->ltsk;
        }
    }

    ProtocolSession::~ProtocolSession() {
        heartbeat_timer_->cancel();
        if (transport_) {
            transport_->ClearListener();
            transport_->Close();
        }
    }

    std::string ProtocolSession::PairingId() const {
        return std::string(identity_.pairing_id.begin(), identity_.pairing_id.end());
    }

    AsyncResult<Unit> ProtocolSession::Start(const bool skip_initial_messages) {
        if (state_ == SessionState::Ready) {
            co_return RemoteResult<Unit>::Ok(unit);
        }
        if (state_ != SessionState::NotStarted) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::InvalidState(
                std::format("Cannot start session in state {}", ToString(state_))));
        }
        [[maybe_unused]] const auto self = shared_from_this();
        state_ = SessionState::Connecting;

        auto started = co_await RunStartSequence(skip_initial_messages);
        if (started.IsErr()) {
            TVREMOTE_LOG_WARN("SESSION", "Start failed: " + started.UnwrapErr().Describe());
            Stop();
            state_ = SessionState::Failed;
            co_return started;
        }
        co_return started;
    }

    AsyncResult<Unit> ProtocolSession::RunStartSequence(const bool skip_initial_messages) {
        TVREMOTE_CO_TRY(crypto::SodiumInterop::Initialize());
        if (identity_.pairing_id.empty()) {
            identity_ = auth::PairingIdentity::Generate();
        }

        transport_ = FrameTransport::Create(io_context_, config_.max_frame_bytes);
        transport_->SetListener(this);
        TVREMOTE_CO_TRY(co_await transport_->Connect(host_, port_, config_.connect_timeout));
        if (state_ != SessionState::Connecting) {
            co_return RemoteResult<Unit>::Err(
                RemoteFailure::Cancelled("Session stopped while connecting"));
        }
        state_ = SessionState::Connected;

        // The device ignores everything until it has seen our device info.
        auto info = co_await engine_.SendAndReceive(
            messages::DeviceInformation(config_.identity, PairingId()),
            config_.request_timeout);
        TVREMOTE_CO_TRY(info);
        device_info_ = std::move(info).Unwrap();
        engine_.DispatchToListeners(*device_info_);

        if (skip_initial_messages) {
            pairing_channel_ = true;
            co_return RemoteResult<Unit>::Ok(unit);
        }

        if (credentials_) {
            state_ = SessionState::Verifying;
            auto encrypted = co_await EnableEncryption();
            if (encrypted.IsErr()) {
                co_return RemoteResult<Unit>::Err(RemoteFailure::ConnectionFailed(
                    "Credentials were not accepted", std::move(encrypted).UnwrapErr()));
            }
        }

        TVREMOTE_CO_TRY(engine_.Send(messages::SetConnectionState()));
        TVREMOTE_CO_TRY(co_await engine_.SendAndReceive(
            messages::ClientUpdatesConfig(), config_.request_timeout));
        TVREMOTE_CO_TRY(co_await engine_.SendAndReceive(
            messages::GetKeyboardSession(), config_.request_timeout));

        if (state_ != SessionState::Connected && state_ != SessionState::Verifying) {
            co_return RemoteResult<Unit>::Err(
                RemoteFailure::Cancelled("Session stopped while starting"));
        }
        state_ = SessionState::Ready;
        TVREMOTE_LOG_MSG("SESSION", std::format("Session to {}:{} is ready", host_, port_));

        if (config_.HeartbeatEnabled()) {
            boost::asio::co_spawn(io_context_, HeartbeatLoop(weak_from_this(), heartbeat_timer_), boost::asio::detached);
        }
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<Unit> ProtocolSession::EnableEncryption() {
        auto keys = co_await VerifyCredentials(*credentials_);
        TVREMOTE_CO_TRY(keys);
        TVREMOTE_CO_TRY(transport_->EnableEncryption(std::move(keys).Unwrap()));
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<crypto::SessionKeys> ProtocolSession::VerifyCredentials(const auth::Credentials& credentials) {
        TVREMOTE_LOG_SECTION("SESSION", "Pair-verify");
        auto verifier = auth::PairVerifyClient::Create(credentials);
        TVREMOTE_CO_TRY(verifier);
        auto& client = *verifier.Unwrap();

        auto hello = client.StartRequest();
        TVREMOTE_CO_TRY(hello);
        auto reply = co_await engine_.SendAndReceive(
            messages::CryptoPairing(hello.Unwrap()), config_.request_timeout);
        TVREMOTE_CO_TRY(reply);
        auto device_hello = messages::ReadPairingData(reply.Unwrap());
        TVREMOTE_CO_TRY(device_hello);

        auto finish = client.HandleStartResponse(device_hello.Unwrap());
        TVREMOTE_CO_TRY(finish);
        auto ack = co_await engine_.SendAndReceive(
            messages::CryptoPairing(finish.Unwrap()), config_.request_timeout);
        TVREMOTE_CO_TRY(ack);
        auto device_ack = messages::ReadPairingData(ack.Unwrap());
        TVREMOTE_CO_TRY(device_ack);
        TVREMOTE_CO_TRY(client.HandleFinishResponse(device_ack.Unwrap()));

        co_return client.SessionKeys();
    }

    void ProtocolSession::Stop() {
        if (state_ == SessionState::Stopped || state_ == SessionState::Failed) {
            return;
        }
        if (engine_.PendingCount() > 0) {
            TVREMOTE_LOG_WARN("SESSION",
                std::format("Stopping with {} outstanding requests", engine_.PendingCount()));
        }
        heartbeat_timer_->cancel();
        if (transport_) {
            transport_->Close();
        }
        state_ = SessionState::Stopped;
        engine_.CancelAll(RemoteFailure::Cancelled("Session stopped"));
    }

    Result<Unit, RemoteFailure> ProtocolSession::RequireMessaging() const {
        if (state_ == SessionState::Ready) {
            return Result<Unit, RemoteFailure>::Ok(unit);
        }
        // A pairing session stays Connected and carries pair-setup itself.
        if (state_ == SessionState::Connected && pairing_channel_) {
            return Result<Unit, RemoteFailure>::Ok(unit);
        }
        return Result<Unit, RemoteFailure>::Err(RemoteFailure::InvalidState(
            std::format("Session is {}", ToString(state_))));
    }

    Result<Unit, RemoteFailure> ProtocolSession::Send(const ProtocolMessage& message) {
        TVREMOTE_TRY(RequireMessaging());
        return engine_.Send(message);
    }

    AsyncResult<ProtocolMessage> ProtocolSession::SendAndReceive(
        ProtocolMessage message,
        const std::optional<std::chrono::milliseconds> timeout) {
        TVREMOTE_CO_TRY(RequireMessaging());
        co_return co_await engine_.SendAndReceive(
            std::move(message), timeout.value_or(config_.request_timeout));
    }

    CorrelationEngine::ListenerToken ProtocolSession::ListenTo(
        const MessageType type,
        MessageCallback callback,
        const bool one_shot) {
        return engine_.RegisterListener(type, std::move(callback), one_shot);
    }

    bool ProtocolSession::StopListening(const CorrelationEngine::ListenerToken token) {
        return engine_.RemoveListener(token);
    }

    void ProtocolSession::OnMessage(const ProtocolMessage& message) {
        engine_.Dispatch(message);
    }

    void ProtocolSession::OnConnectionLost(const RemoteFailure& failure) {
        const bool was_ready = state_ == SessionState::Ready;
        heartbeat_timer_->cancel();
        engine_.CancelAll(failure);
        if (was_ready) {
            state_ = SessionState::Stopped;
            device_listener_.Notify([&failure](interfaces::DeviceListener& listener) {
                listener.OnConnectionLost(failure);
            });
        }
    }

    void ProtocolSession::OnConnectionClosed() {
        const bool was_ready = state_ == SessionState::Ready;
        heartbeat_timer_->cancel();
        engine_.CancelAll(RemoteFailure::Cancelled("Connection closed"));
        if (was_ready) {
            state_ = SessionState::Stopped;
            device_listener_.Notify([](interfaces::DeviceListener& listener) {
                listener.OnConnectionClosed();
            });
        }
    }

    boost::asio::awaitable<void> ProtocolSession::HeartbeatLoop(
        std::weak_ptr<ProtocolSession> weak_self,
        std::shared_ptr<boost::asio::steady_timer> timer) {
        uint32_t attempts = 0;
        uint64_t count = 0;
        for (;;) {
            // Retries go out immediately.
            if (attempts == 0) {
                {
                    const auto self = weak_self.lock();
                    if (!self || self->state_ != SessionState::Ready) {
                        break;
                    }
                    timer->expires_after(self->config_.heartbeat_interval);
                }
                boost::system::error_code ec;
                co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec) {
                    break;
                }
            }

            // Held for one request only; an abandoned session is not kept alive.
            const auto self = weak_self.lock();
            if (!self || self->state_ != SessionState::Ready) {
                break;
            }
            TVREMOTE_LOG_VALUE("SESSION", "heartbeat", count);
            auto reply = co_await self->engine_.SendAndReceive(messages::Generic(), self->config_.request_timeout);
            ++count;
            if (self->state_ != SessionState::Ready) {
                break;
            }
            if (reply.IsOk()) {
                attempts = 0;
                continue;
            }

            ++attempts;
            if (attempts > self->config_.heartbeat_retries) {
                TVREMOTE_LOG_WARN("SESSION", std::format("Heartbeat {} failed after {} attempts: {}",
                    count, attempts, reply.UnwrapErr().Describe()));
                self->transport_->Abort(RemoteFailure::ConnectionLost("Device stopped answering heartbeats"));
                break;
            }
        }
        TVREMOTE_LOG_VALUE("SESSION", "heartbeat loop stopped at", count);
    }

}
