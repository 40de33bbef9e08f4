#include "tvremote/mrp/frame_transport.hpp"
#include "tvremote/codec/variant_codec.hpp"
#include "tvremote/core/constants.hpp"
#include "tvremote/debug/log.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <array>
#include <format>

namespace tvremote::mrp {

using boost::asio::ip::tcp;

namespace {

    constexpr size_t kReadChunkBytes = 4096;

}

    std::shared_ptr<FrameTransport> FrameTransport::Create(
        boost::asio::io_context& io_context,
        const size_t max_frame_bytes) {
        return std::shared_ptr<FrameTransport>(new FrameTransport(io_context, max_frame_bytes));
    }

    FrameTransport::FrameTransport(boost::asio::io_context& io_context, const size_t max_frame_bytes)
        : io_context_(io_context)
        , socket_(io_context)
        , max_frame_bytes_(max_frame_bytes) {
    }

    FrameTransport::~FrameTransport() {
        listener_ = nullptr;
        Shutdown();
    }

    AsyncResult<Unit> FrameTransport::Connect(
        std::string host,
        const uint16_t port,
        const std::chrono::milliseconds timeout) {
        if (state_ != State::Idle) {
            co_return RemoteResult<Unit>::Err(
                RemoteFailure::InvalidState("Transport can only connect once"));
        }
        state_ = State::Connecting;
        auto self = shared_from_this();

        auto resolver = std::make_shared<tcp::resolver>(io_context_);
        auto timed_out = std::make_shared<bool>(false);
        boost::asio::steady_timer timer(io_context_);
        timer.expires_after(timeout);
        timer.async_wait([weak = weak_from_this(), resolver, timed_out](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            *timed_out = true;
            resolver->cancel();
            if (auto transport = weak.lock()) {
                boost::system::error_code ignored;
                transport->socket_.cancel(ignored);
            }
        });

        boost::system::error_code ec;
        const auto endpoints = co_await resolver->async_resolve(
            host, std::to_string(port),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (!ec && !*timed_out) {
            co_await boost::asio::async_connect(
                socket_, endpoints,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        timer.cancel();

        if (state_ == State::Closed) {
            co_return RemoteResult<Unit>::Err(
                RemoteFailure::ConnectionFailed("Transport closed while connecting"));
        }
        if (*timed_out) {
            state_ = State::Closed;
            Shutdown();
            co_return RemoteResult<Unit>::Err(RemoteFailure::ConnectionFailed(
                std::format("Connecting to {}:{} timed out after {} ms", host, port, timeout.count())));
        }
        if (ec) {
            state_ = State::Closed;
            Shutdown();
            co_return RemoteResult<Unit>::Err(RemoteFailure::ConnectionFailed(
                std::format("Failed to connect to {}:{}: {}", host, port, ec.message())));
        }

        socket_.set_option(tcp::no_delay(true), ec);
        if (ec) {
            TVREMOTE_LOG_WARN("TRANSPORT", "Failed to disable Nagle: " + ec.message());
        }
        state_ = State::Open;
        TVREMOTE_LOG_MSG("TRANSPORT", std::format("Connected to {}:{}", host, port));
        boost::asio::co_spawn(io_context_, ReadLoop(std::move(self)), boost::asio::detached);
        co_return RemoteResult<Unit>::Ok(unit);
    }

    Result<Unit, RemoteFailure> FrameTransport::Attach(tcp::socket socket) {
        if (state_ != State::Idle) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Transport already has a connection"));
        }
        if (!socket.is_open()) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::ConnectionFailed("Socket is not connected"));
        }
        socket_ = std::move(socket);
        state_ = State::Open;
        boost::asio::co_spawn(io_context_, ReadLoop(shared_from_this()), boost::asio::detached);
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<Unit, RemoteFailure> FrameTransport::Send(const proto::mrp::ProtocolMessage& message) {
        if (state_ != State::Open) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidState("Transport is not connected"));
        }
        std::string serialized;
        if (!message.SerializeToString(&serialized)) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::Encode("Failed to serialize protocol message"));
        }
        TVREMOTE_LOG_MSG("TRANSPORT", ">> " + message.ShortDebugString());

        std::vector<uint8_t> payload(serialized.begin(), serialized.end());
        if (channel_) {
            auto sealed = channel_->Encrypt(payload);
            if (sealed.IsErr()) {
                return Result<Unit, RemoteFailure>::Err(std::move(sealed).UnwrapErr());
            }
            payload = std::move(sealed).Unwrap();
        }

        codec::VariantCodec::EncodeTo(payload.size(), pending_send_buf_);
        pending_send_buf_.insert(pending_send_buf_.end(), payload.begin(), payload.end());
        if (!write_in_progress_) {
            StartWrite();
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<Unit, RemoteFailure> FrameTransport::EnableEncryption(crypto::SessionKeys keys) {
        auto channel = crypto::SymmetricChannel::Create(std::move(keys));
        if (channel.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(channel).UnwrapErr());
        }
        channel_ = std::move(channel).Unwrap();
        TVREMOTE_LOG_MSG("TRANSPORT", "Encryption enabled");
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    void FrameTransport::OnBytesReceived(const std::span<const uint8_t> data) {
        receive_buf_.insert(receive_buf_.end(), data.begin(), data.end());

        while (state_ != State::Closed && !receive_buf_.empty()) {
            auto prefix = codec::VariantCodec::Decode(receive_buf_);
            if (prefix.IsErr()) {
                if (receive_buf_.size() < kMaxVariantBytes) {
                    return;
                }
                Abort(RemoteFailure::MalformedLength("Frame length prefix is invalid"));
                return;
            }
            const auto [length, remaining] = prefix.Unwrap();
            if (length > max_frame_bytes_) {
                Abort(RemoteFailure::MalformedLength(
                    std::format("Frame of {} bytes exceeds limit of {}", length, max_frame_bytes_)));
                return;
            }
            if (remaining.size() < length) {
                return;
            }

            const size_t header_bytes = receive_buf_.size() - remaining.size();
            std::vector<uint8_t> payload(remaining.begin(), remaining.begin() + static_cast<std::ptrdiff_t>(length));
            receive_buf_.erase(
                receive_buf_.begin(),
                receive_buf_.begin() + static_cast<std::ptrdiff_t>(header_bytes + length));

            if (channel_) {
                auto opened = channel_->Decrypt(payload);
                if (opened.IsErr()) {
                    Abort(std::move(opened).UnwrapErr());
                    return;
                }
                payload = std::move(opened).Unwrap();
            }

            proto::mrp::ProtocolMessage message;
            if (!message.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                Abort(RemoteFailure::Decode("Received frame is not a valid protocol message"));
                return;
            }
            TVREMOTE_LOG_MSG("TRANSPORT", "<< " + message.ShortDebugString());

            if (listener_ != nullptr) {
                try {
                    listener_->OnMessage(message);
                } catch (const std::exception& ex) {
                    TVREMOTE_LOG_WARN("TRANSPORT", std::string("Message handler failed: ") + ex.what());
                }
            }
        }
    }

    void FrameTransport::Close() {
        if (state_ == State::Closed) {
            return;
        }
        state_ = State::Closed;
        Shutdown();
        if (auto* listener = listener_) {
            listener->OnConnectionClosed();
        }
    }

    boost::asio::awaitable<void> FrameTransport::ReadLoop(std::shared_ptr<FrameTransport> self) {
        std::array<uint8_t, kReadChunkBytes> chunk{};
        while (state_ == State::Open) {
            boost::system::error_code ec;
            const size_t received = co_await socket_.async_read_some(
                boost::asio::buffer(chunk),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    Abort(RemoteFailure::ConnectionLost("Connection closed by peer"));
                } else if (ec != boost::asio::error::operation_aborted) {
                    Abort(RemoteFailure::ConnectionLost("Read failed: " + ec.message()));
                }
                co_return;
            }
            OnBytesReceived(std::span<const uint8_t>(chunk.data(), received));
        }
    }

    void FrameTransport::StartWrite() {
        write_in_progress_ = true;
        writing_send_buf_.swap(pending_send_buf_);
        pending_send_buf_.clear();
        boost::asio::async_write(
            socket_,
            boost::asio::buffer(writing_send_buf_),
            [weak = weak_from_this()](const boost::system::error_code& ec, size_t) {
                auto self = weak.lock();
                if (!self) {
                    return;
                }
                self->writing_send_buf_.clear();
                self->write_in_progress_ = false;
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        self->Abort(RemoteFailure::ConnectionLost("Write failed: " + ec.message()));
                    }
                    return;
                }
                if (self->state_ == State::Open && !self->pending_send_buf_.empty()) {
                    self->StartWrite();
                }
            });
    }

    void FrameTransport::Abort(const RemoteFailure& failure) {
        if (state_ == State::Closed) {
            return;
        }
        TVREMOTE_LOG_WARN("TRANSPORT", "Connection lost: " + failure.Describe());
        state_ = State::Closed;
        Shutdown();
        if (auto* listener = listener_) {
            listener->OnConnectionLost(failure);
        }
    }

    void FrameTransport::Shutdown() {
        boost::system::error_code ec;
        if (socket_.is_open()) {
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
        pending_send_buf_.clear();
    }

}
