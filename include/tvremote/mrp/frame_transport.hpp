#pragma once
#include "tvremote/core/async_result.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include "tvremote/crypto/symmetric_channel.hpp"
#include "mrp/protocol_message.pb.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace tvremote::mrp {

class TransportListener {
public:
    virtual ~TransportListener() = default;
    virtual void OnMessage(const proto::mrp::ProtocolMessage& message) = 0;
    virtual void OnConnectionLost(const RemoteFailure& failure) = 0;
    virtual void OnConnectionClosed() = 0;
};

/**
 * @brief Length-prefixed protobuf frames over one TCP connection
 *
 * Frames are `varint(length) || payload`. Once EnableEncryption() has been
 * called every payload sent or received after that point is sealed by the
 * session's SymmetricChannel.
 *
 * Lifecycle: exactly one of OnConnectionLost() or OnConnectionClosed() is
 * reported per transport. Close() reports closed, any read/write error, a
 * peer shutdown or an undecodable frame reports lost.
 *
 * Must be created with Create() and used from the io_context thread only.
 */
class FrameTransport : public std::enable_shared_from_this<FrameTransport> {
public:
    enum class State {
        Idle,
        Connecting,
        Open,
        Closed
    };

    [[nodiscard]] static std::shared_ptr<FrameTransport> Create(
        boost::asio::io_context& io_context,
        size_t max_frame_bytes);

    [[nodiscard]] AsyncResult<Unit> Connect(
        std::string host,
        uint16_t port,
        std::chrono::milliseconds timeout);

    /// Takes over an already connected socket and starts reading.
    [[nodiscard]] Result<Unit, RemoteFailure> Attach(boost::asio::ip::tcp::socket socket);

    [[nodiscard]] Result<Unit, RemoteFailure> Send(const proto::mrp::ProtocolMessage& message);

    [[nodiscard]] Result<Unit, RemoteFailure> EnableEncryption(crypto::SessionKeys keys);

    /**
     * @brief Append received bytes and deliver every complete frame
     *
     * Partial frames stay buffered. A frame that fails to decrypt or parse,
     * or that announces a length above the configured maximum, closes the
     * connection as lost.
     */
    void OnBytesReceived(std::span<const uint8_t> data);

    void Close();

    /// Drops the connection and reports it as lost with @p failure.
    void Abort(const RemoteFailure& failure);

    void SetListener(TransportListener* listener) noexcept { listener_ = listener; }
    void ClearListener() noexcept { listener_ = nullptr; }

    [[nodiscard]] State CurrentState() const noexcept { return state_; }
    [[nodiscard]] bool IsOpen() const noexcept { return state_ == State::Open; }
    [[nodiscard]] bool IsEncrypted() const noexcept { return channel_ != nullptr; }
    [[nodiscard]] size_t BufferedBytes() const noexcept { return receive_buf_.size(); }

    FrameTransport(const FrameTransport&) = delete;
    FrameTransport& operator=(const FrameTransport&) = delete;
    ~FrameTransport();

private:
    FrameTransport(boost::asio::io_context& io_context, size_t max_frame_bytes);

    boost::asio::awaitable<void> ReadLoop(std::shared_ptr<FrameTransport> self);
    void StartWrite();
    void Shutdown();

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::socket socket_;
    size_t max_frame_bytes_;
    State state_ = State::Idle;
    std::unique_ptr<crypto::SymmetricChannel> channel_;
    std::vector<uint8_t> receive_buf_;
    std::vector<uint8_t> pending_send_buf_;
    std::vector<uint8_t> writing_send_buf_;
    bool write_in_progress_ = false;
    TransportListener* listener_ = nullptr;
};

}  // namespace tvremote::mrp
