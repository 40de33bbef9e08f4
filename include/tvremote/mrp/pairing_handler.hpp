#pragma once
#include "tvremote/auth/handshake_engine.hpp"
#include "tvremote/configuration/session_config.hpp"
#include "tvremote/interfaces/pairing_handler.hpp"
#include "tvremote/mrp/protocol_session.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <string>

namespace tvremote::mrp {

/**
 * @brief Pair-setup against the protobuf remote-control service
 *
 * Runs on its own session that stops after the device-info exchange.
 * HasPaired() turns true once the device's M6 reply has been opened and
 * its signature checked; the credentials are first used on the next
 * connection.
 */
class MrpPairingHandler final : public interfaces::IPairingHandler {
public:
    MrpPairingHandler(boost::asio::io_context& io_context,
                      std::string host,
                      uint16_t port,
                      configuration::SessionConfig config);
    ~MrpPairingHandler() override;

    AsyncResult<Unit> Begin() override;
    void Pin(std::string pin) override;
    AsyncResult<Unit> Finish() override;
    [[nodiscard]] bool HasPaired() const noexcept override { return credentials_.has_value(); }
    boost::asio::awaitable<void> Close() override;
    [[nodiscard]] std::optional<std::string> Credentials() const override;

    [[nodiscard]] const std::optional<auth::Credentials>& PairedCredentials() const noexcept {
        return credentials_;
    }

    MrpPairingHandler(const MrpPairingHandler&) = delete;
    MrpPairingHandler& operator=(const MrpPairingHandler&) = delete;

private:
    AsyncResult<Unit> RunBegin();
    AsyncResult<auth::Credentials> RunFinish();
    AsyncResult<auth::Tlv8> Exchange(const auth::Tlv8& request);

    boost::asio::io_context& io_context_;
    std::string host_;
    uint16_t port_;
    configuration::SessionConfig config_;
    std::shared_ptr<ProtocolSession> session_;
    std::unique_ptr<auth::PairSetupClient> setup_;
    std::string pin_;
    std::optional<auth::Credentials> credentials_;
};

}  // namespace tvremote::mrp
