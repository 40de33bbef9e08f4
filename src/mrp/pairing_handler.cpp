#include "tvremote/mrp/pairing_handler.hpp"
#include "tvremote/debug/log.hpp"
#include "tvremote/mrp/messages.hpp"

namespace tvremote::mrp {

namespace {

    constexpr size_t kPinDigits = 4;

    RemoteFailure AsPairingFailure(RemoteFailure failure) {
        if (failure.Is(RemoteFailureType::Pairing)) {
            return failure;
        }
        return RemoteFailure::Pairing("Pairing failed", std::move(failure));
    }

}

    MrpPairingHandler::MrpPairingHandler(boost::asio::io_context& io_context,
                                         std::string host,
                                         const uint16_t port,
                                         configuration::SessionConfig config)
        : io_context_(io_context)
        , host_(std::move(host))
        , port_(port)
        , config_(std::move(config)) {
        // Pairing sessions are short lived.
        config_.heartbeat_interval = std::chrono::milliseconds{0};
    }

    MrpPairingHandler::~MrpPairingHandler() {
        if (session_) {
            session_->Stop();
        }
    }

    AsyncResult<Unit> MrpPairingHandler::Begin() {
        auto begun = co_await RunBegin();
        if (begun.IsErr()) {
            co_return RemoteResult<Unit>::Err(AsPairingFailure(std::move(begun).UnwrapErr()));
        }
        co_return begun;
    }

    AsyncResult<Unit> MrpPairingHandler::RunBegin() {
        if (session_) {
            co_return RemoteResult<Unit>::Err(RemoteFailure::InvalidState("Pairing already started"));
        }
        session_ = ProtocolSession::Create(io_context_, host_, port_, config_);
        TVREMOTE_CO_TRY(co_await session_->Start(true));

        auto setup = auth::PairSetupClient::Create(session_->Identity());
        TVREMOTE_CO_TRY(setup);
        setup_ = std::move(setup).Unwrap();

        auto hello = setup_->StartRequest();
        TVREMOTE_CO_TRY(hello);
        auto reply = co_await Exchange(hello.Unwrap());
        TVREMOTE_CO_TRY(reply);
        TVREMOTE_CO_TRY(setup_->HandleStartResponse(reply.Unwrap()));
        TVREMOTE_LOG_MSG("PAIRING", "Device is showing a PIN");
        co_return RemoteResult<Unit>::Ok(unit);
    }

    void MrpPairingHandler::Pin(std::string pin) {
        if (pin.size() < kPinDigits) {
            pin.insert(0, kPinDigits - pin.size(), '0');
        }
        pin_ = std::move(pin);
    }

    AsyncResult<Unit> MrpPairingHandler::Finish() {
        auto finished = co_await RunFinish();
        if (finished.IsErr()) {
            co_return RemoteResult<Unit>::Err(AsPairingFailure(std::move(finished).UnwrapErr()));
        }
        credentials_ = std::move(finished).Unwrap();
        co_return RemoteResult<Unit>::Ok(unit);
    }

    AsyncResult<auth::Credentials> MrpPairingHandler::RunFinish() {
        if (!setup_) {
            co_return RemoteResult<auth::Credentials>::Err(
                RemoteFailure::InvalidState("Pairing has not been started"));
        }
        if (pin_.empty()) {
            co_return RemoteResult<auth::Credentials>::Err(
                RemoteFailure::InvalidState("No PIN has been entered"));
        }

        auto proof = setup_->ProofRequest(pin_);
        TVREMOTE_CO_TRY(proof);
        auto proof_reply = co_await Exchange(proof.Unwrap());
        TVREMOTE_CO_TRY(proof_reply);
        TVREMOTE_CO_TRY(setup_->HandleProofResponse(proof_reply.Unwrap()));

        auto exchange = setup_->ExchangeRequest();
        TVREMOTE_CO_TRY(exchange);
        auto exchange_reply = co_await Exchange(exchange.Unwrap());
        TVREMOTE_CO_TRY(exchange_reply);
        co_return setup_->HandleExchangeResponse(exchange_reply.Unwrap());
    }

    AsyncResult<auth::Tlv8> MrpPairingHandler::Exchange(const auth::Tlv8& request) {
        auto reply = co_await session_->SendAndReceive(messages::CryptoPairing(request, true));
        TVREMOTE_CO_TRY(reply);
        co_return messages::ReadPairingData(reply.Unwrap());
    }

    boost::asio::awaitable<void> MrpPairingHandler::Close() {
        if (session_) {
            session_->Stop();
        }
        co_return;
    }

    std::optional<std::string> MrpPairingHandler::Credentials() const {
        if (!credentials_) {
            return std::nullopt;
        }
        return credentials_->ToString();
    }

}
