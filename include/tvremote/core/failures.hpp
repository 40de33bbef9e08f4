#pragma once
#include "tvremote/core/result.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
namespace tvremote {
enum class RemoteFailureType {
    Generic,
    MalformedLength,
    Decryption,
    Authentication,
    BackOff,
    Pairing,
    Timeout,
    NotSupported,
    InvalidState,
    ConnectionFailed,
    ConnectionLost,
    NoService,
    Cancelled,
    Command,
    Encode,
    Decode,
    InvalidInput
};
class RemoteFailure {
public:
    RemoteFailureType type;
    std::string message;
    std::shared_ptr<const RemoteFailure> cause;
    std::optional<uint32_t> backoff_seconds;
    RemoteFailure(const RemoteFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    [[nodiscard]] bool Is(const RemoteFailureType t) const noexcept { return type == t; }
    [[nodiscard]] const RemoteFailure& RootCause() const {
        const RemoteFailure* current = this;
        while (current->cause) {
            current = current->cause.get();
        }
        return *current;
    }
    [[nodiscard]] std::string Describe() const {
        std::string text = message;
        if (cause) {
            text += ": " + cause->Describe();
        }
        return text;
    }
    static RemoteFailure Generic(std::string msg) {
        return {RemoteFailureType::Generic, std::move(msg)};
    }
    static RemoteFailure MalformedLength(std::string msg) {
        return {RemoteFailureType::MalformedLength, std::move(msg)};
    }
    static RemoteFailure Decryption(std::string msg) {
        return {RemoteFailureType::Decryption, std::move(msg)};
    }
    static RemoteFailure Authentication(std::string msg) {
        return {RemoteFailureType::Authentication, std::move(msg)};
    }
    static RemoteFailure BackOff(std::string msg, const uint32_t seconds) {
        RemoteFailure failure{RemoteFailureType::BackOff, std::move(msg)};
        failure.backoff_seconds = seconds;
        return failure;
    }
    static RemoteFailure Pairing(std::string msg, RemoteFailure inner) {
        RemoteFailure failure{RemoteFailureType::Pairing, std::move(msg)};
        failure.cause = std::make_shared<const RemoteFailure>(std::move(inner));
        return failure;
    }
    static RemoteFailure Timeout(std::string msg) {
        return {RemoteFailureType::Timeout, std::move(msg)};
    }
    static RemoteFailure NotSupported(std::string msg) {
        return {RemoteFailureType::NotSupported, std::move(msg)};
    }
    static RemoteFailure InvalidState(std::string msg) {
        return {RemoteFailureType::InvalidState, std::move(msg)};
    }
    static RemoteFailure ConnectionFailed(std::string msg) {
        return {RemoteFailureType::ConnectionFailed, std::move(msg)};
    }
    static RemoteFailure ConnectionFailed(std::string msg, RemoteFailure inner) {
        RemoteFailure failure{RemoteFailureType::ConnectionFailed, std::move(msg)};
        failure.cause = std::make_shared<const RemoteFailure>(std::move(inner));
        return failure;
    }
    static RemoteFailure ConnectionLost(std::string msg) {
        return {RemoteFailureType::ConnectionLost, std::move(msg)};
    }
    static RemoteFailure NoService(std::string msg) {
        return {RemoteFailureType::NoService, std::move(msg)};
    }
    static RemoteFailure Cancelled(std::string msg) {
        return {RemoteFailureType::Cancelled, std::move(msg)};
    }
    static RemoteFailure Command(std::string msg) {
        return {RemoteFailureType::Command, std::move(msg)};
    }
    static RemoteFailure Encode(std::string msg) {
        return {RemoteFailureType::Encode, std::move(msg)};
    }
    static RemoteFailure Decode(std::string msg) {
        return {RemoteFailureType::Decode, std::move(msg)};
    }
    static RemoteFailure InvalidInput(std::string msg) {
        return {RemoteFailureType::InvalidInput, std::move(msg)};
    }
};
template<typename T>
using RemoteResult = Result<T, RemoteFailure>;
inline std::string_view ToString(const RemoteFailureType type) {
    switch (type) {
        case RemoteFailureType::Generic: return "Generic";
        case RemoteFailureType::MalformedLength: return "MalformedLength";
        case RemoteFailureType::Decryption: return "Decryption";
        case RemoteFailureType::Authentication: return "Authentication";
        case RemoteFailureType::BackOff: return "BackOff";
        case RemoteFailureType::Pairing: return "Pairing";
        case RemoteFailureType::Timeout: return "Timeout";
        case RemoteFailureType::NotSupported: return "NotSupported";
        case RemoteFailureType::InvalidState: return "InvalidState";
        case RemoteFailureType::ConnectionFailed: return "ConnectionFailed";
        case RemoteFailureType::ConnectionLost: return "ConnectionLost";
        case RemoteFailureType::NoService: return "NoService";
        case RemoteFailureType::Cancelled: return "Cancelled";
        case RemoteFailureType::Command: return "Command";
        case RemoteFailureType::Encode: return "Encode";
        case RemoteFailureType::Decode: return "Decode";
        case RemoteFailureType::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}
}
