#include "tvremote/auth/credentials.hpp"
#include <sodium.h>
#include <array>

namespace tvremote::auth {

    namespace {
        constexpr size_t kFieldCount = 4;

        std::string ToHex(const std::vector<uint8_t>& bytes) {
            std::string hex(bytes.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
            hex.pop_back();
            return hex;
        }

        Result<std::vector<uint8_t>, RemoteFailure> FromHex(std::string_view hex) {
            std::vector<uint8_t> bytes(hex.size() / 2);
            size_t written = 0;
            const char* end = nullptr;
            if (hex.size() % 2 != 0 ||
                sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                               nullptr, &written, &end) != 0 ||
                end != hex.data() + hex.size()) {
                return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                    RemoteFailure::InvalidInput("Credentials contain invalid hex"));
            }
            bytes.resize(written);
            return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(bytes));
        }
    }

    Result<Credentials, RemoteFailure> Credentials::Parse(std::string_view text) {
        std::array<std::string_view, kFieldCount> fields{};
        size_t count = 0;
        size_t start = 0;
        while (true) {
            const size_t colon = text.find(':', start);
            if (count == kFieldCount) {
                return Result<Credentials, RemoteFailure>::Err(
                    RemoteFailure::InvalidInput("Credentials have too many fields"));
            }
            fields[count++] = text.substr(start, colon == std::string_view::npos ? colon : colon - start);
            if (colon == std::string_view::npos) {
                break;
            }
            start = colon + 1;
        }
        if (count != kFieldCount) {
            return Result<Credentials, RemoteFailure>::Err(
                RemoteFailure::InvalidInput(
                    "Credentials need " + std::to_string(kFieldCount) + " fields, got " +
                    std::to_string(count)));
        }

        Credentials credentials;
        std::array<std::vector<uint8_t>*, kFieldCount> targets{
            &credentials.ltpk, &credentials.ltsk, &credentials.device_id, &credentials.client_id};
        for (size_t i = 0; i < kFieldCount; ++i) {
            auto bytes = FromHex(fields[i]);
            if (bytes.IsErr()) {
                return Result<Credentials, RemoteFailure>::Err(std::move(bytes).UnwrapErr());
            }
            *targets[i] = std::move(bytes).Unwrap();
        }
        return Result<Credentials, RemoteFailure>::Ok(std::move(credentials));
    }

    std::string Credentials::ToString() const {
        return ToHex(ltpk) + ":" + ToHex(ltsk) + ":" + ToHex(device_id) + ":" + ToHex(client_id);
    }

}
