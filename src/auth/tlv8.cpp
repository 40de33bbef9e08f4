#include "tvremote/auth/tlv8.hpp"
#include "tvremote/core/constants.hpp"
#include <algorithm>
#include <format>

namespace tvremote::auth {

    Tlv8& Tlv8::Add(const TlvTag tag, std::span<const uint8_t> value) {
        auto [it, inserted] = values_.try_emplace(tag);
        if (inserted) {
            order_.push_back(tag);
        }
        it->second.assign(value.begin(), value.end());
        return *this;
    }

    Tlv8& Tlv8::Add(const TlvTag tag, const uint8_t value) {
        return Add(tag, std::span<const uint8_t>(&value, 1));
    }

    Tlv8& Tlv8::Add(const TlvTag tag, const std::string& value) {
        return Add(tag, std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(value.data()), value.size()));
    }

    bool Tlv8::Contains(const TlvTag tag) const {
        return values_.contains(tag);
    }

    const std::vector<uint8_t>* Tlv8::Find(const TlvTag tag) const {
        const auto it = values_.find(tag);
        return it == values_.end() ? nullptr : &it->second;
    }

    Result<std::vector<uint8_t>, RemoteFailure> Tlv8::Require(const TlvTag tag) const {
        const auto* value = Find(tag);
        if (value == nullptr) {
            return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                RemoteFailure::Decode(
                    std::format("Missing TLV tag 0x{:02x}", static_cast<unsigned>(tag))));
        }
        return Result<std::vector<uint8_t>, RemoteFailure>::Ok(*value);
    }

    std::vector<uint8_t> Tlv8::Encode() const {
        std::vector<uint8_t> out;
        for (const auto tag : order_) {
            const auto& value = values_.at(tag);
            if (value.empty()) {
                out.push_back(static_cast<uint8_t>(tag));
                out.push_back(0);
                continue;
            }
            for (size_t offset = 0; offset < value.size(); offset += kTlvChunkBytes) {
                const size_t length = std::min(kTlvChunkBytes, value.size() - offset);
                out.push_back(static_cast<uint8_t>(tag));
                out.push_back(static_cast<uint8_t>(length));
                out.insert(out.end(), value.begin() + static_cast<std::ptrdiff_t>(offset),
                           value.begin() + static_cast<std::ptrdiff_t>(offset + length));
            }
        }
        return out;
    }

    Result<Tlv8, RemoteFailure> Tlv8::Decode(std::span<const uint8_t> data) {
        Tlv8 tlv;
        size_t pos = 0;
        while (pos < data.size()) {
            if (data.size() - pos < 2) {
                return Result<Tlv8, RemoteFailure>::Err(
                    RemoteFailure::Decode("Truncated TLV header"));
            }
            const auto tag = static_cast<TlvTag>(data[pos]);
            const size_t length = data[pos + 1];
            pos += 2;
            if (data.size() - pos < length) {
                return Result<Tlv8, RemoteFailure>::Err(
                    RemoteFailure::Decode(
                        std::format("TLV value truncated: need {} bytes, have {}",
                            length, data.size() - pos)));
            }
            auto [it, inserted] = tlv.values_.try_emplace(tag);
            if (inserted) {
                tlv.order_.push_back(tag);
            }
            it->second.insert(it->second.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                              data.begin() + static_cast<std::ptrdiff_t>(pos + length));
            pos += length;
        }
        return Result<Tlv8, RemoteFailure>::Ok(std::move(tlv));
    }

    Result<Unit, RemoteFailure> Tlv8::CheckError() const {
        const auto* error = Find(TlvTag::Error);
        if (error == nullptr) {
            return Result<Unit, RemoteFailure>::Ok(unit);
        }
        const auto code = error->empty()
            ? TlvErrorCode::Unknown
            : static_cast<TlvErrorCode>((*error)[0]);
        if (code == TlvErrorCode::BackOff) {
            uint32_t seconds = 0;
            if (const auto* backoff = Find(TlvTag::BackOff)) {
                for (size_t i = 0; i < backoff->size() && i < sizeof(seconds); ++i) {
                    seconds |= static_cast<uint32_t>((*backoff)[i]) << (8 * i);
                }
            }
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::BackOff(
                    std::format("Device asked to back off for {} seconds", seconds), seconds));
        }
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Authentication(
                std::format("Device returned error: {}", ToString(code))));
    }

    std::string_view ToString(const TlvErrorCode code) {
        switch (code) {
            case TlvErrorCode::Unknown: return "Unknown";
            case TlvErrorCode::Authentication: return "Authentication";
            case TlvErrorCode::BackOff: return "BackOff";
            case TlvErrorCode::MaxPeers: return "MaxPeers";
            case TlvErrorCode::MaxTries: return "MaxTries";
            case TlvErrorCode::Unavailable: return "Unavailable";
            case TlvErrorCode::Busy: return "Busy";
        }
        return "Unrecognized";
    }

}
