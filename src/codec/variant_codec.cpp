#include "tvremote/codec/variant_codec.hpp"
#include "tvremote/core/constants.hpp"

namespace tvremote::codec {

    namespace {
        constexpr uint8_t kContinuationBit = 0x80;
        constexpr uint8_t kPayloadMask = 0x7F;
        constexpr unsigned kBitsPerByte = 7;
    }

    std::vector<uint8_t> VariantCodec::Encode(const uint64_t value) {
        std::vector<uint8_t> out;
        out.reserve(EncodedSize(value));
        EncodeTo(value, out);
        return out;
    }

    void VariantCodec::EncodeTo(uint64_t value, std::vector<uint8_t>& out) {
        while (value > kPayloadMask) {
            out.push_back(static_cast<uint8_t>((value & kPayloadMask) | kContinuationBit));
            value >>= kBitsPerByte;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    Result<VariantCodec::Decoded, RemoteFailure> VariantCodec::Decode(std::span<const uint8_t> data) {
        uint64_t value = 0;
        unsigned shift = 0;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i >= kMaxVariantBytes) {
                return Result<Decoded, RemoteFailure>::Err(
                    RemoteFailure::MalformedLength("Variant exceeds 64 bits"));
            }
            const uint8_t byte = data[i];
            const uint64_t group = byte & kPayloadMask;
            if (shift == 63 && group > 1) {
                return Result<Decoded, RemoteFailure>::Err(
                    RemoteFailure::MalformedLength("Variant exceeds 64 bits"));
            }
            value |= group << shift;
            if ((byte & kContinuationBit) == 0) {
                return Result<Decoded, RemoteFailure>::Ok(Decoded{value, data.subspan(i + 1)});
            }
            shift += kBitsPerByte;
        }
        return Result<Decoded, RemoteFailure>::Err(
            RemoteFailure::MalformedLength(
                "Variant truncated after " + std::to_string(data.size()) + " bytes"));
    }

    size_t VariantCodec::EncodedSize(uint64_t value) noexcept {
        size_t size = 1;
        while (value > kPayloadMask) {
            value >>= kBitsPerByte;
            ++size;
        }
        return size;
    }

}
