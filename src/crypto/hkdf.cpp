#include "tvremote/crypto/hkdf.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace tvremote::crypto {

namespace {
    struct KdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<Unit, RemoteFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::InvalidInput(
                "HKDF output size exceeds maximum allowed: " +
                std::to_string(output.size()) + " > " + std::to_string(MAX_OUTPUT_LEN)));
    }

    if (ikm.empty()) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Generic("Failed to fetch HKDF algorithm"));
    }

    KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Generic("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        "digest", const_cast<char*>("SHA512"), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<uint8_t*>(ikm.data()), ikm.size());

    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }

    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<uint8_t*>(info.data()), info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        return Result<Unit, RemoteFailure>::Err(
            RemoteFailure::Generic("HKDF key derivation failed"));
    }

    return Result<Unit, RemoteFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, RemoteFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::string_view salt,
    std::string_view info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, AsBytes(salt), AsBytes(info));

    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, RemoteFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(output));
}

} // namespace tvremote::crypto
