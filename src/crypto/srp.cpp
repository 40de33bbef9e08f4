#include "tvremote/crypto/srp.hpp"
#include "tvremote/core/constants.hpp"
#include "tvremote/crypto/sodium_interop.hpp"

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <initializer_list>
#include <string>

namespace tvremote::crypto {

    namespace {
        struct BnDeleter {
            void operator()(BIGNUM* bn) const {
                if (bn) {
                    BN_clear_free(bn);
                }
            }
        };
        struct BnCtxDeleter {
            void operator()(BN_CTX* ctx) const {
                if (ctx) {
                    BN_CTX_free(ctx);
                }
            }
        };
        struct MdCtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const {
                if (ctx) {
                    EVP_MD_CTX_free(ctx);
                }
            }
        };
        using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
        using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

        template<typename T>
        Result<T, RemoteFailure> ArithmeticError(const char* step) {
            return Result<T, RemoteFailure>::Err(
                RemoteFailure::Generic(std::string("SRP arithmetic failed: ") + step));
        }

        BnPtr FromBytes(std::span<const uint8_t> bytes) {
            return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
        }

        std::vector<uint8_t> ToBytes(const BIGNUM* bn) {
            std::vector<uint8_t> out(static_cast<size_t>(BN_num_bytes(bn)));
            BN_bn2bin(bn, out.data());
            return out;
        }

        std::vector<uint8_t> ToPadded(const BIGNUM* bn) {
            std::vector<uint8_t> out(kSrpPrimeBytes);
            BN_bn2binpad(bn, out.data(), static_cast<int>(out.size()));
            return out;
        }

        std::span<const uint8_t> AsBytes(std::string_view text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        Result<std::vector<uint8_t>, RemoteFailure> Sha512(
            std::initializer_list<std::span<const uint8_t>> parts) {
            MdCtxPtr ctx(EVP_MD_CTX_new());
            if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) != 1) {
                return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                    RemoteFailure::Generic("Failed to initialize SHA-512"));
            }
            for (const auto part : parts) {
                if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
                    return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                        RemoteFailure::Generic("SHA-512 update failed"));
                }
            }
            std::vector<uint8_t> digest(kSha512Bytes);
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
                return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                    RemoteFailure::Generic("SHA-512 finalization failed"));
            }
            digest.resize(length);
            return Result<std::vector<uint8_t>, RemoteFailure>::Ok(std::move(digest));
        }

        struct Group {
            BnPtr n;
            BnPtr g;
            BnPtr k;
            BnCtxPtr ctx;
        };

        Result<Group, RemoteFailure> LoadGroup() {
            Group group{
                BnPtr(BN_get_rfc3526_prime_3072(nullptr)),
                BnPtr(BN_new()),
                nullptr,
                BnCtxPtr(BN_CTX_new())};
            if (!group.n || !group.g || !group.ctx || BN_set_word(group.g.get(), kSrpGenerator) != 1) {
                return ArithmeticError<Group>("group setup");
            }
            auto k = Sha512({ToBytes(group.n.get()), ToPadded(group.g.get())});
            if (k.IsErr()) {
                return Result<Group, RemoteFailure>::Err(std::move(k).UnwrapErr());
            }
            group.k = FromBytes(k.Unwrap());
            if (!group.k) {
                return ArithmeticError<Group>("multiplier");
            }
            return Result<Group, RemoteFailure>::Ok(std::move(group));
        }

        Result<BnPtr, RemoteFailure> ComputeX(
            std::string_view username,
            std::string_view password,
            std::span<const uint8_t> salt) {
            std::string identity(username);
            identity += ':';
            identity += password;
            auto inner = Sha512({AsBytes(identity)});
            if (inner.IsErr()) {
                return Result<BnPtr, RemoteFailure>::Err(std::move(inner).UnwrapErr());
            }
            auto outer = Sha512({salt, inner.Unwrap()});
            if (outer.IsErr()) {
                return Result<BnPtr, RemoteFailure>::Err(std::move(outer).UnwrapErr());
            }
            return Result<BnPtr, RemoteFailure>::Ok(FromBytes(outer.Unwrap()));
        }

        Result<BnPtr, RemoteFailure> ComputeU(const BIGNUM* a_pub, const BIGNUM* b_pub) {
            auto digest = Sha512({ToPadded(a_pub), ToPadded(b_pub)});
            if (digest.IsErr()) {
                return Result<BnPtr, RemoteFailure>::Err(std::move(digest).UnwrapErr());
            }
            BnPtr u = FromBytes(digest.Unwrap());
            if (!u || BN_is_zero(u.get())) {
                return Result<BnPtr, RemoteFailure>::Err(
                    RemoteFailure::Authentication("SRP scrambling parameter is zero"));
            }
            return Result<BnPtr, RemoteFailure>::Ok(std::move(u));
        }

        Result<std::vector<uint8_t>, RemoteFailure> ComputeClientProof(
            const Group& group,
            std::string_view username,
            std::span<const uint8_t> salt,
            std::span<const uint8_t> a_pub,
            std::span<const uint8_t> b_pub,
            std::span<const uint8_t> session_key) {
            auto hash_n = Sha512({ToBytes(group.n.get())});
            auto hash_g = Sha512({ToBytes(group.g.get())});
            auto hash_i = Sha512({AsBytes(username)});
            if (hash_n.IsErr() || hash_g.IsErr() || hash_i.IsErr()) {
                return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                    RemoteFailure::Generic("SRP proof hashing failed"));
            }
            std::vector<uint8_t> group_hash = hash_n.Unwrap();
            for (size_t i = 0; i < group_hash.size(); ++i) {
                group_hash[i] ^= hash_g.Unwrap()[i];
            }
            return Sha512({group_hash, hash_i.Unwrap(), salt, a_pub, b_pub, session_key});
        }

        bool IsZeroModN(const BIGNUM* value, const Group& group) {
            BnPtr remainder(BN_new());
            if (!remainder || BN_nnmod(remainder.get(), value, group.n.get(), group.ctx.get()) != 1) {
                return true;
            }
            return BN_is_zero(remainder.get());
        }
    }

    // ========================================================================
    // SrpClient
    // ========================================================================

    struct SrpClient::State {
        Group group;
        BnPtr a;
        BnPtr a_pub;
        std::vector<uint8_t> public_key;
        std::vector<uint8_t> proof;
        std::vector<uint8_t> session_key;
        std::vector<uint8_t> expected_server_proof;
    };

    SrpClient::SrpClient() = default;
    SrpClient::~SrpClient() {
        if (state_) {
            SodiumInterop::SecureWipe(state_->session_key);
        }
    }

    Result<std::unique_ptr<SrpClient>, RemoteFailure> SrpClient::Create(
        std::span<const uint8_t> private_value) {
        if (private_value.empty()) {
            return Result<std::unique_ptr<SrpClient>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("SRP private value cannot be empty"));
        }
        auto group = LoadGroup();
        if (group.IsErr()) {
            return Result<std::unique_ptr<SrpClient>, RemoteFailure>::Err(std::move(group).UnwrapErr());
        }

        auto state = std::make_unique<State>();
        state->group = std::move(group).Unwrap();
        state->a = FromBytes(private_value);
        state->a_pub = BnPtr(BN_new());
        if (!state->a || !state->a_pub ||
            BN_mod_exp(state->a_pub.get(), state->group.g.get(), state->a.get(),
                       state->group.n.get(), state->group.ctx.get()) != 1) {
            return ArithmeticError<std::unique_ptr<SrpClient>>("client public value");
        }
        state->public_key = ToBytes(state->a_pub.get());

        std::unique_ptr<SrpClient> client(new SrpClient());
        client->state_ = std::move(state);
        return Result<std::unique_ptr<SrpClient>, RemoteFailure>::Ok(std::move(client));
    }

    Result<Unit, RemoteFailure> SrpClient::Process(
        std::string_view username,
        std::string_view password,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> server_public) {
        auto& group = state_->group;
        BnPtr b_pub = FromBytes(server_public);
        if (!b_pub) {
            return ArithmeticError<Unit>("server public value");
        }
        if (IsZeroModN(b_pub.get(), group)) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::Authentication("Server public value is zero modulo N"));
        }

        auto u = ComputeU(state_->a_pub.get(), b_pub.get());
        if (u.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(u).UnwrapErr());
        }
        auto x = ComputeX(username, password, salt);
        if (x.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(x).UnwrapErr());
        }

        BnPtr gx(BN_new());
        BnPtr kgx(BN_new());
        BnPtr base(BN_new());
        BnPtr ux(BN_new());
        BnPtr exponent(BN_new());
        BnPtr secret(BN_new());
        BN_CTX* ctx = group.ctx.get();
        if (!gx || !kgx || !base || !ux || !exponent || !secret ||
            BN_mod_exp(gx.get(), group.g.get(), x.Unwrap().get(), group.n.get(), ctx) != 1 ||
            BN_mod_mul(kgx.get(), group.k.get(), gx.get(), group.n.get(), ctx) != 1 ||
            BN_mod_sub(base.get(), b_pub.get(), kgx.get(), group.n.get(), ctx) != 1 ||
            BN_mul(ux.get(), u.Unwrap().get(), x.Unwrap().get(), ctx) != 1 ||
            BN_add(exponent.get(), state_->a.get(), ux.get()) != 1 ||
            BN_mod_exp(secret.get(), base.get(), exponent.get(), group.n.get(), ctx) != 1) {
            return ArithmeticError<Unit>("premaster secret");
        }

        auto session_key = Sha512({ToBytes(secret.get())});
        if (session_key.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(session_key).UnwrapErr());
        }
        state_->session_key = std::move(session_key).Unwrap();

        auto proof = ComputeClientProof(group, username, salt, state_->public_key,
                                        server_public, state_->session_key);
        if (proof.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(proof).UnwrapErr());
        }
        state_->proof = std::move(proof).Unwrap();

        auto expected = Sha512({state_->public_key, state_->proof, state_->session_key});
        if (expected.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(expected).UnwrapErr());
        }
        state_->expected_server_proof = std::move(expected).Unwrap();
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    const std::vector<uint8_t>& SrpClient::PublicKey() const {
        return state_->public_key;
    }

    const std::vector<uint8_t>& SrpClient::Proof() const {
        return state_->proof;
    }

    const std::vector<uint8_t>& SrpClient::SessionKey() const {
        return state_->session_key;
    }

    Result<Unit, RemoteFailure> SrpClient::VerifyServerProof(
        std::span<const uint8_t> server_proof) const {
        if (state_->expected_server_proof.empty()) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidState("SRP exchange has not been processed"));
        }
        if (!SodiumInterop::ConstantTimeEquals(server_proof, state_->expected_server_proof)) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::Authentication("Server proof does not match"));
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    // ========================================================================
    // SrpServer
    // ========================================================================

    struct SrpServer::State {
        Group group;
        std::string username;
        std::vector<uint8_t> salt;
        BnPtr verifier;
        BnPtr b;
        BnPtr b_pub;
        std::vector<uint8_t> public_key;
        std::vector<uint8_t> session_key;
        std::vector<uint8_t> expected_client_proof;
        std::vector<uint8_t> server_proof;
    };

    SrpServer::SrpServer() = default;
    SrpServer::~SrpServer() {
        if (state_) {
            SodiumInterop::SecureWipe(state_->session_key);
        }
    }

    Result<std::unique_ptr<SrpServer>, RemoteFailure> SrpServer::Create(
        std::string_view username,
        std::string_view password,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> private_value) {
        if (salt.empty() || private_value.empty()) {
            return Result<std::unique_ptr<SrpServer>, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("SRP salt and private value are required"));
        }
        auto group = LoadGroup();
        if (group.IsErr()) {
            return Result<std::unique_ptr<SrpServer>, RemoteFailure>::Err(std::move(group).UnwrapErr());
        }
        auto x = ComputeX(username, password, salt);
        if (x.IsErr()) {
            return Result<std::unique_ptr<SrpServer>, RemoteFailure>::Err(std::move(x).UnwrapErr());
        }

        auto state = std::make_unique<State>();
        state->group = std::move(group).Unwrap();
        state->username = std::string(username);
        state->salt.assign(salt.begin(), salt.end());
        state->verifier = BnPtr(BN_new());
        state->b = FromBytes(private_value);
        state->b_pub = BnPtr(BN_new());
        BnPtr kv(BN_new());
        BnPtr gb(BN_new());
        auto& g = state->group;
        if (!state->verifier || !state->b || !state->b_pub || !kv || !gb ||
            BN_mod_exp(state->verifier.get(), g.g.get(), x.Unwrap().get(), g.n.get(), g.ctx.get()) != 1 ||
            BN_mod_mul(kv.get(), g.k.get(), state->verifier.get(), g.n.get(), g.ctx.get()) != 1 ||
            BN_mod_exp(gb.get(), g.g.get(), state->b.get(), g.n.get(), g.ctx.get()) != 1 ||
            BN_mod_add(state->b_pub.get(), kv.get(), gb.get(), g.n.get(), g.ctx.get()) != 1) {
            return ArithmeticError<std::unique_ptr<SrpServer>>("server public value");
        }
        state->public_key = ToBytes(state->b_pub.get());

        std::unique_ptr<SrpServer> server(new SrpServer());
        server->state_ = std::move(state);
        return Result<std::unique_ptr<SrpServer>, RemoteFailure>::Ok(std::move(server));
    }

    const std::vector<uint8_t>& SrpServer::PublicKey() const {
        return state_->public_key;
    }

    const std::vector<uint8_t>& SrpServer::Salt() const {
        return state_->salt;
    }

    const std::vector<uint8_t>& SrpServer::SessionKey() const {
        return state_->session_key;
    }

    Result<Unit, RemoteFailure> SrpServer::Process(std::span<const uint8_t> client_public) {
        auto& g = state_->group;
        BnPtr a_pub = FromBytes(client_public);
        if (!a_pub) {
            return ArithmeticError<Unit>("client public value");
        }
        if (IsZeroModN(a_pub.get(), g)) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::Authentication("Client public value is zero modulo N"));
        }
        auto u = ComputeU(a_pub.get(), state_->b_pub.get());
        if (u.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(u).UnwrapErr());
        }

        BnPtr vu(BN_new());
        BnPtr base(BN_new());
        BnPtr secret(BN_new());
        if (!vu || !base || !secret ||
            BN_mod_exp(vu.get(), state_->verifier.get(), u.Unwrap().get(), g.n.get(), g.ctx.get()) != 1 ||
            BN_mod_mul(base.get(), a_pub.get(), vu.get(), g.n.get(), g.ctx.get()) != 1 ||
            BN_mod_exp(secret.get(), base.get(), state_->b.get(), g.n.get(), g.ctx.get()) != 1) {
            return ArithmeticError<Unit>("premaster secret");
        }

        auto session_key = Sha512({ToBytes(secret.get())});
        if (session_key.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(session_key).UnwrapErr());
        }
        state_->session_key = std::move(session_key).Unwrap();

        auto expected = ComputeClientProof(g, state_->username, state_->salt, client_public,
                                           state_->public_key, state_->session_key);
        if (expected.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(expected).UnwrapErr());
        }
        state_->expected_client_proof = std::move(expected).Unwrap();

        auto server_proof = Sha512({client_public, state_->expected_client_proof, state_->session_key});
        if (server_proof.IsErr()) {
            return Result<Unit, RemoteFailure>::Err(std::move(server_proof).UnwrapErr());
        }
        state_->server_proof = std::move(server_proof).Unwrap();
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, RemoteFailure> SrpServer::VerifyClientProof(
        std::span<const uint8_t> client_proof) const {
        if (state_->expected_client_proof.empty()) {
            return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                RemoteFailure::InvalidState("SRP exchange has not been processed"));
        }
        if (!SodiumInterop::ConstantTimeEquals(client_proof, state_->expected_client_proof)) {
            return Result<std::vector<uint8_t>, RemoteFailure>::Err(
                RemoteFailure::Authentication("Client proof does not match"));
        }
        return Result<std::vector<uint8_t>, RemoteFailure>::Ok(state_->server_proof);
    }

}
