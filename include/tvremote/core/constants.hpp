#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tvremote {

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kChaChaKeyBytes = 32;
inline constexpr size_t kChaChaNonceBytes = 12;
inline constexpr size_t kChaChaTagBytes = 16;
inline constexpr size_t kNoncePrefixBytes = 4;
inline constexpr size_t kNonceCounterBytes = 8;
inline constexpr size_t kSessionKeyBytes = 32;

inline constexpr size_t kMaxVariantBytes = 10;
inline constexpr size_t kTlvChunkBytes = 255;
inline constexpr size_t kDefaultMaxFrameBytes = 8u * 1024u * 1024u;

inline constexpr std::string_view kSrpUsername = "Pair-Setup";
inline constexpr uint32_t kSrpGenerator = 5;
inline constexpr size_t kSrpPrimeBytes = 384;
inline constexpr size_t kSrpSaltBytes = 16;
inline constexpr size_t kSha512Bytes = 64;

inline constexpr std::string_view kPairSetupSignSalt = "Pair-Setup-Controller-Sign-Salt";
inline constexpr std::string_view kPairSetupSignInfo = "Pair-Setup-Controller-Sign-Info";
inline constexpr std::string_view kPairSetupAccessorySignSalt = "Pair-Setup-Accessory-Sign-Salt";
inline constexpr std::string_view kPairSetupAccessorySignInfo = "Pair-Setup-Accessory-Sign-Info";
inline constexpr std::string_view kPairSetupEncryptSalt = "Pair-Setup-Encrypt-Salt";
inline constexpr std::string_view kPairSetupEncryptInfo = "Pair-Setup-Encrypt-Info";
inline constexpr std::string_view kPairVerifyEncryptSalt = "Pair-Verify-Encrypt-Salt";
inline constexpr std::string_view kPairVerifyEncryptInfo = "Pair-Verify-Encrypt-Info";
inline constexpr std::string_view kSessionKeySalt = "MediaRemote-Salt";
inline constexpr std::string_view kSessionWriteKeyInfo = "MediaRemote-Write-Encryption-Key";
inline constexpr std::string_view kSessionReadKeyInfo = "MediaRemote-Read-Encryption-Key";

inline constexpr std::string_view kPairSetupMsg05Nonce = "PS-Msg05";
inline constexpr std::string_view kPairSetupMsg06Nonce = "PS-Msg06";
inline constexpr std::string_view kPairVerifyMsg02Nonce = "PV-Msg02";
inline constexpr std::string_view kPairVerifyMsg03Nonce = "PV-Msg03";

inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{5000};
inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{10000};
inline constexpr std::chrono::milliseconds kDefaultHeartbeatInterval{30000};
inline constexpr std::chrono::milliseconds kDefaultInitialStateWait{1000};
inline constexpr std::chrono::milliseconds kKeyHoldDuration{1000};
inline constexpr uint32_t kDefaultHeartbeatRetries = 1;

}  // namespace tvremote
