#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace keystr {

inline constexpr size_t kSecretKeyBytes = 32;
inline constexpr size_t kPublicKeyBytes = 32;
inline constexpr size_t kSchnorrSignatureBytes = 64;
inline constexpr size_t kDigestBytes = 32;
inline constexpr size_t kSharedSecretBytes = 32;

inline constexpr size_t kVaultKeyBytes = 32;
inline constexpr size_t kScryptSaltBytes = 16;
inline constexpr size_t kXChaChaNonceBytes = 24;
inline constexpr size_t kAeadTagBytes = 16;
inline constexpr uint8_t kDefaultScryptLogN = 13;
inline constexpr uint8_t kMinScryptLogN = 1;
inline constexpr uint8_t kMaxScryptLogN = 22;
inline constexpr uint32_t kScryptBlockSize = 8;
inline constexpr uint32_t kScryptParallelism = 1;
/// Associated data byte: key not known to have been handled insecurely.
inline constexpr uint8_t kKeySecurityTrusted = 0x01;

inline constexpr uint8_t kLegacyBlobVersion = 0x01;
inline constexpr size_t kLegacyBlobBytes =
    1 + 1 + kScryptSaltBytes + kXChaChaNonceBytes + 1 + kSecretKeyBytes + kAeadTagBytes;

inline constexpr uint32_t kVaultFormatVersion = 1;

inline constexpr size_t kNip04IvBytes = 16;
inline constexpr size_t kAesBlockBytes = 16;
inline constexpr std::string_view kNip04IvSeparator = "?iv=";

inline constexpr std::string_view kSecretKeyHrp = "nsec";
inline constexpr std::string_view kPublicKeyHrp = "npub";

inline constexpr std::string_view kNostrConnectScheme = "nostrconnect://";
inline constexpr std::string_view kDelegationTokenPrefix = "nostr:delegation:";
inline constexpr std::string_view kBip340ChallengeTag = "BIP0340/challenge";
inline constexpr std::string_view kBip340AuxTag = "BIP0340/aux";
inline constexpr std::string_view kBip340NonceTag = "BIP0340/nonce";

inline constexpr std::chrono::seconds kDefaultApprovalTimeout{120};
inline constexpr size_t kDefaultWorkerThreads = 2;
inline constexpr size_t kDefaultWorkerQueueCapacity = 64;
inline constexpr size_t kDefaultMaxPendingRequests = 256;
inline constexpr size_t kRequestIdBytes = 8;
inline constexpr size_t kPreviewContentChars = 100;

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SIGNING_UNAVAILABLE = "No unlocked secret key available";
    static constexpr std::string_view VAULT_EMPTY = "Vault holds no key";
    static constexpr std::string_view VAULT_NOT_LOCKED = "Vault holds no locked record";
    static constexpr std::string_view PASSWORD_REQUIRED = "Security level requires a non-empty password";
    static constexpr std::string_view WRONG_PASSWORD = "Password does not open the stored key";
    static constexpr std::string_view NO_RECORD = "No stored vault record";
    static constexpr std::string_view PUBLIC_KEY_MISMATCH = "Stored public key does not match decrypted secret key";
    static constexpr std::string_view REVEAL_NOT_CONFIRMED = "Secret key reveal requires explicit confirmation";
    static constexpr std::string_view INVALID_SECRET_KEY = "Secret key must be 64 hex characters or an nsec string";
    static constexpr std::string_view INVALID_PUBLIC_KEY = "Public key must be 64 hex characters or an npub string";
    static constexpr std::string_view DIGEST_SIZE = "Message digest must be 32 bytes";
    static constexpr std::string_view AEAD_AUTH_FAILED = "Authentication tag mismatch";
    static constexpr std::string_view NIP04_FORMAT = "Payload is not <base64>?iv=<base64>";
    static constexpr std::string_view REQUEST_NOT_PENDING = "No pending request with this id";
    static constexpr std::string_view QUEUE_FULL = "Too many pending requests";
    static constexpr std::string_view REJECTED_BY_USER = "Request rejected by user";
    static constexpr std::string_view APPROVAL_TIMEOUT = "Approval timed out";
    static constexpr std::string_view SESSION_CLOSED = "Session closed before approval";
};

}
