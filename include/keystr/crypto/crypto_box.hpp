#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keystr::crypto {

/// Everything needed to reopen a sealed secret, apart from the password.
struct SealedSecret {
    uint8_t log_n = kDefaultScryptLogN;
    std::array<uint8_t, kScryptSaltBytes> salt{};
    std::array<uint8_t, kXChaChaNonceBytes> nonce{};
    uint8_t key_security = kKeySecurityTrusted;
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, kAeadTagBytes> tag{};
};

/**
 * @brief Password-based sealing of small secrets (secret keys).
 *
 * Key derivation: scrypt with N = 2^log_n, r = 8, p = 1, 16-byte random
 * salt, 32-byte output. Cipher: XChaCha20-Poly1305 with a 24-byte random
 * nonce and the key_security byte as associated data.
 *
 * These parameters match the encrypted-key blobs written by earlier
 * keystr releases; see ToLegacyBlob for the byte layout.
 *
 * The derived key is held in secure memory for the duration of one call
 * and zeroed on every path. Open decrypts straight into secure memory.
 */
class CryptoBox {
public:
    static Result<SealedSecret, KeystrFailure> Seal(
        std::span<const uint8_t> plaintext,
        std::string_view password,
        uint8_t log_n = kDefaultScryptLogN);

    /// AuthenticationFailed when the password is wrong or any sealed byte was altered.
    static Result<SecureMemoryHandle, KeystrFailure> Open(
        const SealedSecret& sealed,
        std::string_view password);

    /**
     * @brief 91-byte blob: version(0x01) | log_n | salt[16] | nonce[24] |
     *        key_security | ciphertext[32] | tag[16].
     */
    static Result<std::vector<uint8_t>, KeystrFailure> ToLegacyBlob(const SealedSecret& sealed);

    static Result<SealedSecret, KeystrFailure> FromLegacyBlob(std::span<const uint8_t> blob);

    static Result<Unit, KeystrFailure> ValidateLogN(uint8_t log_n);

private:
    static Result<SecureMemoryHandle, KeystrFailure> DeriveKey(
        std::string_view password,
        std::span<const uint8_t> salt,
        uint8_t log_n);

    CryptoBox() = delete;
};

}
