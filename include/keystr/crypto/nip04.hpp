#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace keystr::crypto {

/**
 * NIP-04 direct-message encryption.
 *
 * AES-256-CBC (PKCS#7 padding) keyed by the raw 32-byte ECDH shared
 * secret, random 16-byte IV, wire form "<base64 ciphertext>?iv=<base64 iv>".
 *
 * The scheme carries no authentication tag: a wrong key is only detected
 * through a padding error or a downstream parse failure. Both surface
 * as DecryptionFailed.
 */
class Nip04 {
public:
    static Result<std::string, KeystrFailure> Encrypt(
        std::span<const uint8_t> shared_secret,
        std::string_view plaintext);

    /// Deterministic variant with a caller-supplied IV, for known-answer tests.
    static Result<std::string, KeystrFailure> EncryptWithIv(
        std::span<const uint8_t> shared_secret,
        std::string_view plaintext,
        std::span<const uint8_t> iv);

    static Result<std::string, KeystrFailure> Decrypt(
        std::span<const uint8_t> shared_secret,
        std::string_view payload);

private:
    Nip04() = delete;
};

}
