#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"

#include <span>
#include <string>
#include <string_view>

namespace keystr::encoding {

/**
 * Textual key formats: 64 hex characters, or the NIP-19 bech32 forms
 * nsec1... (secret) and npub1... (public). Surrounding whitespace is
 * ignored. Parsed secret keys go straight into secure memory and are
 * range-checked against the curve order.
 */
class KeyEncoding {
public:
    static Result<crypto::SecureMemoryHandle, KeystrFailure> ParseSecretKey(std::string_view text);

    static Result<crypto::XOnlyPublicKey, KeystrFailure> ParsePublicKey(std::string_view text);

    static std::string ToNpub(const crypto::XOnlyPublicKey& public_key);

    static std::string ToNsec(std::span<const uint8_t> secret_key);

private:
    KeyEncoding() = delete;
};

}
