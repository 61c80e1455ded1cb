#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/crypto_box.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace keystr::vault {

/**
 * A public key, optionally paired with the secret key it derives from.
 *
 * The public key is always computed from the secret key when one is
 * present; there is no way to set the two independently. The secret
 * key stays in secure memory and is only reachable through the
 * operations below.
 */
class Identity {
public:
    static Result<Identity, KeystrFailure> Generate();

    static Result<Identity, KeystrFailure> FromSecretKey(crypto::SecureMemoryHandle secret_key);

    static Identity FromPublicKey(const crypto::XOnlyPublicKey& public_key);

    Identity(Identity&&) noexcept = default;
    Identity& operator=(Identity&&) noexcept = default;
    Identity(const Identity&) = delete;
    Identity& operator=(const Identity&) = delete;

    [[nodiscard]] const crypto::XOnlyPublicKey& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] bool HasSecretKey() const noexcept { return secret_key_.has_value(); }

    [[nodiscard]] const std::optional<std::string>& GetLabel() const noexcept { return label_; }
    void SetLabel(std::optional<std::string> label) { label_ = std::move(label); }

    Result<crypto::SchnorrSignature, KeystrFailure> Sign(std::span<const uint8_t> digest) const;

    Result<crypto::SecureMemoryHandle, KeystrFailure> DeriveSharedSecret(
        const crypto::XOnlyPublicKey& peer) const;

    Result<crypto::SealedSecret, KeystrFailure> SealSecretKey(std::string_view password, uint8_t log_n) const;

    Result<std::string, KeystrFailure> EncodeSecretKey() const;

    /// Zeroes and drops the secret key; the public key is kept.
    void ForgetSecretKey() noexcept;

private:
    Identity(const crypto::XOnlyPublicKey& public_key,
             std::optional<crypto::SecureMemoryHandle> secret_key)
        : public_key_(public_key)
        , secret_key_(std::move(secret_key)) {}

    Result<const crypto::SecureMemoryHandle*, KeystrFailure> RequireSecretKey() const;

    crypto::XOnlyPublicKey public_key_;
    std::optional<crypto::SecureMemoryHandle> secret_key_;
    std::optional<std::string> label_;
};

}
