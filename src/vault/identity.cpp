#include "keystr/vault/identity.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/encoding/key_encoding.hpp"

namespace keystr::vault {

using crypto::SecureMemoryHandle;

Result<Identity, KeystrFailure> Identity::Generate() {
    using R = Result<Identity, KeystrFailure>;

    auto allocated = SecureMemoryHandle::Allocate(kSecretKeyBytes);
    if (allocated.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(allocated.UnwrapErr()));
    }
    SecureMemoryHandle secret = std::move(allocated).Unwrap();

    // A uniform 32-byte value is >= n with probability ~2^-128; redraw in that case.
    for (;;) {
        auto drawn = secret.WithWriteAccess([](std::span<uint8_t> out) {
            crypto::SodiumInterop::FillRandom(out);
            return crypto::Secp256k1::ValidateSecretKey(out).IsOk();
        });
        if (drawn.IsErr()) {
            return R::Err(KeystrFailure::FromSodiumFailure(drawn.UnwrapErr()));
        }
        if (drawn.Unwrap()) {
            break;
        }
    }
    return FromSecretKey(std::move(secret));
}

Result<Identity, KeystrFailure> Identity::FromSecretKey(SecureMemoryHandle secret_key) {
    using R = Result<Identity, KeystrFailure>;

    auto derived = secret_key.WithReadAccess([](std::span<const uint8_t> sk) {
        return crypto::Secp256k1::DerivePublicKey(sk);
    });
    if (derived.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    auto& public_key = derived.Unwrap();
    if (public_key.IsErr()) {
        return R::Err(std::move(public_key).UnwrapErr());
    }
    return R::Ok(Identity(public_key.Unwrap(), std::move(secret_key)));
}

Identity Identity::FromPublicKey(const crypto::XOnlyPublicKey& public_key) {
    return Identity(public_key, std::nullopt);
}

Result<const SecureMemoryHandle*, KeystrFailure> Identity::RequireSecretKey() const {
    if (!secret_key_.has_value() || secret_key_->IsInvalid()) {
        return Result<const SecureMemoryHandle*, KeystrFailure>::Err(
            KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE)));
    }
    return Result<const SecureMemoryHandle*, KeystrFailure>::Ok(&*secret_key_);
}

Result<crypto::SchnorrSignature, KeystrFailure> Identity::Sign(std::span<const uint8_t> digest) const {
    using R = Result<crypto::SchnorrSignature, KeystrFailure>;

    auto secret = RequireSecretKey();
    if (secret.IsErr()) {
        return R::Err(std::move(secret).UnwrapErr());
    }
    auto signed_result = secret.Unwrap()->WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto::Secp256k1::SignSchnorr(sk, digest);
    });
    if (signed_result.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(signed_result.UnwrapErr()));
    }
    return std::move(signed_result).Unwrap();
}

Result<SecureMemoryHandle, KeystrFailure> Identity::DeriveSharedSecret(
    const crypto::XOnlyPublicKey& peer) const {

    using R = Result<SecureMemoryHandle, KeystrFailure>;

    auto secret = RequireSecretKey();
    if (secret.IsErr()) {
        return R::Err(std::move(secret).UnwrapErr());
    }
    auto shared = secret.Unwrap()->WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto::Secp256k1::ComputeSharedSecret(sk, peer);
    });
    if (shared.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(shared.UnwrapErr()));
    }
    return std::move(shared).Unwrap();
}

Result<crypto::SealedSecret, KeystrFailure> Identity::SealSecretKey(
    std::string_view password, uint8_t log_n) const {

    using R = Result<crypto::SealedSecret, KeystrFailure>;

    auto secret = RequireSecretKey();
    if (secret.IsErr()) {
        return R::Err(std::move(secret).UnwrapErr());
    }
    auto sealed = secret.Unwrap()->WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto::CryptoBox::Seal(sk, password, log_n);
    });
    if (sealed.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    return std::move(sealed).Unwrap();
}

Result<std::string, KeystrFailure> Identity::EncodeSecretKey() const {
    using R = Result<std::string, KeystrFailure>;

    auto secret = RequireSecretKey();
    if (secret.IsErr()) {
        return R::Err(std::move(secret).UnwrapErr());
    }
    auto encoded = secret.Unwrap()->WithReadAccess([](std::span<const uint8_t> sk) {
        return encoding::KeyEncoding::ToNsec(sk);
    });
    if (encoded.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(encoded.UnwrapErr()));
    }
    return R::Ok(std::move(encoded).Unwrap());
}

void Identity::ForgetSecretKey() noexcept {
    if (secret_key_.has_value()) {
        secret_key_->Wipe();
        secret_key_.reset();
    }
}

}
