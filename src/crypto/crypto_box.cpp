#include "keystr/crypto/crypto_box.hpp"
#include "keystr/crypto/sodium_interop.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace keystr::crypto {

Result<Unit, KeystrFailure> CryptoBox::ValidateLogN(uint8_t log_n) {
    if (log_n < kMinScryptLogN || log_n > kMaxScryptLogN) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::CorruptRecord(
                fmt::format("scrypt log_n {} outside [{}, {}]", log_n, kMinScryptLogN, kMaxScryptLogN)));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<SecureMemoryHandle, KeystrFailure> CryptoBox::DeriveKey(
    std::string_view password,
    std::span<const uint8_t> salt,
    uint8_t log_n) {

    using R = Result<SecureMemoryHandle, KeystrFailure>;

    auto log_n_check = ValidateLogN(log_n);
    if (log_n_check.IsErr()) {
        return R::Err(std::move(log_n_check).UnwrapErr());
    }

    auto allocated = SecureMemoryHandle::Allocate(kVaultKeyBytes);
    if (allocated.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(allocated.UnwrapErr()));
    }
    SecureMemoryHandle key = std::move(allocated).Unwrap();

    static constexpr uint8_t kEmptyPassword = 0;
    const auto* password_bytes = password.empty()
        ? &kEmptyPassword
        : reinterpret_cast<const uint8_t*>(password.data());

    auto derived = key.WithWriteAccess([&](std::span<uint8_t> out) {
        return crypto_pwhash_scryptsalsa208sha256_ll(
            password_bytes, password.size(),
            salt.data(), salt.size(),
            uint64_t{1} << log_n, kScryptBlockSize, kScryptParallelism,
            out.data(), out.size());
    });
    if (derived.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    if (derived.Unwrap() != SodiumConstants::SUCCESS) {
        return R::Err(KeystrFailure::Crypto("scrypt key derivation failed"));
    }
    return R::Ok(std::move(key));
}

Result<SealedSecret, KeystrFailure> CryptoBox::Seal(
    std::span<const uint8_t> plaintext,
    std::string_view password,
    uint8_t log_n) {

    using R = Result<SealedSecret, KeystrFailure>;

    SealedSecret sealed;
    sealed.log_n = log_n;
    sealed.key_security = kKeySecurityTrusted;
    SodiumInterop::FillRandom(sealed.salt);
    SodiumInterop::FillRandom(sealed.nonce);

    auto key_result = DeriveKey(password, sealed.salt, log_n);
    if (key_result.IsErr()) {
        return R::Err(std::move(key_result).UnwrapErr());
    }
    const SecureMemoryHandle& key = key_result.Unwrap();

    sealed.ciphertext.resize(plaintext.size());
    auto encrypted = key.WithReadAccess([&](std::span<const uint8_t> k) {
        return crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
            sealed.ciphertext.data(),
            sealed.tag.data(), nullptr,
            plaintext.data(), plaintext.size(),
            &sealed.key_security, 1,
            nullptr,
            sealed.nonce.data(),
            k.data());
    });
    if (encrypted.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    if (encrypted.Unwrap() != SodiumConstants::SUCCESS) {
        return R::Err(KeystrFailure::Crypto("XChaCha20-Poly1305 encryption failed"));
    }
    return R::Ok(std::move(sealed));
}

Result<SecureMemoryHandle, KeystrFailure> CryptoBox::Open(
    const SealedSecret& sealed,
    std::string_view password) {

    using R = Result<SecureMemoryHandle, KeystrFailure>;

    if (sealed.ciphertext.empty()) {
        return R::Err(KeystrFailure::CorruptRecord("Sealed secret has no ciphertext"));
    }

    auto key_result = DeriveKey(password, sealed.salt, sealed.log_n);
    if (key_result.IsErr()) {
        return R::Err(std::move(key_result).UnwrapErr());
    }
    const SecureMemoryHandle& key = key_result.Unwrap();

    auto allocated = SecureMemoryHandle::Allocate(sealed.ciphertext.size());
    if (allocated.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(allocated.UnwrapErr()));
    }
    SecureMemoryHandle plaintext = std::move(allocated).Unwrap();

    auto decrypted = key.WithReadAccess([&](std::span<const uint8_t> k) {
        return plaintext.WithWriteAccess([&](std::span<uint8_t> out) {
            return crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
                out.data(),
                nullptr,
                sealed.ciphertext.data(), sealed.ciphertext.size(),
                sealed.tag.data(),
                &sealed.key_security, 1,
                sealed.nonce.data(),
                k.data());
        });
    });
    if (decrypted.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    auto& status = decrypted.Unwrap();
    if (status.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(status.UnwrapErr()));
    }
    if (status.Unwrap() != SodiumConstants::SUCCESS) {
        plaintext.Wipe();
        return R::Err(KeystrFailure::AuthenticationFailed(std::string(ErrorMessages::AEAD_AUTH_FAILED)));
    }
    if (sealed.key_security != kKeySecurityTrusted) {
        return R::Err(KeystrFailure::CorruptRecord(
            fmt::format("Unsupported key security marker {}", sealed.key_security)));
    }
    return R::Ok(std::move(plaintext));
}

Result<std::vector<uint8_t>, KeystrFailure> CryptoBox::ToLegacyBlob(const SealedSecret& sealed) {
    if (sealed.ciphertext.size() != kSecretKeyBytes) {
        return Result<std::vector<uint8_t>, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Legacy blob only holds a 32-byte secret key"));
    }
    std::vector<uint8_t> blob;
    blob.reserve(kLegacyBlobBytes);
    blob.push_back(kLegacyBlobVersion);
    blob.push_back(sealed.log_n);
    blob.insert(blob.end(), sealed.salt.begin(), sealed.salt.end());
    blob.insert(blob.end(), sealed.nonce.begin(), sealed.nonce.end());
    blob.push_back(sealed.key_security);
    blob.insert(blob.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
    blob.insert(blob.end(), sealed.tag.begin(), sealed.tag.end());
    return Result<std::vector<uint8_t>, KeystrFailure>::Ok(std::move(blob));
}

Result<SealedSecret, KeystrFailure> CryptoBox::FromLegacyBlob(std::span<const uint8_t> blob) {
    using R = Result<SealedSecret, KeystrFailure>;

    if (blob.empty()) {
        return R::Err(KeystrFailure::InvalidKeyFormat("Encrypted key blob is empty"));
    }
    if (blob[0] != kLegacyBlobVersion) {
        return R::Err(KeystrFailure::UnsupportedVaultVersion(
            fmt::format("Encrypted key version {} is not supported", blob[0])));
    }
    if (blob.size() != kLegacyBlobBytes) {
        return R::Err(KeystrFailure::InvalidKeyFormat(
            fmt::format("Encrypted key must be {} bytes, got {}", kLegacyBlobBytes, blob.size())));
    }

    SealedSecret sealed;
    size_t offset = 1;
    sealed.log_n = blob[offset++];
    std::copy_n(blob.begin() + offset, kScryptSaltBytes, sealed.salt.begin());
    offset += kScryptSaltBytes;
    std::copy_n(blob.begin() + offset, kXChaChaNonceBytes, sealed.nonce.begin());
    offset += kXChaChaNonceBytes;
    sealed.key_security = blob[offset++];
    sealed.ciphertext.assign(blob.begin() + offset, blob.begin() + offset + kSecretKeyBytes);
    offset += kSecretKeyBytes;
    std::copy_n(blob.begin() + offset, kAeadTagBytes, sealed.tag.begin());

    auto log_n_check = ValidateLogN(sealed.log_n);
    if (log_n_check.IsErr()) {
        return R::Err(std::move(log_n_check).UnwrapErr());
    }
    return R::Ok(std::move(sealed));
}

}
