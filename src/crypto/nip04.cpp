#include "keystr/crypto/nip04.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

#include <fmt/format.h>

#include <memory>
#include <vector>

namespace keystr::crypto {

namespace {

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

Result<Unit, KeystrFailure> CheckKey(std::span<const uint8_t> shared_secret) {
    if (shared_secret.size() != kSharedSecretBytes) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::Crypto(
                fmt::format("NIP-04 key must be {} bytes, got {}", kSharedSecretBytes, shared_secret.size())));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

}

Result<std::string, KeystrFailure> Nip04::Encrypt(
    std::span<const uint8_t> shared_secret,
    std::string_view plaintext) {

    std::array<uint8_t, kNip04IvBytes> iv{};
    SodiumInterop::FillRandom(iv);
    return EncryptWithIv(shared_secret, plaintext, iv);
}

Result<std::string, KeystrFailure> Nip04::EncryptWithIv(
    std::span<const uint8_t> shared_secret,
    std::string_view plaintext,
    std::span<const uint8_t> iv) {

    using R = Result<std::string, KeystrFailure>;

    auto key_check = CheckKey(shared_secret);
    if (key_check.IsErr()) {
        return R::Err(std::move(key_check).UnwrapErr());
    }
    if (iv.size() != kNip04IvBytes) {
        return R::Err(KeystrFailure::Crypto(
            fmt::format("NIP-04 IV must be {} bytes, got {}", kNip04IvBytes, iv.size())));
    }

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                           shared_secret.data(), iv.data()) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        return R::Err(KeystrFailure::Crypto("Failed to initialize AES-256-CBC"));
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + kAesBlockBytes);
    int written = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &written,
                          reinterpret_cast<const uint8_t*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        return R::Err(KeystrFailure::Crypto("AES-256-CBC encryption failed"));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + written, &final_len) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        return R::Err(KeystrFailure::Crypto("AES-256-CBC finalization failed"));
    }
    ciphertext.resize(static_cast<size_t>(written + final_len));

    std::string payload = encoding::Base64Encode(ciphertext);
    payload.append(kNip04IvSeparator);
    payload.append(encoding::Base64Encode(iv));
    return R::Ok(std::move(payload));
}

Result<std::string, KeystrFailure> Nip04::Decrypt(
    std::span<const uint8_t> shared_secret,
    std::string_view payload) {

    using R = Result<std::string, KeystrFailure>;

    auto key_check = CheckKey(shared_secret);
    if (key_check.IsErr()) {
        return R::Err(std::move(key_check).UnwrapErr());
    }

    const auto separator = payload.find(kNip04IvSeparator);
    if (separator == std::string_view::npos) {
        return R::Err(KeystrFailure::DecryptionFailed(std::string(ErrorMessages::NIP04_FORMAT)));
    }
    auto ciphertext = encoding::Base64Decode(payload.substr(0, separator));
    auto iv = encoding::Base64Decode(payload.substr(separator + kNip04IvSeparator.size()));
    if (ciphertext.IsErr() || iv.IsErr()) {
        return R::Err(KeystrFailure::DecryptionFailed(std::string(ErrorMessages::NIP04_FORMAT)));
    }
    const auto& ct = ciphertext.Unwrap();
    if (iv.Unwrap().size() != kNip04IvBytes || ct.empty() || ct.size() % kAesBlockBytes != 0) {
        return R::Err(KeystrFailure::DecryptionFailed("Malformed NIP-04 ciphertext or IV"));
    }

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                           shared_secret.data(), iv.Unwrap().data()) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        return R::Err(KeystrFailure::Crypto("Failed to initialize AES-256-CBC"));
    }

    std::vector<uint8_t> plaintext(ct.size() + kAesBlockBytes);
    int written = 0;
    int final_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written,
                          ct.data(), static_cast<int>(ct.size())) != OpenSSLConstants::SUCCESS ||
        EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &final_len) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        SodiumInterop::SecureWipe(plaintext);
        return R::Err(KeystrFailure::DecryptionFailed("NIP-04 decryption failed"));
    }

    std::string text(reinterpret_cast<const char*>(plaintext.data()),
                     static_cast<size_t>(written + final_len));
    SodiumInterop::SecureWipe(plaintext);
    return R::Ok(std::move(text));
}

}
