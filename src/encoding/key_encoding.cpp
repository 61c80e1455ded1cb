#include "keystr/encoding/key_encoding.hpp"
#include "keystr/encoding/bech32.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/crypto/sodium_interop.hpp"

namespace keystr::encoding {

namespace {

std::string_view Trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool HasPrefix(std::string_view text, std::string_view hrp) {
    return text.size() > hrp.size() && text.substr(0, hrp.size()) == hrp && text[hrp.size()] == '1';
}

/// Decodes hex or bech32 (with the expected hrp) into @p out; out must be wiped by the caller.
Result<Unit, KeystrFailure> DecodeKeyBytes(std::string_view text, std::string_view hrp,
                                           std::string_view format_error,
                                           std::vector<uint8_t>& out) {
    if (HasPrefix(text, hrp)) {
        auto decoded = Bech32::Decode(text);
        if (decoded.IsErr() || decoded.Unwrap().hrp != hrp) {
            return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidKeyFormat(std::string(format_error)));
        }
        out = std::move(decoded.Unwrap().data);
    } else {
        auto decoded = FromHex(text);
        if (decoded.IsErr()) {
            return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidKeyFormat(std::string(format_error)));
        }
        out = std::move(decoded).Unwrap();
    }
    if (out.size() != kSecretKeyBytes) {
        crypto::SodiumInterop::SecureWipe(out);
        return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidKeyFormat(std::string(format_error)));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

}

Result<crypto::SecureMemoryHandle, KeystrFailure> KeyEncoding::ParseSecretKey(std::string_view text) {
    using R = Result<crypto::SecureMemoryHandle, KeystrFailure>;

    std::vector<uint8_t> bytes;
    auto decoded = DecodeKeyBytes(Trim(text), kSecretKeyHrp, ErrorMessages::INVALID_SECRET_KEY, bytes);
    if (decoded.IsErr()) {
        return R::Err(std::move(decoded).UnwrapErr());
    }

    auto valid = crypto::Secp256k1::ValidateSecretKey(bytes);
    if (valid.IsErr()) {
        crypto::SodiumInterop::SecureWipe(bytes);
        return R::Err(std::move(valid).UnwrapErr());
    }
    auto handle = crypto::SecureMemoryHandle::FromBytes(bytes);
    crypto::SodiumInterop::SecureWipe(bytes);
    if (handle.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return R::Ok(std::move(handle).Unwrap());
}

Result<crypto::XOnlyPublicKey, KeystrFailure> KeyEncoding::ParsePublicKey(std::string_view text) {
    using R = Result<crypto::XOnlyPublicKey, KeystrFailure>;

    std::vector<uint8_t> bytes;
    auto decoded = DecodeKeyBytes(Trim(text), kPublicKeyHrp, ErrorMessages::INVALID_PUBLIC_KEY, bytes);
    if (decoded.IsErr()) {
        return R::Err(std::move(decoded).UnwrapErr());
    }
    auto valid = crypto::Secp256k1::ValidatePublicKey(bytes);
    if (valid.IsErr()) {
        return R::Err(std::move(valid).UnwrapErr());
    }
    crypto::XOnlyPublicKey public_key{};
    std::copy(bytes.begin(), bytes.end(), public_key.begin());
    return R::Ok(public_key);
}

std::string KeyEncoding::ToNpub(const crypto::XOnlyPublicKey& public_key) {
    return Bech32::Encode(kPublicKeyHrp, public_key);
}

std::string KeyEncoding::ToNsec(std::span<const uint8_t> secret_key) {
    return Bech32::Encode(kSecretKeyHrp, secret_key);
}

}
