#include "keystr/encoding/byte_encoding.hpp"

#include <sodium.h>

namespace keystr::encoding {

std::string ToHex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.resize(data.size() * 2);
    return out;
}

Result<std::vector<uint8_t>, KeystrFailure> FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat("Hex string has odd length"));
    }
    std::vector<uint8_t> out(hex.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int rc = sodium_hex2bin(
        out.data(), out.size(),
        hex.data(), hex.size(),
        nullptr, &decoded_len, &end);
    if (rc != 0 || decoded_len != out.size() || end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat("Invalid hex string"));
    }
    return Result<std::vector<uint8_t>, KeystrFailure>::Ok(std::move(out));
}

std::string Base64Encode(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    out.resize(out.size() - 1);
    return out;
}

Result<std::vector<uint8_t>, KeystrFailure> Base64Decode(std::string_view text) {
    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int rc = sodium_base642bin(
        out.data(), out.size(),
        text.data(), text.size(),
        nullptr, &decoded_len, &end,
        sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0 || end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, KeystrFailure>::Err(
            KeystrFailure::InvalidRequest("Invalid base64 text"));
    }
    out.resize(decoded_len);
    return Result<std::vector<uint8_t>, KeystrFailure>::Ok(std::move(out));
}

}
