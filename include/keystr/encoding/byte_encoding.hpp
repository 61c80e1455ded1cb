#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::encoding {

/// Lowercase hex.
std::string ToHex(std::span<const uint8_t> data);

/// Strict hex decoding: even length, no separators, no whitespace.
Result<std::vector<uint8_t>, KeystrFailure> FromHex(std::string_view hex);

/// Decodes exactly N bytes of hex.
template<size_t N>
Result<std::array<uint8_t, N>, KeystrFailure> FromHexFixed(std::string_view hex) {
    if (hex.size() != N * 2) {
        return Result<std::array<uint8_t, N>, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat(
                "Expected " + std::to_string(N * 2) + " hex characters, got " +
                std::to_string(hex.size())));
    }
    auto decoded = FromHex(hex);
    if (decoded.IsErr()) {
        return Result<std::array<uint8_t, N>, KeystrFailure>::Err(std::move(decoded).UnwrapErr());
    }
    const auto& bytes = decoded.Unwrap();
    std::array<uint8_t, N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<std::array<uint8_t, N>, KeystrFailure>::Ok(out);
}

/// Standard alphabet with padding.
std::string Base64Encode(std::span<const uint8_t> data);

Result<std::vector<uint8_t>, KeystrFailure> Base64Decode(std::string_view text);

}
