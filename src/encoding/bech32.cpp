#include "keystr/encoding/bech32.hpp"

#include <cctype>

namespace keystr::encoding {

namespace {

constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr uint32_t kChecksumConstant = 1;
constexpr size_t kChecksumLength = 6;

int CharsetIndex(char c) noexcept {
    const auto pos = kCharset.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

}

uint32_t Bech32::Polymod(std::span<const uint8_t> values) noexcept {
    constexpr uint32_t generator[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (const uint8_t value : values) {
        const uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ value;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= generator[i];
            }
        }
    }
    return chk;
}

std::vector<uint8_t> Bech32::ExpandHrp(std::string_view hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (const char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) >> 5);
    }
    out.push_back(0);
    for (const char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    return out;
}

bool Bech32::ConvertBits(std::span<const uint8_t> in, int from_bits, int to_bits,
                         bool pad, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t max_value = (1u << to_bits) - 1;
    for (const uint8_t value : in) {
        if ((value >> from_bits) != 0) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_value));
        }
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_value));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_value) != 0) {
        return false;
    }
    return true;
}

std::string Bech32::Encode(std::string_view hrp, std::span<const uint8_t> data) {
    std::vector<uint8_t> words;
    ConvertBits(data, 8, 5, true, words);

    std::vector<uint8_t> checksum_input = ExpandHrp(hrp);
    checksum_input.insert(checksum_input.end(), words.begin(), words.end());
    checksum_input.insert(checksum_input.end(), kChecksumLength, 0);
    const uint32_t mod = Polymod(checksum_input) ^ kChecksumConstant;

    std::string out(hrp);
    out.push_back('1');
    for (const uint8_t word : words) {
        out.push_back(kCharset[word]);
    }
    for (size_t i = 0; i < kChecksumLength; ++i) {
        out.push_back(kCharset[(mod >> (5 * (kChecksumLength - 1 - i))) & 0x1f]);
    }
    return out;
}

Result<Bech32Payload, KeystrFailure> Bech32::Decode(std::string_view text) {
    using R = Result<Bech32Payload, KeystrFailure>;

    bool has_lower = false;
    bool has_upper = false;
    for (const char c : text) {
        if (c < 33 || c > 126) {
            return R::Err(KeystrFailure::InvalidKeyFormat("bech32: invalid character"));
        }
        has_lower |= std::islower(static_cast<unsigned char>(c)) != 0;
        has_upper |= std::isupper(static_cast<unsigned char>(c)) != 0;
    }
    if (has_lower && has_upper) {
        return R::Err(KeystrFailure::InvalidKeyFormat("bech32: mixed case"));
    }

    std::string lowered(text);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    const auto separator = lowered.rfind('1');
    if (separator == std::string::npos || separator == 0 ||
        separator + 1 + kChecksumLength > lowered.size()) {
        return R::Err(KeystrFailure::InvalidKeyFormat("bech32: missing separator or checksum"));
    }

    const std::string hrp = lowered.substr(0, separator);
    std::vector<uint8_t> words;
    words.reserve(lowered.size() - separator - 1);
    for (size_t i = separator + 1; i < lowered.size(); ++i) {
        const int index = CharsetIndex(lowered[i]);
        if (index < 0) {
            return R::Err(KeystrFailure::InvalidKeyFormat("bech32: character outside charset"));
        }
        words.push_back(static_cast<uint8_t>(index));
    }

    std::vector<uint8_t> checksum_input = ExpandHrp(hrp);
    checksum_input.insert(checksum_input.end(), words.begin(), words.end());
    if (Polymod(checksum_input) != kChecksumConstant) {
        return R::Err(KeystrFailure::InvalidKeyFormat("bech32: checksum mismatch"));
    }

    words.resize(words.size() - kChecksumLength);
    Bech32Payload payload;
    payload.hrp = hrp;
    if (!ConvertBits(words, 5, 8, false, payload.data)) {
        return R::Err(KeystrFailure::InvalidKeyFormat("bech32: invalid padding"));
    }
    return R::Ok(std::move(payload));
}

}
