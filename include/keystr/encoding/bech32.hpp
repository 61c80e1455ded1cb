#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::encoding {

struct Bech32Payload {
    std::string hrp;
    std::vector<uint8_t> data;
};

/**
 * @brief BIP-173 bech32 (original checksum constant, not bech32m) over 8-bit payloads.
 *
 * Used for the nsec / npub key encodings. Mixed-case input is rejected;
 * the 90-character limit of BIP-173 is not enforced since key strings
 * stay well below it.
 */
class Bech32 {
public:
    static std::string Encode(std::string_view hrp, std::span<const uint8_t> data);

    static Result<Bech32Payload, KeystrFailure> Decode(std::string_view text);

private:
    static uint32_t Polymod(std::span<const uint8_t> values) noexcept;
    static std::vector<uint8_t> ExpandHrp(std::string_view hrp);
    static bool ConvertBits(std::span<const uint8_t> in, int from_bits, int to_bits,
                            bool pad, std::vector<uint8_t>& out);

    Bech32() = delete;
};

}
