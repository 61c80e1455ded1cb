#include <catch2/catch_test_macros.hpp>
#include "keystr/encoding/key_encoding.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include <string>
#include <vector>
using namespace keystr;
using namespace keystr::encoding;
using namespace keystr::crypto;
namespace {
constexpr std::string_view kSecretHex = "b2f3673ee3a659283e6599080e0ab0e669a3c2640914375a9b0b357faae08b17";
constexpr std::string_view kPublicHex = "1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4";
constexpr std::string_view kNsec = "nsec1ktekw0hr5evjs0n9nyyquz4sue568snypy2rwk5mpv6hl2hq3vtsk0kpae";
constexpr std::string_view kNpub = "npub1rfze4zn25ezp6jqt5ejlhrajrfx0az72ed7cwvq0spr22k9rlnjq93lmd4";
std::string ReadSecretHex(const SecureMemoryHandle& handle) {
    return handle.WithReadAccess([](std::span<const uint8_t> bytes) { return ToHex(bytes); }).Unwrap();
}
}
TEST_CASE("KeyEncoding - NIP-19 known pair", "[encoding][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("nsec and hex parse to the same secret") {
        auto from_hex = KeyEncoding::ParseSecretKey(kSecretHex);
        auto from_nsec = KeyEncoding::ParseSecretKey(kNsec);
        REQUIRE(from_hex.IsOk());
        REQUIRE(from_nsec.IsOk());
        REQUIRE(ReadSecretHex(from_hex.Unwrap()) == kSecretHex);
        REQUIRE(ReadSecretHex(from_nsec.Unwrap()) == kSecretHex);
    }
    SECTION("npub and hex parse to the same public key") {
        auto from_hex = KeyEncoding::ParsePublicKey(kPublicHex);
        auto from_npub = KeyEncoding::ParsePublicKey(kNpub);
        REQUIRE(from_hex.IsOk());
        REQUIRE(from_npub.IsOk());
        REQUIRE(from_hex.Unwrap() == from_npub.Unwrap());
        REQUIRE(ToHex(from_npub.Unwrap()) == kPublicHex);
    }
    SECTION("Encoding reproduces the bech32 strings") {
        auto public_key = KeyEncoding::ParsePublicKey(kPublicHex).Unwrap();
        REQUIRE(KeyEncoding::ToNpub(public_key) == kNpub);
        auto secret = FromHex(kSecretHex).Unwrap();
        REQUIRE(KeyEncoding::ToNsec(secret) == kNsec);
    }
    SECTION("Surrounding whitespace is ignored") {
        REQUIRE(KeyEncoding::ParsePublicKey("  " + std::string(kNpub) + "\n").IsOk());
        REQUIRE(KeyEncoding::ParseSecretKey("\t" + std::string(kSecretHex) + " ").IsOk());
    }
}
TEST_CASE("KeyEncoding - Rejected inputs", "[encoding][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wrong hrp is rejected") {
        auto npub_as_secret = KeyEncoding::ParseSecretKey(kNpub);
        REQUIRE(npub_as_secret.IsErr());
        REQUIRE(npub_as_secret.UnwrapErr().type == FailureType::InvalidKeyFormat);
        REQUIRE(KeyEncoding::ParsePublicKey(kNsec).IsErr());
    }
    SECTION("Wrong length is rejected") {
        REQUIRE(KeyEncoding::ParseSecretKey(kSecretHex.substr(0, 62)).IsErr());
        REQUIRE(KeyEncoding::ParsePublicKey(std::string(kPublicHex) + "00").IsErr());
        REQUIRE(KeyEncoding::ParsePublicKey("").IsErr());
    }
    SECTION("Zero and curve-order secrets are out of range") {
        const std::string zero(64, '0');
        const std::string order = "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";
        auto zero_result = KeyEncoding::ParseSecretKey(zero);
        REQUIRE(zero_result.IsErr());
        REQUIRE(zero_result.UnwrapErr().type == FailureType::InvalidKeyFormat);
        REQUIRE(KeyEncoding::ParseSecretKey(order).IsErr());
    }
    SECTION("x-coordinate off the curve is rejected") {
        const std::string off_curve = "eefdea4cdb677750a420fee807eacf21eb9898ae79b9768766e4faa04a2d4a34";
        auto result = KeyEncoding::ParsePublicKey(off_curve);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidKeyFormat);
    }
}
