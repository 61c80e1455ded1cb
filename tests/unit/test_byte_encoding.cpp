#include <catch2/catch_test_macros.hpp>
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/encoding/bech32.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include <cctype>
#include <string>
#include <vector>
using namespace keystr;
using namespace keystr::encoding;
TEST_CASE("Hex - Encoding and strict decoding", "[encoding][hex]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Lowercase output") {
        const std::vector<uint8_t> bytes = {0x00, 0xAB, 0xff, 0x10};
        REQUIRE(ToHex(bytes) == "00abff10");
        REQUIRE(ToHex(std::vector<uint8_t>{}).empty());
    }
    SECTION("Upper and lower case both decode") {
        auto lower = FromHex("00abff10");
        auto upper = FromHex("00ABFF10");
        REQUIRE(lower.IsOk());
        REQUIRE(upper.IsOk());
        REQUIRE(lower.Unwrap() == upper.Unwrap());
        REQUIRE(lower.Unwrap() == std::vector<uint8_t>{0x00, 0xab, 0xff, 0x10});
    }
    SECTION("Odd length, separators and non-hex characters are rejected") {
        REQUIRE(FromHex("abc").IsErr());
        REQUIRE(FromHex("ab:cd").IsErr());
        REQUIRE(FromHex("ab cd").IsErr());
        REQUIRE(FromHex("zz").IsErr());
        REQUIRE(FromHex("abc").UnwrapErr().type == FailureType::InvalidKeyFormat);
    }
    SECTION("Fixed-size decoding checks the length") {
        REQUIRE(FromHexFixed<2>("beef").IsOk());
        REQUIRE(FromHexFixed<2>("beef").Unwrap()[0] == 0xbe);
        REQUIRE(FromHexFixed<3>("beef").IsErr());
    }
}
TEST_CASE("Base64 - Standard alphabet with padding", "[encoding][base64]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Known encodings") {
        const std::string text = "hello";
        const std::vector<uint8_t> bytes(text.begin(), text.end());
        REQUIRE(Base64Encode(bytes) == "aGVsbG8=");
        auto decoded = Base64Decode("aGVsbG8=");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == bytes);
    }
    SECTION("Garbage is rejected") {
        REQUIRE(Base64Decode("aGVs*G8=").IsErr());
        REQUIRE(Base64Decode("aGVsbG8").IsErr());
    }
}
TEST_CASE("Bech32 - BIP-173 checksum", "[encoding][bech32]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Encode then decode keeps hrp and data") {
        const std::vector<uint8_t> data = {1, 2, 3, 4, 5, 250};
        const std::string encoded = Bech32::Encode("test", data);
        REQUIRE(encoded.rfind("test1", 0) == 0);
        auto decoded = Bech32::Decode(encoded);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().hrp == "test");
        REQUIRE(decoded.Unwrap().data == data);
    }
    SECTION("A single altered character breaks the checksum") {
        std::string encoded = Bech32::Encode("npub", std::vector<uint8_t>(32, 0x42));
        encoded[10] = encoded[10] == 'q' ? 'p' : 'q';
        auto decoded = Bech32::Decode(encoded);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == FailureType::InvalidKeyFormat);
    }
    SECTION("Mixed case is rejected, uppercase is accepted") {
        const std::string encoded = Bech32::Encode("npub", std::vector<uint8_t>(32, 0x07));
        std::string upper = encoded;
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        REQUIRE(Bech32::Decode(upper).IsOk());
        std::string mixed = encoded;
        mixed[0] = 'N';
        REQUIRE(Bech32::Decode(mixed).IsErr());
    }
    SECTION("Missing separator is rejected") {
        REQUIRE(Bech32::Decode("npubqqqqqqqq").IsErr());
        REQUIRE(Bech32::Decode("").IsErr());
    }
}
