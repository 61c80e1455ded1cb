#include <catch2/catch_test_macros.hpp>
#include "keystr/signer/signer_engine.hpp"
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/encoding/key_encoding.hpp"
#include "helpers/recording_event_handler.hpp"
#include "helpers/recording_transport.hpp"
#include "helpers/signer_peer.hpp"
#include <memory>
#include <string>
#include <vector>
using namespace keystr;
using namespace keystr::signer;
using namespace keystr::test_helpers;
using keystr::configuration::SignerConfig;
using keystr::configuration::VaultConfig;
using keystr::vault::RevealConfirmation;
using keystr::vault::SecurityLevel;
using keystr::vault::VaultState;
using json = nlohmann::json;
namespace {
constexpr std::string_view kSecretHex = "b2f3673ee3a659283e6599080e0ab0e669a3c2640914375a9b0b357faae08b17";
constexpr std::string_view kSecretNsec = "nsec1ktekw0hr5evjs0n9nyyquz4sue568snypy2rwk5mpv6hl2hq3vtsk0kpae";
std::unique_ptr<KeyVault> KnownVault(std::shared_ptr<MemoryVaultStorage> storage) {
    auto vault = KeyVault::Create(std::move(storage), VaultConfig::Default().WithScryptLogN(4)).Unwrap();
    REQUIRE(vault->ImportSecret(kSecretHex).IsOk());
    return vault;
}
bool Leaks(std::string_view text) {
    return text.find(kSecretHex) != std::string_view::npos ||
           text.find(kSecretNsec) != std::string_view::npos;
}
}
TEST_CASE("Secret containment - Signer traffic", "[security][containment]") {
    auto storage = std::make_shared<MemoryVaultStorage>();
    auto vault = KnownVault(storage);
    const auto signer_key = *vault->GetPublicKey();
    auto transport = std::make_shared<RecordingTransport>();
    auto engine = SignerEngine::Create(*vault, transport, SignerConfig::Default().WithWorkerThreads(0)).Unwrap();
    SignerPeer client;
    const json note = {{"created_at", 1700000000}, {"kind", 1}, {"tags", json::array()}, {"content", "hi"}};
    SECTION("No response or prompt carries the secret key") {
        client.Send(*engine, signer_key, "1", "describe");
        client.Send(*engine, signer_key, "2", "get_public_key");
        client.Send(*engine, signer_key, "3", "get_secret_key");
        client.Send(*engine, signer_key, "4", "export_nsec", json::array({"please"}));
        client.Send(*engine, signer_key, "5", "sign_event", json::array({note}));
        client.Send(*engine, signer_key, "6", "nip04_encrypt", json::array({client.PublicKeyHex(), std::string(kSecretHex)}));
        client.Send(*engine, signer_key, "7", "sign_event", json::array({json{{"kind", "x"}}}));
        for (const auto& view : engine->ListPending()) {
            REQUIRE_FALSE(Leaks(view.description));
        }
        REQUIRE(engine->Decide("5", Decision::Approve).IsOk());
        REQUIRE(engine->Decide("6", Decision::Reject).IsOk());

        const auto plaintexts = client.Open(signer_key, transport->Drain());
        REQUIRE(plaintexts.size() == 7);
        for (const auto& text : plaintexts) {
            REQUIRE_FALSE(Leaks(text));
        }
    }
    SECTION("Unknown methods leave permissions and the vault alone") {
        const size_t writes = storage->WriteCount();
        client.Send(*engine, signer_key, "1", "grant_permission", json::array({"sign_event"}));
        client.Send(*engine, signer_key, "2", "save", json::array({"", "PersistOptionalPassword"}));
        client.Send(*engine, signer_key, "3", "lock");
        const auto responses = client.Responses(signer_key, transport->Drain());
        REQUIRE(responses.size() == 3);
        for (const auto& response : responses) {
            REQUIRE(response.error->starts_with("UnsupportedMethod"));
        }
        const auto sessions = engine->ListSessions();
        REQUIRE(sessions.size() == 1);
        REQUIRE(sessions[0].permissions.empty());
        REQUIRE(vault->GetState() == VaultState::LoadedUnlocked);
        REQUIRE(storage->WriteCount() == writes);

        client.Send(*engine, signer_key, "4", "sign_event", json::array({note}));
        REQUIRE(engine->ListPending().size() == 1);
    }
    SECTION("Peer-chosen plaintext stays out of the prompt") {
        client.Send(*engine, signer_key, "1", "nip04_encrypt", json::array({client.PublicKeyHex(), "attack at dawn"}));
        const auto pending = engine->ListPending();
        REQUIRE(pending.size() == 1);
        REQUIRE(pending[0].description.find("attack at dawn") == std::string::npos);
    }
}
TEST_CASE("Secret containment - Vault surfaces", "[security][containment]") {
    auto storage = std::make_shared<MemoryVaultStorage>();
    auto vault = KnownVault(storage);
    SECTION("Reveal needs explicit confirmation") {
        auto refused = vault->RevealSecretKey(RevealConfirmation{});
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == FailureType::PolicyViolation);
        REQUIRE_FALSE(Leaks(refused.UnwrapErr().ToWireError()));
        REQUIRE(vault->RevealSecretKey(RevealConfirmation{true}).Unwrap() == kSecretNsec);
        REQUIRE(vault->GetState() == VaultState::LoadedUnlocked);
    }
    SECTION("Stored record never holds the raw key") {
        REQUIRE(vault->Save("containment", SecurityLevel::PersistPasswordRequired).IsOk());
        const auto record = storage->Read().Unwrap();
        REQUIRE(record.has_value());
        const auto secret = encoding::FromHex(kSecretHex).Unwrap();
        const std::string bytes(record->begin(), record->end());
        REQUIRE(bytes.find(std::string(secret.begin(), secret.end())) == std::string::npos);
        REQUIRE_FALSE(Leaks(bytes));
    }
    SECTION("Optional-password record is still encrypted") {
        REQUIRE(vault->Save(std::nullopt, SecurityLevel::PersistOptionalPassword).IsOk());
        const auto record = storage->Read().Unwrap();
        const auto secret = encoding::FromHex(kSecretHex).Unwrap();
        const std::string bytes(record->begin(), record->end());
        REQUIRE(bytes.find(std::string(secret.begin(), secret.end())) == std::string::npos);
    }
    SECTION("Locked or public-only vaults refuse secret operations") {
        REQUIRE(vault->Save("containment", SecurityLevel::PersistPasswordRequired).IsOk());
        REQUIRE(vault->Lock().IsOk());
        REQUIRE(vault->RevealSecretKey(RevealConfirmation{true}).UnwrapErr().type == FailureType::SigningUnavailable);
        REQUIRE(vault->ExportEncryptedSecret("x").UnwrapErr().type == FailureType::SigningUnavailable);
        REQUIRE(vault->ImportPublic(encoding::KeyEncoding::ToNpub(*vault->GetPublicKey())).IsOk());
        REQUIRE(vault->Nip04Encrypt(*vault->GetPublicKey(), "x").UnwrapErr().type ==
                FailureType::SigningUnavailable);
    }
    SECTION("Failure text never echoes a rejected secret") {
        const std::string almost = std::string(kSecretHex.substr(0, 63)) + "z";
        auto target = KeyVault::Create(std::make_shared<MemoryVaultStorage>()).Unwrap();
        auto imported = target->ImportSecret(almost);
        REQUIRE(imported.IsErr());
        REQUIRE(imported.UnwrapErr().ToWireError().find(almost) == std::string::npos);
    }
}
