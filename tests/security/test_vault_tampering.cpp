#include <catch2/catch_test_macros.hpp>
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "vault/vault_record.pb.h"
#include <memory>
#include <span>
#include <string>
#include <vector>
using namespace keystr;
using namespace keystr::vault;
using keystr::configuration::VaultConfig;
namespace {
constexpr std::string_view kPassword = "tamper-test-password";
const auto kFastConfig = VaultConfig::Default().WithScryptLogN(4);
/// Saved record of a freshly generated key, plus its public key.
struct SavedVault {
    proto::vault::VaultRecord record;
    crypto::XOnlyPublicKey public_key{};
};
SavedVault SaveFreshVault(SecurityLevel level = SecurityLevel::PersistPasswordRequired) {
    auto storage = std::make_shared<MemoryVaultStorage>();
    auto vault = KeyVault::Create(storage, kFastConfig).Unwrap();
    REQUIRE(vault->Generate().IsOk());
    REQUIRE(vault->Save(kPassword, level).IsOk());
    const auto bytes = storage->Read().Unwrap();
    REQUIRE(bytes.has_value());
    SavedVault saved;
    REQUIRE(saved.record.ParseFromArray(bytes->data(), static_cast<int>(bytes->size())));
    saved.public_key = *vault->GetPublicKey();
    return saved;
}
std::unique_ptr<KeyVault> VaultOver(const std::string& bytes) {
    auto storage = std::make_shared<MemoryVaultStorage>();
    REQUIRE(storage->Write(std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size())).IsOk());
    return KeyVault::Create(storage, kFastConfig).Unwrap();
}
std::unique_ptr<KeyVault> VaultOver(const proto::vault::VaultRecord& record) {
    return VaultOver(record.SerializeAsString());
}
void FlipFirstByte(std::string* field) {
    REQUIRE_FALSE(field->empty());
    (*field)[0] = static_cast<char>((*field)[0] ^ 0x01);
}
}
TEST_CASE("Vault tampering - Sealed key fields", "[security][tampering]") {
    auto saved = SaveFreshVault();
    SECTION("Untouched record unlocks") {
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).IsOk());
        REQUIRE(vault->GetPublicKey() == saved.public_key);
    }
    SECTION("Flipped ciphertext") {
        FlipFirstByte(saved.record.mutable_sealed_secret_key()->mutable_ciphertext());
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        auto unlocked = vault->Unlock(kPassword);
        REQUIRE(unlocked.IsErr());
        REQUIRE(unlocked.UnwrapErr().type == FailureType::WrongPassword);
        REQUIRE(vault->GetState() == VaultState::LoadedLocked);
    }
    SECTION("Flipped tag") {
        FlipFirstByte(saved.record.mutable_sealed_secret_key()->mutable_tag());
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).UnwrapErr().type == FailureType::WrongPassword);
    }
    SECTION("Flipped nonce") {
        FlipFirstByte(saved.record.mutable_sealed_secret_key()->mutable_nonce());
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).UnwrapErr().type == FailureType::WrongPassword);
    }
    SECTION("Flipped salt") {
        FlipFirstByte(saved.record.mutable_sealed_secret_key()->mutable_salt());
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).UnwrapErr().type == FailureType::WrongPassword);
    }
    SECTION("Lowered work factor") {
        saved.record.mutable_sealed_secret_key()->set_scrypt_log_n(3);
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).UnwrapErr().type == FailureType::WrongPassword);
    }
    SECTION("Unknown key security byte") {
        saved.record.mutable_sealed_secret_key()->set_key_security(0);
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(kPassword).UnwrapErr().type == FailureType::CorruptRecord);
    }
    SECTION("Truncated ciphertext") {
        saved.record.mutable_sealed_secret_key()->mutable_ciphertext()->pop_back();
        auto vault = VaultOver(saved.record);
        auto loaded = vault->Load();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::CorruptRecord);
        REQUIRE(vault->GetState() == VaultState::Empty);
    }
    SECTION("Work factor out of range") {
        saved.record.mutable_sealed_secret_key()->set_scrypt_log_n(40);
        REQUIRE(VaultOver(saved.record)->Load().UnwrapErr().type == FailureType::CorruptRecord);
    }
}
TEST_CASE("Vault tampering - Record envelope", "[security][tampering]") {
    auto saved = SaveFreshVault();
    SECTION("Swapped public key is caught at unlock") {
        auto other = SaveFreshVault();
        saved.record.set_public_key(other.record.public_key());
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        auto unlocked = vault->Unlock(kPassword);
        REQUIRE(unlocked.IsErr());
        REQUIRE(unlocked.UnwrapErr().type == FailureType::CorruptRecord);
        REQUIRE(vault->GetState() == VaultState::LoadedLocked);
    }
    SECTION("Public key not on the curve") {
        const auto off_curve = encoding::FromHex(
            "eefdea4cdb677750a420fee807eacf21eb9898ae79b9768766e4faa04a2d4a34").Unwrap();
        saved.record.set_public_key(off_curve.data(), off_curve.size());
        REQUIRE(VaultOver(saved.record)->Load().UnwrapErr().type == FailureType::CorruptRecord);
    }
    SECTION("Future format version") {
        saved.record.set_format_version(2);
        auto loaded = VaultOver(saved.record)->Load();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::UnsupportedVaultVersion);
    }
    SECTION("Security level that is never persisted") {
        saved.record.set_security_level(proto::vault::SECURITY_LEVEL_NEVER_PERSIST);
        REQUIRE(VaultOver(saved.record)->Load().UnwrapErr().type == FailureType::CorruptRecord);
    }
    SECTION("Unknown security level") {
        saved.record.set_security_level(static_cast<proto::vault::SecurityLevel>(9));
        REQUIRE(VaultOver(saved.record)->Load().UnwrapErr().type == FailureType::CorruptRecord);
    }
    SECTION("Downgrade to optional password still needs the password") {
        saved.record.set_security_level(proto::vault::SECURITY_LEVEL_PERSIST_OPTIONAL_PASSWORD);
        auto vault = VaultOver(saved.record);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock(std::nullopt).UnwrapErr().type == FailureType::WrongPassword);
        REQUIRE(vault->Unlock(kPassword).IsOk());
    }
    SECTION("Bytes that are not a record") {
        auto loaded = VaultOver(std::string("\xff\xff\xff\xff", 4))->Load();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::CorruptRecord);
    }
}
TEST_CASE("Vault tampering - Legacy encrypted blob", "[security][tampering]") {
    auto storage = std::make_shared<MemoryVaultStorage>();
    auto vault = KeyVault::Create(storage, kFastConfig).Unwrap();
    REQUIRE(vault->Generate().IsOk());
    const auto blob_hex = vault->ExportEncryptedSecret(kPassword).Unwrap();
    auto blob = encoding::FromHex(blob_hex).Unwrap();
    REQUIRE(blob.size() == kLegacyBlobBytes);
    SECTION("Any flipped byte past the header is detected") {
        for (size_t offset : {size_t{2}, size_t{30}, size_t{60}, blob.size() - 1}) {
            auto altered = blob;
            altered[offset] ^= 0x80;
            auto target = KeyVault::Create(std::make_shared<MemoryVaultStorage>(), kFastConfig).Unwrap();
            REQUIRE(target->ImportEncryptedSecret(encoding::ToHex(altered)).IsOk());
            auto unlocked = target->Unlock(kPassword);
            REQUIRE(unlocked.IsErr());
            REQUIRE(unlocked.UnwrapErr().type == FailureType::WrongPassword);
        }
    }
    SECTION("Version byte") {
        blob[0] = 0x07;
        auto target = KeyVault::Create(std::make_shared<MemoryVaultStorage>(), kFastConfig).Unwrap();
        REQUIRE(target->ImportEncryptedSecret(encoding::ToHex(blob)).UnwrapErr().type ==
                FailureType::UnsupportedVaultVersion);
        REQUIRE(target->GetState() == VaultState::Empty);
    }
}
