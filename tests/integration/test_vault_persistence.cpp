#include <catch2/catch_test_macros.hpp>
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <system_error>
using namespace keystr;
using namespace keystr::vault;
using keystr::configuration::VaultConfig;
namespace fs = std::filesystem;
namespace {
const auto kFastConfig = VaultConfig::Default().WithScryptLogN(4);
/// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        path_ = fs::temp_directory_path() / ("keystr-test-" + crypto::SodiumInterop::RandomHexId());
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    [[nodiscard]] const fs::path& Path() const noexcept { return path_; }
private:
    fs::path path_;
};
std::unique_ptr<KeyVault> OpenVault(const fs::path& file) {
    return KeyVault::Create(std::make_shared<FileVaultStorage>(file), kFastConfig).Unwrap();
}
}
TEST_CASE("Vault persistence - Password round trip through a file", "[integration][persistence]") {
    TempDir dir;
    const fs::path file = dir.Path() / "vault.bin";
    crypto::XOnlyPublicKey public_key{};
    {
        auto vault = OpenVault(file);
        REQUIRE(vault->Generate().IsOk());
        public_key = *vault->GetPublicKey();
        REQUIRE(vault->Save("pw1", SecurityLevel::PersistOptionalPassword).IsOk());
        REQUIRE_FALSE(vault->HasUnsavedChanges());
    }
    REQUIRE(fs::exists(file));
    REQUIRE_FALSE(fs::exists(fs::path(file).concat(".tmp")));

    auto vault = OpenVault(file);
    REQUIRE(vault->GetState() == VaultState::Empty);
    REQUIRE(vault->Load().IsOk());
    REQUIRE(vault->GetState() == VaultState::LoadedLocked);
    REQUIRE(vault->GetPublicKey() == public_key);
    REQUIRE(vault->GetStoredSecurityLevel() == SecurityLevel::PersistOptionalPassword);
    REQUIRE(vault->RequiresPassword());

    auto wrong = vault->Unlock("wrong");
    REQUIRE(wrong.IsErr());
    REQUIRE(wrong.UnwrapErr().type == FailureType::WrongPassword);
    REQUIRE(wrong.UnwrapErr().IsRetriable());
    REQUIRE(vault->GetState() == VaultState::LoadedLocked);

    REQUIRE(vault->Unlock("pw1").IsOk());
    REQUIRE(vault->GetState() == VaultState::LoadedUnlocked);
    const auto digest = crypto::SodiumInterop::Sha256(std::span<const uint8_t>());
    auto signature = vault->Sign(digest);
    REQUIRE(signature.IsOk());
    REQUIRE(crypto::Secp256k1::VerifySchnorr(public_key, digest, signature.Unwrap()).Unwrap());
}
TEST_CASE("Vault persistence - File handling", "[integration][persistence]") {
    TempDir dir;
    SECTION("Missing file is NoRecordFound") {
        auto vault = OpenVault(dir.Path() / "absent.bin");
        auto loaded = vault->Load();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::NoRecordFound);
        REQUIRE(vault->GetState() == VaultState::Empty);
    }
    SECTION("Empty file is NoRecordFound") {
        const fs::path file = dir.Path() / "empty.bin";
        std::ofstream(file).close();
        REQUIRE(OpenVault(file)->Load().UnwrapErr().type == FailureType::NoRecordFound);
    }
    SECTION("Nested directories are created") {
        const fs::path file = dir.Path() / "a" / "b" / "vault.bin";
        auto vault = OpenVault(file);
        REQUIRE(vault->Generate().IsOk());
        REQUIRE(vault->Save("pw", SecurityLevel::PersistPasswordRequired).IsOk());
        REQUIRE(fs::exists(file));
    }
    SECTION("Record is readable by the owner only") {
        const fs::path file = dir.Path() / "private.bin";
        auto vault = OpenVault(file);
        REQUIRE(vault->Generate().IsOk());
        REQUIRE(vault->Save("pw", SecurityLevel::PersistPasswordRequired).IsOk());
        const auto perms = fs::status(file).permissions();
        REQUIRE((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
        REQUIRE((perms & fs::perms::owner_read) != fs::perms::none);
    }
    SECTION("Saving again replaces the record") {
        const fs::path file = dir.Path() / "vault.bin";
        auto first = OpenVault(file);
        REQUIRE(first->Generate().IsOk());
        REQUIRE(first->Save("old", SecurityLevel::PersistPasswordRequired).IsOk());
        REQUIRE(first->Generate().IsOk());
        const auto replacement = *first->GetPublicKey();
        REQUIRE(first->Save("new", SecurityLevel::PersistPasswordRequired).IsOk());

        auto second = OpenVault(file);
        REQUIRE(second->Load().IsOk());
        REQUIRE(second->GetPublicKey() == replacement);
        REQUIRE(second->Unlock("old").UnwrapErr().type == FailureType::WrongPassword);
        REQUIRE(second->Unlock("new").IsOk());
    }
    SECTION("Erase removes the file") {
        const fs::path file = dir.Path() / "vault.bin";
        auto vault = OpenVault(file);
        REQUIRE(vault->Generate().IsOk());
        REQUIRE(vault->Save("pw", SecurityLevel::PersistPasswordRequired).IsOk());
        REQUIRE(vault->Erase().IsOk());
        REQUIRE_FALSE(fs::exists(file));
        REQUIRE(vault->GetState() == VaultState::Empty);
        REQUIRE(vault->Erase().IsOk());
    }
}
TEST_CASE("Vault persistence - Record variants", "[integration][persistence]") {
    TempDir dir;
    const fs::path file = dir.Path() / "vault.bin";
    SECTION("Public-key-only record") {
        {
            auto vault = OpenVault(file);
            REQUIRE(vault->ImportPublic("npub1rfze4zn25ezp6jqt5ejlhrajrfx0az72ed7cwvq0spr22k9rlnjq93lmd4").IsOk());
            REQUIRE(vault->Save(std::nullopt, SecurityLevel::PersistOptionalPassword).IsOk());
        }
        auto vault = OpenVault(file);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->GetState() == VaultState::PublicOnly);
        REQUIRE(vault->GetPublicKeyHex() == "1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4");
        REQUIRE(vault->Unlock("anything").UnwrapErr().type == FailureType::InvalidState);
    }
    SECTION("Empty-password record unlocks without a password") {
        {
            auto vault = OpenVault(file);
            REQUIRE(vault->Generate().IsOk());
            REQUIRE(vault->Save(std::nullopt, SecurityLevel::PersistOptionalPassword).IsOk());
        }
        auto vault = OpenVault(file);
        REQUIRE(vault->Load().IsOk());
        REQUIRE_FALSE(vault->RequiresPassword());
        REQUIRE(vault->Unlock(std::nullopt).IsOk());
    }
    SECTION("Label survives a reload") {
        {
            auto vault = OpenVault(file);
            REQUIRE(vault->Generate().IsOk());
            vault->SetLabel("main account");
            REQUIRE(vault->Save("pw", SecurityLevel::PersistPasswordRequired).IsOk());
        }
        auto vault = OpenVault(file);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->GetLabel() == "main account");
    }
    SECTION("Required level refuses an empty unlock") {
        {
            auto vault = OpenVault(file);
            REQUIRE(vault->Generate().IsOk());
            REQUIRE(vault->Save("pw", SecurityLevel::PersistPasswordRequired).IsOk());
        }
        auto vault = OpenVault(file);
        REQUIRE(vault->Load().IsOk());
        REQUIRE(vault->Unlock("").UnwrapErr().type == FailureType::PolicyViolation);
        REQUIRE(vault->GetState() == VaultState::LoadedLocked);
    }
}
