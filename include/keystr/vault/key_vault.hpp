#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/configuration/keystr_config.hpp"
#include "keystr/crypto/crypto_box.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"
#include "keystr/vault/identity.hpp"
#include "keystr/vault/security_level.hpp"
#include "keystr/vault/vault_storage.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace keystr::vault {

enum class VaultState : uint8_t {
    Empty,
    LoadedLocked,
    LoadedUnlocked,
    PublicOnly
};

constexpr std::string_view VaultStateName(VaultState state) noexcept {
    switch (state) {
        case VaultState::Empty: return "Empty";
        case VaultState::LoadedLocked: return "LoadedLocked";
        case VaultState::LoadedUnlocked: return "LoadedUnlocked";
        case VaultState::PublicOnly: return "PublicOnly";
    }
    return "Unknown";
}

/// Proof that the user explicitly asked to see the secret key.
struct RevealConfirmation {
    bool confirmed = false;
};

/**
 * @brief Owner of the local identity and its encrypted-at-rest record.
 *
 * State machine:
 *   Empty          -> LoadedUnlocked  Generate(), ImportSecret()
 *   Empty          -> PublicOnly      ImportPublic()
 *   Empty          -> LoadedLocked    Load(), ImportEncryptedSecret()
 *   LoadedLocked   -> LoadedUnlocked  Unlock() on success
 *   LoadedUnlocked -> LoadedLocked    Lock() when a sealed record is held
 *   any            -> Empty           Clear()
 * Generate/Import/Load from a non-empty state clear the previous key first.
 *
 * The decrypted secret key never leaves this object: callers get
 * signatures, NIP-04 ciphertexts and derived shared secrets. All public
 * operations serialize on one mutex, so concurrent Sign() calls never
 * interleave.
 */
class KeyVault {
public:
    static Result<std::unique_ptr<KeyVault>, KeystrFailure> Create(
        std::shared_ptr<IVaultStorage> storage,
        configuration::VaultConfig config = configuration::VaultConfig::Default());

    ~KeyVault();

    KeyVault(const KeyVault&) = delete;
    KeyVault& operator=(const KeyVault&) = delete;
    KeyVault(KeyVault&&) = delete;
    KeyVault& operator=(KeyVault&&) = delete;

    // ========================================================================
    // Key material
    // ========================================================================

    Result<Unit, KeystrFailure> Generate();

    /// Accepts 64 hex characters or nsec1...; InvalidKeyFormat otherwise.
    Result<Unit, KeystrFailure> ImportSecret(std::string_view encoded);

    /// Accepts 64 hex characters or npub1...; InvalidKeyFormat otherwise.
    Result<Unit, KeystrFailure> ImportPublic(std::string_view encoded);

    /// Hex of a 91-byte encrypted key blob; the vault becomes LoadedLocked.
    Result<Unit, KeystrFailure> ImportEncryptedSecret(std::string_view blob_hex);

    /// Hex of a 91-byte encrypted key blob sealed under @p password.
    Result<std::string, KeystrFailure> ExportEncryptedSecret(std::optional<std::string_view> password) const;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Seals the secret key under @p password and writes the record.
     *
     * NeverPersist is an accepted no-op. PersistPasswordRequired with an
     * absent or empty password fails with PolicyViolation before anything
     * else is checked. A PublicOnly vault writes a record without a sealed key.
     */
    Result<Unit, KeystrFailure> Save(std::optional<std::string_view> password, SecurityLevel level);

    /// Save() at the configured default security level.
    Result<Unit, KeystrFailure> Save(std::optional<std::string_view> password);

    /// NoRecordFound when storage is empty (retriable; nothing changes).
    Result<Unit, KeystrFailure> Load();

    /// WrongPassword leaves the vault LoadedLocked.
    Result<Unit, KeystrFailure> Unlock(std::optional<std::string_view> password);

    Result<Unit, KeystrFailure> Lock();

    /// Zeroes the secret key and returns to Empty. Safe from any state.
    void Clear() noexcept;

    /// Clear() plus removal of the persisted record.
    Result<Unit, KeystrFailure> Erase();

    // ========================================================================
    // Secret key operations (LoadedUnlocked only, else SigningUnavailable)
    // ========================================================================

    Result<crypto::SchnorrSignature, KeystrFailure> Sign(std::span<const uint8_t> digest) const;

    Result<crypto::SecureMemoryHandle, KeystrFailure> DeriveSharedSecret(
        const crypto::XOnlyPublicKey& peer) const;

    Result<std::string, KeystrFailure> Nip04Encrypt(
        const crypto::XOnlyPublicKey& peer, std::string_view plaintext) const;

    Result<std::string, KeystrFailure> Nip04Decrypt(
        const crypto::XOnlyPublicKey& peer, std::string_view payload) const;

    /// nsec of the unlocked key; PolicyViolation unless confirmed. State is unchanged.
    Result<std::string, KeystrFailure> RevealSecretKey(const RevealConfirmation& confirmation) const;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] VaultState GetState() const;
    [[nodiscard]] std::optional<crypto::XOnlyPublicKey> GetPublicKey() const;
    [[nodiscard]] std::optional<std::string> GetPublicKeyHex() const;
    [[nodiscard]] std::optional<std::string> GetNpub() const;
    [[nodiscard]] std::optional<SecurityLevel> GetStoredSecurityLevel() const;
    /// True when the held sealed record needs a non-empty password.
    [[nodiscard]] bool RequiresPassword() const;
    [[nodiscard]] bool HasUnsavedChanges() const;
    [[nodiscard]] std::optional<std::string> GetLabel() const;
    void SetLabel(std::optional<std::string> label);

private:
    KeyVault(std::shared_ptr<IVaultStorage> storage, configuration::VaultConfig config);

    void ClearLocked() noexcept;
    void InstallIdentity(Identity identity, VaultState state);
    Result<const Identity*, KeystrFailure> RequireSecretIdentity() const;
    Result<Unit, KeystrFailure> WriteRecord(SecurityLevel level,
                                            const std::optional<crypto::SealedSecret>& sealed,
                                            bool password_protected);

    mutable std::mutex lock_;
    std::shared_ptr<IVaultStorage> storage_;
    configuration::VaultConfig config_;

    VaultState state_ = VaultState::Empty;
    std::optional<Identity> identity_;
    std::optional<crypto::SealedSecret> sealed_;
    std::optional<SecurityLevel> stored_level_;
    std::optional<std::string> label_;
    bool password_protected_ = false;
    bool unsaved_changes_ = false;
};

}
