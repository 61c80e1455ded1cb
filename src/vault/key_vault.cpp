#include "keystr/vault/key_vault.hpp"
#include "keystr/crypto/nip04.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/debug/logger.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/encoding/key_encoding.hpp"

#include "vault/vault_record.pb.h"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace keystr::vault {

using crypto::SealedSecret;

namespace {

constexpr std::string_view kComponent = "vault";

proto::vault::SecurityLevel ToProto(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::NeverPersist:
            return proto::vault::SECURITY_LEVEL_NEVER_PERSIST;
        case SecurityLevel::PersistPasswordRequired:
            return proto::vault::SECURITY_LEVEL_PERSIST_PASSWORD_REQUIRED;
        case SecurityLevel::PersistOptionalPassword:
            return proto::vault::SECURITY_LEVEL_PERSIST_OPTIONAL_PASSWORD;
    }
    return proto::vault::SECURITY_LEVEL_PERSIST_PASSWORD_REQUIRED;
}

Result<SecurityLevel, KeystrFailure> FromProto(proto::vault::SecurityLevel level) {
    switch (level) {
        case proto::vault::SECURITY_LEVEL_PERSIST_PASSWORD_REQUIRED:
            return Result<SecurityLevel, KeystrFailure>::Ok(SecurityLevel::PersistPasswordRequired);
        case proto::vault::SECURITY_LEVEL_PERSIST_OPTIONAL_PASSWORD:
            return Result<SecurityLevel, KeystrFailure>::Ok(SecurityLevel::PersistOptionalPassword);
        default:
            return Result<SecurityLevel, KeystrFailure>::Err(
                KeystrFailure::CorruptRecord("Vault record carries an unusable security level"));
    }
}

template<size_t N>
bool CopyExact(const std::string& source, std::array<uint8_t, N>& target) {
    if (source.size() != N) {
        return false;
    }
    std::copy(source.begin(), source.end(), target.begin());
    return true;
}

Result<SealedSecret, KeystrFailure> FromProto(const proto::vault::SealedSecretKey& message) {
    using R = Result<SealedSecret, KeystrFailure>;

    SealedSecret sealed;
    if (message.scrypt_log_n() > 0xFF || message.key_security() > 0xFF) {
        return R::Err(KeystrFailure::CorruptRecord("Sealed key parameters out of range"));
    }
    sealed.log_n = static_cast<uint8_t>(message.scrypt_log_n());
    sealed.key_security = static_cast<uint8_t>(message.key_security());
    if (!CopyExact(message.salt(), sealed.salt) ||
        !CopyExact(message.nonce(), sealed.nonce) ||
        !CopyExact(message.tag(), sealed.tag) ||
        message.ciphertext().size() != kSecretKeyBytes) {
        return R::Err(KeystrFailure::CorruptRecord("Sealed key field has the wrong size"));
    }
    sealed.ciphertext.assign(message.ciphertext().begin(), message.ciphertext().end());

    auto log_n_check = crypto::CryptoBox::ValidateLogN(sealed.log_n);
    if (log_n_check.IsErr()) {
        return R::Err(std::move(log_n_check).UnwrapErr());
    }
    return R::Ok(std::move(sealed));
}

void ToProto(const SealedSecret& sealed, bool password_protected, proto::vault::SealedSecretKey* message) {
    message->set_scrypt_log_n(sealed.log_n);
    message->set_salt(sealed.salt.data(), sealed.salt.size());
    message->set_nonce(sealed.nonce.data(), sealed.nonce.size());
    message->set_key_security(sealed.key_security);
    message->set_ciphertext(sealed.ciphertext.data(), sealed.ciphertext.size());
    message->set_tag(sealed.tag.data(), sealed.tag.size());
    message->set_password_protected(password_protected);
}

}

Result<std::unique_ptr<KeyVault>, KeystrFailure> KeyVault::Create(
    std::shared_ptr<IVaultStorage> storage,
    configuration::VaultConfig config) {

    using R = Result<std::unique_ptr<KeyVault>, KeystrFailure>;

    auto init = crypto::SodiumInterop::Initialize();
    if (init.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (!storage) {
        return R::Err(KeystrFailure::InvalidState("Vault storage must not be null"));
    }
    auto valid = config.Validate();
    if (valid.IsErr()) {
        return R::Err(std::move(valid).UnwrapErr());
    }
    return R::Ok(std::unique_ptr<KeyVault>(new KeyVault(std::move(storage), config)));
}

KeyVault::KeyVault(std::shared_ptr<IVaultStorage> storage, configuration::VaultConfig config)
    : storage_(std::move(storage))
    , config_(config) {}

KeyVault::~KeyVault() {
    Clear();
}

// ============================================================================
// Key material
// ============================================================================

void KeyVault::InstallIdentity(Identity identity, VaultState state) {
    ClearLocked();
    label_.reset();
    identity_.emplace(std::move(identity));
    state_ = state;
    unsaved_changes_ = true;
    KEYSTR_LOG_INFO(kComponent, "identity {} installed, state {}",
        debug::ShortKey(identity_->GetPublicKey()), VaultStateName(state_));
}

Result<Unit, KeystrFailure> KeyVault::Generate() {
    auto generated = Identity::Generate();
    if (generated.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(generated).UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    InstallIdentity(std::move(generated).Unwrap(), VaultState::LoadedUnlocked);
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::ImportSecret(std::string_view encoded) {
    auto parsed = encoding::KeyEncoding::ParseSecretKey(encoded);
    if (parsed.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(parsed).UnwrapErr());
    }
    auto identity = Identity::FromSecretKey(std::move(parsed).Unwrap());
    if (identity.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(identity).UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    InstallIdentity(std::move(identity).Unwrap(), VaultState::LoadedUnlocked);
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::ImportPublic(std::string_view encoded) {
    auto parsed = encoding::KeyEncoding::ParsePublicKey(encoded);
    if (parsed.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(parsed).UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    InstallIdentity(Identity::FromPublicKey(parsed.Unwrap()), VaultState::PublicOnly);
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::ImportEncryptedSecret(std::string_view blob_hex) {
    auto bytes = encoding::FromHex(blob_hex);
    if (bytes.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(bytes).UnwrapErr());
    }
    auto sealed = crypto::CryptoBox::FromLegacyBlob(bytes.Unwrap());
    if (sealed.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(sealed).UnwrapErr());
    }

    std::lock_guard<std::mutex> guard(lock_);
    ClearLocked();
    sealed_.emplace(std::move(sealed).Unwrap());
    // Unknown until the blob is opened; Unlock settles it.
    password_protected_ = true;
    unsaved_changes_ = true;
    state_ = VaultState::LoadedLocked;
    KEYSTR_LOG_INFO(kComponent, "encrypted key imported, awaiting unlock");
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<std::string, KeystrFailure> KeyVault::ExportEncryptedSecret(
    std::optional<std::string_view> password) const {

    using R = Result<std::string, KeystrFailure>;

    std::lock_guard<std::mutex> guard(lock_);
    auto identity = RequireSecretIdentity();
    if (identity.IsErr()) {
        return R::Err(std::move(identity).UnwrapErr());
    }
    auto sealed = identity.Unwrap()->SealSecretKey(password.value_or(std::string_view{}), config_.GetScryptLogN());
    if (sealed.IsErr()) {
        return R::Err(std::move(sealed).UnwrapErr());
    }
    auto blob = crypto::CryptoBox::ToLegacyBlob(sealed.Unwrap());
    if (blob.IsErr()) {
        return R::Err(std::move(blob).UnwrapErr());
    }
    return R::Ok(encoding::ToHex(blob.Unwrap()));
}

// ============================================================================
// Persistence
// ============================================================================

Result<Unit, KeystrFailure> KeyVault::WriteRecord(
    SecurityLevel level,
    const std::optional<SealedSecret>& sealed,
    bool password_protected) {

    proto::vault::VaultRecord record;
    record.set_format_version(kVaultFormatVersion);
    record.set_security_level(ToProto(level));
    if (identity_.has_value()) {
        const auto& public_key = identity_->GetPublicKey();
        record.set_public_key(public_key.data(), public_key.size());
    }
    if (sealed.has_value()) {
        ToProto(*sealed, password_protected, record.mutable_sealed_secret_key());
    }
    if (label_.has_value()) {
        record.set_label(*label_);
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    record.mutable_saved_at()->set_seconds(
        std::chrono::duration_cast<std::chrono::seconds>(now).count());

    std::string serialized;
    if (!record.SerializeToString(&serialized)) {
        return Result<Unit, KeystrFailure>::Err(KeystrFailure::Storage("Failed to serialize vault record"));
    }
    return storage_->Write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(serialized.data()), serialized.size()));
}

Result<Unit, KeystrFailure> KeyVault::Save(std::optional<std::string_view> password) {
    return Save(password, config_.GetDefaultSecurityLevel());
}

Result<Unit, KeystrFailure> KeyVault::Save(std::optional<std::string_view> password, SecurityLevel level) {
    if (level == SecurityLevel::NeverPersist) {
        KEYSTR_LOG_DEBUG(kComponent, "save skipped, security level NeverPersist");
        return Result<Unit, KeystrFailure>::Ok(unit);
    }
    const std::string_view pw = password.value_or(std::string_view{});
    if (!AllowsEmptyPassword(level) && pw.empty()) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::PolicyViolation(std::string(ErrorMessages::PASSWORD_REQUIRED)));
    }

    std::lock_guard<std::mutex> guard(lock_);
    std::optional<SealedSecret> sealed;
    switch (state_) {
        case VaultState::Empty:
            return Result<Unit, KeystrFailure>::Err(
                KeystrFailure::InvalidState(std::string(ErrorMessages::VAULT_EMPTY)));
        case VaultState::LoadedLocked:
            return Result<Unit, KeystrFailure>::Err(
                KeystrFailure::InvalidState("Unlock the key before saving it again"));
        case VaultState::PublicOnly:
            break;
        case VaultState::LoadedUnlocked: {
            auto sealed_result = identity_->SealSecretKey(pw, config_.GetScryptLogN());
            if (sealed_result.IsErr()) {
                return Result<Unit, KeystrFailure>::Err(std::move(sealed_result).UnwrapErr());
            }
            sealed.emplace(std::move(sealed_result).Unwrap());
            break;
        }
    }

    auto written = WriteRecord(level, sealed, !pw.empty());
    if (written.IsErr()) {
        return written;
    }
    sealed_ = std::move(sealed);
    stored_level_ = level;
    password_protected_ = !pw.empty();
    unsaved_changes_ = false;
    KEYSTR_LOG_INFO(kComponent, "vault saved ({})", SecurityLevelName(level));
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::Load() {
    using R = Result<Unit, KeystrFailure>;

    auto read = storage_->Read();
    if (read.IsErr()) {
        return R::Err(std::move(read).UnwrapErr());
    }
    const auto& bytes = read.Unwrap();
    if (!bytes.has_value()) {
        return R::Err(KeystrFailure::NoRecordFound(std::string(ErrorMessages::NO_RECORD)));
    }

    proto::vault::VaultRecord record;
    if (!record.ParseFromArray(bytes->data(), static_cast<int>(bytes->size()))) {
        return R::Err(KeystrFailure::CorruptRecord("Vault record does not parse"));
    }
    if (record.format_version() != kVaultFormatVersion) {
        return R::Err(KeystrFailure::UnsupportedVaultVersion(
            fmt::format("Vault format version {} is not supported (expected {})",
                record.format_version(), kVaultFormatVersion)));
    }
    auto level = FromProto(record.security_level());
    if (level.IsErr()) {
        return R::Err(std::move(level).UnwrapErr());
    }
    crypto::XOnlyPublicKey public_key{};
    if (!CopyExact(record.public_key(), public_key) ||
        crypto::Secp256k1::ValidatePublicKey(public_key).IsErr()) {
        return R::Err(KeystrFailure::CorruptRecord("Vault record public key is invalid"));
    }
    std::optional<SealedSecret> sealed;
    if (record.has_sealed_secret_key()) {
        auto converted = FromProto(record.sealed_secret_key());
        if (converted.IsErr()) {
            return R::Err(std::move(converted).UnwrapErr());
        }
        sealed.emplace(std::move(converted).Unwrap());
    }

    std::lock_guard<std::mutex> guard(lock_);
    ClearLocked();
    label_ = record.label().empty() ? std::nullopt : std::optional<std::string>(record.label());
    Identity identity = Identity::FromPublicKey(public_key);
    identity.SetLabel(label_);
    identity_.emplace(std::move(identity));
    stored_level_ = level.Unwrap();
    if (sealed.has_value()) {
        password_protected_ = record.sealed_secret_key().password_protected();
        sealed_ = std::move(sealed);
        state_ = VaultState::LoadedLocked;
    } else {
        state_ = VaultState::PublicOnly;
    }
    unsaved_changes_ = false;
    KEYSTR_LOG_INFO(kComponent, "vault record loaded for {}, state {}",
        debug::ShortKey(public_key), VaultStateName(state_));
    return R::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::Unlock(std::optional<std::string_view> password) {
    using R = Result<Unit, KeystrFailure>;

    std::lock_guard<std::mutex> guard(lock_);
    if (state_ != VaultState::LoadedLocked || !sealed_.has_value()) {
        return R::Err(KeystrFailure::InvalidState(std::string(ErrorMessages::VAULT_NOT_LOCKED)));
    }
    const std::string_view pw = password.value_or(std::string_view{});
    if (stored_level_.has_value() && !AllowsEmptyPassword(*stored_level_) && pw.empty()) {
        return R::Err(KeystrFailure::PolicyViolation(std::string(ErrorMessages::PASSWORD_REQUIRED)));
    }

    auto opened = crypto::CryptoBox::Open(*sealed_, pw);
    if (opened.IsErr()) {
        const KeystrFailure& failure = opened.UnwrapErr();
        if (failure.type == FailureType::AuthenticationFailed) {
            KEYSTR_LOG_INFO(kComponent, "unlock rejected: wrong password");
            return R::Err(KeystrFailure::WrongPassword(std::string(ErrorMessages::WRONG_PASSWORD)));
        }
        return R::Err(failure);
    }
    auto unlocked = Identity::FromSecretKey(std::move(opened).Unwrap());
    if (unlocked.IsErr()) {
        return R::Err(KeystrFailure::CorruptRecord(unlocked.UnwrapErr().message));
    }
    Identity identity = std::move(unlocked).Unwrap();
    if (identity_.has_value() && identity_->GetPublicKey() != identity.GetPublicKey()) {
        return R::Err(KeystrFailure::CorruptRecord(std::string(ErrorMessages::PUBLIC_KEY_MISMATCH)));
    }
    identity.SetLabel(label_);
    identity_.emplace(std::move(identity));
    password_protected_ = !pw.empty();
    state_ = VaultState::LoadedUnlocked;
    KEYSTR_LOG_INFO(kComponent, "vault unlocked for {}", debug::ShortKey(identity_->GetPublicKey()));
    return R::Ok(unit);
}

Result<Unit, KeystrFailure> KeyVault::Lock() {
    std::lock_guard<std::mutex> guard(lock_);
    if (state_ != VaultState::LoadedUnlocked || !sealed_.has_value()) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Only an unlocked key with a sealed record can be locked"));
    }
    identity_->ForgetSecretKey();
    state_ = VaultState::LoadedLocked;
    KEYSTR_LOG_INFO(kComponent, "vault locked");
    return Result<Unit, KeystrFailure>::Ok(unit);
}

void KeyVault::ClearLocked() noexcept {
    if (identity_.has_value()) {
        identity_->ForgetSecretKey();
        identity_.reset();
    }
    if (sealed_.has_value()) {
        crypto::SodiumInterop::SecureWipe(sealed_->ciphertext);
        sealed_.reset();
    }
    stored_level_.reset();
    password_protected_ = false;
    unsaved_changes_ = false;
    state_ = VaultState::Empty;
}

void KeyVault::Clear() noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    ClearLocked();
    label_.reset();
}

Result<Unit, KeystrFailure> KeyVault::Erase() {
    auto erased = storage_->Erase();
    if (erased.IsErr()) {
        return erased;
    }
    Clear();
    KEYSTR_LOG_INFO(kComponent, "vault record erased");
    return Result<Unit, KeystrFailure>::Ok(unit);
}

// ============================================================================
// Secret key operations
// ============================================================================

Result<const Identity*, KeystrFailure> KeyVault::RequireSecretIdentity() const {
    if (state_ != VaultState::LoadedUnlocked || !identity_.has_value() || !identity_->HasSecretKey()) {
        return Result<const Identity*, KeystrFailure>::Err(
            KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE)));
    }
    return Result<const Identity*, KeystrFailure>::Ok(&*identity_);
}

Result<crypto::SchnorrSignature, KeystrFailure> KeyVault::Sign(std::span<const uint8_t> digest) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto identity = RequireSecretIdentity();
    if (identity.IsErr()) {
        return Result<crypto::SchnorrSignature, KeystrFailure>::Err(std::move(identity).UnwrapErr());
    }
    return identity.Unwrap()->Sign(digest);
}

Result<crypto::SecureMemoryHandle, KeystrFailure> KeyVault::DeriveSharedSecret(
    const crypto::XOnlyPublicKey& peer) const {

    std::lock_guard<std::mutex> guard(lock_);
    auto identity = RequireSecretIdentity();
    if (identity.IsErr()) {
        return Result<crypto::SecureMemoryHandle, KeystrFailure>::Err(std::move(identity).UnwrapErr());
    }
    return identity.Unwrap()->DeriveSharedSecret(peer);
}

Result<std::string, KeystrFailure> KeyVault::Nip04Encrypt(
    const crypto::XOnlyPublicKey& peer, std::string_view plaintext) const {

    auto shared = DeriveSharedSecret(peer);
    if (shared.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(std::move(shared).UnwrapErr());
    }
    auto encrypted = shared.Unwrap().WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::Nip04::Encrypt(key, plaintext);
    });
    if (encrypted.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(KeystrFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    return std::move(encrypted).Unwrap();
}

Result<std::string, KeystrFailure> KeyVault::Nip04Decrypt(
    const crypto::XOnlyPublicKey& peer, std::string_view payload) const {

    auto shared = DeriveSharedSecret(peer);
    if (shared.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(std::move(shared).UnwrapErr());
    }
    auto decrypted = shared.Unwrap().WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::Nip04::Decrypt(key, payload);
    });
    if (decrypted.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(KeystrFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    return std::move(decrypted).Unwrap();
}

Result<std::string, KeystrFailure> KeyVault::RevealSecretKey(const RevealConfirmation& confirmation) const {
    if (!confirmation.confirmed) {
        return Result<std::string, KeystrFailure>::Err(
            KeystrFailure::PolicyViolation(std::string(ErrorMessages::REVEAL_NOT_CONFIRMED)));
    }
    std::lock_guard<std::mutex> guard(lock_);
    auto identity = RequireSecretIdentity();
    if (identity.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(std::move(identity).UnwrapErr());
    }
    KEYSTR_LOG_WARN(kComponent, "secret key revealed on explicit user request");
    return identity.Unwrap()->EncodeSecretKey();
}

// ============================================================================
// Queries
// ============================================================================

VaultState KeyVault::GetState() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_;
}

std::optional<crypto::XOnlyPublicKey> KeyVault::GetPublicKey() const {
    std::lock_guard<std::mutex> guard(lock_);
    if (!identity_.has_value()) {
        return std::nullopt;
    }
    return identity_->GetPublicKey();
}

std::optional<std::string> KeyVault::GetPublicKeyHex() const {
    const auto public_key = GetPublicKey();
    if (!public_key.has_value()) {
        return std::nullopt;
    }
    return encoding::ToHex(*public_key);
}

std::optional<std::string> KeyVault::GetNpub() const {
    const auto public_key = GetPublicKey();
    if (!public_key.has_value()) {
        return std::nullopt;
    }
    return encoding::KeyEncoding::ToNpub(*public_key);
}

std::optional<SecurityLevel> KeyVault::GetStoredSecurityLevel() const {
    std::lock_guard<std::mutex> guard(lock_);
    return stored_level_;
}

bool KeyVault::RequiresPassword() const {
    std::lock_guard<std::mutex> guard(lock_);
    return sealed_.has_value() && password_protected_;
}

bool KeyVault::HasUnsavedChanges() const {
    std::lock_guard<std::mutex> guard(lock_);
    return unsaved_changes_;
}

std::optional<std::string> KeyVault::GetLabel() const {
    std::lock_guard<std::mutex> guard(lock_);
    return label_;
}

void KeyVault::SetLabel(std::optional<std::string> label) {
    std::lock_guard<std::mutex> guard(lock_);
    label_ = std::move(label);
    if (identity_.has_value()) {
        identity_->SetLabel(label_);
    }
    if (state_ != VaultState::Empty) {
        unsaved_changes_ = true;
    }
}

}
