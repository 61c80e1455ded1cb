#pragma once
#include <string>
#include <string_view>

namespace keystr {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    MemoryProtectionFailed,
    ObjectDisposed,
    InvalidOperation
};

enum class FailureType {
    InvalidKeyFormat,
    PolicyViolation,
    NoRecordFound,
    WrongPassword,
    SigningUnavailable,
    UnsupportedVaultVersion,
    CorruptRecord,
    AuthenticationFailed,
    DecryptionFailed,
    UnsupportedMethod,
    InvalidRequest,
    UnknownRequest,
    Rejected,
    Expired,
    InvalidState,
    Storage,
    Crypto
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure MemoryProtectionFailed(std::string msg) {
        return {SodiumFailureType::MemoryProtectionFailed, std::move(msg)};
    }
    static SodiumFailure ObjectDisposed(std::string msg) {
        return {SodiumFailureType::ObjectDisposed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

constexpr std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::InvalidKeyFormat: return "InvalidKeyFormat";
        case FailureType::PolicyViolation: return "PolicyViolation";
        case FailureType::NoRecordFound: return "NoRecordFound";
        case FailureType::WrongPassword: return "WrongPassword";
        case FailureType::SigningUnavailable: return "SigningUnavailable";
        case FailureType::UnsupportedVaultVersion: return "UnsupportedVaultVersion";
        case FailureType::CorruptRecord: return "CorruptRecord";
        case FailureType::AuthenticationFailed: return "AuthenticationFailed";
        case FailureType::DecryptionFailed: return "DecryptionFailed";
        case FailureType::UnsupportedMethod: return "UnsupportedMethod";
        case FailureType::InvalidRequest: return "InvalidRequest";
        case FailureType::UnknownRequest: return "UnknownRequest";
        case FailureType::Rejected: return "Rejected";
        case FailureType::Expired: return "Expired";
        case FailureType::InvalidState: return "InvalidState";
        case FailureType::Storage: return "Storage";
        case FailureType::Crypto: return "Crypto";
    }
    return "Unknown";
}

class KeystrFailure {
public:
    FailureType type;
    std::string message;

    KeystrFailure(const FailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static KeystrFailure InvalidKeyFormat(std::string msg) {
        return {FailureType::InvalidKeyFormat, std::move(msg)};
    }
    static KeystrFailure PolicyViolation(std::string msg) {
        return {FailureType::PolicyViolation, std::move(msg)};
    }
    static KeystrFailure NoRecordFound(std::string msg) {
        return {FailureType::NoRecordFound, std::move(msg)};
    }
    static KeystrFailure WrongPassword(std::string msg) {
        return {FailureType::WrongPassword, std::move(msg)};
    }
    static KeystrFailure SigningUnavailable(std::string msg) {
        return {FailureType::SigningUnavailable, std::move(msg)};
    }
    static KeystrFailure UnsupportedVaultVersion(std::string msg) {
        return {FailureType::UnsupportedVaultVersion, std::move(msg)};
    }
    static KeystrFailure CorruptRecord(std::string msg) {
        return {FailureType::CorruptRecord, std::move(msg)};
    }
    static KeystrFailure AuthenticationFailed(std::string msg) {
        return {FailureType::AuthenticationFailed, std::move(msg)};
    }
    static KeystrFailure DecryptionFailed(std::string msg) {
        return {FailureType::DecryptionFailed, std::move(msg)};
    }
    static KeystrFailure UnsupportedMethod(std::string msg) {
        return {FailureType::UnsupportedMethod, std::move(msg)};
    }
    static KeystrFailure InvalidRequest(std::string msg) {
        return {FailureType::InvalidRequest, std::move(msg)};
    }
    static KeystrFailure UnknownRequest(std::string msg) {
        return {FailureType::UnknownRequest, std::move(msg)};
    }
    static KeystrFailure Rejected(std::string msg) {
        return {FailureType::Rejected, std::move(msg)};
    }
    static KeystrFailure Expired(std::string msg) {
        return {FailureType::Expired, std::move(msg)};
    }
    static KeystrFailure InvalidState(std::string msg) {
        return {FailureType::InvalidState, std::move(msg)};
    }
    static KeystrFailure Storage(std::string msg) {
        return {FailureType::Storage, std::move(msg)};
    }
    static KeystrFailure Crypto(std::string msg) {
        return {FailureType::Crypto, std::move(msg)};
    }
    static KeystrFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Crypto(failure.message);
    }

    /// Conditions the user can recover from by retrying (another password, a first save).
    [[nodiscard]] bool IsRetriable() const noexcept {
        return type == FailureType::WrongPassword || type == FailureType::NoRecordFound;
    }

    /// Text placed in the `error` field of a signer response.
    [[nodiscard]] std::string ToWireError() const {
        std::string text(FailureTypeName(type));
        if (!message.empty()) {
            text.append(": ").append(message);
        }
        return text;
    }
};

}
