#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/signer/request_kind.hpp"
#include "keystr/vault/security_level.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace keystr::configuration {

/// Policy parameters of the key vault.
///
/// @example
/// ```cpp
/// auto config = VaultConfig::Default().WithScryptLogN(15);
/// ```
class VaultConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// scrypt log_n = 13 and PersistPasswordRequired.
    ///
    /// log_n = 13 is the work factor of earlier keystr releases, so keys
    /// they wrote open with the default configuration.
    [[nodiscard]] static constexpr VaultConfig Default() noexcept {
        return VaultConfig(kDefaultScryptLogN, vault::SecurityLevel::PersistPasswordRequired);
    }

    // =========================================================================
    // Modifiers
    // =========================================================================

    /// Work factor for newly sealed keys. Existing records carry their own.
    [[nodiscard]] constexpr VaultConfig WithScryptLogN(uint8_t log_n) const noexcept {
        VaultConfig copy = *this;
        copy.scrypt_log_n_ = log_n;
        return copy;
    }

    /// Level used by KeyVault::Save() when the caller does not pass one.
    [[nodiscard]] constexpr VaultConfig WithDefaultSecurityLevel(vault::SecurityLevel level) const noexcept {
        VaultConfig copy = *this;
        copy.default_security_level_ = level;
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr uint8_t GetScryptLogN() const noexcept { return scrypt_log_n_; }

    [[nodiscard]] constexpr vault::SecurityLevel GetDefaultSecurityLevel() const noexcept {
        return default_security_level_;
    }

    [[nodiscard]] Result<Unit, KeystrFailure> Validate() const;

private:
    constexpr VaultConfig(uint8_t log_n, vault::SecurityLevel level) noexcept
        : scrypt_log_n_(log_n)
        , default_security_level_(level) {}

    uint8_t scrypt_log_n_;
    vault::SecurityLevel default_security_level_;
};

/// Policy parameters of the signer engine.
///
/// - approval timeout: how long a request may wait for a human decision
///   before the peer receives an Expired error (default 120 s)
/// - worker threads: threads running signatures and key derivation off the
///   event loop (default 2; 0 runs that work inline on the caller)
/// - worker queue capacity: tasks accepted before Post() refuses (default 64)
/// - max pending requests: approval queue bound across all sessions (default 256)
/// - pre-approved kinds: granted to every new session (default none)
class SignerConfig {
public:
    [[nodiscard]] static constexpr SignerConfig Default() noexcept {
        return SignerConfig();
    }

    [[nodiscard]] constexpr SignerConfig WithApprovalTimeout(std::chrono::milliseconds timeout) const noexcept {
        SignerConfig copy = *this;
        copy.approval_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] constexpr SignerConfig WithWorkerThreads(size_t threads) const noexcept {
        SignerConfig copy = *this;
        copy.worker_threads_ = threads;
        return copy;
    }

    [[nodiscard]] constexpr SignerConfig WithWorkerQueueCapacity(size_t capacity) const noexcept {
        SignerConfig copy = *this;
        copy.worker_queue_capacity_ = capacity;
        return copy;
    }

    [[nodiscard]] constexpr SignerConfig WithMaxPendingRequests(size_t max_pending) const noexcept {
        SignerConfig copy = *this;
        copy.max_pending_requests_ = max_pending;
        return copy;
    }

    [[nodiscard]] constexpr SignerConfig WithPreApproved(signer::RequestKind kind) const noexcept {
        SignerConfig copy = *this;
        copy.pre_approved_mask_ |= KindBit(kind);
        return copy;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds GetApprovalTimeout() const noexcept {
        return approval_timeout_;
    }
    [[nodiscard]] constexpr size_t GetWorkerThreads() const noexcept { return worker_threads_; }
    [[nodiscard]] constexpr size_t GetWorkerQueueCapacity() const noexcept { return worker_queue_capacity_; }
    [[nodiscard]] constexpr size_t GetMaxPendingRequests() const noexcept { return max_pending_requests_; }

    [[nodiscard]] constexpr bool IsPreApproved(signer::RequestKind kind) const noexcept {
        return (pre_approved_mask_ & KindBit(kind)) != 0;
    }

    [[nodiscard]] Result<Unit, KeystrFailure> Validate() const;

private:
    constexpr SignerConfig() noexcept = default;

    static constexpr uint32_t KindBit(signer::RequestKind kind) noexcept {
        return uint32_t{1} << static_cast<uint32_t>(kind);
    }

    std::chrono::milliseconds approval_timeout_{kDefaultApprovalTimeout};
    size_t worker_threads_{kDefaultWorkerThreads};
    size_t worker_queue_capacity_{kDefaultWorkerQueueCapacity};
    size_t max_pending_requests_{kDefaultMaxPendingRequests};
    uint32_t pre_approved_mask_{0};
};

}
