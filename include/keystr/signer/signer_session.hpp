#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/configuration/keystr_config.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"
#include "keystr/signer/message_codec.hpp"
#include "keystr/signer/request.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::vault {
class KeyVault;
}

namespace keystr::signer {

/**
 * @brief One remote client talking to the signer.
 *
 * Holds the NIP-04 shared secret with the client (derived once through
 * the vault, kept in secure memory) and the kinds this client may use
 * without a prompt. The vault's secret key itself never enters a session.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class SignerSession {
public:
    static Result<std::unique_ptr<SignerSession>, KeystrFailure> Create(
        const SessionId& remote,
        const vault::KeyVault& vault,
        const configuration::SignerConfig& config);

    SignerSession(const SignerSession&) = delete;
    SignerSession& operator=(const SignerSession&) = delete;

    [[nodiscard]] const SessionId& GetRemote() const noexcept { return remote_; }

    /// Vault key the shared secret was derived from.
    [[nodiscard]] const crypto::XOnlyPublicKey& GetLocal() const noexcept { return local_; }

    // ========================================================================
    // Envelope encryption
    // ========================================================================

    /// DecryptionFailed on a bad payload or the wrong key.
    Result<std::string, KeystrFailure> DecryptEnvelope(std::string_view payload) const;

    Result<std::string, KeystrFailure> EncryptEnvelope(std::string_view plaintext) const;

    // ========================================================================
    // Requests
    // ========================================================================

    /// Shape check of params for @p kind, done before anything is queued.
    static Result<Unit, KeystrFailure> ValidateParams(RequestKind kind, const nlohmann::json& params);

    /// Answers kinds that need no approval: connect, disconnect, describe,
    /// get_public_key, ping and unknown methods.
    RpcResponse AnswerImmediate(const RpcRequest& request, RequestKind kind, const vault::KeyVault& vault);

    /// Runs an approved sign_event / nip04_encrypt / nip04_decrypt.
    RpcResponse Execute(const SignRequest& request, const vault::KeyVault& vault) const;

    // ========================================================================
    // Permissions and lifecycle
    // ========================================================================

    void GrantPermission(RequestKind kind);
    void RevokePermission(RequestKind kind);
    [[nodiscard]] bool IsPreApproved(RequestKind kind) const;
    [[nodiscard]] std::vector<RequestKind> GetPermissions() const;

    void MarkConnected() noexcept { connected_.store(true); }
    [[nodiscard]] bool IsConnected() const noexcept { return connected_.load(); }

    void Close() noexcept { alive_.store(false); }
    [[nodiscard]] bool IsAlive() const noexcept { return alive_.load(); }

private:
    SignerSession(const SessionId& remote,
                  const crypto::XOnlyPublicKey& local,
                  crypto::SecureMemoryHandle shared_secret);

    static uint32_t KindBit(RequestKind kind) noexcept {
        return uint32_t{1} << static_cast<uint32_t>(kind);
    }

    const SessionId remote_;
    const crypto::XOnlyPublicKey local_;
    crypto::SecureMemoryHandle shared_secret_;

    mutable std::mutex permissions_lock_;
    uint32_t permissions_ = 0;

    std::atomic<bool> connected_{false};
    std::atomic<bool> alive_{true};
};

}
