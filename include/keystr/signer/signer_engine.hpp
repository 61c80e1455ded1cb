#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/configuration/keystr_config.hpp"
#include "keystr/interfaces/i_signer_event_handler.hpp"
#include "keystr/interfaces/i_transport.hpp"
#include "keystr/signer/approval_gate.hpp"
#include "keystr/signer/connect_uri.hpp"
#include "keystr/signer/message_codec.hpp"
#include "keystr/signer/request.hpp"
#include "keystr/signer/signer_session.hpp"
#include "keystr/signer/worker_pool.hpp"
#include "keystr/vault/security_level.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::vault {
class KeyVault;
}

namespace keystr::signer {

struct SessionView {
    SessionId remote{};
    std::string npub;
    bool connected = false;
    std::vector<RequestKind> permissions;
    size_t pending_requests = 0;
};

/**
 * @brief Remote-signer orchestrator.
 *
 * Routes inbound payloads from the transport to a SignerSession keyed by
 * the sender's public key, answers read-only requests at once, parks
 * secret-touching requests in the ApprovalGate and sends their responses
 * once the user decides or the approval timeout passes.
 *
 * Every well-formed request with an id gets exactly one response. Payloads
 * that do not decrypt, or carry no id, are dropped and logged; nothing a
 * peer sends can stop the engine.
 *
 * Signing and key derivation run on the WorkerPool. The transport is
 * called from the caller's thread and from worker threads, one call at
 * a time.
 *
 * @code
 * auto engine = SignerEngine::Create(*vault, transport).Unwrap();
 * transport_loop.OnEvent([&](auto sender, auto content) { engine->OnMessage(sender, content); });
 * ui.OnApprove([&](auto id) { engine->Decide(id, Decision::Approve); });
 * @endcode
 */
class SignerEngine {
public:
    static Result<std::unique_ptr<SignerEngine>, KeystrFailure> Create(
        vault::KeyVault& vault,
        std::shared_ptr<interfaces::ITransport> transport,
        configuration::SignerConfig config = configuration::SignerConfig::Default());

    ~SignerEngine();

    SignerEngine(const SignerEngine&) = delete;
    SignerEngine& operator=(const SignerEngine&) = delete;

    void SetEventHandler(std::shared_ptr<interfaces::ISignerEventHandler> handler);

    // ========================================================================
    // Transport side
    // ========================================================================

    /// Inbound NIP-04 payload from @p sender. Never throws, never fails.
    void OnMessage(const SessionId& sender, std::string_view payload);

    /// Relay failure for one session: the session is torn down.
    void OnTransportError(const SessionId& session);

    // ========================================================================
    // Pairing
    // ========================================================================

    /**
     * @brief Pairs with a client from its nostrconnect:// URI.
     *
     * Opens (or reuses) the session, marks it connected and sends the
     * client a connect request carrying the signer's public key. The
     * parsed URI is returned so the transport can subscribe to its relays.
     */
    Result<ConnectUri, KeystrFailure> Connect(std::string_view uri);

    /// UnknownRequest when no such session exists (also for the permission calls below).
    Result<Unit, KeystrFailure> Disconnect(const SessionId& session);

    void DisconnectAll();

    /**
     * @brief Closes every session bound to a vault key that is gone.
     *
     * Call after Clear(), Erase(), Generate() or an import. Sessions whose
     * shared secret came from another key are torn down and their pending
     * requests expire. Incoming traffic and user calls also run this check.
     *
     * @return number of sessions closed
     */
    size_t OnVaultChanged();

    // ========================================================================
    // User side
    // ========================================================================

    /// Expires overdue requests first, so only decidable requests are listed.
    [[nodiscard]] std::vector<PendingRequestView> ListPending();

    [[nodiscard]] std::vector<SessionView> ListSessions();

    /// @param remember on approval, pre-approve this kind for the session.
    Result<Unit, KeystrFailure> Decide(std::string_view request_id, Decision decision, bool remember = false);

    Result<Unit, KeystrFailure> Decide(const SessionId& session,
                                       std::string_view request_id,
                                       Decision decision,
                                       bool remember = false);

    /// ExpireStale(now). Returns the number of requests expired.
    size_t Tick();

    size_t ExpireStale(Clock::time_point now);

    Result<Unit, KeystrFailure> GrantPermission(const SessionId& session, RequestKind kind);

    Result<Unit, KeystrFailure> RevokePermission(const SessionId& session, RequestKind kind);

    /// Runs KeyVault::Unlock on the worker pool. The password copy is wiped afterwards.
    Result<std::future<Result<Unit, KeystrFailure>>, KeystrFailure> UnlockVault(std::string password);

    Result<std::future<Result<Unit, KeystrFailure>>, KeystrFailure> SaveVault(
        std::optional<std::string> password, vault::SecurityLevel level);

    /// Blocks until every queued signing task has sent its response.
    void WaitIdle();

    [[nodiscard]] size_t SessionCount() const;

private:
    SignerEngine(vault::KeyVault& vault,
                 std::shared_ptr<interfaces::ITransport> transport,
                 configuration::SignerConfig config);

    std::shared_ptr<SignerSession> FindSession(const SessionId& remote) const;

    void HandleRequest(const std::shared_ptr<SignerSession>& session, const Envelope& envelope);

    void Resolve(const std::shared_ptr<SignerSession>& session, SignRequest request);

    void ExecuteApproved(std::shared_ptr<SignerSession> session, SignRequest request);

    void TearDown(const SessionId& remote, std::string_view reason);

    /// False once the vault no longer holds the key @p session was derived from.
    bool MatchesVault(const SignerSession& session) const;

    /// Answers under @p wire_id, the id as the peer wrote it. Failures are logged;
    /// the peer's retry or the relay error path takes over.
    void SendResponse(const SignerSession& session, RpcResponse response, const nlohmann::json& wire_id);

    Result<Unit, KeystrFailure> SendPayload(const SignerSession& session, const std::string& plaintext);

    std::shared_ptr<interfaces::ISignerEventHandler> GetHandler() const;

    vault::KeyVault& vault_;
    std::shared_ptr<interfaces::ITransport> transport_;
    const configuration::SignerConfig config_;

    ApprovalGate gate_;

    mutable std::mutex sessions_lock_;
    std::map<SessionId, std::shared_ptr<SignerSession>> sessions_;

    std::mutex send_lock_;

    mutable std::mutex handler_lock_;
    std::shared_ptr<interfaces::ISignerEventHandler> handler_;

    std::unique_ptr<WorkerPool> pool_;
};

}
