#include "keystr/signer/signer_engine.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/debug/logger.hpp"
#include "keystr/encoding/key_encoding.hpp"
#include "keystr/vault/key_vault.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace keystr::signer {

using json = nlohmann::json;

namespace {

constexpr std::string_view kComponent = "engine";

KeystrFailure NoSession() {
    return KeystrFailure::UnknownRequest("No session for this client");
}

PendingRequestView MakeView(const SignRequest& request) {
    PendingRequestView view;
    view.id = request.id;
    view.session = request.session;
    view.session_npub = encoding::KeyEncoding::ToNpub(request.session);
    view.kind = request.kind;
    view.description = request.Describe();
    view.received_at = request.received_at;
    return view;
}

void WipeString(std::string& text) noexcept {
    crypto::SodiumInterop::SecureWipe(
        std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
}

}

// ============================================================================
// Construction
// ============================================================================

SignerEngine::SignerEngine(vault::KeyVault& vault,
                           std::shared_ptr<interfaces::ITransport> transport,
                           configuration::SignerConfig config)
    : vault_(vault)
    , transport_(std::move(transport))
    , config_(config)
    , gate_(config.GetMaxPendingRequests(), config.GetApprovalTimeout())
    , pool_(std::make_unique<WorkerPool>(config.GetWorkerThreads(), config.GetWorkerQueueCapacity())) {}

Result<std::unique_ptr<SignerEngine>, KeystrFailure> SignerEngine::Create(
    vault::KeyVault& vault,
    std::shared_ptr<interfaces::ITransport> transport,
    configuration::SignerConfig config) {

    using R = Result<std::unique_ptr<SignerEngine>, KeystrFailure>;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return R::Err(std::move(valid).UnwrapErr());
    }
    if (!transport) {
        return R::Err(KeystrFailure::InvalidState("Signer engine needs a transport"));
    }
    return R::Ok(std::unique_ptr<SignerEngine>(new SignerEngine(vault, std::move(transport), config)));
}

SignerEngine::~SignerEngine() {
    // Queued tasks reference this engine; finish them before members go away.
    pool_->Shutdown();
}

void SignerEngine::SetEventHandler(std::shared_ptr<interfaces::ISignerEventHandler> handler) {
    std::lock_guard<std::mutex> guard(handler_lock_);
    handler_ = std::move(handler);
}

std::shared_ptr<interfaces::ISignerEventHandler> SignerEngine::GetHandler() const {
    std::lock_guard<std::mutex> guard(handler_lock_);
    return handler_;
}

std::shared_ptr<SignerSession> SignerEngine::FindSession(const SessionId& remote) const {
    std::lock_guard<std::mutex> guard(sessions_lock_);
    const auto it = sessions_.find(remote);
    return it == sessions_.end() ? nullptr : it->second;
}

// ============================================================================
// Inbound path
// ============================================================================

void SignerEngine::OnMessage(const SessionId& sender, std::string_view payload) {
    ExpireStale(Clock::now());

    if (crypto::Secp256k1::ValidatePublicKey(sender).IsErr()) {
        KEYSTR_LOG_WARN(kComponent, "dropping message from invalid sender key {}", debug::ShortKey(sender));
        return;
    }
    OnVaultChanged();

    std::shared_ptr<SignerSession> session = FindSession(sender);
    const bool is_new = session == nullptr;
    if (is_new) {
        auto created = SignerSession::Create(sender, vault_, config_);
        if (created.IsErr()) {
            KEYSTR_LOG_WARN(kComponent, "dropping message from {}: {}",
                            debug::ShortKey(sender), created.UnwrapErr().ToWireError());
            return;
        }
        session = std::shared_ptr<SignerSession>(std::move(created).Unwrap());
    }

    auto plaintext = session->DecryptEnvelope(payload);
    if (plaintext.IsErr()) {
        KEYSTR_LOG_WARN(kComponent, "dropping undecryptable message from {}: {}",
                        debug::ShortKey(sender), plaintext.UnwrapErr().ToWireError());
        return;
    }

    if (is_new) {
        bool inserted = false;
        {
            std::lock_guard<std::mutex> guard(sessions_lock_);
            auto [it, added] = sessions_.emplace(sender, session);
            inserted = added;
            session = it->second;
        }
        if (inserted) {
            KEYSTR_LOG_INFO(kComponent, "session opened for {}", debug::ShortKey(sender));
            if (auto handler = GetHandler()) {
                handler->OnSessionOpened(sender);
            }
        }
    }

    auto envelope = MessageCodec::Parse(plaintext.Unwrap());
    if (envelope.IsErr()) {
        KEYSTR_LOG_WARN(kComponent, "dropping message from {}: {}",
                        debug::ShortKey(sender), envelope.UnwrapErr().ToWireError());
        return;
    }
    if (envelope.Unwrap().kind == EnvelopeKind::Response) {
        KEYSTR_LOG_DEBUG(kComponent, "response from {} ignored", debug::ShortKey(sender));
        return;
    }
    if (!envelope.Unwrap().id.has_value()) {
        KEYSTR_LOG_WARN(kComponent, "dropping request without id from {}", debug::ShortKey(sender));
        return;
    }

    HandleRequest(session, envelope.Unwrap());
}

void SignerEngine::HandleRequest(const std::shared_ptr<SignerSession>& session, const Envelope& envelope) {
    auto decoded = MessageCodec::DecodeRequest(envelope);
    if (decoded.IsErr()) {
        SendResponse(*session, RpcResponse::Failure(*envelope.id, decoded.UnwrapErr()), envelope.wire_id);
        return;
    }
    RpcRequest request = std::move(decoded).Unwrap();
    const RequestKind kind = ParseMethod(request.method);

    KEYSTR_LOG_DEBUG(kComponent, "request {} '{}' from {}",
                     request.id, request.method, debug::ShortKey(session->GetRemote()));

    if (kind != RequestKind::Unknown) {
        auto valid = SignerSession::ValidateParams(kind, request.params);
        if (valid.IsErr()) {
            SendResponse(*session, RpcResponse::Failure(request.id, valid.UnwrapErr()), request.wire_id);
            return;
        }
    }

    if (!RequiresApproval(kind)) {
        SendResponse(*session, session->AnswerImmediate(request, kind, vault_), request.wire_id);
        if (kind == RequestKind::Disconnect) {
            TearDown(session->GetRemote(), "client disconnected");
        }
        return;
    }

    SignRequest pending;
    pending.id = request.id;
    pending.wire_id = request.wire_id;
    pending.kind = kind;
    pending.params = std::move(request.params);
    pending.session = session->GetRemote();
    pending.received_at = Clock::now();

    if (session->IsPreApproved(kind)) {
        pending.state = DecisionState::Approved;
        ExecuteApproved(session, std::move(pending));
        return;
    }

    const PendingRequestView view = MakeView(pending);
    auto outcome = [&]() -> Result<EnqueueOutcome, KeystrFailure> {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        const auto it = sessions_.find(session->GetRemote());
        if (it == sessions_.end() || it->second != session) {
            return Result<EnqueueOutcome, KeystrFailure>::Err(
                KeystrFailure::Expired(std::string(ErrorMessages::SESSION_CLOSED)));
        }
        return gate_.Enqueue(std::move(pending));
    }();
    if (outcome.IsErr()) {
        KEYSTR_LOG_WARN(kComponent, "refusing request {}: {}", view.id, outcome.UnwrapErr().message);
        SendResponse(*session, RpcResponse::Failure(view.id, outcome.UnwrapErr()), request.wire_id);
        return;
    }
    if (outcome.Unwrap() == EnqueueOutcome::Added) {
        if (auto handler = GetHandler()) {
            handler->OnRequestPending(view);
        }
    }
}

// ============================================================================
// Resolution
// ============================================================================

Result<Unit, KeystrFailure> SignerEngine::Decide(std::string_view request_id, Decision decision, bool remember) {
    ExpireStale(Clock::now());
    OnVaultChanged();

    std::shared_ptr<SignerSession> session;
    std::optional<SignRequest> request;
    {
        // Taking the request and its session under one lock keeps TearDown
        // from closing the session in between.
        std::lock_guard<std::mutex> guard(sessions_lock_);
        auto resolved = gate_.Decide(request_id, decision);
        if (resolved.IsErr()) {
            return Result<Unit, KeystrFailure>::Err(std::move(resolved).UnwrapErr());
        }
        request.emplace(std::move(resolved).Unwrap());
        const auto it = sessions_.find(request->session);
        if (it != sessions_.end()) {
            session = it->second;
        }
    }
    if (!session) {
        KEYSTR_LOG_ERROR(kComponent, "request {} outlived its session", request->id);
        return Result<Unit, KeystrFailure>::Err(NoSession());
    }
    if (remember && decision == Decision::Approve) {
        session->GrantPermission(request->kind);
    }
    Resolve(session, std::move(*request));
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> SignerEngine::Decide(const SessionId& session_id,
                                                 std::string_view request_id,
                                                 Decision decision,
                                                 bool remember) {
    ExpireStale(Clock::now());
    OnVaultChanged();

    std::shared_ptr<SignerSession> session;
    std::optional<SignRequest> request;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        auto resolved = gate_.Decide(session_id, request_id, decision);
        if (resolved.IsErr()) {
            return Result<Unit, KeystrFailure>::Err(std::move(resolved).UnwrapErr());
        }
        request.emplace(std::move(resolved).Unwrap());
        const auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            session = it->second;
        }
    }
    if (!session) {
        KEYSTR_LOG_ERROR(kComponent, "request {} outlived its session", request->id);
        return Result<Unit, KeystrFailure>::Err(NoSession());
    }
    if (remember && decision == Decision::Approve) {
        session->GrantPermission(request->kind);
    }
    Resolve(session, std::move(*request));
    return Result<Unit, KeystrFailure>::Ok(unit);
}

void SignerEngine::Resolve(const std::shared_ptr<SignerSession>& session, SignRequest request) {
    KEYSTR_LOG_INFO(kComponent, "request {} from {} {}",
                    request.id, debug::ShortKey(request.session), DecisionStateName(request.state));
    if (auto handler = GetHandler()) {
        handler->OnRequestResolved(request.session, request.id, request.state);
    }

    switch (request.state) {
        case DecisionState::Approved:
            ExecuteApproved(session, std::move(request));
            return;
        case DecisionState::Rejected:
            SendResponse(*session, RpcResponse::Failure(request.id,
                KeystrFailure::Rejected(std::string(ErrorMessages::REJECTED_BY_USER))), request.wire_id);
            return;
        case DecisionState::Expired:
            SendResponse(*session, RpcResponse::Failure(request.id,
                KeystrFailure::Expired(std::string(ErrorMessages::APPROVAL_TIMEOUT))), request.wire_id);
            return;
        case DecisionState::Pending:
            break;
    }
    KEYSTR_LOG_ERROR(kComponent, "request {} resolved while still pending", request.id);
}

void SignerEngine::ExecuteApproved(std::shared_ptr<SignerSession> session, SignRequest request) {
    const std::string id = request.id;
    const json wire_id = request.wire_id;
    auto posted = pool_->Post([this, session, request = std::move(request)] {
        if (!MatchesVault(*session)) {
            SendResponse(*session, RpcResponse::Failure(request.id,
                KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE))), request.wire_id);
            return;
        }
        SendResponse(*session, session->Execute(request, vault_), request.wire_id);
    });
    if (posted.IsErr()) {
        SendResponse(*session, RpcResponse::Failure(id, posted.UnwrapErr()), wire_id);
    }
}

size_t SignerEngine::Tick() {
    return ExpireStale(Clock::now());
}

size_t SignerEngine::ExpireStale(Clock::time_point now) {
    std::vector<std::pair<std::shared_ptr<SignerSession>, SignRequest>> expired;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        for (auto& request : gate_.ExpireStale(now)) {
            const auto it = sessions_.find(request.session);
            if (it == sessions_.end()) {
                KEYSTR_LOG_WARN(kComponent, "expired request {} has no session", request.id);
                continue;
            }
            expired.emplace_back(it->second, std::move(request));
        }
    }
    for (auto& [session, request] : expired) {
        Resolve(session, std::move(request));
    }
    return expired.size();
}

// ============================================================================
// Sessions
// ============================================================================

Result<ConnectUri, KeystrFailure> SignerEngine::Connect(std::string_view uri) {
    using R = Result<ConnectUri, KeystrFailure>;

    auto parsed = ConnectUri::Parse(uri);
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).UnwrapErr());
    }
    OnVaultChanged();
    const auto local = vault_.GetPublicKeyHex();
    if (!local.has_value()) {
        return R::Err(KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE)));
    }

    const SessionId client = parsed.Unwrap().client;
    std::shared_ptr<SignerSession> session = FindSession(client);
    if (!session) {
        auto created = SignerSession::Create(client, vault_, config_);
        if (created.IsErr()) {
            return R::Err(std::move(created).UnwrapErr());
        }
        bool inserted = false;
        {
            std::lock_guard<std::mutex> guard(sessions_lock_);
            auto [it, added] = sessions_.emplace(client, std::shared_ptr<SignerSession>(std::move(created).Unwrap()));
            inserted = added;
            session = it->second;
        }
        if (inserted) {
            if (auto handler = GetHandler()) {
                handler->OnSessionOpened(client);
            }
        }
    }
    session->MarkConnected();

    RpcRequest request;
    request.id = crypto::SodiumInterop::RandomHexId();
    request.method = std::string(MethodName(RequestKind::Connect));
    request.params = json::array({*local});

    auto sent = SendPayload(*session, MessageCodec::EncodeRequest(request));
    if (sent.IsErr()) {
        return R::Err(std::move(sent).UnwrapErr());
    }
    KEYSTR_LOG_INFO(kComponent, "paired with {} via {} relay(s)",
                    debug::ShortKey(client), parsed.Unwrap().relays.size());
    return parsed;
}

Result<Unit, KeystrFailure> SignerEngine::Disconnect(const SessionId& session) {
    if (!FindSession(session)) {
        return Result<Unit, KeystrFailure>::Err(NoSession());
    }
    TearDown(session, "disconnected by user");
    return Result<Unit, KeystrFailure>::Ok(unit);
}

void SignerEngine::DisconnectAll() {
    std::vector<SessionId> remotes;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        remotes.reserve(sessions_.size());
        for (const auto& [remote, session] : sessions_) {
            remotes.push_back(remote);
        }
    }
    for (const auto& remote : remotes) {
        TearDown(remote, "disconnected by user");
    }
}

void SignerEngine::OnTransportError(const SessionId& session) {
    TearDown(session, "transport error");
}

void SignerEngine::TearDown(const SessionId& remote, std::string_view reason) {
    std::shared_ptr<SignerSession> session;
    std::vector<SignRequest> cancelled;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        const auto it = sessions_.find(remote);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
        cancelled = gate_.CancelSession(remote);
    }
    session->Close();

    const auto handler = GetHandler();
    for (const auto& request : cancelled) {
        SendResponse(*session, RpcResponse::Failure(request.id,
            KeystrFailure::Expired(std::string(ErrorMessages::SESSION_CLOSED))), request.wire_id);
        if (handler) {
            handler->OnRequestResolved(remote, request.id, request.state);
        }
    }

    KEYSTR_LOG_INFO(kComponent, "session with {} closed: {}", debug::ShortKey(remote), reason);
    if (handler) {
        handler->OnSessionClosed(remote);
    }
}

size_t SignerEngine::OnVaultChanged() {
    std::vector<SessionId> stale;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        for (const auto& [remote, session] : sessions_) {
            if (!MatchesVault(*session)) {
                stale.push_back(remote);
            }
        }
    }
    for (const auto& remote : stale) {
        TearDown(remote, "vault key changed");
    }
    return stale.size();
}

bool SignerEngine::MatchesVault(const SignerSession& session) const {
    const auto current = vault_.GetPublicKey();
    return current.has_value() && *current == session.GetLocal();
}

Result<Unit, KeystrFailure> SignerEngine::GrantPermission(const SessionId& session, RequestKind kind) {
    auto found = FindSession(session);
    if (!found) {
        return Result<Unit, KeystrFailure>::Err(NoSession());
    }
    found->GrantPermission(kind);
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> SignerEngine::RevokePermission(const SessionId& session, RequestKind kind) {
    auto found = FindSession(session);
    if (!found) {
        return Result<Unit, KeystrFailure>::Err(NoSession());
    }
    found->RevokePermission(kind);
    return Result<Unit, KeystrFailure>::Ok(unit);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PendingRequestView> SignerEngine::ListPending() {
    ExpireStale(Clock::now());
    OnVaultChanged();

    std::vector<PendingRequestView> views;
    for (const auto& request : gate_.List()) {
        views.push_back(MakeView(request));
    }
    return views;
}

std::vector<SessionView> SignerEngine::ListSessions() {
    OnVaultChanged();

    std::vector<std::shared_ptr<SignerSession>> sessions;
    {
        std::lock_guard<std::mutex> guard(sessions_lock_);
        for (const auto& [remote, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    const std::vector<SignRequest> pending = gate_.List();

    std::vector<SessionView> views;
    views.reserve(sessions.size());
    for (const auto& session : sessions) {
        SessionView view;
        view.remote = session->GetRemote();
        view.npub = encoding::KeyEncoding::ToNpub(view.remote);
        view.connected = session->IsConnected();
        view.permissions = session->GetPermissions();
        view.pending_requests = static_cast<size_t>(std::count_if(pending.begin(), pending.end(),
            [&](const SignRequest& request) { return request.session == view.remote; }));
        views.push_back(std::move(view));
    }
    return views;
}

size_t SignerEngine::SessionCount() const {
    std::lock_guard<std::mutex> guard(sessions_lock_);
    return sessions_.size();
}

// ============================================================================
// Vault operations off the event loop
// ============================================================================

Result<std::future<Result<Unit, KeystrFailure>>, KeystrFailure> SignerEngine::UnlockVault(std::string password) {
    return pool_->Submit([this, password = std::move(password)]() mutable {
        auto result = vault_.Unlock(std::string_view(password));
        WipeString(password);
        return result;
    });
}

Result<std::future<Result<Unit, KeystrFailure>>, KeystrFailure> SignerEngine::SaveVault(
    std::optional<std::string> password, vault::SecurityLevel level) {

    return pool_->Submit([this, password = std::move(password), level]() mutable {
        std::optional<std::string_view> view;
        if (password.has_value()) {
            view = *password;
        }
        auto result = vault_.Save(view, level);
        if (password.has_value()) {
            WipeString(*password);
        }
        return result;
    });
}

void SignerEngine::WaitIdle() {
    pool_->WaitIdle();
}

// ============================================================================
// Outbound path
// ============================================================================

Result<Unit, KeystrFailure> SignerEngine::SendPayload(const SignerSession& session, const std::string& plaintext) {
    auto encrypted = session.EncryptEnvelope(plaintext);
    if (encrypted.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(encrypted).UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(send_lock_);
    return transport_->Send(session.GetRemote(), encrypted.Unwrap());
}

void SignerEngine::SendResponse(const SignerSession& session, RpcResponse response, const json& wire_id) {
    response.wire_id = wire_id;
    auto sent = SendPayload(session, MessageCodec::EncodeResponse(response));
    if (sent.IsErr()) {
        KEYSTR_LOG_WARN(kComponent, "response {} to {} not sent: {}",
                        response.id, debug::ShortKey(session.GetRemote()), sent.UnwrapErr().ToWireError());
    }
}

}
