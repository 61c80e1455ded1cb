#include "keystr/signer/signer_session.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/nip04.hpp"
#include "keystr/debug/logger.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/encoding/key_encoding.hpp"
#include "keystr/nostr/event.hpp"
#include "keystr/vault/key_vault.hpp"

#include <fmt/format.h>

namespace keystr::signer {

using json = nlohmann::json;

namespace {

constexpr std::string_view kComponent = "session";

Result<Unit, KeystrFailure> InvalidParams(RequestKind kind, std::string_view what) {
    return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidRequest(
        fmt::format("{} params: {}", MethodName(kind), what)));
}

/// [<peer pubkey>, <text>] shared by both NIP-04 methods.
Result<Unit, KeystrFailure> ValidateNip04Params(RequestKind kind, const json& params) {
    if (params.size() != 2 || !params[0].is_string() || !params[1].is_string()) {
        return InvalidParams(kind, "expected [<pubkey>, <text>]");
    }
    auto peer = encoding::KeyEncoding::ParsePublicKey(params[0].get<std::string>());
    if (peer.IsErr()) {
        return InvalidParams(kind, "third-party pubkey is not a valid key");
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

RpcResponse FromResult(const std::string& id, Result<std::string, KeystrFailure> result) {
    if (result.IsErr()) {
        return RpcResponse::Failure(id, result.UnwrapErr());
    }
    return RpcResponse::Success(id, std::move(result).Unwrap());
}

}

SignerSession::SignerSession(const SessionId& remote,
                             const crypto::XOnlyPublicKey& local,
                             crypto::SecureMemoryHandle shared_secret)
    : remote_(remote)
    , local_(local)
    , shared_secret_(std::move(shared_secret)) {}

Result<std::unique_ptr<SignerSession>, KeystrFailure> SignerSession::Create(
    const SessionId& remote,
    const vault::KeyVault& vault,
    const configuration::SignerConfig& config) {

    using R = Result<std::unique_ptr<SignerSession>, KeystrFailure>;

    const auto local = vault.GetPublicKey();
    if (!local.has_value()) {
        return R::Err(KeystrFailure::SigningUnavailable(std::string(ErrorMessages::VAULT_EMPTY)));
    }
    auto shared = vault.DeriveSharedSecret(remote);
    if (shared.IsErr()) {
        return R::Err(std::move(shared).UnwrapErr());
    }

    std::unique_ptr<SignerSession> session(new SignerSession(remote, *local, std::move(shared).Unwrap()));
    for (const RequestKind kind : kSupportedKinds) {
        if (config.IsPreApproved(kind)) {
            session->GrantPermission(kind);
        }
    }
    KEYSTR_LOG_DEBUG(kComponent, "session with {} created", debug::ShortKey(remote));
    return R::Ok(std::move(session));
}

Result<std::string, KeystrFailure> SignerSession::DecryptEnvelope(std::string_view payload) const {
    auto decrypted = shared_secret_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::Nip04::Decrypt(key, payload);
    });
    if (decrypted.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(KeystrFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    return std::move(decrypted).Unwrap();
}

Result<std::string, KeystrFailure> SignerSession::EncryptEnvelope(std::string_view plaintext) const {
    auto encrypted = shared_secret_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::Nip04::Encrypt(key, plaintext);
    });
    if (encrypted.IsErr()) {
        return Result<std::string, KeystrFailure>::Err(KeystrFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    return std::move(encrypted).Unwrap();
}

Result<Unit, KeystrFailure> SignerSession::ValidateParams(RequestKind kind, const json& params) {
    if (!params.is_array()) {
        return InvalidParams(kind, "must be an array");
    }
    switch (kind) {
        case RequestKind::SignEvent: {
            if (params.size() != 1) {
                return InvalidParams(kind, "expected exactly one event");
            }
            auto event = nostr::UnsignedEvent::FromJson(params[0]);
            if (event.IsErr()) {
                return Result<Unit, KeystrFailure>::Err(std::move(event).UnwrapErr());
            }
            return Result<Unit, KeystrFailure>::Ok(unit);
        }
        case RequestKind::Nip04Encrypt:
        case RequestKind::Nip04Decrypt:
            return ValidateNip04Params(kind, params);
        case RequestKind::Connect:
            if (!params.empty() && !params[0].is_string()) {
                return InvalidParams(kind, "signer pubkey must be a string");
            }
            return Result<Unit, KeystrFailure>::Ok(unit);
        case RequestKind::Disconnect:
        case RequestKind::Describe:
        case RequestKind::GetPublicKey:
        case RequestKind::Ping:
        case RequestKind::Unknown:
            return Result<Unit, KeystrFailure>::Ok(unit);
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

RpcResponse SignerSession::AnswerImmediate(const RpcRequest& request,
                                           RequestKind kind,
                                           const vault::KeyVault& vault) {
    switch (kind) {
        case RequestKind::Describe: {
            json methods = json::array();
            for (const RequestKind supported : kSupportedKinds) {
                methods.push_back(std::string(MethodName(supported)));
            }
            return RpcResponse::Success(request.id, std::move(methods));
        }
        case RequestKind::GetPublicKey: {
            const auto public_key = vault.GetPublicKeyHex();
            if (!public_key.has_value()) {
                return RpcResponse::Failure(request.id,
                    KeystrFailure::InvalidState(std::string(ErrorMessages::VAULT_EMPTY)));
            }
            return RpcResponse::Success(request.id, *public_key);
        }
        case RequestKind::Ping:
            return RpcResponse::Success(request.id, "pong");
        case RequestKind::Connect: {
            if (!request.params.empty() && request.params[0].is_string()) {
                auto target = encoding::KeyEncoding::ParsePublicKey(request.params[0].get<std::string>());
                const auto local = vault.GetPublicKey();
                if (target.IsErr() || !local.has_value() || target.Unwrap() != *local) {
                    return RpcResponse::Failure(request.id,
                        KeystrFailure::InvalidRequest("connect is addressed to another signer"));
                }
            }
            MarkConnected();
            KEYSTR_LOG_INFO(kComponent, "client {} connected", debug::ShortKey(remote_));
            return RpcResponse::Success(request.id, "ack");
        }
        case RequestKind::Disconnect:
            return RpcResponse::Success(request.id, "ok");
        case RequestKind::Unknown:
            return RpcResponse::Failure(request.id, KeystrFailure::UnsupportedMethod(
                fmt::format("method '{}' is not supported", request.method)));
        case RequestKind::SignEvent:
        case RequestKind::Nip04Encrypt:
        case RequestKind::Nip04Decrypt:
            break;
    }
    return RpcResponse::Failure(request.id,
        KeystrFailure::InvalidState(fmt::format("{} requires approval", MethodName(kind))));
}

RpcResponse SignerSession::Execute(const SignRequest& request, const vault::KeyVault& vault) const {
    auto valid = ValidateParams(request.kind, request.params);
    if (valid.IsErr()) {
        return RpcResponse::Failure(request.id, valid.UnwrapErr());
    }
    switch (request.kind) {
        case RequestKind::SignEvent: {
            auto event = nostr::UnsignedEvent::FromJson(request.params.at(0));
            if (event.IsErr()) {
                return RpcResponse::Failure(request.id, event.UnwrapErr());
            }
            auto signed_event = nostr::EventSigner::Sign(vault, event.Unwrap());
            if (signed_event.IsErr()) {
                return RpcResponse::Failure(request.id, signed_event.UnwrapErr());
            }
            KEYSTR_LOG_INFO(kComponent, "signed kind {} event for {}",
                            signed_event.Unwrap().kind, debug::ShortKey(remote_));
            return RpcResponse::Success(request.id, encoding::ToHex(signed_event.Unwrap().sig));
        }
        case RequestKind::Nip04Encrypt:
        case RequestKind::Nip04Decrypt: {
            auto peer = encoding::KeyEncoding::ParsePublicKey(request.params.at(0).get<std::string>());
            if (peer.IsErr()) {
                return RpcResponse::Failure(request.id, peer.UnwrapErr());
            }
            const std::string text = request.params.at(1).get<std::string>();
            if (request.kind == RequestKind::Nip04Encrypt) {
                return FromResult(request.id, vault.Nip04Encrypt(peer.Unwrap(), text));
            }
            return FromResult(request.id, vault.Nip04Decrypt(peer.Unwrap(), text));
        }
        default:
            return RpcResponse::Failure(request.id,
                KeystrFailure::InvalidState(fmt::format("{} is not an approval kind", MethodName(request.kind))));
    }
}

void SignerSession::GrantPermission(RequestKind kind) {
    std::lock_guard<std::mutex> guard(permissions_lock_);
    permissions_ |= KindBit(kind);
}

void SignerSession::RevokePermission(RequestKind kind) {
    std::lock_guard<std::mutex> guard(permissions_lock_);
    permissions_ &= ~KindBit(kind);
}

bool SignerSession::IsPreApproved(RequestKind kind) const {
    std::lock_guard<std::mutex> guard(permissions_lock_);
    return (permissions_ & KindBit(kind)) != 0;
}

std::vector<RequestKind> SignerSession::GetPermissions() const {
    std::lock_guard<std::mutex> guard(permissions_lock_);
    std::vector<RequestKind> kinds;
    for (const RequestKind kind : kSupportedKinds) {
        if ((permissions_ & KindBit(kind)) != 0) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

}
