#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace keystr::signer {

/// Closed set of signer methods. Anything else decodes to Unknown.
enum class RequestKind : uint8_t {
    Connect,
    Disconnect,
    Describe,
    GetPublicKey,
    SignEvent,
    Nip04Encrypt,
    Nip04Decrypt,
    Ping,
    Unknown
};

constexpr std::string_view MethodName(RequestKind kind) noexcept {
    switch (kind) {
        case RequestKind::Connect: return "connect";
        case RequestKind::Disconnect: return "disconnect";
        case RequestKind::Describe: return "describe";
        case RequestKind::GetPublicKey: return "get_public_key";
        case RequestKind::SignEvent: return "sign_event";
        case RequestKind::Nip04Encrypt: return "nip04_encrypt";
        case RequestKind::Nip04Decrypt: return "nip04_decrypt";
        case RequestKind::Ping: return "ping";
        case RequestKind::Unknown: return "unknown";
    }
    return "unknown";
}

inline constexpr std::array<RequestKind, 8> kSupportedKinds = {
    RequestKind::Connect,
    RequestKind::Disconnect,
    RequestKind::Describe,
    RequestKind::GetPublicKey,
    RequestKind::SignEvent,
    RequestKind::Nip04Encrypt,
    RequestKind::Nip04Decrypt,
    RequestKind::Ping,
};

constexpr RequestKind ParseMethod(std::string_view method) noexcept {
    for (const RequestKind kind : kSupportedKinds) {
        if (MethodName(kind) == method) {
            return kind;
        }
    }
    return RequestKind::Unknown;
}

/// Kinds that touch the secret key and wait for a human decision.
constexpr bool RequiresApproval(RequestKind kind) noexcept {
    return kind == RequestKind::SignEvent ||
           kind == RequestKind::Nip04Encrypt ||
           kind == RequestKind::Nip04Decrypt;
}

}
