#include "keystr/signer/request.hpp"
#include "keystr/encoding/key_encoding.hpp"
#include "keystr/nostr/event.hpp"

#include <fmt/format.h>

namespace keystr::signer {

namespace {

std::string DescribePeer(const nlohmann::json& params) {
    if (!params.is_array() || params.empty() || !params[0].is_string()) {
        return "(unspecified peer)";
    }
    auto peer = encoding::KeyEncoding::ParsePublicKey(params[0].get<std::string>());
    if (peer.IsErr()) {
        return "(invalid peer)";
    }
    return encoding::KeyEncoding::ToNpub(peer.Unwrap());
}

}

std::string SignRequest::Describe() const {
    switch (kind) {
        case RequestKind::SignEvent: {
            if (!params.is_array() || params.empty()) {
                return "Signature requested for a missing event";
            }
            auto event = nostr::UnsignedEvent::FromJson(params[0]);
            if (event.IsErr()) {
                return "Signature requested for a malformed event";
            }
            return fmt::format("Signature requested for message: '{}'", event.Unwrap().Preview());
        }
        case RequestKind::Nip04Encrypt:
            return fmt::format("Encrypt a message for {}", DescribePeer(params));
        case RequestKind::Nip04Decrypt:
            return fmt::format("Decrypt a message from {}", DescribePeer(params));
        default:
            return fmt::format("({}, no action needed)", MethodName(kind));
    }
}

}
