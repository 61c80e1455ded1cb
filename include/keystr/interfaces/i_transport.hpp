#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/crypto/secp256k1.hpp"

#include <string>

namespace keystr::interfaces {

/// Relay client that delivers signer payloads to a remote public key.
///
/// The payload is already NIP-04 encrypted; the transport wraps it in a
/// relay event and publishes it. Inbound traffic flows the other way
/// through SignerEngine::OnMessage().
class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual Result<Unit, KeystrFailure> Send(
        const crypto::XOnlyPublicKey& target,
        const std::string& payload) = 0;
};

}
