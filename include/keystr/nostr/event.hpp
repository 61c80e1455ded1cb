#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/crypto/secp256k1.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::vault {
class KeyVault;
}

namespace keystr::nostr {

using Tags = std::vector<std::vector<std::string>>;

/**
 * @brief Event as submitted by a remote client for signing.
 *
 * The client may leave out pubkey and id. When present they are checked
 * against the signer key and the computed id respectively.
 */
struct UnsignedEvent {
    std::optional<crypto::XOnlyPublicKey> pubkey;
    uint64_t created_at = 0;
    uint32_t kind = 0;
    Tags tags;
    std::string content;
    std::optional<crypto::Digest> id;

    /// Accepts an event object, or a JSON string holding one.
    static Result<UnsignedEvent, KeystrFailure> FromJson(const nlohmann::json& value);

    static Result<UnsignedEvent, KeystrFailure> Parse(std::string_view text);

    /// [0,"<pubkey hex>",created_at,kind,tags,"content"] with NIP-01 escaping.
    [[nodiscard]] Result<std::string, KeystrFailure> SerializeForId(const crypto::XOnlyPublicKey& author) const;

    [[nodiscard]] Result<crypto::Digest, KeystrFailure> ComputeId(const crypto::XOnlyPublicKey& author) const;

    /// One-line summary for approval prompts: kind plus the start of the content.
    [[nodiscard]] std::string Preview() const;
};

struct SignedEvent {
    crypto::Digest id{};
    crypto::XOnlyPublicKey pubkey{};
    uint64_t created_at = 0;
    uint32_t kind = 0;
    Tags tags;
    std::string content;
    crypto::SchnorrSignature sig{};

    [[nodiscard]] nlohmann::json ToJson() const;
};

class EventSigner {
public:
    /**
     * Computes the id under the vault's public key and signs it.
     *
     * InvalidRequest when the event names another pubkey or carries an id
     * that does not match its content; vault errors pass through unchanged.
     */
    static Result<SignedEvent, KeystrFailure> Sign(const vault::KeyVault& vault, const UnsignedEvent& event);

    static Result<bool, KeystrFailure> Verify(const SignedEvent& event);

private:
    EventSigner() = delete;
};

}
