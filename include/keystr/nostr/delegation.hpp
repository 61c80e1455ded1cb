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

/// Parsed form of a NIP-26 conditions string ("kind=1&created_at>...&created_at<...").
struct DelegationConditions {
    std::vector<uint32_t> kinds;
    std::optional<uint64_t> created_after;
    std::optional<uint64_t> created_before;

    static Result<DelegationConditions, KeystrFailure> Parse(std::string_view text);

    /// True when an event of @p kind created at @p created_at satisfies every clause.
    [[nodiscard]] bool Allows(uint32_t kind, uint64_t created_at) const noexcept;
};

struct DelegationTag {
    crypto::XOnlyPublicKey delegator{};
    std::string conditions;
    crypto::SchnorrSignature signature{};

    /// ["delegation","<delegator hex>","<conditions>","<signature hex>"]
    [[nodiscard]] nlohmann::json ToJson() const;

    [[nodiscard]] std::string ToString() const;

    static Result<DelegationTag, KeystrFailure> Parse(std::string_view text);
};

/**
 * NIP-26 delegation: the delegator signs SHA-256 of
 * "nostr:delegation:<delegatee hex>:<conditions>" so that the delegatee
 * may publish events on its behalf within the conditions.
 */
class Delegation {
public:
    /// Clauses in the order kind, created_at>, created_at<; absent ones are omitted.
    static std::string BuildConditions(std::optional<uint32_t> kind,
                                       std::optional<uint64_t> since,
                                       std::optional<uint64_t> until);

    static std::string BuildToken(const crypto::XOnlyPublicKey& delegatee, std::string_view conditions);

    /// Signs with the vault's key. Conditions must parse.
    static Result<DelegationTag, KeystrFailure> Create(const vault::KeyVault& vault,
                                                       const crypto::XOnlyPublicKey& delegatee,
                                                       std::string_view conditions);

    /// Checks the signature only.
    static Result<bool, KeystrFailure> Verify(const DelegationTag& tag,
                                              const crypto::XOnlyPublicKey& delegatee);

    /// Signature check plus the conditions against an event's kind and timestamp.
    static Result<bool, KeystrFailure> Validate(const DelegationTag& tag,
                                                const crypto::XOnlyPublicKey& delegatee,
                                                uint32_t kind,
                                                uint64_t created_at);

private:
    Delegation() = delete;
};

}
