#include "keystr/nostr/delegation.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/vault/key_vault.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <charconv>

namespace keystr::nostr {

using json = nlohmann::json;

namespace {

constexpr std::string_view kKindClause = "kind=";
constexpr std::string_view kAfterClause = "created_at>";
constexpr std::string_view kBeforeClause = "created_at<";
constexpr std::string_view kTagName = "delegation";

template<typename T>
bool ParseNumber(std::string_view text, T& out) {
    if (text.empty()) {
        return false;
    }
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && end == text.data() + text.size();
}

KeystrFailure BadConditions(std::string_view clause) {
    return KeystrFailure::InvalidRequest(fmt::format("Unrecognized delegation condition '{}'", clause));
}

crypto::Digest TokenDigest(const crypto::XOnlyPublicKey& delegatee, std::string_view conditions) {
    const std::string token = Delegation::BuildToken(delegatee, conditions);
    return crypto::SodiumInterop::Sha256(
        std::span(reinterpret_cast<const uint8_t*>(token.data()), token.size()));
}

}

Result<DelegationConditions, KeystrFailure> DelegationConditions::Parse(std::string_view text) {
    using R = Result<DelegationConditions, KeystrFailure>;

    DelegationConditions conditions;
    if (text.empty()) {
        return R::Ok(std::move(conditions));
    }

    size_t start = 0;
    while (start <= text.size()) {
        const size_t amp = text.find('&', start);
        const std::string_view clause = text.substr(start, amp == std::string_view::npos ? std::string_view::npos : amp - start);

        if (clause.starts_with(kKindClause)) {
            uint32_t kind = 0;
            if (!ParseNumber(clause.substr(kKindClause.size()), kind)) {
                return R::Err(BadConditions(clause));
            }
            conditions.kinds.push_back(kind);
        } else if (clause.starts_with(kAfterClause)) {
            uint64_t value = 0;
            if (!ParseNumber(clause.substr(kAfterClause.size()), value)) {
                return R::Err(BadConditions(clause));
            }
            conditions.created_after = value;
        } else if (clause.starts_with(kBeforeClause)) {
            uint64_t value = 0;
            if (!ParseNumber(clause.substr(kBeforeClause.size()), value)) {
                return R::Err(BadConditions(clause));
            }
            conditions.created_before = value;
        } else {
            return R::Err(BadConditions(clause));
        }

        if (amp == std::string_view::npos) {
            break;
        }
        start = amp + 1;
    }
    return R::Ok(std::move(conditions));
}

bool DelegationConditions::Allows(uint32_t kind, uint64_t created_at) const noexcept {
    if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
        return false;
    }
    if (created_after.has_value() && created_at <= *created_after) {
        return false;
    }
    if (created_before.has_value() && created_at >= *created_before) {
        return false;
    }
    return true;
}

json DelegationTag::ToJson() const {
    return json::array({
        std::string(kTagName),
        encoding::ToHex(delegator),
        conditions,
        encoding::ToHex(signature)
    });
}

std::string DelegationTag::ToString() const {
    return ToJson().dump();
}

Result<DelegationTag, KeystrFailure> DelegationTag::Parse(std::string_view text) {
    using R = Result<DelegationTag, KeystrFailure>;

    const json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array() || parsed.size() != 4) {
        return R::Err(KeystrFailure::InvalidRequest("Delegation tag must be a 4-element array"));
    }
    for (const auto& field : parsed) {
        if (!field.is_string()) {
            return R::Err(KeystrFailure::InvalidRequest("Delegation tag fields must be strings"));
        }
    }
    if (parsed[0].get<std::string>() != kTagName) {
        return R::Err(KeystrFailure::InvalidRequest("Not a delegation tag"));
    }

    auto delegator = encoding::FromHexFixed<kPublicKeyBytes>(parsed[1].get<std::string>());
    if (delegator.IsErr()) {
        return R::Err(std::move(delegator).UnwrapErr());
    }
    auto signature = encoding::FromHexFixed<kSchnorrSignatureBytes>(parsed[3].get<std::string>());
    if (signature.IsErr()) {
        return R::Err(std::move(signature).UnwrapErr());
    }

    DelegationTag tag;
    tag.delegator = delegator.Unwrap();
    tag.conditions = parsed[2].get<std::string>();
    tag.signature = signature.Unwrap();
    return R::Ok(std::move(tag));
}

std::string Delegation::BuildConditions(std::optional<uint32_t> kind,
                                        std::optional<uint64_t> since,
                                        std::optional<uint64_t> until) {
    std::vector<std::string> clauses;
    if (kind.has_value()) {
        clauses.push_back(fmt::format("{}{}", kKindClause, *kind));
    }
    if (since.has_value()) {
        clauses.push_back(fmt::format("{}{}", kAfterClause, *since));
    }
    if (until.has_value()) {
        clauses.push_back(fmt::format("{}{}", kBeforeClause, *until));
    }
    return fmt::format("{}", fmt::join(clauses, "&"));
}

std::string Delegation::BuildToken(const crypto::XOnlyPublicKey& delegatee, std::string_view conditions) {
    return fmt::format("{}{}:{}", kDelegationTokenPrefix, encoding::ToHex(delegatee), conditions);
}

Result<DelegationTag, KeystrFailure> Delegation::Create(const vault::KeyVault& vault,
                                                        const crypto::XOnlyPublicKey& delegatee,
                                                        std::string_view conditions) {
    using R = Result<DelegationTag, KeystrFailure>;

    auto parsed = DelegationConditions::Parse(conditions);
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).UnwrapErr());
    }
    const auto delegator = vault.GetPublicKey();
    if (!delegator.has_value()) {
        return R::Err(KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE)));
    }

    auto signature = vault.Sign(TokenDigest(delegatee, conditions));
    if (signature.IsErr()) {
        return R::Err(std::move(signature).UnwrapErr());
    }

    DelegationTag tag;
    tag.delegator = *delegator;
    tag.conditions = std::string(conditions);
    tag.signature = signature.Unwrap();
    return R::Ok(std::move(tag));
}

Result<bool, KeystrFailure> Delegation::Verify(const DelegationTag& tag,
                                               const crypto::XOnlyPublicKey& delegatee) {
    return crypto::Secp256k1::VerifySchnorr(
        tag.delegator, TokenDigest(delegatee, tag.conditions), tag.signature);
}

Result<bool, KeystrFailure> Delegation::Validate(const DelegationTag& tag,
                                                 const crypto::XOnlyPublicKey& delegatee,
                                                 uint32_t kind,
                                                 uint64_t created_at) {
    auto conditions = DelegationConditions::Parse(tag.conditions);
    if (conditions.IsErr()) {
        return Result<bool, KeystrFailure>::Err(std::move(conditions).UnwrapErr());
    }
    if (!conditions.Unwrap().Allows(kind, created_at)) {
        return Result<bool, KeystrFailure>::Ok(false);
    }
    return Verify(tag, delegatee);
}

}
