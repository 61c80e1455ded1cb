#include "keystr/nostr/event.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/vault/key_vault.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

namespace keystr::nostr {

using json = nlohmann::json;

namespace {

KeystrFailure MalformedEvent(std::string_view what) {
    return KeystrFailure::InvalidRequest(fmt::format("Malformed event: {}", what));
}

Result<Tags, KeystrFailure> ParseTags(const json& value) {
    if (!value.is_array()) {
        return Result<Tags, KeystrFailure>::Err(MalformedEvent("tags must be an array"));
    }
    Tags tags;
    tags.reserve(value.size());
    for (const auto& tag : value) {
        if (!tag.is_array()) {
            return Result<Tags, KeystrFailure>::Err(MalformedEvent("each tag must be an array"));
        }
        std::vector<std::string> fields;
        fields.reserve(tag.size());
        for (const auto& field : tag) {
            if (!field.is_string()) {
                return Result<Tags, KeystrFailure>::Err(MalformedEvent("tag fields must be strings"));
            }
            fields.push_back(field.get<std::string>());
        }
        tags.push_back(std::move(fields));
    }
    return Result<Tags, KeystrFailure>::Ok(std::move(tags));
}

template<typename T>
Result<T, KeystrFailure> ParseUnsigned(const json& object, const char* name) {
    const auto it = object.find(name);
    if (it == object.end() || !it->is_number_integer()) {
        return Result<T, KeystrFailure>::Err(MalformedEvent(fmt::format("{} must be an integer", name)));
    }
    if (it->is_number_unsigned()) {
        const auto raw = it->get<uint64_t>();
        if (raw > std::numeric_limits<T>::max()) {
            return Result<T, KeystrFailure>::Err(MalformedEvent(fmt::format("{} is out of range", name)));
        }
        return Result<T, KeystrFailure>::Ok(static_cast<T>(raw));
    }
    const auto raw = it->get<int64_t>();
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        return Result<T, KeystrFailure>::Err(MalformedEvent(fmt::format("{} is out of range", name)));
    }
    return Result<T, KeystrFailure>::Ok(static_cast<T>(raw));
}

template<size_t N>
Result<std::optional<std::array<uint8_t, N>>, KeystrFailure> ParseOptionalHex(const json& object, const char* name) {
    using R = Result<std::optional<std::array<uint8_t, N>>, KeystrFailure>;
    const auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!it->is_string()) {
        return R::Err(MalformedEvent(fmt::format("{} must be a hex string", name)));
    }
    auto decoded = encoding::FromHexFixed<N>(it->get<std::string>());
    if (decoded.IsErr()) {
        return R::Err(MalformedEvent(fmt::format("{} is not {} bytes of hex", name, N)));
    }
    return R::Ok(decoded.Unwrap());
}

json TagsToJson(const Tags& tags) {
    json out = json::array();
    for (const auto& tag : tags) {
        out.push_back(tag);
    }
    return out;
}

}

Result<UnsignedEvent, KeystrFailure> UnsignedEvent::FromJson(const json& value) {
    using R = Result<UnsignedEvent, KeystrFailure>;

    if (value.is_string()) {
        return Parse(value.get<std::string>());
    }
    if (!value.is_object()) {
        return R::Err(MalformedEvent("expected an object"));
    }

    UnsignedEvent event;

    auto created_at = ParseUnsigned<uint64_t>(value, "created_at");
    if (created_at.IsErr()) {
        return R::Err(std::move(created_at).UnwrapErr());
    }
    event.created_at = created_at.Unwrap();

    auto kind = ParseUnsigned<uint32_t>(value, "kind");
    if (kind.IsErr()) {
        return R::Err(std::move(kind).UnwrapErr());
    }
    event.kind = kind.Unwrap();

    if (const auto it = value.find("tags"); it != value.end()) {
        auto tags = ParseTags(*it);
        if (tags.IsErr()) {
            return R::Err(std::move(tags).UnwrapErr());
        }
        event.tags = std::move(tags).Unwrap();
    }

    const auto content = value.find("content");
    if (content == value.end() || !content->is_string()) {
        return R::Err(MalformedEvent("content must be a string"));
    }
    event.content = content->get<std::string>();

    auto pubkey = ParseOptionalHex<kPublicKeyBytes>(value, "pubkey");
    if (pubkey.IsErr()) {
        return R::Err(std::move(pubkey).UnwrapErr());
    }
    event.pubkey = pubkey.Unwrap();

    auto id = ParseOptionalHex<kDigestBytes>(value, "id");
    if (id.IsErr()) {
        return R::Err(std::move(id).UnwrapErr());
    }
    event.id = id.Unwrap();

    return R::Ok(std::move(event));
}

Result<UnsignedEvent, KeystrFailure> UnsignedEvent::Parse(std::string_view text) {
    const json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Result<UnsignedEvent, KeystrFailure>::Err(MalformedEvent("not valid JSON"));
    }
    if (parsed.is_string()) {
        return Result<UnsignedEvent, KeystrFailure>::Err(MalformedEvent("expected an object"));
    }
    return FromJson(parsed);
}

Result<std::string, KeystrFailure> UnsignedEvent::SerializeForId(const crypto::XOnlyPublicKey& author) const {
    const json canonical = json::array({
        0,
        encoding::ToHex(author),
        created_at,
        kind,
        TagsToJson(tags),
        content
    });
    // nlohmann escapes exactly the NIP-01 set (\" \\ \n \r \t \b \f) plus
    // other control characters as \u00XX, and leaves UTF-8 untouched.
    try {
        return Result<std::string, KeystrFailure>::Ok(
            canonical.dump(-1, ' ', false, json::error_handler_t::strict));
    } catch (const json::type_error& e) {
        return Result<std::string, KeystrFailure>::Err(
            MalformedEvent(fmt::format("content is not valid UTF-8 ({})", e.id)));
    }
}

Result<crypto::Digest, KeystrFailure> UnsignedEvent::ComputeId(const crypto::XOnlyPublicKey& author) const {
    auto serialized = SerializeForId(author);
    if (serialized.IsErr()) {
        return Result<crypto::Digest, KeystrFailure>::Err(std::move(serialized).UnwrapErr());
    }
    const std::string& text = serialized.Unwrap();
    return Result<crypto::Digest, KeystrFailure>::Ok(crypto::SodiumInterop::Sha256(
        std::span(reinterpret_cast<const uint8_t*>(text.data()), text.size())));
}

std::string UnsignedEvent::Preview() const {
    size_t cut = std::min(content.size(), kPreviewContentChars);
    while (cut > 0 && cut < content.size() &&
           (static_cast<uint8_t>(content[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    const bool truncated = cut < content.size();
    return fmt::format("kind {}: {}{}", kind, std::string_view(content).substr(0, cut), truncated ? ".." : "");
}

json SignedEvent::ToJson() const {
    return json{
        {"id", encoding::ToHex(id)},
        {"pubkey", encoding::ToHex(pubkey)},
        {"created_at", created_at},
        {"kind", kind},
        {"tags", TagsToJson(tags)},
        {"content", content},
        {"sig", encoding::ToHex(sig)}
    };
}

Result<SignedEvent, KeystrFailure> EventSigner::Sign(const vault::KeyVault& vault, const UnsignedEvent& event) {
    using R = Result<SignedEvent, KeystrFailure>;

    const auto author = vault.GetPublicKey();
    if (!author.has_value()) {
        return R::Err(KeystrFailure::SigningUnavailable(std::string(ErrorMessages::SIGNING_UNAVAILABLE)));
    }
    if (event.pubkey.has_value() && *event.pubkey != *author) {
        return R::Err(KeystrFailure::InvalidRequest("Event pubkey does not belong to this signer"));
    }

    auto id = event.ComputeId(*author);
    if (id.IsErr()) {
        return R::Err(std::move(id).UnwrapErr());
    }
    if (event.id.has_value() && *event.id != id.Unwrap()) {
        return R::Err(KeystrFailure::InvalidRequest("Event id does not match its content"));
    }

    auto signature = vault.Sign(id.Unwrap());
    if (signature.IsErr()) {
        return R::Err(std::move(signature).UnwrapErr());
    }

    SignedEvent signed_event;
    signed_event.id = id.Unwrap();
    signed_event.pubkey = *author;
    signed_event.created_at = event.created_at;
    signed_event.kind = event.kind;
    signed_event.tags = event.tags;
    signed_event.content = event.content;
    signed_event.sig = signature.Unwrap();
    return R::Ok(std::move(signed_event));
}

Result<bool, KeystrFailure> EventSigner::Verify(const SignedEvent& event) {
    UnsignedEvent unsigned_event;
    unsigned_event.created_at = event.created_at;
    unsigned_event.kind = event.kind;
    unsigned_event.tags = event.tags;
    unsigned_event.content = event.content;

    auto id = unsigned_event.ComputeId(event.pubkey);
    if (id.IsErr()) {
        return Result<bool, KeystrFailure>::Err(std::move(id).UnwrapErr());
    }
    if (id.Unwrap() != event.id) {
        return Result<bool, KeystrFailure>::Ok(false);
    }
    return crypto::Secp256k1::VerifySchnorr(event.pubkey, event.id, event.sig);
}

}
