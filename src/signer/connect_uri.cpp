#include "keystr/signer/connect_uri.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/encoding/byte_encoding.hpp"
#include "keystr/encoding/key_encoding.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <cctype>

namespace keystr::signer {

namespace {

int HexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<std::string, KeystrFailure> PercentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                return Result<std::string, KeystrFailure>::Err(
                    KeystrFailure::InvalidRequest("Truncated percent escape in connect URI"));
            }
            const int hi = HexValue(text[i + 1]);
            const int lo = HexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return Result<std::string, KeystrFailure>::Err(
                    KeystrFailure::InvalidRequest("Invalid percent escape in connect URI"));
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return Result<std::string, KeystrFailure>::Ok(std::move(out));
}

std::string PercentEncode(std::string_view text) {
    std::string out;
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out += fmt::format("%{:02X}", byte);
        }
    }
    return out;
}

}

Result<ConnectUri, KeystrFailure> ConnectUri::Parse(std::string_view uri) {
    using R = Result<ConnectUri, KeystrFailure>;

    if (!uri.starts_with(kNostrConnectScheme)) {
        return R::Err(KeystrFailure::InvalidRequest(
            fmt::format("Connect URI must start with {}", kNostrConnectScheme)));
    }
    std::string_view rest = uri.substr(kNostrConnectScheme.size());

    const size_t query_start = rest.find('?');
    const std::string_view key_text = rest.substr(0, query_start);
    const std::string_view query = query_start == std::string_view::npos
        ? std::string_view{}
        : rest.substr(query_start + 1);

    auto client = encoding::KeyEncoding::ParsePublicKey(key_text);
    if (client.IsErr()) {
        return R::Err(std::move(client).UnwrapErr());
    }

    ConnectUri parsed;
    parsed.client = client.Unwrap();

    size_t pos = 0;
    while (pos < query.size()) {
        const size_t amp = query.find('&', pos);
        const std::string_view pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        pos = amp == std::string_view::npos ? query.size() : amp + 1;
        if (pair.empty()) {
            continue;
        }

        const size_t eq = pair.find('=');
        const std::string_view name = pair.substr(0, eq);
        auto value = PercentDecode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        if (value.IsErr()) {
            return R::Err(std::move(value).UnwrapErr());
        }

        if (name == "relay") {
            if (!value.Unwrap().empty()) {
                parsed.relays.push_back(std::move(value).Unwrap());
            }
        } else if (name == "metadata") {
            const auto metadata = nlohmann::json::parse(value.Unwrap(), nullptr, false);
            if (metadata.is_discarded() || !metadata.is_object()) {
                return R::Err(KeystrFailure::InvalidRequest("Connect URI metadata is not a JSON object"));
            }
            if (const auto it = metadata.find("name"); it != metadata.end() && it->is_string()) {
                parsed.app_name = it->get<std::string>();
            }
        }
    }

    if (parsed.relays.empty()) {
        return R::Err(KeystrFailure::InvalidRequest("Connect URI names no relay"));
    }
    return R::Ok(std::move(parsed));
}

std::string ConnectUri::ToString() const {
    std::string out = fmt::format("{}{}", kNostrConnectScheme, encoding::ToHex(client));
    char separator = '?';
    for (const auto& relay : relays) {
        out += fmt::format("{}relay={}", separator, PercentEncode(relay));
        separator = '&';
    }
    if (app_name.has_value()) {
        const nlohmann::json metadata = {{"name", *app_name}};
        out += fmt::format("{}metadata={}", separator,
                           PercentEncode(metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
    }
    return out;
}

}
