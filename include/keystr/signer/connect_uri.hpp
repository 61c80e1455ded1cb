#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/crypto/secp256k1.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keystr::signer {

/**
 * nostrconnect://<client pubkey>?relay=<url>&relay=<url>&metadata=<json>
 *
 * The pubkey may be hex or npub. Query values are percent-decoded;
 * unknown parameters are ignored. The application name comes from the
 * "name" member of the metadata object, when present.
 */
struct ConnectUri {
    crypto::XOnlyPublicKey client{};
    std::vector<std::string> relays;
    std::optional<std::string> app_name;

    static Result<ConnectUri, KeystrFailure> Parse(std::string_view uri);

    [[nodiscard]] std::string ToString() const;
};

}
