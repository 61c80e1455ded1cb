#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/crypto/sodium_secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace keystr::crypto {

using XOnlyPublicKey = std::array<uint8_t, kPublicKeyBytes>;
using SchnorrSignature = std::array<uint8_t, kSchnorrSignatureBytes>;
using Digest = std::array<uint8_t, kDigestBytes>;

/**
 * @brief secp256k1 operations used by the Nostr protocol, on top of OpenSSL's EC API.
 *
 * Public keys are BIP-340 x-only keys (the curve point with even y).
 * Signatures are BIP-340 Schnorr signatures over 32-byte digests.
 *
 * Every secret scalar is loaded into a BN_FLG_CONSTTIME bignum, freed
 * with BN_clear_free, and any intermediate byte buffer holding secret
 * material is wiped before returning, on both success and error paths.
 */
class Secp256k1 {
public:
    /// Secret key must be 32 bytes encoding an integer in [1, n-1].
    static Result<Unit, KeystrFailure> ValidateSecretKey(std::span<const uint8_t> secret_key);

    /// Public key must be 32 bytes naming the x-coordinate of a curve point.
    static Result<Unit, KeystrFailure> ValidatePublicKey(std::span<const uint8_t> public_key);

    static Result<XOnlyPublicKey, KeystrFailure> DerivePublicKey(std::span<const uint8_t> secret_key);

    /**
     * @brief BIP-340 signing.
     *
     * @param aux_rand 32 bytes of auxiliary randomness, or empty for the
     *                 all-zero value which makes the signature deterministic.
     */
    static Result<SchnorrSignature, KeystrFailure> SignSchnorr(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> digest,
        std::span<const uint8_t> aux_rand = {});

    /// Ok(false) for a well-formed but invalid signature or an off-curve key.
    static Result<bool, KeystrFailure> VerifySchnorr(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> digest,
        std::span<const uint8_t> signature);

    /**
     * @brief Unhashed ECDH: x-coordinate of secret_key * lift_x(peer_public_key).
     *
     * This is the NIP-04 shared secret; the result lives in secure memory.
     */
    static Result<SecureMemoryHandle, KeystrFailure> ComputeSharedSecret(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> peer_public_key);

    /// SHA256(SHA256(tag) || SHA256(tag) || parts...)
    static Digest TaggedHash(std::string_view tag,
                             std::initializer_list<std::span<const uint8_t>> parts) noexcept;

private:
    Secp256k1() = delete;
};

}
