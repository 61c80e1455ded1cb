#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/sodium_interop.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <fmt/format.h>

#include <algorithm>
#include <memory>

namespace keystr::crypto {

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const {
        if (bn) {
            BN_clear_free(bn);
        }
    }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const {
        if (ctx) {
            BN_CTX_free(ctx);
        }
    }
};
struct EcGroupDeleter {
    void operator()(EC_GROUP* group) const {
        if (group) {
            EC_GROUP_free(group);
        }
    }
};
struct EcPointDeleter {
    void operator()(EC_POINT* point) const {
        if (point) {
            EC_POINT_clear_free(point);
        }
    }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[OpenSSLConstants::ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

KeystrFailure OpenSSLFailure(std::string_view operation) {
    return KeystrFailure::Crypto(fmt::format("{}: {}", operation, GetOpenSSLError()));
}

BnPtr NewBn() {
    return BnPtr(BN_new());
}

BnPtr BnFromBytes(std::span<const uint8_t> bytes) {
    return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

bool BnToBytes32(const BIGNUM* bn, std::span<uint8_t> out) {
    return out.size() == 32 && BN_bn2binpad(bn, out.data(), 32) == 32;
}

/// Group and field prime are immutable once built and shared by all threads.
struct CurveParams {
    EcGroupPtr group;
    BnPtr field_prime;
};

const CurveParams* SharedCurveParams() {
    static const CurveParams* params = []() -> const CurveParams* {
        auto built = std::make_unique<CurveParams>();
        built->group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
        built->field_prime = NewBn();
        if (!built->group || !built->field_prime ||
            EC_GROUP_get_curve(built->group.get(), built->field_prime.get(), nullptr, nullptr,
                               nullptr) != OpenSSLConstants::SUCCESS) {
            return nullptr;
        }
        // Kept for the program lifetime.
        return built.release();
    }();
    return params;
}

/// Shared curve parameters plus a per-call BN_CTX; a BN_CTX is not thread-safe.
struct Curve {
    const EC_GROUP* group = nullptr;
    const BIGNUM* field_prime = nullptr;
    BnCtxPtr ctx;

    [[nodiscard]] const BIGNUM* Order() const {
        return EC_GROUP_get0_order(group);
    }
};

Result<Curve, KeystrFailure> LoadCurve() {
    const CurveParams* params = SharedCurveParams();
    if (!params) {
        return Result<Curve, KeystrFailure>::Err(OpenSSLFailure("secp256k1 context"));
    }
    Curve curve;
    curve.group = params->group.get();
    curve.field_prime = params->field_prime.get();
    curve.ctx.reset(BN_CTX_new());
    if (!curve.ctx) {
        return Result<Curve, KeystrFailure>::Err(OpenSSLFailure("secp256k1 BN_CTX"));
    }
    return Result<Curve, KeystrFailure>::Ok(std::move(curve));
}

Result<BnPtr, KeystrFailure> LoadSecretScalar(const Curve& curve, std::span<const uint8_t> secret_key) {
    if (secret_key.size() != kSecretKeyBytes) {
        return Result<BnPtr, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat(
                fmt::format("Secret key must be {} bytes, got {}", kSecretKeyBytes, secret_key.size())));
    }
    BnPtr d = BnFromBytes(secret_key);
    if (!d) {
        return Result<BnPtr, KeystrFailure>::Err(OpenSSLFailure("load secret scalar"));
    }
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), curve.Order()) >= 0) {
        return Result<BnPtr, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat("Secret key is outside the curve order"));
    }
    return Result<BnPtr, KeystrFailure>::Ok(std::move(d));
}

/// Curve point with even y whose x-coordinate is @p x_bytes.
Result<EcPointPtr, KeystrFailure> LiftX(const Curve& curve, std::span<const uint8_t> x_bytes) {
    if (x_bytes.size() != kPublicKeyBytes) {
        return Result<EcPointPtr, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat(
                fmt::format("Public key must be {} bytes, got {}", kPublicKeyBytes, x_bytes.size())));
    }
    BnPtr x = BnFromBytes(x_bytes);
    EcPointPtr point(EC_POINT_new(curve.group));
    if (!x || !point) {
        return Result<EcPointPtr, KeystrFailure>::Err(OpenSSLFailure("lift_x allocation"));
    }
    if (BN_cmp(x.get(), curve.field_prime) >= 0 ||
        EC_POINT_set_compressed_coordinates(curve.group, point.get(), x.get(), 0,
                                            curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        ERR_clear_error();
        return Result<EcPointPtr, KeystrFailure>::Err(
            KeystrFailure::InvalidKeyFormat("Public key is not on secp256k1"));
    }
    return Result<EcPointPtr, KeystrFailure>::Ok(std::move(point));
}

struct AffinePoint {
    BnPtr x;
    BnPtr y;
};

Result<AffinePoint, KeystrFailure> ToAffine(const Curve& curve, const EC_POINT* point) {
    AffinePoint affine{NewBn(), NewBn()};
    if (!affine.x || !affine.y ||
        EC_POINT_get_affine_coordinates(curve.group, point, affine.x.get(), affine.y.get(),
                                        curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<AffinePoint, KeystrFailure>::Err(OpenSSLFailure("affine coordinates"));
    }
    return Result<AffinePoint, KeystrFailure>::Ok(std::move(affine));
}

Result<EcPointPtr, KeystrFailure> MultiplyGenerator(const Curve& curve, const BIGNUM* scalar) {
    EcPointPtr point(EC_POINT_new(curve.group));
    if (!point || EC_POINT_mul(curve.group, point.get(), scalar, nullptr, nullptr,
                               curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<EcPointPtr, KeystrFailure>::Err(OpenSSLFailure("scalar multiplication"));
    }
    return Result<EcPointPtr, KeystrFailure>::Ok(std::move(point));
}

/// Replaces @p scalar by n - scalar when the matching point has odd y.
Result<Unit, KeystrFailure> NormalizeForEvenY(const Curve& curve, BIGNUM* scalar, const BIGNUM* y) {
    if (!BN_is_odd(y)) {
        return Result<Unit, KeystrFailure>::Ok(unit);
    }
    if (BN_sub(scalar, curve.Order(), scalar) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, KeystrFailure>::Err(OpenSSLFailure("scalar negation"));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<BnPtr, KeystrFailure> ChallengeScalar(const Curve& curve,
                                             std::span<const uint8_t> r_bytes,
                                             std::span<const uint8_t> public_key,
                                             std::span<const uint8_t> digest) {
    const Digest challenge = Secp256k1::TaggedHash(kBip340ChallengeTag, {r_bytes, public_key, digest});
    BnPtr e = BnFromBytes(challenge);
    if (!e || BN_nnmod(e.get(), e.get(), curve.Order(), curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<BnPtr, KeystrFailure>::Err(OpenSSLFailure("challenge reduction"));
    }
    return Result<BnPtr, KeystrFailure>::Ok(std::move(e));
}

}

Digest Secp256k1::TaggedHash(std::string_view tag,
                             std::initializer_list<std::span<const uint8_t>> parts) noexcept {
    Digest tag_hash{};
    crypto_hash_sha256(tag_hash.data(), reinterpret_cast<const unsigned char*>(tag.data()), tag.size());

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    crypto_hash_sha256_update(&state, tag_hash.data(), tag_hash.size());
    crypto_hash_sha256_update(&state, tag_hash.data(), tag_hash.size());
    for (const auto& part : parts) {
        crypto_hash_sha256_update(&state, part.data(), part.size());
    }
    Digest out{};
    crypto_hash_sha256_final(&state, out.data());
    return out;
}

Result<Unit, KeystrFailure> Secp256k1::ValidateSecretKey(std::span<const uint8_t> secret_key) {
    auto curve = LoadCurve();
    if (curve.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(curve).UnwrapErr());
    }
    auto scalar = LoadSecretScalar(curve.Unwrap(), secret_key);
    if (scalar.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(scalar).UnwrapErr());
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> Secp256k1::ValidatePublicKey(std::span<const uint8_t> public_key) {
    auto curve = LoadCurve();
    if (curve.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(curve).UnwrapErr());
    }
    auto point = LiftX(curve.Unwrap(), public_key);
    if (point.IsErr()) {
        return Result<Unit, KeystrFailure>::Err(std::move(point).UnwrapErr());
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<XOnlyPublicKey, KeystrFailure> Secp256k1::DerivePublicKey(std::span<const uint8_t> secret_key) {
    using R = Result<XOnlyPublicKey, KeystrFailure>;

    auto curve_result = LoadCurve();
    if (curve_result.IsErr()) {
        return R::Err(std::move(curve_result).UnwrapErr());
    }
    const Curve& curve = curve_result.Unwrap();

    auto scalar = LoadSecretScalar(curve, secret_key);
    if (scalar.IsErr()) {
        return R::Err(std::move(scalar).UnwrapErr());
    }
    auto point = MultiplyGenerator(curve, scalar.Unwrap().get());
    if (point.IsErr()) {
        return R::Err(std::move(point).UnwrapErr());
    }
    auto affine = ToAffine(curve, point.Unwrap().get());
    if (affine.IsErr()) {
        return R::Err(std::move(affine).UnwrapErr());
    }

    XOnlyPublicKey public_key{};
    if (!BnToBytes32(affine.Unwrap().x.get(), public_key)) {
        return R::Err(OpenSSLFailure("encode public key"));
    }
    return R::Ok(public_key);
}

Result<SchnorrSignature, KeystrFailure> Secp256k1::SignSchnorr(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> digest,
    std::span<const uint8_t> aux_rand) {

    using R = Result<SchnorrSignature, KeystrFailure>;

    if (digest.size() != kDigestBytes) {
        return R::Err(KeystrFailure::InvalidRequest(std::string(ErrorMessages::DIGEST_SIZE)));
    }
    std::array<uint8_t, 32> aux{};
    if (!aux_rand.empty()) {
        if (aux_rand.size() != aux.size()) {
            return R::Err(KeystrFailure::InvalidRequest("Auxiliary randomness must be 32 bytes"));
        }
        std::copy(aux_rand.begin(), aux_rand.end(), aux.begin());
    }

    auto curve_result = LoadCurve();
    if (curve_result.IsErr()) {
        return R::Err(std::move(curve_result).UnwrapErr());
    }
    const Curve& curve = curve_result.Unwrap();

    auto scalar = LoadSecretScalar(curve, secret_key);
    if (scalar.IsErr()) {
        return R::Err(std::move(scalar).UnwrapErr());
    }
    BnPtr d = std::move(scalar).Unwrap();

    auto public_point = MultiplyGenerator(curve, d.get());
    if (public_point.IsErr()) {
        return R::Err(std::move(public_point).UnwrapErr());
    }
    auto public_affine = ToAffine(curve, public_point.Unwrap().get());
    if (public_affine.IsErr()) {
        return R::Err(std::move(public_affine).UnwrapErr());
    }
    XOnlyPublicKey public_key{};
    if (!BnToBytes32(public_affine.Unwrap().x.get(), public_key)) {
        return R::Err(OpenSSLFailure("encode public key"));
    }
    auto normalized = NormalizeForEvenY(curve, d.get(), public_affine.Unwrap().y.get());
    if (normalized.IsErr()) {
        return R::Err(std::move(normalized).UnwrapErr());
    }

    std::array<uint8_t, 32> masked{};
    if (!BnToBytes32(d.get(), masked)) {
        return R::Err(OpenSSLFailure("encode secret scalar"));
    }
    const Digest aux_hash = TaggedHash(kBip340AuxTag, {aux});
    for (size_t i = 0; i < masked.size(); ++i) {
        masked[i] ^= aux_hash[i];
    }
    Digest nonce_hash = TaggedHash(kBip340NonceTag, {masked, public_key, digest});
    SodiumInterop::SecureWipe(masked);

    BnPtr k = BnFromBytes(nonce_hash);
    SodiumInterop::SecureWipe(nonce_hash);
    if (!k) {
        return R::Err(OpenSSLFailure("load nonce"));
    }
    BN_set_flags(k.get(), BN_FLG_CONSTTIME);
    if (BN_nnmod(k.get(), k.get(), curve.Order(), curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return R::Err(OpenSSLFailure("nonce reduction"));
    }
    if (BN_is_zero(k.get())) {
        return R::Err(KeystrFailure::Crypto("Derived nonce is zero"));
    }

    auto nonce_point = MultiplyGenerator(curve, k.get());
    if (nonce_point.IsErr()) {
        return R::Err(std::move(nonce_point).UnwrapErr());
    }
    auto nonce_affine = ToAffine(curve, nonce_point.Unwrap().get());
    if (nonce_affine.IsErr()) {
        return R::Err(std::move(nonce_affine).UnwrapErr());
    }
    normalized = NormalizeForEvenY(curve, k.get(), nonce_affine.Unwrap().y.get());
    if (normalized.IsErr()) {
        return R::Err(std::move(normalized).UnwrapErr());
    }

    SchnorrSignature signature{};
    const std::span<uint8_t> r_bytes(signature.data(), 32);
    const std::span<uint8_t> s_bytes(signature.data() + 32, 32);
    if (!BnToBytes32(nonce_affine.Unwrap().x.get(), r_bytes)) {
        return R::Err(OpenSSLFailure("encode nonce point"));
    }

    auto e = ChallengeScalar(curve, r_bytes, public_key, digest);
    if (e.IsErr()) {
        return R::Err(std::move(e).UnwrapErr());
    }
    BnPtr s = NewBn();
    if (!s ||
        BN_mod_mul(s.get(), e.Unwrap().get(), d.get(), curve.Order(), curve.ctx.get()) != OpenSSLConstants::SUCCESS ||
        BN_mod_add(s.get(), s.get(), k.get(), curve.Order(), curve.ctx.get()) != OpenSSLConstants::SUCCESS ||
        !BnToBytes32(s.get(), s_bytes)) {
        return R::Err(OpenSSLFailure("signature scalar"));
    }

    auto verified = VerifySchnorr(public_key, digest, signature);
    if (verified.IsErr()) {
        return R::Err(std::move(verified).UnwrapErr());
    }
    if (!verified.Unwrap()) {
        return R::Err(KeystrFailure::Crypto("Produced signature failed verification"));
    }
    return R::Ok(signature);
}

Result<bool, KeystrFailure> Secp256k1::VerifySchnorr(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> digest,
    std::span<const uint8_t> signature) {

    using R = Result<bool, KeystrFailure>;

    if (digest.size() != kDigestBytes) {
        return R::Err(KeystrFailure::InvalidRequest(std::string(ErrorMessages::DIGEST_SIZE)));
    }
    if (signature.size() != kSchnorrSignatureBytes) {
        return R::Err(KeystrFailure::InvalidRequest(
            fmt::format("Signature must be {} bytes, got {}", kSchnorrSignatureBytes, signature.size())));
    }

    auto curve_result = LoadCurve();
    if (curve_result.IsErr()) {
        return R::Err(std::move(curve_result).UnwrapErr());
    }
    const Curve& curve = curve_result.Unwrap();

    auto lifted = LiftX(curve, public_key);
    if (lifted.IsErr()) {
        return R::Ok(false);
    }

    const auto r_bytes = signature.subspan(0, 32);
    const auto s_bytes = signature.subspan(32, 32);
    BnPtr r = BnFromBytes(r_bytes);
    BnPtr s = BnFromBytes(s_bytes);
    if (!r || !s) {
        return R::Err(OpenSSLFailure("load signature"));
    }
    if (BN_cmp(r.get(), curve.field_prime) >= 0 || BN_cmp(s.get(), curve.Order()) >= 0) {
        return R::Ok(false);
    }

    auto e = ChallengeScalar(curve, r_bytes, public_key, digest);
    if (e.IsErr()) {
        return R::Err(std::move(e).UnwrapErr());
    }
    BnPtr neg_e = NewBn();
    if (!neg_e ||
        BN_mod_sub(neg_e.get(), curve.Order(), e.Unwrap().get(), curve.Order(),
                   curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return R::Err(OpenSSLFailure("challenge negation"));
    }

    // R = s*G - e*P
    EcPointPtr candidate(EC_POINT_new(curve.group));
    if (!candidate ||
        EC_POINT_mul(curve.group, candidate.get(), s.get(), lifted.Unwrap().get(), neg_e.get(),
                     curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return R::Err(OpenSSLFailure("verification multiplication"));
    }
    if (EC_POINT_is_at_infinity(curve.group, candidate.get()) == 1) {
        return R::Ok(false);
    }
    auto affine = ToAffine(curve, candidate.get());
    if (affine.IsErr()) {
        return R::Err(std::move(affine).UnwrapErr());
    }
    const AffinePoint& point = affine.Unwrap();
    return R::Ok(!BN_is_odd(point.y.get()) && BN_cmp(point.x.get(), r.get()) == 0);
}

Result<SecureMemoryHandle, KeystrFailure> Secp256k1::ComputeSharedSecret(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> peer_public_key) {

    using R = Result<SecureMemoryHandle, KeystrFailure>;

    auto curve_result = LoadCurve();
    if (curve_result.IsErr()) {
        return R::Err(std::move(curve_result).UnwrapErr());
    }
    const Curve& curve = curve_result.Unwrap();

    auto scalar = LoadSecretScalar(curve, secret_key);
    if (scalar.IsErr()) {
        return R::Err(std::move(scalar).UnwrapErr());
    }
    auto peer = LiftX(curve, peer_public_key);
    if (peer.IsErr()) {
        return R::Err(std::move(peer).UnwrapErr());
    }

    EcPointPtr shared_point(EC_POINT_new(curve.group));
    if (!shared_point ||
        EC_POINT_mul(curve.group, shared_point.get(), nullptr, peer.Unwrap().get(),
                     scalar.Unwrap().get(), curve.ctx.get()) != OpenSSLConstants::SUCCESS) {
        return R::Err(OpenSSLFailure("ECDH multiplication"));
    }
    auto affine = ToAffine(curve, shared_point.get());
    if (affine.IsErr()) {
        return R::Err(std::move(affine).UnwrapErr());
    }

    auto allocated = SecureMemoryHandle::Allocate(kSharedSecretBytes);
    if (allocated.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(allocated.UnwrapErr()));
    }
    SecureMemoryHandle shared = std::move(allocated).Unwrap();
    const BIGNUM* x = affine.Unwrap().x.get();
    auto written = shared.WithWriteAccess([x](std::span<uint8_t> out) {
        return BnToBytes32(x, out);
    });
    if (written.IsErr()) {
        return R::Err(KeystrFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    if (!written.Unwrap()) {
        return R::Err(OpenSSLFailure("encode shared secret"));
    }
    return R::Ok(std::move(shared));
}

}
