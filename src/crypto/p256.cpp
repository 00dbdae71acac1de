#include "p256.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <memory>

namespace p256 {

namespace {

struct GroupDeleter   { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter   { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BnDeleter      { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct BnCtxDeleter   { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct PkeyDeleter    { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct ParamBldDeleter{ void operator()(OSSL_PARAM_BLD* p) const { OSSL_PARAM_BLD_free(p); } };
struct ParamDeleter   { void operator()(OSSL_PARAM* p) const { OSSL_PARAM_free(p); } };
struct SigDeleter     { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using GroupPtr    = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr    = std::unique_ptr<EC_POINT, PointDeleter>;
using BnPtr       = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr    = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PkeyPtr     = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr  = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
using ParamPtr    = std::unique_ptr<OSSL_PARAM, ParamDeleter>;
using SigPtr      = std::unique_ptr<ECDSA_SIG, SigDeleter>;

const char* const CURVE_NAME = "prime256v1";

GroupPtr new_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
    if (!group) throw P256Error("Failed to create P-256 group");
    return group;
}

PointPtr decode_point(const EC_GROUP* group, const Bytes& encoded, BN_CTX* ctx) {
    if (encoded.size() != COMPRESSED_PUBLIC_KEY_SIZE &&
        encoded.size() != UNCOMPRESSED_PUBLIC_KEY_SIZE) {
        throw P256Error("Invalid public key size: " + std::to_string(encoded.size()));
    }
    PointPtr point(EC_POINT_new(group));
    if (!point) throw P256Error("Failed to allocate curve point");
    // oct2point rejects encodings that are not on the curve
    if (EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), ctx) != 1) {
        throw P256Error("Public key is not a valid P-256 point");
    }
    if (EC_POINT_is_at_infinity(group, point.get())) {
        throw P256Error("Public key is the point at infinity");
    }
    return point;
}

Bytes encode_point(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    Bytes out(COMPRESSED_PUBLIC_KEY_SIZE);
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx);
    if (len != COMPRESSED_PUBLIC_KEY_SIZE) throw P256Error("Failed to encode public key");
    return out;
}

BnPtr private_scalar(const EC_GROUP* group, const Bytes& private_key) {
    if (private_key.size() != PRIVATE_KEY_SIZE) {
        throw P256Error("Invalid private key size: " + std::to_string(private_key.size()));
    }
    BnPtr d(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
    if (!d) throw P256Error("Failed to decode private key");
    const BIGNUM* order = EC_GROUP_get0_order(group);
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), order) >= 0) {
        throw P256Error("Private key out of range");
    }
    return d;
}

PkeyPtr make_pkey(const Bytes& public_key, const BIGNUM* private_key) {
    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld) throw P256Error("Failed to allocate parameter builder");

    if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                         public_key.data(), public_key.size()) != 1) {
        throw P256Error("Failed to build key parameters");
    }
    if (private_key && OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, private_key) != 1) {
        throw P256Error("Failed to build key parameters");
    }

    ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        throw P256Error("Failed to initialize key import");
    }

    EVP_PKEY* raw = nullptr;
    int selection = private_key ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) != 1 || !raw) {
        throw P256Error("Failed to import P-256 key");
    }
    return PkeyPtr(raw);
}

void check_digest(const Bytes& digest) {
    if (digest.size() != DIGEST_SIZE) {
        throw P256Error("Invalid digest size: " + std::to_string(digest.size()));
    }
}

} // namespace

KeyPair keygen() {
    PkeyPtr pkey(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"));
    if (!pkey) throw P256Error("Key generation failed");

    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw) != 1 || !raw) {
        throw P256Error("Failed to export private key");
    }
    BnPtr d(raw);

    KeyPair kp;
    kp.private_key.resize(PRIVATE_KEY_SIZE);
    if (BN_bn2binpad(d.get(), kp.private_key.data(), static_cast<int>(PRIVATE_KEY_SIZE)) < 0) {
        throw P256Error("Failed to export private key");
    }
    kp.public_key = public_key_from_private(kp.private_key);
    return kp;
}

Bytes public_key_from_private(const Bytes& private_key) {
    GroupPtr group = new_group();
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr d = private_scalar(group.get(), private_key);

    PointPtr pub(EC_POINT_new(group.get()));
    if (!pub || EC_POINT_mul(group.get(), pub.get(), d.get(), nullptr, nullptr, ctx.get()) != 1) {
        throw P256Error("Failed to derive public key");
    }
    return encode_point(group.get(), pub.get(), ctx.get());
}

Bytes compress_public_key(const Bytes& public_key) {
    GroupPtr group = new_group();
    BnCtxPtr ctx(BN_CTX_new());
    PointPtr point = decode_point(group.get(), public_key, ctx.get());
    return encode_point(group.get(), point.get(), ctx.get());
}

bool is_valid_public_key(const Bytes& public_key) {
    try {
        compress_public_key(public_key);
        return true;
    } catch (const P256Error&) {
        return false;
    }
}

Bytes sign_digest(const Bytes& private_key, const Bytes& digest) {
    check_digest(digest);

    GroupPtr group = new_group();
    BnPtr d = private_scalar(group.get(), private_key);
    PkeyPtr pkey = make_pkey(public_key_from_private(private_key), d.get());

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
        throw P256Error("Failed to initialize signing");
    }

    size_t der_len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &der_len, digest.data(), digest.size()) != 1) {
        throw P256Error("Failed to size signature");
    }
    Bytes der(der_len);
    if (EVP_PKEY_sign(ctx.get(), der.data(), &der_len, digest.data(), digest.size()) != 1) {
        throw P256Error("Signing failed");
    }

    const unsigned char* p = der.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)));
    if (!sig) throw P256Error("Failed to decode DER signature");

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    Bytes out(SIGNATURE_SIZE);
    if (BN_bn2binpad(r, out.data(), 32) < 0 || BN_bn2binpad(s, out.data() + 32, 32) < 0) {
        throw P256Error("Failed to encode signature");
    }
    return out;
}

bool verify_digest(const Bytes& public_key, const Bytes& digest, const Bytes& signature) {
    check_digest(digest);
    if (signature.size() != SIGNATURE_SIZE) {
        throw P256Error("Invalid signature size: " + std::to_string(signature.size()));
    }

    // Validates the point before handing it to the EVP layer.
    Bytes compressed = compress_public_key(public_key);
    PkeyPtr pkey = make_pkey(compressed, nullptr);

    BIGNUM* r = BN_bin2bn(signature.data(), 32, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + 32, 32, nullptr);
    SigPtr sig(ECDSA_SIG_new());
    if (!r || !s || !sig || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        throw P256Error("Failed to decode signature");
    }

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0) throw P256Error("Failed to encode DER signature");
    std::unique_ptr<unsigned char, void (*)(unsigned char*)> der_guard(
        der, [](unsigned char* ptr) { OPENSSL_free(ptr); });

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1) {
        throw P256Error("Failed to initialize verification");
    }

    // 1 = valid, 0 = invalid, <0 = error (e.g. r or s out of range)
    return EVP_PKEY_verify(ctx.get(), der, static_cast<size_t>(der_len),
                           digest.data(), digest.size()) == 1;
}

} // namespace p256
