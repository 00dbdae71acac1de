#ifndef SIWN_CRYPTO_P256_HPP
#define SIWN_CRYPTO_P256_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Thin shim over OpenSSL's secp256r1 (NIST P-256), the curve Neo N3 accounts use.
namespace p256 {

    using Bytes = std::vector<uint8_t>;

    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t COMPRESSED_PUBLIC_KEY_SIZE = 33;
    constexpr size_t UNCOMPRESSED_PUBLIC_KEY_SIZE = 65;
    constexpr size_t SIGNATURE_SIZE = 64;  // r || s, big-endian
    constexpr size_t DIGEST_SIZE = 32;

    class P256Error : public std::runtime_error {
    public:
        explicit P256Error(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct KeyPair {
        Bytes private_key;  // 32 bytes
        Bytes public_key;   // 33 bytes, compressed
    };

    KeyPair keygen();

    // Derive the compressed public key for a 32-byte private scalar.
    Bytes public_key_from_private(const Bytes& private_key);

    // Accepts a compressed (33) or uncompressed (65) SEC1 point and returns the
    // compressed encoding. Throws P256Error if the bytes are not a curve point.
    Bytes compress_public_key(const Bytes& public_key);

    bool is_valid_public_key(const Bytes& public_key);

    // Sign a 32-byte digest. The digest is used as-is (no further hashing).
    Bytes sign_digest(const Bytes& private_key, const Bytes& digest);

    // Verify an r || s signature over a 32-byte digest.
    // Returns false for a well-formed signature that does not verify; throws
    // P256Error for malformed keys, digests or signature encodings.
    bool verify_digest(const Bytes& public_key, const Bytes& digest, const Bytes& signature);

} // namespace p256

#endif // SIWN_CRYPTO_P256_HPP
