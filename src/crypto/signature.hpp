#ifndef SIWN_CRYPTO_SIGNATURE_HPP
#define SIWN_CRYPTO_SIGNATURE_HPP

#include "p256.hpp"

#include <string>

namespace neo {

/**
 * Verify a NeoLine signMessageWithoutSaltV2 signature.
 *
 * The message is wrapped with wrap_message(), hashed with SHA-256 and checked
 * against the 64-byte r || s signature with the secp256r1 public key.
 *
 * @param message        The exact text that was signed
 * @param signature_hex  Hex-encoded 64-byte signature
 * @param public_key_hex Hex-encoded SEC1 public key (compressed or not)
 * @return true only for a valid signature. Malformed input is logged and
 *         reported as false; this function never throws.
 */
bool verify_signature(const std::string& message,
                      const std::string& signature_hex,
                      const std::string& public_key_hex) noexcept;

// Wallet side of the same scheme. Returns the hex r || s signature.
// Throws p256::P256Error / std::invalid_argument on a malformed key.
std::string sign_message(const std::string& message, const std::string& private_key_hex);

} // namespace neo

#endif // SIWN_CRYPTO_SIGNATURE_HPP
