#ifndef SIWN_CRYPTO_ADDRESS_HPP
#define SIWN_CRYPTO_ADDRESS_HPP

#include "p256.hpp"

#include <cstdint>
#include <string>

namespace neo {

using Bytes = p256::Bytes;

// Neo N3 address version byte ('N' prefix after Base58 encoding).
constexpr uint8_t ADDRESS_VERSION = 0x35;
constexpr size_t SCRIPT_HASH_SIZE = 20;

// -----------------------------------------------------------------------------
// Base58 / Base58Check
// -----------------------------------------------------------------------------
std::string base58_encode(const Bytes& data);
Bytes base58_decode(const std::string& text);              // throws std::invalid_argument

// payload || first 4 bytes of SHA256(SHA256(payload))
std::string base58check_encode(const Bytes& payload);
Bytes base58check_decode(const std::string& text);         // throws std::invalid_argument

// -----------------------------------------------------------------------------
// Single-signature accounts
// -----------------------------------------------------------------------------

// PUSHDATA1 0x21 <compressed key> SYSCALL System.Crypto.CheckSig
Bytes verification_script(const Bytes& compressed_public_key);

// RIPEMD160(SHA256(script)), in script byte order (not the reversed display form).
Bytes script_hash(const Bytes& script);

std::string address_from_script_hash(const Bytes& script_hash);
Bytes script_hash_from_address(const std::string& address);  // throws std::invalid_argument

// Derive the account address for a hex-encoded compressed public key.
// Throws protocol::AuthError(InvalidPublicKey) for malformed input.
std::string address_from_public_key(const std::string& public_key_hex);

bool is_valid_address(const std::string& address);

} // namespace neo

#endif // SIWN_CRYPTO_ADDRESS_HPP
