#ifndef SIWN_CRYPTO_PREIMAGE_HPP
#define SIWN_CRYPTO_PREIMAGE_HPP

#include "p256.hpp"

#include <cstdint>
#include <string>

namespace neo {

using Bytes = p256::Bytes;

// Zeroed N3 transaction header that NeoLine's signMessageWithoutSaltV2 places
// in front of the message: version, nonce, system fee, network fee,
// valid-until-block, one signer (zero account, scope None), no attributes.
constexpr size_t PSEUDO_TX_HEADER_SIZE = 48;
constexpr size_t PREIMAGE_SIZE = 4 + 32;

// header || var-int(len) || message bytes. The message is embedded where a
// transaction script would be.
Bytes pseudo_transaction(const std::string& message);

// u32le(network_magic) || SHA256(pseudo_transaction(message))
// This is the byte string the wallet signs.
Bytes wrap_message(const std::string& message, uint32_t network_magic = 0);

// SHA256(wrap_message(message)), the digest the ECDSA signature covers.
Bytes message_digest(const std::string& message, uint32_t network_magic = 0);

} // namespace neo

#endif // SIWN_CRYPTO_PREIMAGE_HPP
