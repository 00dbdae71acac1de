#include "signature.hpp"
#include "preimage.hpp"
#include "../helpers.hpp"

namespace neo {

using siwn::utils::bytes_to_hex;
using siwn::utils::hex_to_bytes;

bool verify_signature(const std::string& message,
                      const std::string& signature_hex,
                      const std::string& public_key_hex) noexcept {
    try {
        Bytes digest = message_digest(message);
        return p256::verify_digest(hex_to_bytes(public_key_hex), digest, hex_to_bytes(signature_hex));
    } catch (const std::exception& e) {
        try {
            siwn::utils::logger()->debug("Signature verification error: {}", e.what());
        } catch (const std::exception&) {
            // logging must not turn a rejected signature into an exception
        }
        return false;
    }
}

std::string sign_message(const std::string& message, const std::string& private_key_hex) {
    Bytes digest = message_digest(message);
    return bytes_to_hex(p256::sign_digest(hex_to_bytes(private_key_hex), digest));
}

} // namespace neo
