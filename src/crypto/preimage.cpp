#include "preimage.hpp"
#include "../helpers.hpp"

namespace neo {

using siwn::utils::append_u32_le;
using siwn::utils::append_var_int;
using siwn::utils::sha256;

Bytes pseudo_transaction(const std::string& message) {
    Bytes tx;
    tx.reserve(PSEUDO_TX_HEADER_SIZE + 9 + message.size());

    tx.push_back(0x00);                  // version
    append_u32_le(tx, 0);                // nonce
    tx.insert(tx.end(), 8, 0x00);        // system fee
    tx.insert(tx.end(), 8, 0x00);        // network fee
    append_u32_le(tx, 0);                // valid until block
    tx.push_back(0x01);                  // signer count
    tx.insert(tx.end(), 20, 0x00);       // signer account
    tx.push_back(0x00);                  // signer scope: None
    tx.push_back(0x00);                  // attribute count

    append_var_int(tx, message.size());
    tx.insert(tx.end(), message.begin(), message.end());
    return tx;
}

Bytes wrap_message(const std::string& message, uint32_t network_magic) {
    Bytes out;
    out.reserve(PREIMAGE_SIZE);
    append_u32_le(out, network_magic);
    Bytes h = sha256(pseudo_transaction(message));
    out.insert(out.end(), h.begin(), h.end());
    return out;
}

Bytes message_digest(const std::string& message, uint32_t network_magic) {
    return sha256(wrap_message(message, network_magic));
}

} // namespace neo
