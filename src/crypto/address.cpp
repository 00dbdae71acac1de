#include "address.hpp"
#include "../helpers.hpp"
#include "../protocol/errors.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace neo {

using siwn::utils::hash256;
using siwn::utils::sha256;
using siwn::utils::ripemd160;

namespace {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Interop id of System.Crypto.CheckSig: first 4 bytes of SHA256 of the name.
const std::array<uint8_t, 4> CHECKSIG_INTEROP = {0x56, 0xe7, 0xb3, 0x27};

constexpr uint8_t OP_PUSHDATA1 = 0x0C;
constexpr uint8_t OP_SYSCALL = 0x41;

int base58_digit(char c) {
    for (int i = 0; i < 58; ++i) {
        if (BASE58_ALPHABET[i] == c) return i;
    }
    return -1;
}

} // namespace

// -----------------------------------------------------------------------------
// Base58
// -----------------------------------------------------------------------------

std::string base58_encode(const Bytes& data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) ++leading_zeros;

    // log(256) / log(58) ~ 1.366
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = leading_zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(leading_zeros, '1');
    for (; it != digits.end(); ++it) out += BASE58_ALPHABET[*it];
    return out;
}

Bytes base58_decode(const std::string& text) {
    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == '1') ++leading_ones;

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((text.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t i = leading_ones; i < text.size(); ++i) {
        int carry = base58_digit(text[i]);
        if (carry < 0) throw std::invalid_argument("Invalid Base58 character");
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) ++it;

    Bytes out(leading_ones, 0x00);
    out.insert(out.end(), it, bytes.end());
    return out;
}

std::string base58check_encode(const Bytes& payload) {
    Bytes checksum = hash256(payload);
    Bytes data = payload;
    data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
    return base58_encode(data);
}

Bytes base58check_decode(const std::string& text) {
    Bytes data = base58_decode(text);
    if (data.size() < 4) throw std::invalid_argument("Base58Check data too short");

    Bytes payload(data.begin(), data.end() - 4);
    Bytes checksum = hash256(payload);
    if (!std::equal(data.end() - 4, data.end(), checksum.begin())) {
        throw std::invalid_argument("Base58Check checksum mismatch");
    }
    return payload;
}

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------

Bytes verification_script(const Bytes& compressed_public_key) {
    if (compressed_public_key.size() != p256::COMPRESSED_PUBLIC_KEY_SIZE) {
        throw std::invalid_argument("Verification script requires a compressed public key");
    }
    Bytes script;
    script.reserve(2 + compressed_public_key.size() + 1 + CHECKSIG_INTEROP.size());
    script.push_back(OP_PUSHDATA1);
    script.push_back(static_cast<uint8_t>(compressed_public_key.size()));
    script.insert(script.end(), compressed_public_key.begin(), compressed_public_key.end());
    script.push_back(OP_SYSCALL);
    script.insert(script.end(), CHECKSIG_INTEROP.begin(), CHECKSIG_INTEROP.end());
    return script;
}

Bytes script_hash(const Bytes& script) {
    return ripemd160(sha256(script));
}

std::string address_from_script_hash(const Bytes& hash) {
    if (hash.size() != SCRIPT_HASH_SIZE) {
        throw std::invalid_argument("Script hash must be 20 bytes");
    }
    Bytes payload;
    payload.reserve(1 + hash.size());
    payload.push_back(ADDRESS_VERSION);
    payload.insert(payload.end(), hash.begin(), hash.end());
    return base58check_encode(payload);
}

Bytes script_hash_from_address(const std::string& address) {
    Bytes payload = base58check_decode(address);
    if (payload.size() != 1 + SCRIPT_HASH_SIZE || payload[0] != ADDRESS_VERSION) {
        throw std::invalid_argument("Not a Neo N3 address");
    }
    return Bytes(payload.begin() + 1, payload.end());
}

std::string address_from_public_key(const std::string& public_key_hex) {
    using protocol::AuthError;
    using protocol::AuthErrorKind;

    Bytes key;
    try {
        key = p256::compress_public_key(siwn::utils::hex_to_bytes(public_key_hex));
    } catch (const std::exception& e) {
        throw AuthError(AuthErrorKind::InvalidPublicKey,
                        std::string("Invalid public key: ") + e.what());
    }
    return address_from_script_hash(script_hash(verification_script(key)));
}

bool is_valid_address(const std::string& address) {
    try {
        script_hash_from_address(address);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

} // namespace neo
