#ifndef SIWN_TEST_HELPERS_HPP
#define SIWN_TEST_HELPERS_HPP

#include "../src/helpers.hpp"
#include "../src/crypto/p256.hpp"
#include "../src/crypto/signature.hpp"
#include "../src/crypto/address.hpp"
#include "../src/protocol/siwn.hpp"
#include "../src/protocol/config.hpp"

#include <chrono>
#include <string>

namespace test_helpers {

using Bytes = p256::Bytes;
using siwn::utils::TimePoint;

// -----------------------------------------------------------------------------
// Fixed vectors
// -----------------------------------------------------------------------------

// Signature below was produced over MESSAGE with the OpenSSL CLI
// (ecdsa-with-SHA256 over the pre-image), then DER-decoded to r || s.
const std::string PRIVATE_KEY = "107966e88c03d11454f7eab94493673c0c3cb12530d51e094eea3fea074eb5b7";
const std::string PUBLIC_KEY  = "03ed1ec9e5430a273e5e0bdb8baaf9b77e822f688107d86ca4d7e44d6f429766ba";
const std::string ADDRESS     = "NbiEJn22ot68uYMxEoFsxy5dzbKGo9Xvdu";

const std::string MESSAGE =
    "app.example.com wants you to sign in with your Neo account:\n"
    "NbiEJn22ot68uYMxEoFsxy5dzbKGo9Xvdu\n"
    "\n"
    "Sign in to Example\n"
    "\n"
    "URI: https://app.example.com/login\n"
    "Version: 1\n"
    "Chain ID: 860833102\n"
    "Nonce: 3f0b6c2a-9d4e-4f1a-8b7c-5e2d1a0f9c3b\n"
    "Issued At: 2026-02-19T11:00:00.000Z\n"
    "Expiration Time: 2026-02-19T11:05:00.000Z";

const std::string MESSAGE_PREIMAGE = "00000000aa8760551261ba15ea5c54d02ee7db7c2b0b2146dd512295b9d7184065e47d63";
const std::string MESSAGE_DIGEST   = "f2dfdf83c204bc356e7c3c214167c5718794ff4d7e2c7baedb5f971a6a28dac5";
const std::string SIGNATURE =
    "20470d8b39ecaa6e25bf1fc9cd87df905b7d086e044426cf9b712d5bb7fbfbe4"
    "81815334c281324103593060222fceb63e6aa89d14c280ba5e8171a5c241d25e";

const std::string SECRET = "0123456789abcdef0123456789abcdef-test-secret";

// -----------------------------------------------------------------------------
// Time
// -----------------------------------------------------------------------------

inline TimePoint at(const std::string& iso) {
    auto tp = siwn::utils::parse_iso8601(iso);
    if (!tp) throw std::invalid_argument("bad test timestamp: " + iso);
    return *tp;
}

inline TimePoint plus_seconds(TimePoint tp, long long s) {
    return tp + std::chrono::seconds(s);
}

// -----------------------------------------------------------------------------
// Wallet simulation
// -----------------------------------------------------------------------------

struct TestWallet {
    std::string private_key;
    std::string public_key;
    std::string address;

    std::string sign(const std::string& message) const {
        return neo::sign_message(message, private_key);
    }
};

inline TestWallet make_wallet() {
    p256::KeyPair kp = p256::keygen();
    TestWallet w;
    w.private_key = siwn::utils::bytes_to_hex(kp.private_key);
    w.public_key = siwn::utils::bytes_to_hex(kp.public_key);
    w.address = neo::address_from_public_key(w.public_key);
    return w;
}

// A message the client would build after fetching `nonce` at time `now`.
inline protocol::SiwnMessage make_message(const std::string& domain,
                                          const std::string& address,
                                          const std::string& nonce,
                                          TimePoint now,
                                          long long valid_for_seconds = 300) {
    protocol::SiwnMessage m;
    m.domain = domain;
    m.address = address;
    m.statement = "Sign in to Example";
    m.uri = "https://" + domain + "/login";
    m.version = "1";
    m.chain_id = 860833102;
    m.nonce = nonce;
    m.issued_at = siwn::utils::format_iso8601(now);
    m.expiration_time = siwn::utils::format_iso8601(plus_seconds(now, valid_for_seconds));
    return m;
}

inline protocol::ServerConfig make_config(const std::string& domains = "app.example.com,*.example.org,localhost:*") {
    return protocol::ServerConfig::from_env_string(
        "ALLOWED_DOMAINS=" + domains + "\n"
        "WALLET_AUTH_SECRET=" + SECRET + "\n");
}

// Flip one bit of a hex string at byte `index`.
inline std::string flip_bit(const std::string& hex, size_t index, uint8_t mask = 0x01) {
    Bytes b = siwn::utils::hex_to_bytes(hex);
    b[index] ^= mask;
    return siwn::utils::bytes_to_hex(b);
}

} // namespace test_helpers

#endif // SIWN_TEST_HELPERS_HPP
