#include <iostream>
#include <chrono>
#include <string>
#include <iomanip>
#include <functional>
#include <vector>

#include "helpers.hpp"
#include "crypto/address.hpp"
#include "crypto/preimage.hpp"
#include "crypto/signature.hpp"
#include "protocol/domain.hpp"
#include "protocol/login.hpp"

using p256::Bytes;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

int main() {
    siwn::utils::ensure_sodium_init();
    siwn::utils::logger()->set_level(spdlog::level::warn);

    BenchmarkRunner primitive_runner(10000); // fast ops
    BenchmarkRunner protocol_runner(500);    // slower ops

    p256::KeyPair kp = p256::keygen();
    const std::string priv_hex = siwn::utils::bytes_to_hex(kp.private_key);
    const std::string pub_hex = siwn::utils::bytes_to_hex(kp.public_key);
    const std::string address = neo::address_from_public_key(pub_hex);

    // =====================================================================
    // SECTION 1: Encoding and hashing
    // =====================================================================
    std::cout << "\n--- Encoding (Avg over " << primitive_runner.num_iters << " iters) ---" << std::endl;

    primitive_runner.run("Address from public key", [&]() {
        auto a = neo::address_from_public_key(pub_hex);
        volatile size_t sink = a.size();
        (void)sink;
    });

    primitive_runner.run("Address validation", [&]() {
        volatile bool sink = neo::is_valid_address(address);
        (void)sink;
    });

    const std::vector<std::string> patterns = {"app.example.com", "*.example.org", "localhost:*"};
    primitive_runner.run("Domain allow-list match", [&]() {
        volatile bool sink = protocol::is_domain_allowed("www.example.org", patterns);
        (void)sink;
    });

    // =====================================================================
    // SECTION 2: Challenge message and signature
    // =====================================================================
    std::cout << "\n--- Message & Signature (Avg over " << protocol_runner.num_iters << " iters) ---" << std::endl;

    auto now = std::chrono::system_clock::now();
    protocol::SiwnMessage m;
    m.domain = "app.example.com";
    m.address = address;
    m.statement = "Sign in to Example";
    m.uri = "https://app.example.com/login";
    m.version = "1";
    m.chain_id = 860833102;
    m.nonce = siwn::utils::random_uuid();
    m.issued_at = siwn::utils::format_iso8601(now);
    m.expiration_time = siwn::utils::format_iso8601(now + std::chrono::minutes(5));
    const std::string text = m.prepare();

    protocol_runner.run("Message prepare + parse", [&]() {
        auto parsed = protocol::SiwnMessage::parse(m.prepare());
        volatile bool sink = parsed == m;
        (void)sink;
    });

    protocol_runner.run("Pre-image (wrap_message)", [&]() {
        Bytes pre = neo::wrap_message(text);
        volatile size_t sink = pre.size();
        (void)sink;
    });

    protocol_runner.run("Sign (wallet side)", [&]() {
        auto sig = neo::sign_message(text, priv_hex);
        volatile size_t sink = sig.size();
        (void)sink;
    });

    const std::string sig = neo::sign_message(text, priv_hex);
    protocol_runner.run("Verify signature", [&]() {
        volatile bool sink = neo::verify_signature(text, sig, pub_hex);
        (void)sink;
    });

    // =====================================================================
    // SECTION 3: Full login
    // =====================================================================
    std::cout << "\n--- Login (Avg over " << protocol_runner.num_iters << " iters) ---" << std::endl;

    protocol::ServerConfig cfg = protocol::ServerConfig::from_env_string(
        "ALLOWED_DOMAINS=app.example.com\nWALLET_AUTH_SECRET=benchmark-secret-0123456789abcdef\n");
    protocol::InMemoryNonceRepository nonce_repo;
    protocol::NonceStore nonces(nonce_repo, cfg);
    protocol::InMemoryWalletRepository wallets;
    protocol::InMemoryIdentityStore identities;
    protocol::StoreWalletIdentity identity(cfg, wallets, identities);
    protocol::LoginOrchestrator orchestrator(cfg, nonces, identity);

    protocol_runner.run("Nonce + login (existing wallet)", [&]() {
        protocol::SiwnMessage fresh = m;
        fresh.nonce = orchestrator.issue_nonce(address, now);
        std::string body = fresh.prepare();
        protocol::LoginRequest req{body, neo::sign_message(body, priv_hex), pub_hex};
        volatile bool sink = orchestrator.attempt(req, now).ok();
        (void)sink;
    });

    return 0;
}
