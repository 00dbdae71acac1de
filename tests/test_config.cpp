#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace protocol;

TEST_CASE("ServerConfig defaults", "[config]") {
    ServerConfig cfg;
    REQUIRE(cfg.nonce_ttl_seconds == 300);
    REQUIRE(cfg.email_domain == "my-app.com");
    REQUIRE(cfg.wallet_provider == "neoline");
    REQUIRE_FALSE(cfg.is_complete());
}

TEST_CASE("ServerConfig from env string", "[config]") {
    const std::string env =
        "# wallet login\n"
        "ALLOWED_DOMAINS= app.example.com, *.example.org ,localhost:*\n"
        "WALLET_AUTH_SECRET=s3cr3t-value\n"
        "\n"
        "NONCE_TTL_SECONDS=120\n"
        "WALLET_EMAIL_DOMAIN=wallets.example.com\n"
        "WALLET_PROVIDER=o3\n"
        "UNRELATED=ignored\n"
        "no equals sign here\n";

    ServerConfig cfg = ServerConfig::from_env_string(env);
    REQUIRE(cfg.allowed_domains == std::vector<std::string>{"app.example.com", "*.example.org", "localhost:*"});
    REQUIRE(cfg.wallet_auth_secret == "s3cr3t-value");
    REQUIRE(cfg.nonce_ttl_seconds == 120);
    REQUIRE(cfg.email_domain == "wallets.example.com");
    REQUIRE(cfg.wallet_provider == "o3");
    REQUIRE(cfg.is_complete());
}

TEST_CASE("ServerConfig env string round trip", "[config]") {
    ServerConfig cfg = test_helpers::make_config();
    cfg.nonce_ttl_seconds = 60;

    ServerConfig restored = ServerConfig::from_env_string(cfg.to_env_string());
    REQUIRE(restored.allowed_domains == cfg.allowed_domains);
    REQUIRE(restored.wallet_auth_secret == cfg.wallet_auth_secret);
    REQUIRE(restored.nonce_ttl_seconds == 60);
    REQUIRE(restored.email_domain == cfg.email_domain);
    REQUIRE(restored.wallet_provider == cfg.wallet_provider);
}

TEST_CASE("ServerConfig completeness", "[config]") {
    REQUIRE_FALSE(ServerConfig::from_env_string("WALLET_AUTH_SECRET=x\n").is_complete());
    REQUIRE_FALSE(ServerConfig::from_env_string("ALLOWED_DOMAINS=a.com\n").is_complete());
    REQUIRE_FALSE(ServerConfig::from_env_string("ALLOWED_DOMAINS= , \nWALLET_AUTH_SECRET=x\n").is_complete());
    REQUIRE(ServerConfig::from_env_string("ALLOWED_DOMAINS=a.com\nWALLET_AUTH_SECRET=x\n").is_complete());
}

TEST_CASE("ServerConfig rejects a bad TTL", "[config]") {
    REQUIRE_THROWS_AS(ServerConfig::from_env_string("NONCE_TTL_SECONDS=abc\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(ServerConfig::from_env_string("NONCE_TTL_SECONDS=0\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(ServerConfig::from_env_string("NONCE_TTL_SECONDS=-5\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(ServerConfig::from_env_string("NONCE_TTL_SECONDS=10s\n"), std::invalid_argument);
}

TEST_CASE("ServerConfig from process environment", "[config]") {
    setenv("ALLOWED_DOMAINS", "env.example.com", 1);
    setenv("WALLET_AUTH_SECRET", "from-the-environment-0123456789abcdef", 1);
    setenv("NONCE_TTL_SECONDS", "90", 1);
    unsetenv("WALLET_EMAIL_DOMAIN");
    unsetenv("WALLET_PROVIDER");

    ServerConfig cfg = ServerConfig::from_environment();
    REQUIRE(cfg.allowed_domains == std::vector<std::string>{"env.example.com"});
    REQUIRE(cfg.wallet_auth_secret == "from-the-environment-0123456789abcdef");
    REQUIRE(cfg.nonce_ttl_seconds == 90);
    REQUIRE(cfg.email_domain == "my-app.com");

    unsetenv("ALLOWED_DOMAINS");
    unsetenv("WALLET_AUTH_SECRET");
    unsetenv("NONCE_TTL_SECONDS");
    REQUIRE_FALSE(ServerConfig::from_environment().is_complete());
}
