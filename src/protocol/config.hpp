#ifndef SIWN_PROTOCOL_CONFIG_HPP
#define SIWN_PROTOCOL_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// ServerConfig - process-wide settings, read once at startup
// -----------------------------------------------------------------------------
struct ServerConfig {
    // ALLOWED_DOMAINS: comma-separated domain patterns (see domain.hpp)
    std::vector<std::string> allowed_domains;

    // WALLET_AUTH_SECRET: keys the per-address credential derivation.
    // Never logged, never returned to clients.
    std::string wallet_auth_secret;

    // NONCE_TTL_SECONDS
    int64_t nonce_ttl_seconds = 300;

    // WALLET_EMAIL_DOMAIN: accounts are created as wallet_<address>@<domain>
    std::string email_domain = "my-app.com";

    // WALLET_PROVIDER: tag stored with each wallet mapping
    std::string wallet_provider = "neoline";

    // True when both the secret and at least one domain pattern are set.
    bool is_complete() const;

    // Serialize to environment variable format
    std::string to_env_string() const;

    // Deserialize from environment variable format (KEY=value lines, '#' comments)
    static ServerConfig from_env_string(const std::string& env_content);

    // Read the variables above from the process environment.
    static ServerConfig from_environment();
};

} // namespace protocol

#endif // SIWN_PROTOCOL_CONFIG_HPP
