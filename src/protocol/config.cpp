#include "config.hpp"
#include "domain.hpp"
#include "../helpers.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace protocol {

using siwn::utils::trim;

static const char* const ENV_ALLOWED_DOMAINS = "ALLOWED_DOMAINS";
static const char* const ENV_SECRET          = "WALLET_AUTH_SECRET";
static const char* const ENV_NONCE_TTL       = "NONCE_TTL_SECONDS";
static const char* const ENV_EMAIL_DOMAIN    = "WALLET_EMAIL_DOMAIN";
static const char* const ENV_PROVIDER        = "WALLET_PROVIDER";

static int64_t parse_ttl(const std::string& value) {
    size_t used = 0;
    long long ttl = 0;
    try {
        ttl = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(ENV_NONCE_TTL) + " is not a number");
    }
    if (used != value.size() || ttl <= 0) {
        throw std::invalid_argument(std::string(ENV_NONCE_TTL) + " must be a positive integer");
    }
    return ttl;
}

static void apply(ServerConfig& cfg, const std::string& key, const std::string& value) {
    if (key == ENV_ALLOWED_DOMAINS) {
        cfg.allowed_domains = parse_domain_patterns(value);
    } else if (key == ENV_SECRET) {
        cfg.wallet_auth_secret = value;
    } else if (key == ENV_NONCE_TTL) {
        cfg.nonce_ttl_seconds = parse_ttl(value);
    } else if (key == ENV_EMAIL_DOMAIN) {
        if (!value.empty()) cfg.email_domain = value;
    } else if (key == ENV_PROVIDER) {
        if (!value.empty()) cfg.wallet_provider = value;
    }
}

bool ServerConfig::is_complete() const {
    return !wallet_auth_secret.empty() && !allowed_domains.empty();
}

std::string ServerConfig::to_env_string() const {
    std::ostringstream oss;
    oss << ENV_ALLOWED_DOMAINS << "=";
    for (size_t i = 0; i < allowed_domains.size(); ++i) {
        if (i) oss << ",";
        oss << allowed_domains[i];
    }
    oss << "\n";
    oss << ENV_SECRET << "=" << wallet_auth_secret << "\n";
    oss << ENV_NONCE_TTL << "=" << nonce_ttl_seconds << "\n";
    oss << ENV_EMAIL_DOMAIN << "=" << email_domain << "\n";
    oss << ENV_PROVIDER << "=" << wallet_provider << "\n";
    return oss.str();
}

ServerConfig ServerConfig::from_env_string(const std::string& env_content) {
    ServerConfig cfg;
    std::istringstream iss(env_content);
    std::string line;

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        apply(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }

    return cfg;
}

ServerConfig ServerConfig::from_environment() {
    ServerConfig cfg;
    for (const char* key : {ENV_ALLOWED_DOMAINS, ENV_SECRET, ENV_NONCE_TTL, ENV_EMAIL_DOMAIN, ENV_PROVIDER}) {
        const char* value = std::getenv(key);
        if (value) apply(cfg, key, trim(value));
    }

    auto log = siwn::utils::logger();
    if (!cfg.is_complete()) {
        log->warn("SIWN configuration incomplete: {} and {} are required", ENV_ALLOWED_DOMAINS, ENV_SECRET);
    } else if (cfg.wallet_auth_secret.size() < 32) {
        log->warn("{} is shorter than 32 characters", ENV_SECRET);
    }
    return cfg;
}

} // namespace protocol
