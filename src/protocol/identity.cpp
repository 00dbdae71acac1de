#include "identity.hpp"

#include <sodium.h>

namespace protocol {

using siwn::utils::logger;

static const std::string CREDENTIAL_CONTEXT = "neo_wallet:";

WalletCredential derive_wallet_credential(const ServerConfig& config, const std::string& address) {
    WalletCredential cred;
    cred.email = "wallet_" + address + "@" + config.email_domain;
    cred.password = siwn::utils::bytes_to_hex(
        siwn::utils::hmac_sha256(config.wallet_auth_secret, CREDENTIAL_CONTEXT + address));
    return cred;
}

// -----------------------------------------------------------------------------
// StoreWalletIdentity
// -----------------------------------------------------------------------------

StoreWalletIdentity::StoreWalletIdentity(const ServerConfig& config,
                                         WalletRepository& wallets,
                                         IdentityStore& identities)
    : config_(config)
    , wallets_(wallets)
    , identities_(identities)
{
}

std::optional<WalletMapping> StoreWalletIdentity::find_mapping(const std::string& address) {
    try {
        return wallets_.find_by_address(address);
    } catch (const StoreError& e) {
        logger()->error("Error looking up wallet {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::IdentityStoreError, std::string("Wallet lookup failed: ") + e.what());
    }
}

std::string StoreWalletIdentity::resolve_or_create_account(const std::string& address) {
    auto existing = find_mapping(address);
    if (existing) return existing->user_id;

    WalletCredential cred = derive_wallet_credential(config_, address);
    std::map<std::string, std::string> metadata = {
        {"address", address},
        {"login_type", "neo_wallet"},
    };

    User user;
    try {
        user = identities_.create_user(cred, metadata);
    } catch (const DuplicateKeyError& e) {
        // Either another request for the same address got here first, or an
        // earlier attempt created the account but never linked it.
        auto winner = find_mapping(address);
        if (winner) return winner->user_id;
        logger()->warn("Account for wallet {} exists without a mapping: {}", address, e.what());
        return link_wallet(recover_user_id(cred, address), address);
    } catch (const StoreError& e) {
        logger()->error("Error creating user for {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::IdentityStoreError, std::string("Failed to create user account: ") + e.what());
    }

    std::string user_id = link_wallet(user.id, address);
    logger()->info("Created account {} for wallet {}", user_id, address);
    return user_id;
}

std::string StoreWalletIdentity::recover_user_id(const WalletCredential& cred, const std::string& address) {
    try {
        SignInResult existing = identities_.sign_in(cred);
        if (existing.user.id.empty()) {
            throw StoreError("identity store returned no user");
        }
        return existing.user.id;
    } catch (const StoreError& e) {
        logger()->error("Error recovering account for wallet {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::IdentityStoreError, std::string("Failed to recover user account: ") + e.what());
    }
}

std::string StoreWalletIdentity::link_wallet(const std::string& user_id, const std::string& address) {
    WalletMapping mapping;
    mapping.user_id = user_id;
    mapping.address = address;
    mapping.provider = config_.wallet_provider;
    mapping.created_at = std::chrono::system_clock::now();

    try {
        wallets_.insert(mapping);
    } catch (const DuplicateKeyError&) {
        auto winner = find_mapping(address);
        if (!winner) {
            throw AuthError(AuthErrorKind::IdentityStoreError, "Failed to link wallet to account");
        }
        return winner->user_id;
    } catch (const StoreError& e) {
        logger()->error("Error linking wallet {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::IdentityStoreError, std::string("Failed to link wallet to account: ") + e.what());
    }
    return user_id;
}

SignInResult StoreWalletIdentity::authenticate(const std::string& address) {
    WalletCredential cred = derive_wallet_credential(config_, address);
    try {
        SignInResult result = identities_.sign_in(cred);
        if (result.session.access_token.empty() || result.session.refresh_token.empty()) {
            throw StoreError("identity store returned no session");
        }
        return result;
    } catch (const StoreError& e) {
        logger()->error("Error signing in wallet {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::IdentitySessionError, std::string("Failed to create login session: ") + e.what());
    }
}

// -----------------------------------------------------------------------------
// InMemoryWalletRepository
// -----------------------------------------------------------------------------

std::optional<WalletMapping> InMemoryWalletRepository::find_by_address(const std::string& address) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = by_address_.find(address);
    if (it == by_address_.end()) return std::nullopt;
    return it->second;
}

void InMemoryWalletRepository::insert(const WalletMapping& mapping) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!by_address_.emplace(mapping.address, mapping).second) {
        throw DuplicateKeyError("duplicate key value violates unique constraint on address " + mapping.address);
    }
}

size_t InMemoryWalletRepository::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return by_address_.size();
}

// -----------------------------------------------------------------------------
// InMemoryIdentityStore
// -----------------------------------------------------------------------------

InMemoryIdentityStore::InMemoryIdentityStore(int64_t session_ttl_seconds)
    : session_ttl_seconds_(session_ttl_seconds)
{
}

User InMemoryIdentityStore::create_user(const WalletCredential& credential,
                                        const std::map<std::string, std::string>& metadata) {
    if (credential.email.empty() || credential.password.empty()) {
        throw StoreError("email and password are required");
    }

    Account account;
    account.user.id = siwn::utils::random_uuid();
    account.user.email = credential.email;
    account.user.user_metadata = metadata;
    account.password_hash = siwn::utils::sha256(siwn::utils::to_bytes(credential.password));

    std::lock_guard<std::mutex> lock(mu_);
    if (!by_email_.emplace(credential.email, account).second) {
        throw DuplicateKeyError("A user with this email address has already been registered");
    }
    return account.user;
}

SignInResult InMemoryIdentityStore::sign_in(const WalletCredential& credential) {
    Bytes hash = siwn::utils::sha256(siwn::utils::to_bytes(credential.password));

    User user;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = by_email_.find(credential.email);
        if (it == by_email_.end() ||
            sodium_memcmp(it->second.password_hash.data(), hash.data(), hash.size()) != 0) {
            throw StoreError("Invalid login credentials");
        }
        user = it->second.user;
    }

    auto now = std::chrono::system_clock::now();
    SignInResult result;
    result.user = user;
    result.session.access_token = siwn::utils::bytes_to_hex(siwn::utils::random_bytes(32));
    result.session.refresh_token = siwn::utils::bytes_to_hex(siwn::utils::random_bytes(32));
    result.session.expires_at =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count() + session_ttl_seconds_;
    return result;
}

std::optional<User> InMemoryIdentityStore::find_user(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : by_email_) {
        if (kv.second.user.id == user_id) return kv.second.user;
    }
    return std::nullopt;
}

size_t InMemoryIdentityStore::user_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return by_email_.size();
}

} // namespace protocol
