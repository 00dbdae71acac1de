#ifndef SIWN_PROTOCOL_IDENTITY_HPP
#define SIWN_PROTOCOL_IDENTITY_HPP

#include "config.hpp"
#include "errors.hpp"
#include "../helpers.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace protocol {

using siwn::utils::Bytes;
using siwn::utils::TimePoint;

// -----------------------------------------------------------------------------
// Identity types
// -----------------------------------------------------------------------------

// Persisted association between a wallet address and an account.
struct WalletMapping {
    std::string user_id;
    std::string address;               // unique
    std::string provider = "neoline";
    TimePoint   created_at;
};

struct User {
    std::string id;
    std::string email;
    std::map<std::string, std::string> user_metadata;
};

struct Session {
    std::string access_token;
    std::string refresh_token;
    int64_t     expires_at = 0;        // unix seconds
};

struct SignInResult {
    User    user;
    Session session;
};

// Server-side credential bound to one address. Never leaves the server.
struct WalletCredential {
    std::string email;
    std::string password;
};

// email    = wallet_<address>@<email_domain>
// password = hex(HMAC-SHA256(wallet_auth_secret, "neo_wallet:" + address))
WalletCredential derive_wallet_credential(const ServerConfig& config, const std::string& address);

// -----------------------------------------------------------------------------
// External collaborators. Both throw StoreError on failure.
// -----------------------------------------------------------------------------

class WalletRepository {
public:
    virtual ~WalletRepository() = default;

    virtual std::optional<WalletMapping> find_by_address(const std::string& address) = 0;

    // Throws DuplicateKeyError if the address is already mapped.
    virtual void insert(const WalletMapping& mapping) = 0;
};

class IdentityStore {
public:
    virtual ~IdentityStore() = default;

    // Create a confirmed account for the credential.
    virtual User create_user(const WalletCredential& credential,
                             const std::map<std::string, std::string>& metadata) = 0;

    // Password sign-in. Throws StoreError on unknown email or wrong password.
    virtual SignInResult sign_in(const WalletCredential& credential) = 0;
};

// -----------------------------------------------------------------------------
// WalletIdentity - account capability used by the login flow
// -----------------------------------------------------------------------------
class WalletIdentity {
public:
    virtual ~WalletIdentity() = default;

    // Return the account id mapped to `address`, creating account and mapping
    // on first use. Throws AuthError(IdentityStoreError).
    virtual std::string resolve_or_create_account(const std::string& address) = 0;

    // Obtain a session for the account mapped to `address`.
    // Throws AuthError(IdentitySessionError).
    virtual SignInResult authenticate(const std::string& address) = 0;
};

// WalletIdentity on top of a WalletRepository and an IdentityStore.
class StoreWalletIdentity : public WalletIdentity {
public:
    StoreWalletIdentity(const ServerConfig& config,
                        WalletRepository& wallets,
                        IdentityStore& identities);

    std::string resolve_or_create_account(const std::string& address) override;
    SignInResult authenticate(const std::string& address) override;

private:
    std::optional<WalletMapping> find_mapping(const std::string& address);
    std::string recover_user_id(const WalletCredential& cred, const std::string& address);
    std::string link_wallet(const std::string& user_id, const std::string& address);

    const ServerConfig& config_;
    WalletRepository&   wallets_;
    IdentityStore&      identities_;
};

// -----------------------------------------------------------------------------
// In-memory collaborators
// -----------------------------------------------------------------------------

class InMemoryWalletRepository : public WalletRepository {
public:
    std::optional<WalletMapping> find_by_address(const std::string& address) override;
    void insert(const WalletMapping& mapping) override;

    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, WalletMapping> by_address_;
};

// Stores SHA-256 of each password and mints random hex tokens.
class InMemoryIdentityStore : public IdentityStore {
public:
    explicit InMemoryIdentityStore(int64_t session_ttl_seconds = 3600);

    User create_user(const WalletCredential& credential,
                     const std::map<std::string, std::string>& metadata) override;
    SignInResult sign_in(const WalletCredential& credential) override;

    std::optional<User> find_user(const std::string& user_id) const;
    size_t user_count() const;

private:
    struct Account {
        User  user;
        Bytes password_hash;
    };

    int64_t session_ttl_seconds_;
    mutable std::mutex mu_;
    std::map<std::string, Account> by_email_;
};

} // namespace protocol

#endif // SIWN_PROTOCOL_IDENTITY_HPP
