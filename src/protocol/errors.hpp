#ifndef SIWN_PROTOCOL_ERRORS_HPP
#define SIWN_PROTOCOL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace protocol {

// -----------------------------------------------------------------------------
// AuthErrorKind - why a nonce or login request was refused
// -----------------------------------------------------------------------------
enum class AuthErrorKind {
    BadRequest,
    MalformedMessage,
    DomainRejected,
    DomainMismatch,
    NonceMismatch,
    MessageExpired,
    IssuedInFuture,
    InvalidPublicKey,
    KeyAddressMismatch,
    InvalidSignature,
    InvalidOrExpiredNonce,
    StoreUnavailable,
    ConfigurationMissing,
    IdentityStoreError,
    IdentitySessionError
};

// what() carries full detail for server-side logs only. Use public_message()
// for anything sent back to a client.
class AuthError : public std::runtime_error {
public:
    AuthError(AuthErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    AuthErrorKind kind() const { return kind_; }

private:
    AuthErrorKind kind_;
};

// Failure reported by an external store (nonce table, wallet mapping table,
// identity service).
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// Unique-constraint violation, e.g. a second mapping for the same address.
class DuplicateKeyError : public StoreError {
public:
    explicit DuplicateKeyError(const std::string& msg) : StoreError(msg) {}
};

const char* to_string(AuthErrorKind kind);

// HTTP status the kind surfaces as at the network boundary.
int http_status(AuthErrorKind kind);

// Short client-facing message. Never contains request-specific detail.
const char* public_message(AuthErrorKind kind);

} // namespace protocol

#endif // SIWN_PROTOCOL_ERRORS_HPP
