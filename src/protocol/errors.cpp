#include "errors.hpp"

namespace protocol {

const char* to_string(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::BadRequest:            return "BadRequest";
        case AuthErrorKind::MalformedMessage:      return "MalformedMessage";
        case AuthErrorKind::DomainRejected:        return "DomainRejected";
        case AuthErrorKind::DomainMismatch:        return "DomainMismatch";
        case AuthErrorKind::NonceMismatch:         return "NonceMismatch";
        case AuthErrorKind::MessageExpired:        return "MessageExpired";
        case AuthErrorKind::IssuedInFuture:        return "IssuedInFuture";
        case AuthErrorKind::InvalidPublicKey:      return "InvalidPublicKey";
        case AuthErrorKind::KeyAddressMismatch:    return "KeyAddressMismatch";
        case AuthErrorKind::InvalidSignature:      return "InvalidSignature";
        case AuthErrorKind::InvalidOrExpiredNonce: return "InvalidOrExpiredNonce";
        case AuthErrorKind::StoreUnavailable:      return "StoreUnavailable";
        case AuthErrorKind::ConfigurationMissing:  return "ConfigurationMissing";
        case AuthErrorKind::IdentityStoreError:    return "IdentityStoreError";
        case AuthErrorKind::IdentitySessionError:  return "IdentitySessionError";
    }
    return "Unknown";
}

int http_status(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::BadRequest:
        case AuthErrorKind::MalformedMessage:
        case AuthErrorKind::DomainRejected:
        case AuthErrorKind::InvalidPublicKey:
        case AuthErrorKind::KeyAddressMismatch:
            return 400;

        case AuthErrorKind::DomainMismatch:
        case AuthErrorKind::NonceMismatch:
        case AuthErrorKind::MessageExpired:
        case AuthErrorKind::IssuedInFuture:
        case AuthErrorKind::InvalidSignature:
        case AuthErrorKind::InvalidOrExpiredNonce:
            return 401;

        case AuthErrorKind::StoreUnavailable:
        case AuthErrorKind::ConfigurationMissing:
        case AuthErrorKind::IdentityStoreError:
        case AuthErrorKind::IdentitySessionError:
            return 500;
    }
    return 500;
}

const char* public_message(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::BadRequest:           return "Missing required fields";
        case AuthErrorKind::MalformedMessage:     return "Malformed SIWN message";
        case AuthErrorKind::DomainRejected:       return "Invalid domain in SIWN message";
        case AuthErrorKind::InvalidPublicKey:     return "Invalid public key";
        case AuthErrorKind::KeyAddressMismatch:   return "Public key does not match address";

        // Signature, nonce and freshness failures share one message so the
        // response does not reveal which check failed.
        case AuthErrorKind::DomainMismatch:
        case AuthErrorKind::NonceMismatch:
        case AuthErrorKind::MessageExpired:
        case AuthErrorKind::IssuedInFuture:
        case AuthErrorKind::InvalidSignature:
        case AuthErrorKind::InvalidOrExpiredNonce:
            return "Authentication failed";

        case AuthErrorKind::StoreUnavailable:     return "Service temporarily unavailable";
        case AuthErrorKind::ConfigurationMissing: return "Server configuration error";
        case AuthErrorKind::IdentityStoreError:   return "Failed to create user account";
        case AuthErrorKind::IdentitySessionError: return "Failed to create login session";
    }
    return "Authentication failed";
}

} // namespace protocol
