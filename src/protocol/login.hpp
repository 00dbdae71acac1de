#ifndef SIWN_PROTOCOL_LOGIN_HPP
#define SIWN_PROTOCOL_LOGIN_HPP

#include "config.hpp"
#include "errors.hpp"
#include "identity.hpp"
#include "nonce.hpp"
#include "siwn.hpp"

#include <optional>
#include <string>
#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// Login state machine
// -----------------------------------------------------------------------------
//
//   ReceivedRequest -> DomainChecked -> MessageValidated -> KeyMatched
//     -> SignatureVerified -> NonceConsumed -> IdentityResolved -> SessionIssued
//
// Any step may move to Failed. Nothing is retried.
enum class LoginState {
    ReceivedRequest,
    DomainChecked,
    MessageValidated,
    KeyMatched,
    SignatureVerified,
    NonceConsumed,
    IdentityResolved,
    SessionIssued,
    Failed
};

const char* to_string(LoginState state);

struct LoginRequest {
    std::string message;      // exact signed text
    std::string signature;    // hex r || s
    std::string public_key;   // hex SEC1 key
};

struct LoginOutcome {
    LoginState                   state = LoginState::ReceivedRequest;
    std::vector<LoginState>      trace;     // every state entered, in order
    std::optional<AuthErrorKind> error;
    std::string                  detail;    // server-side detail for `error`
    SignInResult                 result;    // valid when ok()

    bool ok() const { return state == LoginState::SessionIssued; }
};

// -----------------------------------------------------------------------------
// LoginOrchestrator
// -----------------------------------------------------------------------------
class LoginOrchestrator {
public:
    LoginOrchestrator(const ServerConfig& config, NonceStore& nonces, WalletIdentity& identity);

    // GET .../nonce
    std::string issue_nonce(const std::string& address, TimePoint now);

    // Run the full pipeline and report how far it got. AuthErrors are
    // captured in the outcome; other exceptions propagate.
    LoginOutcome attempt(const LoginRequest& request, TimePoint now);

    // Same as attempt() but throws AuthError on failure.
    SignInResult login(const LoginRequest& request, TimePoint now);

    const ServerConfig& config() const { return config_; }

private:
    void run(const LoginRequest& request, TimePoint now, LoginOutcome& out);

    const ServerConfig& config_;
    NonceStore&         nonces_;
    WalletIdentity&     identity_;
};

} // namespace protocol

#endif // SIWN_PROTOCOL_LOGIN_HPP
