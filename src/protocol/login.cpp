#include "login.hpp"
#include "domain.hpp"
#include "../crypto/address.hpp"
#include "../crypto/signature.hpp"

namespace protocol {

using siwn::utils::logger;

const char* to_string(LoginState state) {
    switch (state) {
        case LoginState::ReceivedRequest:   return "ReceivedRequest";
        case LoginState::DomainChecked:     return "DomainChecked";
        case LoginState::MessageValidated:  return "MessageValidated";
        case LoginState::KeyMatched:        return "KeyMatched";
        case LoginState::SignatureVerified: return "SignatureVerified";
        case LoginState::NonceConsumed:     return "NonceConsumed";
        case LoginState::IdentityResolved:  return "IdentityResolved";
        case LoginState::SessionIssued:     return "SessionIssued";
        case LoginState::Failed:            return "Failed";
    }
    return "Unknown";
}

static void enter(LoginOutcome& out, LoginState state) {
    out.state = state;
    out.trace.push_back(state);
}

LoginOrchestrator::LoginOrchestrator(const ServerConfig& config, NonceStore& nonces, WalletIdentity& identity)
    : config_(config)
    , nonces_(nonces)
    , identity_(identity)
{
}

std::string LoginOrchestrator::issue_nonce(const std::string& address, TimePoint now) {
    return nonces_.issue(address, now);
}

void LoginOrchestrator::run(const LoginRequest& request, TimePoint now, LoginOutcome& out) {
    if (request.message.empty() || request.signature.empty() || request.public_key.empty()) {
        throw AuthError(AuthErrorKind::BadRequest, "Missing required fields");
    }
    if (!config_.is_complete()) {
        throw AuthError(AuthErrorKind::ConfigurationMissing,
                        "ALLOWED_DOMAINS and WALLET_AUTH_SECRET must be set");
    }

    // 1. structure and domain
    SiwnMessage msg = SiwnMessage::parse(request.message);
    if (!is_domain_allowed(msg.domain, config_.allowed_domains)) {
        throw AuthError(AuthErrorKind::DomainRejected, "Domain not allowed: " + msg.domain);
    }
    enter(out, LoginState::DomainChecked);

    // 2. freshness
    msg.validate(now);
    enter(out, LoginState::MessageValidated);

    // 3. key belongs to the claimed address
    std::string derived = neo::address_from_public_key(request.public_key);
    if (derived != msg.address) {
        throw AuthError(AuthErrorKind::KeyAddressMismatch,
                        "Public key address " + derived + " does not match " + msg.address);
    }
    enter(out, LoginState::KeyMatched);

    // 4. signature over the exact submitted text
    if (!neo::verify_signature(request.message, request.signature, request.public_key)) {
        throw AuthError(AuthErrorKind::InvalidSignature, "Invalid signature for " + msg.address);
    }
    enter(out, LoginState::SignatureVerified);

    // 5. single use
    if (!nonces_.consume(msg.address, msg.nonce, now)) {
        throw AuthError(AuthErrorKind::InvalidOrExpiredNonce, "Invalid or expired nonce for " + msg.address);
    }
    enter(out, LoginState::NonceConsumed);

    // 6. account
    std::string user_id = identity_.resolve_or_create_account(msg.address);
    enter(out, LoginState::IdentityResolved);

    out.result = identity_.authenticate(msg.address);
    enter(out, LoginState::SessionIssued);

    logger()->info("Wallet {} signed in as {}", msg.address, user_id);
}

LoginOutcome LoginOrchestrator::attempt(const LoginRequest& request, TimePoint now) {
    LoginOutcome out;
    out.trace.push_back(LoginState::ReceivedRequest);

    try {
        run(request, now, out);
    } catch (const AuthError& e) {
        LoginState reached = out.state;
        out.error = e.kind();
        out.detail = e.what();
        enter(out, LoginState::Failed);

        int status = http_status(e.kind());
        if (status >= 500) {
            logger()->error("Login failed after {}: {} ({})", to_string(reached), to_string(e.kind()), e.what());
        } else {
            logger()->warn("Login rejected after {}: {} ({})", to_string(reached), to_string(e.kind()), e.what());
        }
    }
    return out;
}

SignInResult LoginOrchestrator::login(const LoginRequest& request, TimePoint now) {
    LoginOutcome out = attempt(request, now);
    if (!out.ok()) {
        throw AuthError(*out.error, out.detail);
    }
    return out.result;
}

} // namespace protocol
