#ifndef SIWN_PROTOCOL_SIWN_HPP
#define SIWN_PROTOCOL_SIWN_HPP

#include "errors.hpp"
#include "../helpers.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace protocol {

using siwn::utils::TimePoint;

// -----------------------------------------------------------------------------
// SiwnMessage - one Sign-In With Neo challenge
// -----------------------------------------------------------------------------
//
//   <domain> wants you to sign in with your Neo account:
//   <address>
//
//   <statement>
//
//   URI: <uri>
//   Version: <version>
//   Chain ID: <chain id>
//   Nonce: <nonce>
//   Issued At: <ISO-8601>
//   Expiration Time: <ISO-8601>      (optional)
//
struct SiwnMessage {
    std::string                domain;
    std::string                address;
    std::string                statement;
    std::string                uri;
    std::string                version;
    int64_t                    chain_id = 0;
    std::string                nonce;
    std::string                issued_at;        // kept verbatim, it is part of the signed text
    std::optional<std::string> expiration_time;

    // Render the text the wallet signs.
    std::string prepare() const;

    // Throws AuthError(MalformedMessage) if the text is not a SIWN message.
    static SiwnMessage parse(const std::string& text);

    // Checks, in order: expected domain, expected nonce, expiration, issue
    // time. Throws AuthError with the kind of the first failing check.
    void validate(TimePoint now,
                  const std::optional<std::string>& expected_domain = std::nullopt,
                  const std::optional<std::string>& expected_nonce = std::nullopt) const;

    bool operator==(const SiwnMessage& other) const;
    bool operator!=(const SiwnMessage& other) const { return !(*this == other); }
};

} // namespace protocol

#endif // SIWN_PROTOCOL_SIWN_HPP
