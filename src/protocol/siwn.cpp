#include "siwn.hpp"

#include <cctype>
#include <limits>
#include <vector>

namespace protocol {

using siwn::utils::parse_iso8601;
using siwn::utils::split;

static const std::string HEADER_SUFFIX = " wants you to sign in with your Neo account:";

static const std::string KEY_URI        = "URI";
static const std::string KEY_VERSION    = "Version";
static const std::string KEY_CHAIN_ID   = "Chain ID";
static const std::string KEY_NONCE      = "Nonce";
static const std::string KEY_ISSUED_AT  = "Issued At";
static const std::string KEY_EXPIRATION = "Expiration Time";

static AuthError malformed(const std::string& why) {
    return AuthError(AuthErrorKind::MalformedMessage, "Invalid SIWN message: " + why);
}

// Decimal integer, optional leading '-', no whitespace or trailing junk.
static int64_t parse_chain_id(const std::string& value) {
    size_t i = 0;
    bool negative = false;
    if (!value.empty() && value[0] == '-') {
        negative = true;
        i = 1;
    }
    if (i >= value.size()) throw malformed("Chain ID is not a number");

    uint64_t limit = negative ? uint64_t(std::numeric_limits<int64_t>::max()) + 1
                              : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t acc = 0;
    for (; i < value.size(); ++i) {
        char c = value[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw malformed("Chain ID is not a number");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (acc > (limit - digit) / 10) throw malformed("Chain ID out of range");
        acc = acc * 10 + digit;
    }
    if (negative) {
        return acc == limit ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(acc);
    }
    return static_cast<int64_t>(acc);
}

// -----------------------------------------------------------------------------
// SiwnMessage
// -----------------------------------------------------------------------------

std::string SiwnMessage::prepare() const {
    std::string out;
    out += domain + HEADER_SUFFIX + "\n";
    out += address + "\n";
    out += "\n";
    out += statement + "\n";
    out += "\n";
    out += KEY_URI + ": " + uri + "\n";
    out += KEY_VERSION + ": " + version + "\n";
    out += KEY_CHAIN_ID + ": " + std::to_string(chain_id) + "\n";
    out += KEY_NONCE + ": " + nonce + "\n";
    out += KEY_ISSUED_AT + ": " + issued_at;
    if (expiration_time) {
        out += "\n" + KEY_EXPIRATION + ": " + *expiration_time;
    }
    return out;
}

SiwnMessage SiwnMessage::parse(const std::string& text) {
    std::vector<std::string> lines = split(text, "\n");

    const std::string& header = lines[0];
    if (header.size() <= HEADER_SUFFIX.size() ||
        header.compare(header.size() - HEADER_SUFFIX.size(), HEADER_SUFFIX.size(), HEADER_SUFFIX) != 0) {
        throw malformed("Header missing or malformed");
    }
    if (lines.size() < 4) {
        throw malformed("Message truncated");
    }

    SiwnMessage msg;
    msg.domain    = header.substr(0, header.size() - HEADER_SUFFIX.size());
    msg.address   = lines[1];
    msg.statement = lines[3];

    bool has_uri = false, has_version = false, has_chain = false;
    bool has_nonce = false, has_issued = false;

    for (size_t i = 5; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) continue;

        size_t sep = line.find(": ");
        std::string key = line.substr(0, sep);
        std::string value = sep == std::string::npos ? std::string() : line.substr(sep + 2);

        if (key == KEY_URI) {
            msg.uri = value;
            has_uri = true;
        } else if (key == KEY_VERSION) {
            msg.version = value;
            has_version = true;
        } else if (key == KEY_CHAIN_ID) {
            msg.chain_id = parse_chain_id(value);
            has_chain = true;
        } else if (key == KEY_NONCE) {
            msg.nonce = value;
            has_nonce = true;
        } else if (key == KEY_ISSUED_AT) {
            msg.issued_at = value;
            has_issued = true;
        } else if (key == KEY_EXPIRATION) {
            msg.expiration_time = value;
        }
        // unknown keys are ignored
    }

    if (!has_uri)     throw malformed("URI missing");
    if (!has_version) throw malformed("Version missing");
    if (!has_chain)   throw malformed("Chain ID missing");
    if (!has_nonce)   throw malformed("Nonce missing");
    if (!has_issued)  throw malformed("Issued At missing");

    return msg;
}

void SiwnMessage::validate(TimePoint now,
                           const std::optional<std::string>& expected_domain,
                           const std::optional<std::string>& expected_nonce) const {
    if (expected_domain && domain != *expected_domain) {
        throw AuthError(AuthErrorKind::DomainMismatch,
                        "Domain mismatch: expected " + *expected_domain + ", got " + domain);
    }

    if (expected_nonce && nonce != *expected_nonce) {
        throw AuthError(AuthErrorKind::NonceMismatch,
                        "Nonce mismatch: expected " + *expected_nonce + ", got " + nonce);
    }

    auto issued = parse_iso8601(issued_at);
    if (!issued) throw malformed("Issued At is not an ISO-8601 timestamp");

    if (expiration_time) {
        auto expires = parse_iso8601(*expiration_time);
        if (!expires) throw malformed("Expiration Time is not an ISO-8601 timestamp");
        if (*expires < now) {
            throw AuthError(AuthErrorKind::MessageExpired, "Message has expired");
        }
    }

    if (*issued > now) {
        throw AuthError(AuthErrorKind::IssuedInFuture, "Message issue time is in the future");
    }
}

bool SiwnMessage::operator==(const SiwnMessage& other) const {
    return domain == other.domain &&
           address == other.address &&
           statement == other.statement &&
           uri == other.uri &&
           version == other.version &&
           chain_id == other.chain_id &&
           nonce == other.nonce &&
           issued_at == other.issued_at &&
           expiration_time == other.expiration_time;
}

} // namespace protocol
