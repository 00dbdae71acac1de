#ifndef SIWN_PROTOCOL_DOMAIN_HPP
#define SIWN_PROTOCOL_DOMAIN_HPP

#include <string>
#include <vector>

namespace protocol {

// Allow-list check for the domain claimed in a SIWN message.
//
// Pattern forms:
//   example.com     exact match
//   *.example.com   any subdomain, and example.com itself
//   localhost:*     localhost with any port, and bare localhost
//
// Matching is case-sensitive; patterns and domains are compared exactly as
// configured.
bool is_domain_allowed(const std::string& domain, const std::vector<std::string>& patterns);

// Split a comma-separated ALLOWED_DOMAINS value, trimming whitespace and
// dropping empty entries.
std::vector<std::string> parse_domain_patterns(const std::string& csv);

} // namespace protocol

#endif // SIWN_PROTOCOL_DOMAIN_HPP
