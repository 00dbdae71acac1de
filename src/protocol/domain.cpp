#include "domain.hpp"
#include "../helpers.hpp"

namespace protocol {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool matches(const std::string& domain, const std::string& pattern) {
    if (starts_with(pattern, "*.")) {
        const std::string parent = pattern.substr(2);
        return ends_with(domain, pattern.substr(1)) || domain == parent;
    }
    if (ends_with(pattern, ":*")) {
        const std::string host = pattern.substr(0, pattern.size() - 2);
        return domain == host || starts_with(domain, host + ":");
    }
    return domain == pattern;
}

bool is_domain_allowed(const std::string& domain, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (matches(domain, pattern)) return true;
    }
    return false;
}

std::vector<std::string> parse_domain_patterns(const std::string& csv) {
    std::vector<std::string> patterns;
    for (const auto& part : siwn::utils::split(csv, ",")) {
        std::string p = siwn::utils::trim(part);
        if (!p.empty()) patterns.push_back(p);
    }
    return patterns;
}

} // namespace protocol
