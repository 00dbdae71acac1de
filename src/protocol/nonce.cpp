#include "nonce.hpp"

#include <algorithm>

namespace protocol {

// -----------------------------------------------------------------------------
// InMemoryNonceRepository
// -----------------------------------------------------------------------------

void InMemoryNonceRepository::insert(const NonceRecord& record) {
    std::lock_guard<std::mutex> lock(mu_);
    records_.push_back(record);
}

std::optional<NonceRecord> InMemoryNonceRepository::take(const std::string& address,
                                                         const std::string& nonce,
                                                         TimePoint now) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = std::find_if(records_.begin(), records_.end(), [&](const NonceRecord& r) {
        return r.address == address && r.nonce == nonce && r.expires_at > now;
    });
    if (it == records_.end()) return std::nullopt;

    NonceRecord found = *it;
    records_.erase(it);
    return found;
}

size_t InMemoryNonceRepository::purge_expired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mu_);
    auto first = std::remove_if(records_.begin(), records_.end(), [&](const NonceRecord& r) {
        return r.expires_at <= now;
    });
    size_t removed = static_cast<size_t>(std::distance(first, records_.end()));
    records_.erase(first, records_.end());
    return removed;
}

size_t InMemoryNonceRepository::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
}

// -----------------------------------------------------------------------------
// NonceStore
// -----------------------------------------------------------------------------

NonceStore::NonceStore(NonceRepository& repo, std::chrono::seconds ttl)
    : repo_(repo)
    , ttl_(ttl)
{
}

NonceStore::NonceStore(NonceRepository& repo, const ServerConfig& config)
    : NonceStore(repo, std::chrono::seconds(config.nonce_ttl_seconds))
{
}

std::string NonceStore::issue(const std::string& address, TimePoint now) {
    if (address.empty()) {
        throw AuthError(AuthErrorKind::BadRequest, "Address is required");
    }

    NonceRecord record;
    record.address = address;
    record.nonce = siwn::utils::random_uuid();
    record.created_at = now;
    record.expires_at = now + ttl_;

    try {
        repo_.insert(record);
    } catch (const StoreError& e) {
        siwn::utils::logger()->error("Error storing nonce for {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::StoreUnavailable, std::string("Failed to store nonce: ") + e.what());
    }

    siwn::utils::logger()->info("Issued nonce for {} (expires {})",
                                address, siwn::utils::format_iso8601(record.expires_at));
    return record.nonce;
}

bool NonceStore::consume(const std::string& address, const std::string& nonce, TimePoint now) {
    try {
        return repo_.take(address, nonce, now).has_value();
    } catch (const StoreError& e) {
        siwn::utils::logger()->error("Error consuming nonce for {}: {}", address, e.what());
        throw AuthError(AuthErrorKind::StoreUnavailable, std::string("Failed to consume nonce: ") + e.what());
    }
}

size_t NonceStore::purge_expired(TimePoint now) {
    try {
        size_t removed = repo_.purge_expired(now);
        if (removed) siwn::utils::logger()->debug("Purged {} expired nonces", removed);
        return removed;
    } catch (const StoreError& e) {
        siwn::utils::logger()->error("Error purging nonces: {}", e.what());
        throw AuthError(AuthErrorKind::StoreUnavailable, std::string("Failed to purge nonces: ") + e.what());
    }
}

} // namespace protocol
