#ifndef SIWN_PROTOCOL_NONCE_HPP
#define SIWN_PROTOCOL_NONCE_HPP

#include "config.hpp"
#include "errors.hpp"
#include "../helpers.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

using siwn::utils::TimePoint;

// -----------------------------------------------------------------------------
// NonceRecord - one outstanding challenge
// -----------------------------------------------------------------------------
struct NonceRecord {
    std::string address;
    std::string nonce;
    TimePoint   expires_at;
    TimePoint   created_at;
};

// -----------------------------------------------------------------------------
// NonceRepository - keyed-record store holding outstanding nonces
// -----------------------------------------------------------------------------
// Implementations throw StoreError on failure. take() must be atomic with
// respect to concurrent callers: at most one caller receives a given record.
class NonceRepository {
public:
    virtual ~NonceRepository() = default;

    virtual void insert(const NonceRecord& record) = 0;

    // Delete and return the record matching (address, nonce) whose expires_at
    // is after `now`. Expired records are never returned.
    virtual std::optional<NonceRecord> take(const std::string& address,
                                            const std::string& nonce,
                                            TimePoint now) = 0;

    // Delete every record with expires_at <= now. Returns the count removed.
    virtual size_t purge_expired(TimePoint now) = 0;
};

// Mutex-guarded in-process repository.
class InMemoryNonceRepository : public NonceRepository {
public:
    void insert(const NonceRecord& record) override;
    std::optional<NonceRecord> take(const std::string& address,
                                    const std::string& nonce,
                                    TimePoint now) override;
    size_t purge_expired(TimePoint now) override;

    size_t size() const;

private:
    mutable std::mutex mu_;
    std::vector<NonceRecord> records_;
};

// -----------------------------------------------------------------------------
// NonceStore - issues and consumes single-use challenge tokens
// -----------------------------------------------------------------------------
class NonceStore {
public:
    explicit NonceStore(NonceRepository& repo,
                        std::chrono::seconds ttl = std::chrono::seconds(300));

    // TTL taken from config.nonce_ttl_seconds (NONCE_TTL_SECONDS).
    NonceStore(NonceRepository& repo, const ServerConfig& config);

    // Generate a random token for `address` and persist it until now + ttl.
    // Throws AuthError(BadRequest) for an empty address and
    // AuthError(StoreUnavailable) if the repository write fails.
    std::string issue(const std::string& address, TimePoint now);

    // True iff an unexpired (address, nonce) record existed and this call
    // removed it. Throws AuthError(StoreUnavailable) on repository failure.
    bool consume(const std::string& address, const std::string& nonce, TimePoint now);

    // Sweep expired records. Intended for the host's periodic cleanup job.
    size_t purge_expired(TimePoint now);

    std::chrono::seconds ttl() const { return ttl_; }

private:
    NonceRepository&     repo_;
    std::chrono::seconds ttl_;
};

} // namespace protocol

#endif // SIWN_PROTOCOL_NONCE_HPP
