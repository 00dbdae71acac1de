#ifndef SIWN_HELPERS_HPP
#define SIWN_HELPERS_HPP

#include "crypto/p256.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <initializer_list>
#include <vector>

namespace siwn {
namespace utils {

    using p256::Bytes;
    using TimePoint = std::chrono::system_clock::time_point;

    // Hex helpers
    std::string bytes_to_hex(const Bytes& bytes);
    Bytes hex_to_bytes(const std::string& hex);   // throws std::invalid_argument
    bool is_hex(const std::string& s);

    // Generic serialization primitives
    Bytes to_bytes(const std::string& s);
    Bytes concat_bytes(const Bytes& a, const Bytes& b);

    void append_u32_le(Bytes& out, uint32_t v);
    void append_var_int(Bytes& out, uint64_t v);

    // Hash utilities
    Bytes sha256(const Bytes& data);
    Bytes hash256(const Bytes& data);      // SHA256(SHA256(data))
    Bytes ripemd160(const Bytes& data);
    Bytes hmac_sha256(const std::string& key, const std::string& data);

    // Randomness (libsodium)
    Bytes random_bytes(std::size_t len);
    std::string random_uuid();

    // ISO-8601 timestamps as produced by Date.prototype.toISOString
    std::optional<TimePoint> parse_iso8601(const std::string& s);
    std::string format_iso8601(TimePoint tp);

    // String helpers
    std::vector<std::string> split(const std::string& s, const std::string& delim);
    std::string trim(const std::string& s);

    // Library logger ("siwn"). Hosts may replace it before first use.
    std::shared_ptr<spdlog::logger> logger();
    void set_logger(std::shared_ptr<spdlog::logger> l);

    // Throws std::runtime_error if libsodium cannot be initialized.
    void ensure_sodium_init();

} // namespace utils
} // namespace siwn

#endif // SIWN_HELPERS_HPP
