#include "helpers.hpp"

#include <openssl/evp.h>
#include <sodium.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace siwn {
namespace utils {

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_hex(const std::string& s) {
    for (char c : s) {
        if (hex_value(c) < 0) return false;
    }
    return true;
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) throw std::invalid_argument("Hex string length must be even.");
    Bytes bytes;
    bytes.reserve(hex.length() / 2);
    for (std::size_t i = 0; i < hex.length(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("Hex string contains non-hex characters.");
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

Bytes concat_bytes(const Bytes& a, const Bytes& b) {
    Bytes result;
    result.reserve(a.size() + b.size());
    result.insert(result.end(), a.begin(), a.end());
    result.insert(result.end(), b.begin(), b.end());
    return result;
}

void append_u32_le(Bytes& out, uint32_t v) {
    out.push_back(uint8_t((v >>  0) & 0xFF));
    out.push_back(uint8_t((v >>  8) & 0xFF));
    out.push_back(uint8_t((v >> 16) & 0xFF));
    out.push_back(uint8_t((v >> 24) & 0xFF));
}

void append_var_int(Bytes& out, uint64_t v) {
    int width = 0;
    if (v < 0xFD) {
        out.push_back(static_cast<uint8_t>(v));
        return;
    } else if (v <= 0xFFFF) {
        out.push_back(0xFD);
        width = 2;
    } else if (v <= 0xFFFFFFFFull) {
        out.push_back(0xFE);
        width = 4;
    } else {
        out.push_back(0xFF);
        width = 8;
    }
    for (int i = 0; i < width; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void ensure_sodium_init() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] { ok = sodium_init() >= 0; });
    if (!ok) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Bytes sha256(const Bytes& data) {
    ensure_sodium_init();
    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Bytes hash256(const Bytes& data) {
    return sha256(sha256(data));
}

Bytes ripemd160(const Bytes& data) {
    // libsodium has no RIPEMD-160; OpenSSL provides it.
    Bytes result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), result.data(), &len, EVP_ripemd160(), nullptr) != 1) {
        throw std::runtime_error("RIPEMD-160 digest failed");
    }
    result.resize(len);
    return result;
}

Bytes hmac_sha256(const std::string& key, const std::string& data) {
    ensure_sodium_init();
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state,
                                reinterpret_cast<const unsigned char*>(key.data()),
                                key.size());
    crypto_auth_hmacsha256_update(&state,
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  data.size());
    Bytes mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof state);
    return mac;
}

Bytes random_bytes(std::size_t len) {
    ensure_sodium_init();
    Bytes out(len);
    randombytes_buf(out.data(), out.size());
    return out;
}

std::string random_uuid() {
    Bytes b = random_bytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = bytes_to_hex(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// -----------------------------------------------------------------------------
// ISO-8601
// -----------------------------------------------------------------------------

// Days since 1970-01-01 for a proleptic Gregorian date.
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

static bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

// Reads exactly n digits at s[pos].
static bool read_digits(const std::string& s, std::size_t& pos, std::size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

static bool expect(const std::string& s, std::size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

std::optional<TimePoint> parse_iso8601(const std::string& s) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int64_t micros = 0;
    int64_t offset_secs = 0;

    if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, month)) return std::nullopt;

    if (pos < s.size()) {
        if (!expect(s, pos, 'T') ||
            !read_digits(s, pos, 2, hour) || !expect(s, pos, ':') ||
            !read_digits(s, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!read_digits(s, pos, 2, second)) return std::nullopt;
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                std::size_t start = pos;
                int64_t scale = 100000;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                    micros += (s[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                }
                if (pos == start) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

        if (pos >= s.size()) return std::nullopt;  // time without zone designator
        if (s[pos] == 'Z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = s[pos] == '+' ? 1 : -1;
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!read_digits(s, pos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset_secs = sign * (oh * 3600 + om * 60);
        } else {
            return std::nullopt;
        }
        if (pos != s.size()) return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_secs;
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

std::string format_iso8601(TimePoint tp) {
    using namespace std::chrono;
    int64_t ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    int64_t secs = ms >= 0 ? ms / 1000 : (ms - 999) / 1000;
    int64_t millis = ms - secs * 1000;
    int64_t days = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
    int64_t sod = secs - days * 86400;

    int64_t y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof buf, "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(sod / 3600),
                  static_cast<long long>((sod % 3600) / 60),
                  static_cast<long long>(sod % 60),
                  static_cast<long long>(millis));
    return buf;
}

// -----------------------------------------------------------------------------
// Strings
// -----------------------------------------------------------------------------

std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    if (delim.empty()) {
        parts.push_back(s);
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        std::size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
    return parts;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// -----------------------------------------------------------------------------
// Logging
// -----------------------------------------------------------------------------

static std::mutex logger_mu;
static std::shared_ptr<spdlog::logger> lib_logger;

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mu);
    if (!lib_logger) {
        lib_logger = spdlog::get("siwn");
        if (!lib_logger) {
            lib_logger = spdlog::stderr_color_mt("siwn");
        }
    }
    return lib_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> l) {
    std::lock_guard<std::mutex> lock(logger_mu);
    lib_logger = std::move(l);
}

} // namespace utils
} // namespace siwn
