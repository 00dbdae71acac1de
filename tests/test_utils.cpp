#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

#include <set>
#include <stdexcept>

using namespace siwn::utils;
using namespace test_helpers;

TEST_CASE("Hex encoding", "[utils]") {
    SECTION("round trip") {
        Bytes b = {0x00, 0x01, 0xab, 0xff};
        REQUIRE(bytes_to_hex(b) == "0001abff");
        REQUIRE(hex_to_bytes("0001abff") == b);
        REQUIRE(hex_to_bytes("0001ABFF") == b);
    }

    SECTION("strict decoding") {
        REQUIRE_THROWS_AS(hex_to_bytes("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(hex_to_bytes("zz"), std::invalid_argument);
        REQUIRE(hex_to_bytes("").empty());
        REQUIRE(is_hex("deadBEEF"));
        REQUIRE_FALSE(is_hex("xyz"));
    }
}

TEST_CASE("Var-int encoding", "[utils]") {
    auto enc = [](uint64_t v) {
        Bytes out;
        append_var_int(out, v);
        return bytes_to_hex(out);
    };

    REQUIRE(enc(0) == "00");
    REQUIRE(enc(0xFC) == "fc");
    REQUIRE(enc(0xFD) == "fdfd00");
    REQUIRE(enc(303) == "fd2f01");
    REQUIRE(enc(0xFFFF) == "fdffff");
    REQUIRE(enc(0x10000) == "fe00000100");
    REQUIRE(enc(0x100000000ull) == "ff0000000001000000");
}

TEST_CASE("Hashes match published vectors", "[utils]") {
    REQUIRE(bytes_to_hex(sha256(to_bytes("abc"))) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(bytes_to_hex(ripemd160(Bytes())) == "9c1185a5c5e9fc54612808977ee8f548b2258d31");
    REQUIRE(bytes_to_hex(hmac_sha256("key", "The quick brown fox jumps over the lazy dog")) ==
            "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST_CASE("random_uuid produces distinct v4 identifiers", "[utils]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = random_uuid();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[14] == '4');
        REQUIRE(id[18] == '-');
        REQUIRE(id[23] == '-');
        seen.insert(id);
    }
    REQUIRE(seen.size() == 100);
}

TEST_CASE("ISO-8601 timestamps", "[utils]") {
    using std::chrono::milliseconds;

    SECTION("JavaScript toISOString form") {
        auto tp = parse_iso8601("2026-02-19T11:00:00.000Z");
        REQUIRE(tp.has_value());
        auto ms = std::chrono::duration_cast<milliseconds>(tp->time_since_epoch()).count();
        REQUIRE(ms == 1771498800000LL);
        REQUIRE(format_iso8601(*tp) == "2026-02-19T11:00:00.000Z");
    }

    SECTION("offsets and fractions") {
        REQUIRE(*parse_iso8601("2026-02-19T12:30:00+01:30") == *parse_iso8601("2026-02-19T11:00:00Z"));
        REQUIRE(*parse_iso8601("2026-02-19T10:00:00-0100") == *parse_iso8601("2026-02-19T11:00:00Z"));
        REQUIRE(format_iso8601(*parse_iso8601("2026-02-19T11:00:00.25Z")) == "2026-02-19T11:00:00.250Z");
        REQUIRE(parse_iso8601("2026-02-19").has_value());
    }

    SECTION("rejects malformed input") {
        REQUIRE_FALSE(parse_iso8601("").has_value());
        REQUIRE_FALSE(parse_iso8601("not a date").has_value());
        REQUIRE_FALSE(parse_iso8601("2026-13-01T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2026-02-30T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2026-02-19T11:00:00").has_value());
        REQUIRE_FALSE(parse_iso8601("2026-02-19T25:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2026-02-19T11:00:00Zjunk").has_value());
    }

    SECTION("leap day") {
        REQUIRE(parse_iso8601("2024-02-29T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2023-02-29T00:00:00Z").has_value());
    }
}

TEST_CASE("String helpers", "[utils]") {
    REQUIRE(split("a,b,,c", ",") == std::vector<std::string>{"a", "b", "", "c"});
    REQUIRE(split("", "\n") == std::vector<std::string>{""});
    REQUIRE(trim("  x y \t\n") == "x y");
    REQUIRE(trim("   ").empty());
}
