#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace protocol;
using namespace test_helpers;

static SiwnMessage sample_message() {
    SiwnMessage m;
    m.domain = "app.example.com";
    m.address = ADDRESS;
    m.statement = "Sign in to Example";
    m.uri = "https://app.example.com/login";
    m.version = "1";
    m.chain_id = 860833102;
    m.nonce = "3f0b6c2a-9d4e-4f1a-8b7c-5e2d1a0f9c3b";
    m.issued_at = "2026-02-19T11:00:00.000Z";
    m.expiration_time = "2026-02-19T11:05:00.000Z";
    return m;
}

static AuthErrorKind parse_error(const std::string& text) {
    try {
        SiwnMessage::parse(text);
    } catch (const AuthError& e) {
        return e.kind();
    }
    FAIL("parse accepted: " << text);
    return AuthErrorKind::BadRequest;
}

static AuthErrorKind validate_error(const SiwnMessage& m,
                                    TimePoint now,
                                    const std::optional<std::string>& domain = std::nullopt,
                                    const std::optional<std::string>& nonce = std::nullopt) {
    try {
        m.validate(now, domain, nonce);
    } catch (const AuthError& e) {
        return e.kind();
    }
    FAIL("validate accepted message");
    return AuthErrorKind::BadRequest;
}

TEST_CASE("prepare renders the canonical text", "[siwn]") {
    REQUIRE(sample_message().prepare() == MESSAGE);

    SiwnMessage no_exp = sample_message();
    no_exp.expiration_time.reset();
    std::string text = no_exp.prepare();
    REQUIRE(text.find("Expiration Time") == std::string::npos);
    REQUIRE(text.back() == 'Z');
}

TEST_CASE("parse inverts prepare", "[siwn]") {
    SECTION("with expiration") {
        SiwnMessage m = sample_message();
        REQUIRE(SiwnMessage::parse(m.prepare()) == m);
        REQUIRE(SiwnMessage::parse(MESSAGE) == m);
    }

    SECTION("without expiration") {
        SiwnMessage m = sample_message();
        m.expiration_time.reset();
        SiwnMessage parsed = SiwnMessage::parse(m.prepare());
        REQUIRE(parsed == m);
        REQUIRE_FALSE(parsed.expiration_time.has_value());
    }

    SECTION("negative and large chain ids") {
        SiwnMessage m = sample_message();
        m.chain_id = -1;
        REQUIRE(SiwnMessage::parse(m.prepare()).chain_id == -1);
        m.chain_id = 9007199254740993LL;
        REQUIRE(SiwnMessage::parse(m.prepare()).chain_id == 9007199254740993LL);
    }

    SECTION("values containing the separator") {
        SiwnMessage m = sample_message();
        m.uri = "https://app.example.com/login?next=a: b";
        m.statement = "Note: this is fine";
        REQUIRE(SiwnMessage::parse(m.prepare()) == m);
    }
}

TEST_CASE("parse extracts fields", "[siwn]") {
    SiwnMessage m = SiwnMessage::parse(MESSAGE);
    REQUIRE(m.domain == "app.example.com");
    REQUIRE(m.address == ADDRESS);
    REQUIRE(m.statement == "Sign in to Example");
    REQUIRE(m.uri == "https://app.example.com/login");
    REQUIRE(m.version == "1");
    REQUIRE(m.chain_id == 860833102);
    REQUIRE(m.nonce == "3f0b6c2a-9d4e-4f1a-8b7c-5e2d1a0f9c3b");
    REQUIRE(m.issued_at == "2026-02-19T11:00:00.000Z");
    REQUIRE(m.expiration_time == std::optional<std::string>("2026-02-19T11:05:00.000Z"));
}

TEST_CASE("parse ignores unknown keys", "[siwn]") {
    std::string text = MESSAGE + "\nRequest ID: 42\nResources: none";
    REQUIRE(SiwnMessage::parse(text) == sample_message());
}

TEST_CASE("parse rejects malformed text", "[siwn]") {
    SECTION("header") {
        REQUIRE(parse_error("") == AuthErrorKind::MalformedMessage);
        REQUIRE(parse_error("hello world") == AuthErrorKind::MalformedMessage);
        REQUIRE(parse_error(" wants you to sign in with your Neo account:\nN\n\ns\n\nURI: u") ==
                AuthErrorKind::MalformedMessage);
        std::string eth = MESSAGE;
        eth.replace(eth.find("Neo"), 3, "Ethereum");
        REQUIRE(parse_error(eth) == AuthErrorKind::MalformedMessage);
    }

    SECTION("truncated") {
        REQUIRE(parse_error("app.example.com wants you to sign in with your Neo account:\nNabc") ==
                AuthErrorKind::MalformedMessage);
    }

    SECTION("missing required keys") {
        for (const char* key : {"URI: ", "Version: ", "Chain ID: ", "Nonce: ", "Issued At: "}) {
            std::string text = MESSAGE;
            size_t pos = text.find(key);
            size_t end = text.find('\n', pos);
            text.erase(pos, end - pos + 1);
            INFO("without " << key);
            REQUIRE(parse_error(text) == AuthErrorKind::MalformedMessage);
        }
    }

    SECTION("non-numeric chain id") {
        for (const char* bad : {"Chain ID: abc", "Chain ID: 12x", "Chain ID: ", "Chain ID: 1.5",
                                "Chain ID: 99999999999999999999"}) {
            std::string text = MESSAGE;
            text.replace(text.find("Chain ID: 860833102"), 19, bad);
            INFO(bad);
            REQUIRE(parse_error(text) == AuthErrorKind::MalformedMessage);
        }
    }
}

TEST_CASE("validate temporal claims", "[siwn]") {
    SiwnMessage m = sample_message();

    SECTION("inside the window") {
        REQUIRE_NOTHROW(m.validate(at("2026-02-19T11:00:00.000Z")));
        REQUIRE_NOTHROW(m.validate(at("2026-02-19T11:02:30Z")));
        REQUIRE_NOTHROW(m.validate(at("2026-02-19T11:05:00.000Z")));
    }

    SECTION("expired") {
        REQUIRE(validate_error(m, at("2026-02-19T11:05:00.001Z")) == AuthErrorKind::MessageExpired);
        REQUIRE(validate_error(m, at("2026-02-20T00:00:00Z")) == AuthErrorKind::MessageExpired);
    }

    SECTION("issued in the future") {
        REQUIRE(validate_error(m, at("2026-02-19T10:59:59.999Z")) == AuthErrorKind::IssuedInFuture);
    }

    SECTION("no expiration means no upper bound") {
        m.expiration_time.reset();
        REQUIRE_NOTHROW(m.validate(at("2030-01-01T00:00:00Z")));
    }

    SECTION("unparsable timestamps") {
        SiwnMessage bad = m;
        bad.issued_at = "yesterday";
        REQUIRE(validate_error(bad, at("2026-02-19T11:01:00Z")) == AuthErrorKind::MalformedMessage);
        bad = m;
        bad.expiration_time = "soon";
        REQUIRE(validate_error(bad, at("2026-02-19T11:01:00Z")) == AuthErrorKind::MalformedMessage);
    }
}

TEST_CASE("validate expectations and ordering", "[siwn]") {
    SiwnMessage m = sample_message();
    TimePoint inside = at("2026-02-19T11:01:00Z");
    TimePoint late = at("2026-02-19T12:00:00Z");

    REQUIRE_NOTHROW(m.validate(inside, std::string("app.example.com"), m.nonce));
    REQUIRE(validate_error(m, inside, std::string("other.example.com")) == AuthErrorKind::DomainMismatch);
    REQUIRE(validate_error(m, inside, std::nullopt, std::string("nonce")) == AuthErrorKind::NonceMismatch);

    // first failing check wins
    REQUIRE(validate_error(m, late, std::string("other.example.com"), std::string("nonce")) ==
            AuthErrorKind::DomainMismatch);
    REQUIRE(validate_error(m, late, std::nullopt, std::string("nonce")) == AuthErrorKind::NonceMismatch);

    SiwnMessage inverted = m;
    inverted.issued_at = "2026-02-19T13:00:00Z";
    REQUIRE(validate_error(inverted, late) == AuthErrorKind::MessageExpired);
}
