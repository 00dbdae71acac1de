#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include "../src/protocol/handler.hpp"

using namespace protocol;
using namespace test_helpers;
using json = nlohmann::json;

struct HandlerFixture {
    ServerConfig             config = make_config();
    InMemoryNonceRepository  nonce_repo;
    NonceStore               nonces{nonce_repo, config};
    InMemoryWalletRepository wallets;
    InMemoryIdentityStore    identities;
    StoreWalletIdentity      identity{config, wallets, identities};
    LoginOrchestrator        orchestrator{config, nonces, identity};

    TimePoint   now = at("2026-02-19T11:00:00Z");
    AuthHandler handler{orchestrator, [this] { return now; }};

    HttpResponse get(const std::string& target) {
        return handler.handle(HttpRequest::from_target("GET", target));
    }

    HttpResponse post(const std::string& target, const std::string& body) {
        return handler.handle(HttpRequest::from_target("POST", target, body));
    }

    std::string fetch_nonce(const std::string& address) {
        HttpResponse resp = get("/functions/v1/auth/nonce?address=" + address);
        REQUIRE(resp.status == 200);
        return json::parse(resp.body).at("nonce").get<std::string>();
    }

    std::string login_body(const TestWallet& w) {
        SiwnMessage m = make_message("app.example.com", w.address, fetch_nonce(w.address), now);
        std::string text = m.prepare();
        return json{{"message", text}, {"signature", w.sign(text)}, {"publicKey", w.public_key}}.dump();
    }
};

static std::string error_of(const HttpResponse& resp) {
    return json::parse(resp.body).at("error").get<std::string>();
}

TEST_CASE("Request target parsing", "[handler]") {
    HttpRequest req = HttpRequest::from_target("GET", "/auth/nonce?address=N%41bc&x=a+b&flag");
    REQUIRE(req.path == "/auth/nonce");
    REQUIRE(req.query.at("address") == "NAbc");
    REQUIRE(req.query.at("x") == "a b");
    REQUIRE(req.query.at("flag").empty());

    REQUIRE(HttpRequest::from_target("GET", "/auth/nonce").query.empty());
    REQUIRE(HttpRequest::from_target("GET", "/p?v=%zz").query.at("v") == "%zz");
}

TEST_CASE("GET nonce", "[handler]") {
    HandlerFixture f;

    SECTION("issues a nonce") {
        HttpResponse resp = f.get("/auth/nonce?address=" + ADDRESS);
        REQUIRE(resp.status == 200);
        REQUIRE(resp.headers.at("Content-Type") == "application/json");
        REQUIRE(json::parse(resp.body).at("nonce").get<std::string>().size() == 36);
        REQUIRE(f.nonce_repo.size() == 1);
    }

    SECTION("trailing slash") {
        REQUIRE(f.get("/auth/nonce/?address=" + ADDRESS).status == 200);
    }

    SECTION("address is required") {
        HttpResponse resp = f.get("/auth/nonce");
        REQUIRE(resp.status == 400);
        REQUIRE(error_of(resp) == "Address is required");
        REQUIRE(error_of(f.get("/auth/nonce?address=")) == "Address is required");
    }
}

TEST_CASE("POST login", "[handler]") {
    HandlerFixture f;
    TestWallet w = make_wallet();

    SECTION("success") {
        std::string body = f.login_body(w);
        f.now = plus_seconds(f.now, 2);
        HttpResponse resp = f.post("/auth/login", body);
        REQUIRE(resp.status == 200);

        json j = json::parse(resp.body);
        REQUIRE(j.at("user").at("email") == "wallet_" + w.address + "@my-app.com");
        REQUIRE(j.at("user").at("user_metadata").at("address") == w.address);
        REQUIRE(j.at("user").at("user_metadata").at("login_type") == "neo_wallet");
        REQUIRE_FALSE(j.at("session").at("access_token").get<std::string>().empty());
        REQUIRE_FALSE(j.at("session").at("refresh_token").get<std::string>().empty());
        REQUIRE(j.at("session").at("expires_at").get<int64_t>() > 0);
        // the derived password never leaves the server
        REQUIRE(resp.body.find(derive_wallet_credential(f.config, w.address).password) == std::string::npos);

        SECTION("replayed request is rejected") {
            HttpResponse replay = f.post("/auth/login", body);
            REQUIRE(replay.status == 401);
            REQUIRE(error_of(replay) == "Authentication failed");
        }
    }

    SECTION("missing fields") {
        HttpResponse resp = f.post("/auth/login", R"({"message": "x", "signature": "y"})");
        REQUIRE(resp.status == 400);
        REQUIRE(error_of(resp) == "Missing required fields");

        REQUIRE(f.post("/auth/login", R"({"message": 1, "signature": "y", "publicKey": "z"})").status == 400);
        REQUIRE(f.post("/auth/login", "[]").status == 400);
    }

    SECTION("invalid JSON") {
        HttpResponse resp = f.post("/auth/login", "{not json");
        REQUIRE(resp.status == 400);
        REQUIRE(error_of(resp) == "Invalid JSON body");
    }

    SECTION("domain rejected") {
        SiwnMessage m = make_message("evil.example.net", w.address, f.fetch_nonce(w.address), f.now);
        std::string text = m.prepare();
        std::string body = json{{"message", text}, {"signature", w.sign(text)}, {"publicKey", w.public_key}}.dump();
        HttpResponse resp = f.post("/auth/login", body);
        REQUIRE(resp.status == 400);
        REQUIRE(error_of(resp) == "Invalid domain in SIWN message");
    }

    SECTION("key does not match address") {
        json body = json::parse(f.login_body(w));
        body["publicKey"] = make_wallet().public_key;
        HttpResponse resp = f.post("/auth/login", body.dump());
        REQUIRE(resp.status == 400);
        REQUIRE(error_of(resp) == "Public key does not match address");
    }

    SECTION("bad signature and expired message share one message") {
        json body = json::parse(f.login_body(w));
        body["signature"] = flip_bit(body["signature"].get<std::string>(), 3);
        HttpResponse bad_sig = f.post("/auth/login", body.dump());

        std::string fresh = f.login_body(w);
        f.now = plus_seconds(f.now, 3600);
        HttpResponse expired = f.post("/auth/login", fresh);

        REQUIRE(bad_sig.status == 401);
        REQUIRE(expired.status == 401);
        REQUIRE(bad_sig.body == expired.body);
    }

    SECTION("missing configuration is an opaque 500") {
        std::string body = f.login_body(w);
        f.config.allowed_domains.clear();
        HttpResponse resp = f.post("/auth/login", body);
        REQUIRE(resp.status == 500);
        REQUIRE(error_of(resp) == "Server configuration error");
    }
}

TEST_CASE("Unknown routes", "[handler]") {
    HandlerFixture f;

    HttpResponse resp = f.get("/auth/unknown");
    REQUIRE(resp.status == 404);
    REQUIRE(error_of(resp) == "Not Found");

    REQUIRE(f.post("/auth/nonce", "").status == 404);
    REQUIRE(f.get("/auth/login").status == 404);
}
