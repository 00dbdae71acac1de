#include "handler.hpp"

#include <utility>

namespace protocol {

using json = nlohmann::json;
using siwn::utils::logger;

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// application/x-www-form-urlencoded decoding; invalid escapes are kept as-is.
static std::string url_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static HttpResponse json_response(int status, const json& body) {
    HttpResponse resp;
    resp.status = status;
    resp.headers["Content-Type"] = "application/json";
    resp.body = body.dump();
    return resp;
}

static HttpResponse error_response(int status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

HttpRequest HttpRequest::from_target(const std::string& method,
                                     const std::string& target,
                                     const std::string& body) {
    HttpRequest req;
    req.method = method;
    req.body = body;

    size_t q = target.find('?');
    req.path = target.substr(0, q);
    if (q == std::string::npos) return req;

    for (const auto& pair : siwn::utils::split(target.substr(q + 1), "&")) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
        req.query.emplace(key, value);
    }
    return req;
}

json to_json(const User& user) {
    json metadata = json::object();
    for (const auto& kv : user.user_metadata) metadata[kv.first] = kv.second;
    return json{
        {"id", user.id},
        {"email", user.email},
        {"user_metadata", metadata},
    };
}

json to_json(const Session& session) {
    return json{
        {"access_token", session.access_token},
        {"refresh_token", session.refresh_token},
        {"expires_at", session.expires_at},
    };
}

// -----------------------------------------------------------------------------
// AuthHandler
// -----------------------------------------------------------------------------

AuthHandler::AuthHandler(LoginOrchestrator& orchestrator, Clock clock)
    : orchestrator_(orchestrator)
    , clock_(std::move(clock))
{
}

TimePoint AuthHandler::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

HttpResponse AuthHandler::handle(const HttpRequest& request) {
    std::string path = request.path;
    if (!path.empty() && path.back() == '/') path.pop_back();

    try {
        if (request.method == "GET" && ends_with(path, "/nonce")) {
            return handle_nonce(request);
        }
        if (request.method == "POST" && ends_with(path, "/login")) {
            return handle_login(request);
        }
    } catch (const std::exception& e) {
        logger()->error("Unhandled error on {} {}: {}", request.method, request.path, e.what());
        return error_response(500, "Internal server error");
    }
    return error_response(404, "Not Found");
}

HttpResponse AuthHandler::handle_nonce(const HttpRequest& request) {
    auto it = request.query.find("address");
    std::string address = it == request.query.end() ? std::string() : it->second;

    try {
        std::string nonce = orchestrator_.issue_nonce(address, now());
        return json_response(200, json{{"nonce", nonce}});
    } catch (const AuthError& e) {
        if (e.kind() == AuthErrorKind::BadRequest) {
            return error_response(400, "Address is required");
        }
        return error_response(500, "Failed to generate nonce");
    }
}

HttpResponse AuthHandler::handle_login(const HttpRequest& request) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::parse_error& e) {
        logger()->warn("Login rejected: invalid JSON body ({})", e.what());
        return error_response(400, "Invalid JSON body");
    }

    auto field = [&body](const char* name) -> std::string {
        if (!body.is_object()) return std::string();
        auto it = body.find(name);
        if (it == body.end() || !it->is_string()) return std::string();
        return it->get<std::string>();
    };

    LoginRequest login;
    login.message = field("message");
    login.signature = field("signature");
    login.public_key = field("publicKey");

    LoginOutcome outcome = orchestrator_.attempt(login, now());
    if (!outcome.ok()) {
        AuthErrorKind kind = *outcome.error;
        return error_response(http_status(kind), public_message(kind));
    }

    return json_response(200, json{
        {"user", to_json(outcome.result.user)},
        {"session", to_json(outcome.result.session)},
    });
}

} // namespace protocol
