#ifndef SIWN_PROTOCOL_HANDLER_HPP
#define SIWN_PROTOCOL_HANDLER_HPP

#include "login.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>

namespace protocol {

// -----------------------------------------------------------------------------
// Transport-neutral request / response
// -----------------------------------------------------------------------------
struct HttpRequest {
    std::string method;
    std::string path;                            // without query string
    std::map<std::string, std::string> query;    // decoded
    std::string body;

    // Split "/auth/nonce?address=N..." into path and decoded query.
    static HttpRequest from_target(const std::string& method,
                                   const std::string& target,
                                   const std::string& body = "");
};

struct HttpResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;
};

nlohmann::json to_json(const User& user);
nlohmann::json to_json(const Session& session);

// -----------------------------------------------------------------------------
// AuthHandler
// -----------------------------------------------------------------------------
//   GET  .../nonce?address=<address>   -> {"nonce": "..."}
//   POST .../login {message, signature, publicKey}
//                                      -> {"user": {...}, "session": {...}}
// Anything else is 404. A trailing '/' on the path is ignored.
class AuthHandler {
public:
    using Clock = std::function<TimePoint()>;

    explicit AuthHandler(LoginOrchestrator& orchestrator, Clock clock = nullptr);

    HttpResponse handle(const HttpRequest& request);

private:
    HttpResponse handle_nonce(const HttpRequest& request);
    HttpResponse handle_login(const HttpRequest& request);

    TimePoint now() const;

    LoginOrchestrator& orchestrator_;
    Clock              clock_;
};

} // namespace protocol

#endif // SIWN_PROTOCOL_HANDLER_HPP
