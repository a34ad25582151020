#pragma once

#include "auth/CredentialStore.h"
#include "auth/TokenService.h"
#include "core/OffloadPool.h"
#include "metrics/SnapshotService.h"
#include "session/SessionRegistry.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http.hpp>
#include <boost/json/value.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace psmonitor::networking {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Splits "/path?a=1&b=x%20y" into a path and decoded query parameters.
struct Target {
    std::string path;
    std::map<std::string, std::string> query;
};

Target parse_target(std::string_view target);

// Builds a JSON response carrying the CORS headers every route sends.
Response json_response(http::status status, const boost::json::value& body,
                       unsigned version, bool keep_alive);

// {"error": <name>, "message": <text>} with the status mapped from `ec`.
Response error_response(const boost::system::error_code& ec, unsigned version, bool keep_alive);

http::status status_for(const boost::system::error_code& ec);

// Plain HTTP routes. Runs on the dispatcher's loop; anything that blocks
// (password hashing, metric providers) is handed to the offload pool and
// the response is produced from the completion.
class RequestRouter {
public:
    using Respond = std::function<void(Response)>;

    RequestRouter(session::SessionRegistry& registry,
                  const auth::CredentialStore& credentials,
                  const auth::TokenService& tokens,
                  metrics::SnapshotService& snapshots,
                  OffloadPool& pool);

    // `respond` is invoked exactly once, on `ex`.
    void handle(const Request& req, const boost::asio::any_io_executor& ex, Respond respond);

    // Checks "Authorization: Bearer <token>". Empty error_code on success.
    boost::system::error_code authorize(const Request& req, auth::TokenClaims& claims) const;

private:
    void authenticate(const Request& req, const boost::asio::any_io_executor& ex, Respond respond);
    void create_worker(const auth::TokenClaims& claims, unsigned version, bool keep_alive, Respond respond);
    void snapshot(metrics::FeedKind kind, const boost::asio::any_io_executor& ex,
                  unsigned version, bool keep_alive, Respond respond);

    session::SessionRegistry& registry_;
    const auth::CredentialStore& credentials_;
    const auth::TokenService& tokens_;
    metrics::SnapshotService& snapshots_;
    OffloadPool& pool_;
};

} // namespace psmonitor::networking
