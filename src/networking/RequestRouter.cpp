#include "networking/RequestRouter.h"

#include "core/Error.h"
#include "core/Logger.h"

#include <boost/asio/post.hpp>
#include <boost/json.hpp>

#include <optional>
#include <utility>

namespace psmonitor::networking {

namespace asio = boost::asio;
namespace json = boost::json;

namespace {

constexpr char kServerName[] = "psmonitor";
constexpr char kIndexBody[] = "silence is golden.";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void add_cors(Response& res) {
    res.set("Access-Control-Allow-Origin", "*");
    res.set("Access-Control-Allow-Headers", "x-requested-with, authorization, content-type");
    res.set("Access-Control-Allow-Methods", "POST, GET, OPTIONS");
}

Response bad_request(const std::string& message, unsigned version, bool keep_alive) {
    return json_response(http::status::bad_request,
                         json::object{{"error", error_name(make_error_code(errc::bad_request))},
                                      {"message", message}},
                         version, keep_alive);
}

Response method_not_allowed(unsigned version, bool keep_alive) {
    return json_response(http::status::method_not_allowed,
                         json::object{{"error", "method_not_allowed"},
                                      {"message", "method not allowed"}},
                         version, keep_alive);
}

// Reads a required string member; empty optional when missing or mistyped.
std::optional<std::string> string_field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) return std::nullopt;
    return json::value_to<std::string>(*v);
}

} // namespace

Target parse_target(std::string_view target) {
    Target out;
    const auto q = target.find('?');
    out.path = std::string(target.substr(0, q));
    if (q == std::string_view::npos) return out;

    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
        const auto amp = rest.find('&');
        const std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view() : rest.substr(amp + 1);
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        std::string key = percent_decode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string() : percent_decode(pair.substr(eq + 1));
        // first occurrence wins
        out.query.emplace(std::move(key), std::move(value));
    }
    return out;
}

Response json_response(http::status status, const json::value& body, unsigned version, bool keep_alive) {
    Response res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    add_cors(res);
    res.keep_alive(keep_alive);
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

http::status status_for(const boost::system::error_code& ec) {
    if (ec.category() != error_category()) return http::status::internal_server_error;

    switch (static_cast<errc>(ec.value())) {
    case errc::invalid_credentials:
    case errc::token_expired:
    case errc::token_invalid:
        return http::status::unauthorized;
    case errc::not_found:
        return http::status::not_found;
    case errc::already_claimed:
        return http::status::conflict;
    case errc::subject_mismatch:
        return http::status::forbidden;
    case errc::capacity_exceeded:
    case errc::pool_stopped:
    case errc::shutting_down:
        return http::status::service_unavailable;
    case errc::bad_request:
        return http::status::bad_request;
    case errc::provider_failure:
        break;
    }
    return http::status::internal_server_error;
}

Response error_response(const boost::system::error_code& ec, unsigned version, bool keep_alive) {
    return json_response(status_for(ec),
                         json::object{{"error", error_name(ec)}, {"message", ec.message()}},
                         version, keep_alive);
}

RequestRouter::RequestRouter(session::SessionRegistry& registry,
                             const auth::CredentialStore& credentials,
                             const auth::TokenService& tokens,
                             metrics::SnapshotService& snapshots,
                             OffloadPool& pool)
    : registry_(registry),
      credentials_(credentials),
      tokens_(tokens),
      snapshots_(snapshots),
      pool_(pool) {}

boost::system::error_code RequestRouter::authorize(const Request& req, auth::TokenClaims& claims) const {
    const auto header = req.find(http::field::authorization);
    if (header == req.end()) return make_error_code(errc::token_invalid);

    const auto value = header->value();
    const std::string_view token = auth::bearer_token(std::string_view(value.data(), value.size()));
    if (token.empty()) return make_error_code(errc::token_invalid);

    return tokens_.verify(token, claims);
}

void RequestRouter::handle(const Request& req, const asio::any_io_executor& ex, Respond respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    const Target target = parse_target(std::string_view(req.target().data(), req.target().size()));

    PSM_LOG_DEBUG("[Router] " << req.method_string() << " " << req.target());

    // respond() never runs inside handle()
    auto reply = [ex, respond](Response res) mutable {
        asio::post(ex, [respond = std::move(respond), res = std::move(res)]() mutable {
            respond(std::move(res));
        });
    };

    if (req.method() == http::verb::options) {
        Response res{http::status::no_content, version};
        res.set(http::field::server, kServerName);
        add_cors(res);
        res.keep_alive(keep_alive);
        res.prepare_payload();
        return reply(std::move(res));
    }

    if (target.path == "/") {
        if (req.method() != http::verb::get) return reply(method_not_allowed(version, keep_alive));
        Response res{http::status::ok, version};
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, "text/plain");
        add_cors(res);
        res.keep_alive(keep_alive);
        res.body() = kIndexBody;
        res.prepare_payload();
        return reply(std::move(res));
    }

    if (target.path == "/authenticate") {
        if (req.method() != http::verb::post) return reply(method_not_allowed(version, keep_alive));
        return authenticate(req, ex, std::move(respond));
    }

    if (target.path == "/worker" || target.path == "/system" || target.path == "/network") {
        const http::verb expected = target.path == "/worker" ? http::verb::post : http::verb::get;
        if (req.method() != expected) return reply(method_not_allowed(version, keep_alive));

        auth::TokenClaims claims;
        if (auto ec = authorize(req, claims)) {
            PSM_LOG_INFO("[Router] " << target.path << " rejected: " << ec.message());
            return reply(error_response(ec, version, keep_alive));
        }

        if (target.path == "/worker") return create_worker(claims, version, keep_alive, std::move(reply));

        const auto kind = target.path == "/system" ? metrics::FeedKind::System : metrics::FeedKind::Network;
        return snapshot(kind, ex, version, keep_alive, std::move(respond));
    }

    if (target.path == "/connect") {
        return reply(bad_request("websocket upgrade required", version, keep_alive));
    }

    reply(json_response(http::status::not_found,
                        json::object{{"error", "not_found"}, {"message", "no such route"}},
                        version, keep_alive));
}

void RequestRouter::authenticate(const Request& req, const asio::any_io_executor& ex, Respond respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    boost::system::error_code ec;
    json::value body = json::parse(req.body(), ec);
    if (ec || !body.is_object()) {
        asio::post(ex, [respond = std::move(respond), version, keep_alive]() mutable {
            respond(bad_request("expected a JSON object", version, keep_alive));
        });
        return;
    }

    auto username = string_field(body.get_object(), "username");
    auto password = string_field(body.get_object(), "password");
    if (!username || !password) {
        asio::post(ex, [respond = std::move(respond), version, keep_alive]() mutable {
            respond(bad_request("username and password are required", version, keep_alive));
        });
        return;
    }

    struct Outcome {
        boost::system::error_code ec;
        std::string subject;
    };

    // PBKDF2 runs on the pool
    const auth::CredentialStore& credentials = credentials_;
    pool_.submit(
        [&credentials, username = std::move(*username), password = std::move(*password)] {
            Outcome out;
            out.ec = credentials.authenticate(username, password, out.subject);
            return out;
        },
        ex,
        [this, respond = std::move(respond), version, keep_alive](TaskResult<Outcome> r) mutable {
            if (r.ec) {
                PSM_LOG_ERROR("[Router] authenticate: " << r.ec.message());
                return respond(error_response(r.ec, version, keep_alive));
            }
            if (r.value.ec) {
                PSM_LOG_INFO("[Router] authenticate rejected");
                return respond(error_response(r.value.ec, version, keep_alive));
            }

            const auth::AccessToken token = tokens_.issue(r.value.subject);
            respond(json_response(http::status::ok,
                                  json::object{{"token", token.token}, {"expires_at", token.expires_at}},
                                  version, keep_alive));
        });
}

void RequestRouter::create_worker(const auth::TokenClaims& claims, unsigned version, bool keep_alive,
                                  Respond respond) {
    const std::string id = registry_.create(claims.subject);
    PSM_LOG_INFO("[Router] worker " << id << " created for " << claims.subject);
    respond(json_response(http::status::ok, json::object{{"id", id}}, version, keep_alive));
}

void RequestRouter::snapshot(metrics::FeedKind kind, const asio::any_io_executor& ex,
                             unsigned version, bool keep_alive, Respond respond) {
    snapshots_.gather(kind, ex, [respond = std::move(respond), version, keep_alive](json::object snapshot) mutable {
        respond(json_response(http::status::ok, snapshot, version, keep_alive));
    });
}

} // namespace psmonitor::networking
