#include "auth/TokenService.h"

#include "core/Error.h"

#include <boost/json.hpp>

#include <cctype>

namespace json = boost::json;

namespace psmonitor::auth {

namespace {

constexpr char kTokenType[] = "access";

std::int64_t to_unix(TokenService::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

TokenService::TokenService(std::chrono::seconds ttl, std::string secret)
    : ttl_(ttl),
      secret_(std::move(secret)) {
    if (secret_.empty()) {
        const auto key = crypto::random_bytes(32);
        secret_.assign(key.begin(), key.end());
    }
}

std::string TokenService::sign(std::string_view payload_b64) const {
    return crypto::base64url_encode(crypto::hmac_sha256(secret_, payload_b64));
}

AccessToken TokenService::issue(const std::string& subject, Clock::time_point now) const {
    AccessToken out;
    out.expires_at = to_unix(now + ttl_);

    const std::string payload = json::serialize(json::object{
        {"sub", subject},
        {"exp", out.expires_at},
        {"type", kTokenType},
    });

    const std::string payload_b64 = crypto::base64url_encode(std::string_view(payload));
    out.token = payload_b64 + "." + sign(payload_b64);
    return out;
}

boost::system::error_code TokenService::verify(std::string_view token,
                                               TokenClaims& claims,
                                               Clock::time_point now) const {
    const auto dot = token.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= token.size()) {
        return make_error_code(errc::token_invalid);
    }

    const std::string_view payload_b64 = token.substr(0, dot);
    const auto presented = crypto::base64url_decode(token.substr(dot + 1));
    const auto expected = crypto::base64url_decode(sign(payload_b64));
    if (!presented || !expected || !crypto::constant_time_equal(*presented, *expected)) {
        return make_error_code(errc::token_invalid);
    }

    const auto payload = crypto::base64url_decode(payload_b64);
    if (!payload) return make_error_code(errc::token_invalid);

    boost::system::error_code ec;
    json::value v = json::parse(json::string_view(reinterpret_cast<const char*>(payload->data()),
                                                  payload->size()), ec);
    const json::object* obj = ec ? nullptr : v.if_object();
    if (!obj) return make_error_code(errc::token_invalid);

    const json::value* sub = obj->if_contains("sub");
    const json::value* exp = obj->if_contains("exp");
    const json::value* type = obj->if_contains("type");
    if (!sub || !sub->is_string() || !exp || !exp->is_int64() ||
        !type || !type->is_string() || type->get_string() != kTokenType) {
        return make_error_code(errc::token_invalid);
    }

    if (to_unix(now) >= exp->get_int64()) return make_error_code(errc::token_expired);

    claims.subject = json::value_to<std::string>(*sub);
    claims.expires_at = exp->get_int64();
    return {};
}

std::string_view bearer_token(std::string_view authorization) {
    constexpr std::string_view scheme = "bearer";
    if (authorization.size() <= scheme.size()) return {};

    for (std::size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(authorization[i])) != scheme[i]) return {};
    }
    if (authorization[scheme.size()] != ' ') return {};

    std::string_view rest = authorization.substr(scheme.size() + 1);
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    while (!rest.empty() && rest.back() == ' ') rest.remove_suffix(1);
    return rest;
}

} // namespace psmonitor::auth
