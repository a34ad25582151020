#pragma once

#include "auth/Crypto.h"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace psmonitor::auth {

struct AccessToken {
    std::string token;
    std::int64_t expires_at = 0;   // Unix seconds
};

struct TokenClaims {
    std::string subject;
    std::int64_t expires_at = 0;
};

// Issues and verifies self-contained HMAC-SHA256 bearer tokens:
//   base64url(payload) "." base64url(hmac(secret, base64url(payload)))
// payload = {"sub": ..., "exp": <unix seconds>, "type": "access"}
class TokenService {
public:
    using Clock = std::chrono::system_clock;

    // An empty secret is replaced by 32 random bytes, so tokens do not
    // survive a restart.
    explicit TokenService(std::chrono::seconds ttl = std::chrono::seconds(60),
                          std::string secret = {});

    AccessToken issue(const std::string& subject, Clock::time_point now = Clock::now()) const;

    // errc::token_invalid for malformed tokens, bad signatures or a wrong
    // token type; errc::token_expired once now >= exp.
    boost::system::error_code verify(std::string_view token,
                                     TokenClaims& claims,
                                     Clock::time_point now = Clock::now()) const;

    std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    std::string sign(std::string_view payload_b64) const;

    std::chrono::seconds ttl_;
    std::string secret_;
};

// Extracts the token from an "Authorization: Bearer <token>" header value.
// Returns an empty view when the scheme is missing or wrong.
std::string_view bearer_token(std::string_view authorization);

} // namespace psmonitor::auth
