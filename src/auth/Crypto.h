#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Thin wrappers over OpenSSL for the token and credential code.
namespace psmonitor::auth::crypto {

using Bytes = std::vector<std::uint8_t>;

// Throws std::runtime_error if the CSPRNG fails.
Bytes random_bytes(std::size_t n);

Bytes hmac_sha256(std::string_view key, std::string_view data);

Bytes pbkdf2_sha256(std::string_view password, const Bytes& salt, int iterations,
                    std::size_t length = 32);

bool constant_time_equal(const Bytes& a, const Bytes& b);

// RFC 4648 section 5 alphabet, no padding.
std::string base64url_encode(const Bytes& data);
std::string base64url_encode(std::string_view data);
std::optional<Bytes> base64url_decode(std::string_view text);

std::string to_hex(const Bytes& data);
std::optional<Bytes> from_hex(std::string_view text);

} // namespace psmonitor::auth::crypto
