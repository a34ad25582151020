#include "auth/Crypto.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace psmonitor::auth::crypto {

Bytes random_bytes(std::size_t n) {
    Bytes out(n);
    if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

Bytes hmac_sha256(std::string_view key, std::string_view data) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                       out.data(), &len);
    if (!result) throw std::runtime_error("HMAC-SHA256 failed");
    out.resize(len);
    return out;
}

Bytes pbkdf2_sha256(std::string_view password, const Bytes& salt, int iterations, std::size_t length) {
    Bytes out(length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(length), out.data()) != 1) {
        throw std::runtime_error("PBKDF2 failed");
    }
    return out;
}

bool constant_time_equal(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string base64url_encode(const Bytes& data) {
    if (data.empty()) return {};

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string base64url_encode(std::string_view data) {
    return base64url_encode(Bytes(data.begin(), data.end()));
}

std::optional<Bytes> base64url_decode(std::string_view text) {
    if (text.size() % 4 == 1) return std::nullopt;

    std::string b64;
    b64.reserve(text.size() + 3);
    for (char c : text) {
        if (c == '-') b64.push_back('+');
        else if (c == '_') b64.push_back('/');
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
        else b64.push_back(c);
    }
    const std::size_t padding = (4 - b64.size() % 4) % 4;
    b64.append(padding, '=');
    if (b64.empty()) return Bytes{};

    Bytes out(3 * b64.size() / 4);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()),
                                  static_cast<int>(b64.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock counts the padding as zero bytes
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::string to_hex(const Bytes& data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = nibble(text[i]);
        const int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace psmonitor::auth::crypto
