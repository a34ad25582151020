#pragma once

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace psmonitor::session {

// 128 bits from the OpenSSL CSPRNG, Crockford base32 encoded (no I, L, O, U)
// => 26 chars after the prefix. Stateless, safe to call from any thread.
class IDGenerator {
public:
    enum class Kind { Worker, Account };

    static constexpr std::size_t kRandomBytes = 16;
    static constexpr std::size_t kEncodedLen = 26;

    std::string make(Kind kind) const {
        return std::string(prefix_of(kind)) + "-" + encode(random_bytes_());
    }

    std::string workerID() const { return make(Kind::Worker); }
    std::string accountID() const { return make(Kind::Account); }

    // Exposed for tests: 16 bytes -> 26 chars, top 2 bits of the last
    // character padding are zero.
    static std::string encode(const std::array<std::uint8_t, kRandomBytes>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out;
        out.reserve(kEncodedLen);

        std::uint32_t buffer = 0;
        int bits_in_buffer = 0;

        for (std::uint8_t byte : bytes) {
            buffer = (buffer << 8) | byte;
            bits_in_buffer += 8;

            while (bits_in_buffer >= 5) {
                int shift = bits_in_buffer - 5;
                out.push_back(alphabet[(buffer >> shift) & 0x1F]);
                bits_in_buffer -= 5;
                buffer &= (1u << bits_in_buffer) - 1u;
            }
        }

        // 128 = 25 * 5 + 3: pad the remaining 3 bits to a full symbol
        if (bits_in_buffer > 0) {
            out.push_back(alphabet[(buffer << (5 - bits_in_buffer)) & 0x1F]);
        }
        return out;
    }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Worker:  return "worker";
            case Kind::Account: return "account";
        }
        return "id";
    }

    static std::array<std::uint8_t, kRandomBytes> random_bytes_() {
        std::array<std::uint8_t, kRandomBytes> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed: CSPRNG unavailable");
        }
        return bytes;
    }
};

} // namespace psmonitor::session
