#include <doctest/doctest.h>

#include "auth/Crypto.h"

using namespace psmonitor::auth::crypto;

namespace {

Bytes bytes_of(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

} // namespace

DOCTEST_TEST_CASE("base64url uses the URL alphabet without padding") {
    DOCTEST_CHECK_EQ(base64url_encode(std::string_view("")), "");
    DOCTEST_CHECK_EQ(base64url_encode(std::string_view("f")), "Zg");
    DOCTEST_CHECK_EQ(base64url_encode(std::string_view("fo")), "Zm8");
    DOCTEST_CHECK_EQ(base64url_encode(std::string_view("foo")), "Zm9v");
    DOCTEST_CHECK_EQ(base64url_encode(Bytes{0xFB, 0xFF}), "-_8");

    const auto decoded = base64url_decode("-_8");
    DOCTEST_REQUIRE(decoded);
    DOCTEST_CHECK(*decoded == (Bytes{0xFB, 0xFF}));

    const auto foo = base64url_decode("Zm9v");
    DOCTEST_REQUIRE(foo);
    DOCTEST_CHECK(*foo == bytes_of("foo"));
}

DOCTEST_TEST_CASE("base64url rejects the standard alphabet and bad lengths") {
    DOCTEST_CHECK_FALSE(base64url_decode("+/8"));
    DOCTEST_CHECK_FALSE(base64url_decode("Zg=="));
    DOCTEST_CHECK_FALSE(base64url_decode("Zm9vY"));
    DOCTEST_CHECK_FALSE(base64url_decode("Zm!v"));
}

DOCTEST_TEST_CASE("HMAC-SHA256 matches RFC 4231 test case 2") {
    const Bytes mac = hmac_sha256("Jefe", "what do ya want for nothing?");
    DOCTEST_CHECK_EQ(to_hex(mac), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

DOCTEST_TEST_CASE("PBKDF2-HMAC-SHA256 matches the published vector") {
    const Bytes key = pbkdf2_sha256("password", bytes_of("salt"), 1, 32);
    DOCTEST_CHECK_EQ(to_hex(key), "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

DOCTEST_TEST_CASE("hex and comparison helpers") {
    const auto raw = from_hex("00ff10");
    DOCTEST_REQUIRE(raw);
    DOCTEST_CHECK(*raw == (Bytes{0x00, 0xFF, 0x10}));
    DOCTEST_CHECK_FALSE(from_hex("abc"));
    DOCTEST_CHECK_FALSE(from_hex("zz"));

    DOCTEST_CHECK(constant_time_equal(Bytes{1, 2, 3}, Bytes{1, 2, 3}));
    DOCTEST_CHECK_FALSE(constant_time_equal(Bytes{1, 2, 3}, Bytes{1, 2, 4}));
    DOCTEST_CHECK_FALSE(constant_time_equal(Bytes{1, 2, 3}, Bytes{1, 2}));

    DOCTEST_CHECK_EQ(random_bytes(32).size(), 32u);
    DOCTEST_CHECK(random_bytes(16) != random_bytes(16));
}
