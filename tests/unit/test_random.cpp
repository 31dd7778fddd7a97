#include <catch2/catch_test_macros.hpp>
#include "crypto/random.hpp"

#include <algorithm>

using namespace cobalt;

TEST_CASE("crypto::init is idempotent", "[crypto]") {
    REQUIRE(crypto::init().is_ok());
    REQUIRE(crypto::init().is_ok());
}

TEST_CASE("crypto::random_bytes fills the buffer", "[crypto]") {
    const auto a = crypto::random_bytes<32>();
    const auto b = crypto::random_bytes<32>();

    REQUIRE(a != b);
    REQUIRE(std::any_of(a.begin(), a.end(), [](uint8_t x) { return x != 0; }));
}

TEST_CASE("crypto::fill_random accepts zero length", "[crypto]") {
    uint8_t byte = 0xAB;
    crypto::fill_random(&byte, 0);
    REQUIRE(byte == 0xAB);
}
