#include <catch2/catch_test_macros.hpp>
#include "core/correctness.hpp"
#include "core/identifier.hpp"

#include <unordered_set>

using namespace cobalt;

TEST_CASE("check_valid_string accepts ordinary names", "[correctness]") {
    REQUIRE(check_valid_string("timer-1", "name").is_ok());
    REQUIRE(check_valid_string(" padded ", "name").is_ok());
}

TEST_CASE("check_valid_string rejects empty, blank and non-ASCII", "[correctness]") {
    const auto empty = check_valid_string("", "name");
    REQUIRE(empty.is_err());
    REQUIRE(empty.unwrap_err().message == "name string was empty");
    REQUIRE(empty.unwrap_err().kind == ErrorKind::InvalidArgument);

    REQUIRE(check_valid_string(" \t\n", "name").is_err());
    REQUIRE(check_valid_string("caf\xc3\xa9", "name").is_err());
}

TEST_CASE("check_positive_u64 rejects zero", "[correctness]") {
    REQUIRE(check_positive_u64(1, "interval").is_ok());
    const auto zero = check_positive_u64(0, "interval");
    REQUIRE(zero.is_err());
    REQUIRE(zero.unwrap_err().message == "interval was not positive, was 0");
}

TEST_CASE("check_predicate_true reports the message", "[correctness]") {
    REQUIRE(check_predicate_true(true, "unused").is_ok());
    REQUIRE(check_predicate_true(false, "stop before start").unwrap_err().message ==
            "stop before start");
}

TEST_CASE("Identifier: create validates", "[identifier]") {
    const auto id = Identifier::create("O-001");
    REQUIRE(id.is_ok());
    REQUIRE(id.unwrap().value() == "O-001");
    REQUIRE(id.unwrap().as_str() == "O-001");

    REQUIRE(Identifier::create("").is_err());
    REQUIRE(Identifier::create("   ").is_err());
}

TEST_CASE("Identifier: equality, ordering and hashing follow the value", "[identifier]") {
    const auto a = Identifier::create("alpha").unwrap();
    const auto a2 = Identifier::create("alpha").unwrap();
    const auto b = Identifier::create("beta").unwrap();

    REQUIRE(a == a2);
    REQUIRE(a < b);

    std::unordered_set<Identifier> ids{a, a2, b};
    REQUIRE(ids.size() == 2);
}
