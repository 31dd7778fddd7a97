#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/time.hpp"

#include <vector>

using namespace cobalt;

TEST_CASE("Property: whole seconds scale exactly", "[property][time]") {
    REQUIRE(rc::check("secs_to_nanos(s) == s * 10^9 for whole seconds",
        []() {
            const auto secs = *rc::gen::inRange<uint64_t>(0, 4'000'000'000ULL);
            RC_ASSERT(secs_to_nanos(static_cast<double>(secs)) == secs * NANOSECONDS_IN_SECOND);
            RC_ASSERT(secs_to_millis(static_cast<double>(secs)) == secs * MILLISECONDS_IN_SECOND);
        }
    ));
}

TEST_CASE("Property: whole millis and micros scale exactly", "[property][time]") {
    REQUIRE(rc::check("millis_to_nanos and micros_to_nanos are exact on integers",
        []() {
            const auto n = *rc::gen::inRange<uint64_t>(0, 1ULL << 38);
            RC_ASSERT(millis_to_nanos(static_cast<double>(n)) == n * NANOSECONDS_IN_MILLISECOND);
            RC_ASSERT(micros_to_nanos(static_cast<double>(n)) == n * NANOSECONDS_IN_MICROSECOND);
        }
    ));
}

TEST_CASE("Property: nanos to secs and back stays within two microseconds", "[property][time]") {
    REQUIRE(rc::check("secs_to_nanos(nanos_to_secs(n)) ~= n",
        []() {
            // Up to year ~2096, where a double second keeps sub-microsecond resolution.
            const auto nanos = *rc::gen::inRange<uint64_t>(0, 4'000'000'000'000'000'000ULL);
            const auto back = secs_to_nanos(nanos_to_secs(nanos));
            const auto diff = back > nanos ? back - nanos : nanos - back;
            RC_ASSERT(diff <= 2'000ULL);
        }
    ));
}

TEST_CASE("Property: integer divisions agree with each other", "[property][time]") {
    REQUIRE(rc::check("nanos_to_millis(n) == nanos_to_micros(n) / 1000",
        [](uint64_t nanos) {
            RC_ASSERT(nanos_to_millis(nanos) == nanos_to_micros(nanos) / 1'000);
            RC_ASSERT(nanos_to_micros(nanos) * NANOSECONDS_IN_MICROSECOND <= nanos);
        }
    ));
}

TEST_CASE("Property: AtomicTime output never decreases", "[property][time]") {
    REQUIRE(rc::check("observe() over any raw sequence is non-decreasing and >= each input",
        [](const std::vector<uint64_t>& raw) {
            AtomicTime time;
            uint64_t last = 0;
            for (auto value : raw) {
                const auto seen = time.observe(value);
                RC_ASSERT(seen >= last);
                RC_ASSERT(seen >= value);
                last = seen;
            }
        }
    ));
}
