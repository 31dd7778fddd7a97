#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/time.hpp"

#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace cobalt;

TEST_CASE("Time: float conversions scale and truncate", "[time]") {
    REQUIRE(secs_to_nanos(1.0) == 1'000'000'000ULL);
    REQUIRE(secs_to_nanos(1.1) == 1'100'000'000ULL);
    REQUIRE(secs_to_millis(1.5) == 1'500ULL);
    REQUIRE(secs_to_millis(0.0019) == 1ULL);
    REQUIRE(millis_to_nanos(1.0) == 1'000'000ULL);
    REQUIRE(millis_to_nanos(0.0000015) == 1ULL);
    REQUIRE(micros_to_nanos(1.0) == 1'000ULL);
    REQUIRE(micros_to_nanos(2.9999) == 2'999ULL);
}

TEST_CASE("Time: negative, NaN and huge inputs are clamped", "[time]") {
    REQUIRE(secs_to_nanos(-1.0) == 0);
    REQUIRE(secs_to_nanos(std::nan("")) == 0);
    REQUIRE(millis_to_nanos(-0.5) == 0);
    REQUIRE(secs_to_nanos(1e30) == std::numeric_limits<uint64_t>::max());
    REQUIRE(secs_to_nanos(std::numeric_limits<double>::infinity()) ==
            std::numeric_limits<uint64_t>::max());
}

TEST_CASE("Time: integer conversions divide", "[time]") {
    REQUIRE(nanos_to_secs(1'500'000'000ULL) == Catch::Approx(1.5));
    REQUIRE(nanos_to_secs(1ULL) == Catch::Approx(1e-9));
    REQUIRE(nanos_to_millis(1'999'999ULL) == 1ULL);
    REQUIRE(nanos_to_micros(1'999ULL) == 1ULL);
    REQUIRE(nanos_to_millis(0) == 0);
}

TEST_CASE("Time: ISO 8601 formatting", "[time]") {
    REQUIRE(unix_nanos_to_iso8601(0) == "1970-01-01T00:00:00.000000000Z");
    REQUIRE(unix_nanos_to_iso8601(1'546'300'800'000'000'123ULL) ==
            "2019-01-01T00:00:00.000000123Z");
    REQUIRE(unix_nanos_to_iso8601(2'678'401'000'000'000ULL) ==
            "1970-02-01T00:00:01.000000000Z");
}

TEST_CASE("AtomicTime: clamps regressions", "[time]") {
    AtomicTime time;
    REQUIRE(time.observe(100) == 100);
    REQUIRE(time.observe(90) == 100);
    REQUIRE(time.observe(100) == 100);
    REQUIRE(time.observe(150) == 150);
    REQUIRE(time.last() == 150);
}

TEST_CASE("AtomicTime: seed sets the floor", "[time]") {
    AtomicTime time(1'000);
    REQUIRE(time.observe(1) == 1'000);
}

TEST_CASE("AtomicTime: concurrent observers never see a regression", "[time]") {
    AtomicTime time;
    constexpr int threads = 4;
    constexpr int per_thread = 10'000;
    std::vector<std::thread> workers;
    std::vector<char> ordered(threads, 1);

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            UnixNanos last = 0;
            for (int i = 0; i < per_thread; ++i) {
                // Raw values jitter backwards every other step.
                const UnixNanos raw = static_cast<UnixNanos>(i * 10 + (i % 2 == 0 ? 15 : 0));
                const UnixNanos seen = time.observe(raw);
                if (seen < last) ordered[t] = 0;
                last = seen;
            }
        });
    }
    for (auto& w : workers) w.join();

    for (char ok : ordered) REQUIRE(ok == 1);
}

TEST_CASE("Time: unix timestamps are current and non-decreasing", "[time]") {
    // 2020-01-01T00:00:00Z
    constexpr UnixNanos lower_bound = 1'577'836'800'000'000'000ULL;

    UnixNanos last_ns = 0;
    uint64_t last_us = 0;
    uint64_t last_ms = 0;
    double last_s = 0.0;
    for (int i = 0; i < 10'000; ++i) {
        const auto ns = unix_timestamp_ns();
        const auto us = unix_timestamp_us();
        const auto ms = unix_timestamp_ms();
        const auto s = unix_timestamp();
        REQUIRE(ns >= lower_bound);
        REQUIRE(ns >= last_ns);
        REQUIRE(us >= last_us);
        REQUIRE(ms >= last_ms);
        REQUIRE(s >= last_s);
        last_ns = ns;
        last_us = us;
        last_ms = ms;
        last_s = s;
    }
    REQUIRE(read_system_clock_ns() >= lower_bound);
}
