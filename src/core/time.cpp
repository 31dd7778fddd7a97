#include "core/time.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>

namespace cobalt {
namespace {

// 2^64 as a double; every double at or above it is out of range.
constexpr double UINT64_LIMIT = 18446744073709551616.0;

uint64_t scale_truncated(double value, double factor) noexcept {
    if (!(value > 0.0)) {
        return 0;
    }
    const double scaled = std::trunc(value * factor);
    if (scaled >= UINT64_LIMIT) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(scaled);
}

} // namespace

uint64_t secs_to_nanos(double secs) noexcept {
    return scale_truncated(secs, static_cast<double>(NANOSECONDS_IN_SECOND));
}

uint64_t secs_to_millis(double secs) noexcept {
    return scale_truncated(secs, static_cast<double>(MILLISECONDS_IN_SECOND));
}

uint64_t millis_to_nanos(double millis) noexcept {
    return scale_truncated(millis, static_cast<double>(NANOSECONDS_IN_MILLISECOND));
}

uint64_t micros_to_nanos(double micros) noexcept {
    return scale_truncated(micros, static_cast<double>(NANOSECONDS_IN_MICROSECOND));
}

std::string unix_nanos_to_iso8601(UnixNanos nanos) {
    using namespace std::chrono;

    const sys_time<nanoseconds> tp{nanoseconds(static_cast<int64_t>(
        std::min<uint64_t>(nanos, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))))};
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss hms{floor<nanoseconds>(tp - day)};

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%09lldZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  static_cast<long long>(hms.subseconds().count()));
    return std::string(buf);
}

UnixNanos AtomicTime::observe(UnixNanos raw) noexcept {
    uint64_t last = last_.load(std::memory_order_acquire);
    while (raw > last) {
        if (last_.compare_exchange_weak(last, raw,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
            return raw;
        }
    }
    return last;
}

UnixNanos AtomicTime::now() noexcept {
    return observe(read_system_clock_ns());
}

AtomicTime& process_time() noexcept {
    static AtomicTime instance;
    return instance;
}

UnixNanos read_system_clock_ns() noexcept {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    const auto count = since_epoch.count();
    return count > 0 ? static_cast<UnixNanos>(count) : 0;
}

double unix_timestamp() noexcept {
    return nanos_to_secs(unix_timestamp_ns());
}

uint64_t unix_timestamp_ms() noexcept {
    return nanos_to_millis(unix_timestamp_ns());
}

uint64_t unix_timestamp_us() noexcept {
    return nanos_to_micros(unix_timestamp_ns());
}

UnixNanos unix_timestamp_ns() noexcept {
    return process_time().now();
}

} // namespace cobalt
