#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace cobalt {

/**
 * Nanoseconds since the UNIX epoch.
 */
using UnixNanos = uint64_t;

inline constexpr uint64_t MILLISECONDS_IN_SECOND = 1'000;
inline constexpr uint64_t NANOSECONDS_IN_SECOND = 1'000'000'000;
inline constexpr uint64_t NANOSECONDS_IN_MILLISECOND = 1'000'000;
inline constexpr uint64_t NANOSECONDS_IN_MICROSECOND = 1'000;

// Floating inputs are truncated toward zero. Negative and NaN inputs give 0,
// values past the uint64_t range saturate.
[[nodiscard]] uint64_t secs_to_nanos(double secs) noexcept;
[[nodiscard]] uint64_t secs_to_millis(double secs) noexcept;
[[nodiscard]] uint64_t millis_to_nanos(double millis) noexcept;
[[nodiscard]] uint64_t micros_to_nanos(double micros) noexcept;

[[nodiscard]] constexpr double nanos_to_secs(uint64_t nanos) noexcept {
    return static_cast<double>(nanos) / static_cast<double>(NANOSECONDS_IN_SECOND);
}

[[nodiscard]] constexpr uint64_t nanos_to_millis(uint64_t nanos) noexcept {
    return nanos / NANOSECONDS_IN_MILLISECOND;
}

[[nodiscard]] constexpr uint64_t nanos_to_micros(uint64_t nanos) noexcept {
    return nanos / NANOSECONDS_IN_MICROSECOND;
}

/**
 * Format as ISO 8601 UTC with nanosecond precision.
 * Format: YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ
 */
[[nodiscard]] std::string unix_nanos_to_iso8601(UnixNanos nanos);

/**
 * AtomicTime - monotonic clamp over a clock that may stall or step back.
 *
 * observe() returns max(raw, last reported value) and records it, so a
 * sequence of observations never decreases. The first observation seeds the
 * state; there is nothing to tear down.
 */
class AtomicTime {
public:
    AtomicTime() noexcept = default;
    explicit AtomicTime(UnixNanos seed) noexcept : last_(seed) {}

    AtomicTime(const AtomicTime&) = delete;
    AtomicTime& operator=(const AtomicTime&) = delete;

    UnixNanos observe(UnixNanos raw) noexcept;

    /**
     * Read the system clock and observe it.
     */
    UnixNanos now() noexcept;

    [[nodiscard]] UnixNanos last() const noexcept {
        return last_.load(std::memory_order_acquire);
    }

private:
    std::atomic<uint64_t> last_{0};
};

/**
 * The process-wide clamp used by every unix_timestamp query.
 */
AtomicTime& process_time() noexcept;

/**
 * Raw wall clock read, nanoseconds since the epoch (0 before the epoch).
 */
[[nodiscard]] UnixNanos read_system_clock_ns() noexcept;

// Wall clock through process_time(); non-decreasing within a process.
[[nodiscard]] double unix_timestamp() noexcept;
[[nodiscard]] uint64_t unix_timestamp_ms() noexcept;
[[nodiscard]] uint64_t unix_timestamp_us() noexcept;
[[nodiscard]] UnixNanos unix_timestamp_ns() noexcept;

} // namespace cobalt
