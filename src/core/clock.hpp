#pragma once

#include "core/identifier.hpp"
#include "core/result.hpp"
#include "core/time.hpp"
#include "core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cobalt {

/**
 * TimeEvent - raised when a timer or time alert comes due.
 */
struct TimeEvent {
    Identifier name;
    UUID4 event_id;
    UnixNanos ts_event{0};  // when the event was due
    UnixNanos ts_init{0};   // when the clock produced it
};

/**
 * Clock - a source of UNIX time.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual UnixNanos timestamp_ns() const = 0;

    [[nodiscard]] double timestamp() const { return nanos_to_secs(timestamp_ns()); }
    [[nodiscard]] uint64_t timestamp_ms() const { return nanos_to_millis(timestamp_ns()); }
    [[nodiscard]] uint64_t timestamp_us() const { return nanos_to_micros(timestamp_ns()); }
};

/**
 * LiveClock - the wall clock, read through a monotonic clamp (the process
 * clamp unless another is given).
 */
class LiveClock final : public Clock {
public:
    LiveClock() noexcept : time_(&process_time()) {}
    explicit LiveClock(AtomicTime& time) noexcept : time_(&time) {}

    [[nodiscard]] UnixNanos timestamp_ns() const override { return time_->now(); }

private:
    AtomicTime* time_;
};

/**
 * TestTimer - a repeating timer driven by explicit advance() calls.
 *
 * Fires at start + interval, start + 2 * interval, ... up to and including
 * the stop time. It expires as soon as its next fire time would pass the
 * stop time.
 */
class TestTimer {
public:
    TestTimer(Identifier name,
              uint64_t interval_ns,
              UnixNanos start_time_ns,
              std::optional<UnixNanos> stop_time_ns);

    [[nodiscard]] const Identifier& name() const noexcept { return name_; }
    [[nodiscard]] uint64_t interval_ns() const noexcept { return interval_ns_; }
    [[nodiscard]] UnixNanos start_time_ns() const noexcept { return start_time_ns_; }
    [[nodiscard]] std::optional<UnixNanos> stop_time_ns() const noexcept { return stop_time_ns_; }
    [[nodiscard]] UnixNanos next_time_ns() const noexcept { return next_time_ns_; }
    [[nodiscard]] bool is_expired() const noexcept { return expired_; }

    /**
     * Emit an event for every fire time <= to_time_ns, in order.
     */
    [[nodiscard]] std::vector<TimeEvent> advance(UnixNanos to_time_ns);

    /**
     * Drop every fire time <= time_ns without emitting events.
     */
    void skip_through(UnixNanos time_ns);

private:
    [[nodiscard]] bool past_stop(UnixNanos time_ns) const noexcept;

    Identifier name_;
    uint64_t interval_ns_;
    UnixNanos start_time_ns_;
    std::optional<UnixNanos> stop_time_ns_;
    UnixNanos next_time_ns_;
    bool expired_ = false;
};

/**
 * TestClock - a clock whose time only moves when told to.
 *
 * Holds named timers and one-shot time alerts; advance_time() collects the
 * events that came due and drops timers that are done. Not thread-safe.
 */
class TestClock final : public Clock {
public:
    TestClock() = default;
    explicit TestClock(UnixNanos start_time_ns) : time_ns_(start_time_ns) {}

    [[nodiscard]] UnixNanos timestamp_ns() const override { return time_ns_; }

    /**
     * Jump to `to_time_ns` without firing anything. Fire times at or before
     * the new time are dropped; timers left with none are removed.
     */
    void set_time(UnixNanos to_time_ns);

    /**
     * One-shot alert. An alert time in the past is moved to now.
     */
    [[nodiscard]] Result<void> set_time_alert_ns(std::string_view name, UnixNanos alert_time_ns);

    /**
     * Repeating timer. A start time of 0 means now; no stop time means it
     * runs until cancelled. With a start time in the past the first fire
     * time is the first one after now.
     */
    [[nodiscard]] Result<void> set_timer_ns(std::string_view name,
                                            uint64_t interval_ns,
                                            UnixNanos start_time_ns,
                                            std::optional<UnixNanos> stop_time_ns);

    /**
     * Collect the events due in (now, to_time_ns], ordered by ts_event and
     * then by name. An alert set for the current time is due now and fires
     * on the next advance. Moves the clock to `to_time_ns` when `set_time` is true.
     * Fails if `to_time_ns` is before the current time.
     */
    [[nodiscard]] Result<std::vector<TimeEvent>> advance_time(UnixNanos to_time_ns,
                                                              bool set_time = true);

    [[nodiscard]] Result<void> cancel_timer(std::string_view name);
    void cancel_timers();

    [[nodiscard]] std::vector<std::string> timer_names() const;
    [[nodiscard]] std::size_t timer_count() const noexcept { return timers_.size(); }
    [[nodiscard]] std::optional<UnixNanos> next_time_ns(std::string_view name) const;

    /**
     * Next fire time of every timer, in timer name order.
     */
    [[nodiscard]] std::vector<UnixNanos> next_times() const;

private:
    [[nodiscard]] Result<Identifier> register_name(std::string_view name) const;

    UnixNanos time_ns_ = 0;
    std::map<std::string, TestTimer, std::less<>> timers_;
};

} // namespace cobalt
