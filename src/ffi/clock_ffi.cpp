#include "ffi/cobalt_core.h"

#include "core/clock.hpp"
#include "core/cstring.hpp"
#include "core/cvec.hpp"
#include "ffi/ffi_guard.hpp"

#include <memory>
#include <optional>
#include <vector>

struct TestClock_API {
    cobalt::TestClock clock;
};

namespace {

// Releases the strings owned by each event, then the block.
struct TimeEventsDrop {
    void operator()(CVec raw) const noexcept {
        auto* events = static_cast<TimeEvent_t*>(raw.ptr);
        for (uintptr_t i = 0; i < raw.len; ++i) {
            cobalt::OwnedCString name(events[i].name);
            cobalt::OwnedCString event_id(events[i].event_id.value);
        }
        cobalt::deallocate_block(raw.ptr);
    }
};

using OwnedTimeEvents = cobalt::OwnedCVec<TimeEvent_t, TimeEventsDrop>;

TimeEvent_t to_c_event(const cobalt::TimeEvent& event) {
    TimeEvent_t out{};
    out.name = cobalt::make_owned_cstring(event.name.as_str()).release();
    out.event_id.value = cobalt::make_owned_cstring(event.event_id.to_string()).release();
    out.ts_event = event.ts_event;
    out.ts_init = event.ts_init;
    return out;
}

CVec to_c_events(const std::vector<cobalt::TimeEvent>& events) {
    std::vector<TimeEvent_t> out;
    out.reserve(events.size());
    for (const auto& event : events) {
        out.push_back(to_c_event(event));
    }
    qCDebug(cobaltFfiLog) << "advance_time returned" << out.size() << "events";
    return OwnedTimeEvents::from_vector(out).release();
}

uint8_t report(const char* where, const cobalt::Result<void>& result) {
    const auto& checked = result.inspect_err([where](const cobalt::Error& error) {
        qCWarning(cobaltFfiLog) << where << error.message.c_str();
    });
    return checked.is_ok() ? 1 : 0;
}

} // namespace

extern "C" {

TestClock_API *cobalt_test_clock_new(void) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_new", [] {
        return std::make_unique<TestClock_API>().release();
    });
}

void cobalt_test_clock_drop(TestClock_API *clock) {
    std::unique_ptr<TestClock_API> owned(clock);
}

void cobalt_test_clock_set_time(TestClock_API *clock, uint64_t to_time_ns) {
    clock->clock.set_time(to_time_ns);
}

uint64_t cobalt_test_clock_timestamp_ns(const TestClock_API *clock) {
    return clock->clock.timestamp_ns();
}

uint8_t cobalt_test_clock_set_time_alert_ns(TestClock_API *clock,
                                            const char *name,
                                            uint64_t alert_time_ns) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_set_time_alert_ns", [&] {
        return report("cobalt_test_clock_set_time_alert_ns:",
                      clock->clock.set_time_alert_ns(cobalt::borrow_cstring(name).value_or(""),
                                                     alert_time_ns));
    });
}

uint8_t cobalt_test_clock_set_timer_ns(TestClock_API *clock,
                                       const char *name,
                                       uint64_t interval_ns,
                                       uint64_t start_time_ns,
                                       uint64_t stop_time_ns) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_set_timer_ns", [&] {
        std::optional<uint64_t> stop;
        if (stop_time_ns != 0) {
            stop = stop_time_ns;
        }
        return report("cobalt_test_clock_set_timer_ns:",
                      clock->clock.set_timer_ns(cobalt::borrow_cstring(name).value_or(""),
                                                interval_ns, start_time_ns, stop));
    });
}

CVec cobalt_test_clock_advance_time(TestClock_API *clock,
                                    uint64_t to_time_ns,
                                    uint8_t set_time) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_advance_time", [&] {
        return clock->clock.advance_time(to_time_ns, set_time != 0)
            .map(to_c_events)
            .inspect_err([](const cobalt::Error& error) {
                qCWarning(cobaltFfiLog) << "cobalt_test_clock_advance_time:"
                                        << error.message.c_str();
            })
            .value_or(cobalt::empty_cvec());
    });
}

void cobalt_vec_time_events_drop(CVec events) {
    OwnedTimeEvents owned(events);
}

CVec cobalt_test_clock_next_times(const TestClock_API *clock) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_next_times", [&] {
        return cobalt::OwnedCVec<uint64_t>::from_vector(clock->clock.next_times()).release();
    });
}

uint8_t cobalt_test_clock_cancel_timer(TestClock_API *clock, const char *name) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_cancel_timer", [&] {
        return report("cobalt_test_clock_cancel_timer:",
                      clock->clock.cancel_timer(cobalt::borrow_cstring(name).value_or("")));
    });
}

void cobalt_test_clock_cancel_timers(TestClock_API *clock) {
    clock->clock.cancel_timers();
}

uintptr_t cobalt_test_clock_timer_count(const TestClock_API *clock) {
    return clock->clock.timer_count();
}

uint64_t cobalt_test_clock_next_time_ns(const TestClock_API *clock, const char *name) {
    return cobalt::ffi::fatal_on_exception("cobalt_test_clock_next_time_ns", [&] {
        return clock->clock.next_time_ns(cobalt::borrow_cstring(name).value_or("")).value_or(0);
    });
}

} // extern "C"
