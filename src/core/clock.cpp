#include "core/clock.hpp"
#include "core/correctness.hpp"
#include "logging/logging.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <tuple>

namespace cobalt {
namespace {

UnixNanos saturating_add(UnixNanos a, uint64_t b) noexcept {
    if (b > std::numeric_limits<UnixNanos>::max() - a) {
        return std::numeric_limits<UnixNanos>::max();
    }
    return a + b;
}

} // namespace

TestTimer::TestTimer(Identifier name,
                     uint64_t interval_ns,
                     UnixNanos start_time_ns,
                     std::optional<UnixNanos> stop_time_ns)
    : name_(std::move(name)),
      interval_ns_(interval_ns),
      start_time_ns_(start_time_ns),
      stop_time_ns_(stop_time_ns),
      next_time_ns_(saturating_add(start_time_ns, interval_ns)) {
    expired_ = past_stop(next_time_ns_);
}

std::vector<TimeEvent> TestTimer::advance(UnixNanos to_time_ns) {
    std::vector<TimeEvent> events;
    while (!expired_ && next_time_ns_ <= to_time_ns) {
        if (past_stop(next_time_ns_)) {
            expired_ = true;
            break;
        }
        events.push_back(TimeEvent{name_, UUID4::generate(), next_time_ns_, to_time_ns});

        if (interval_ns_ == 0 || next_time_ns_ == std::numeric_limits<UnixNanos>::max()) {
            expired_ = true;
        } else {
            next_time_ns_ = saturating_add(next_time_ns_, interval_ns_);
            expired_ = past_stop(next_time_ns_);
        }
    }
    return events;
}

void TestTimer::skip_through(UnixNanos time_ns) {
    if (expired_ || next_time_ns_ > time_ns) {
        return;
    }
    if (interval_ns_ == 0) {
        expired_ = true;
        return;
    }
    const uint64_t steps = (time_ns - next_time_ns_) / interval_ns_ + 1;
    if (steps > (std::numeric_limits<UnixNanos>::max() - next_time_ns_) / interval_ns_) {
        expired_ = true;
        return;
    }
    next_time_ns_ += steps * interval_ns_;
    expired_ = past_stop(next_time_ns_);
}

bool TestTimer::past_stop(UnixNanos time_ns) const noexcept {
    return stop_time_ns_ && time_ns > *stop_time_ns_;
}

void TestClock::set_time(UnixNanos to_time_ns) {
    qCDebug(cobaltClockLog) << "set_time" << to_time_ns;
    time_ns_ = to_time_ns;
    for (auto it = timers_.begin(); it != timers_.end();) {
        it->second.skip_through(time_ns_);
        if (it->second.is_expired()) {
            qCDebug(cobaltClockLog) << "set_time dropped" << it->first.c_str();
            it = timers_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<Identifier> TestClock::register_name(std::string_view name) const {
    return Identifier::create(name).and_then([&](const Identifier& id) {
        if (timers_.find(name) != timers_.end()) {
            return Result<Identifier>::err(
                Error{"timer '" + std::string(name) + "' already exists", ErrorKind::Duplicate});
        }
        return Result<Identifier>::ok(id);
    });
}

Result<void> TestClock::set_time_alert_ns(std::string_view name, UnixNanos alert_time_ns) {
    return register_name(name).and_then([&](const Identifier& id) {
        const UnixNanos fire_at = std::max(alert_time_ns, time_ns_);
        TestTimer alert(id, fire_at - time_ns_, time_ns_, fire_at);
        qCDebug(cobaltClockLog) << "set_time_alert" << id.value().c_str() << "at" << fire_at;
        timers_.emplace(id.value(), std::move(alert));
        return Result<void>::ok();
    });
}

Result<void> TestClock::set_timer_ns(std::string_view name,
                                     uint64_t interval_ns,
                                     UnixNanos start_time_ns,
                                     std::optional<UnixNanos> stop_time_ns) {
    return register_name(name).and_then([&](const Identifier& id) {
        return check_positive_u64(interval_ns, "interval_ns").and_then([&] {
            const UnixNanos start = start_time_ns == 0 ? time_ns_ : start_time_ns;
            TestTimer timer(id, interval_ns, start, stop_time_ns);
            // Fire times at or before the current time are never delivered.
            timer.skip_through(time_ns_);
            return check_predicate_true(
                       !timer.is_expired(),
                       "stop_time_ns must be at or after the first fire time")
                .and_then([&] {
                    qCDebug(cobaltClockLog) << "set_timer" << id.value().c_str()
                                            << "interval" << interval_ns
                                            << "next" << timer.next_time_ns();
                    timers_.emplace(id.value(), std::move(timer));
                    return Result<void>::ok();
                });
        });
    });
}

Result<std::vector<TimeEvent>> TestClock::advance_time(UnixNanos to_time_ns, bool set_time) {
    if (to_time_ns < time_ns_) {
        return Result<std::vector<TimeEvent>>::err(Error{
            "cannot advance to " + std::to_string(to_time_ns) + ", before current time " +
                std::to_string(time_ns_),
            ErrorKind::OutOfRange});
    }

    std::vector<TimeEvent> events;
    for (auto it = timers_.begin(); it != timers_.end();) {
        auto fired = it->second.advance(to_time_ns);
        events.insert(events.end(),
                      std::make_move_iterator(fired.begin()),
                      std::make_move_iterator(fired.end()));
        if (it->second.is_expired()) {
            it = timers_.erase(it);
        } else {
            ++it;
        }
    }

    std::stable_sort(events.begin(), events.end(), [](const TimeEvent& a, const TimeEvent& b) {
        return std::tie(a.ts_event, a.name) < std::tie(b.ts_event, b.name);
    });

    if (set_time) {
        time_ns_ = to_time_ns;
    }
    qCDebug(cobaltClockLog) << "advance_time" << to_time_ns << "events" << events.size();
    return Result<std::vector<TimeEvent>>::ok(std::move(events));
}

Result<void> TestClock::cancel_timer(std::string_view name) {
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return Result<void>::err(
            Error{"no timer named '" + std::string(name) + "'", ErrorKind::NotFound});
    }
    timers_.erase(it);
    qCDebug(cobaltClockLog) << "cancel_timer" << std::string(name).c_str();
    return Result<void>::ok();
}

void TestClock::cancel_timers() {
    qCDebug(cobaltClockLog) << "cancel_timers" << timers_.size();
    timers_.clear();
}

std::vector<std::string> TestClock::timer_names() const {
    std::vector<std::string> names;
    names.reserve(timers_.size());
    for (const auto& [name, timer] : timers_) {
        names.push_back(name);
    }
    return names;
}

std::optional<UnixNanos> TestClock::next_time_ns(std::string_view name) const {
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return std::nullopt;
    }
    return it->second.next_time_ns();
}

std::vector<UnixNanos> TestClock::next_times() const {
    std::vector<UnixNanos> times;
    times.reserve(timers_.size());
    for (const auto& [name, timer] : timers_) {
        times.push_back(timer.next_time_ns());
    }
    return times;
}

} // namespace cobalt
