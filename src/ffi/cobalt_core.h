/*
 * cobalt_core.h - C ABI of the cobalt native value core.
 *
 * Every function that hands memory to the caller has a paired release
 * function. Borrowed string arguments (const char*) are read during the call
 * only. Returned strings and buffers are allocated by the core and must be
 * released through the core.
 */
#ifndef COBALT_CORE_H
#define COBALT_CORE_H

#include <stdint.h>

#if defined(_WIN32)
#  if defined(COBALT_FFI_BUILDING)
#    define COBALT_API __declspec(dllexport)
#  else
#    define COBALT_API __declspec(dllimport)
#  endif
#else
#  define COBALT_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/*
 * An owned block of `len` elements with room for `cap` elements.
 * Release exactly once with the drop function that matches its producer.
 */
typedef struct CVec {
    void *ptr;
    uintptr_t len;
    uintptr_t cap;
} CVec;

/*
 * A version 4 UUID in canonical form. `value` is an owned, NUL-terminated
 * 36-character string, or NULL when a constructor failed.
 */
typedef struct UUID4_t {
    char *value;
} UUID4_t;

/*
 * An event raised by a test clock timer or time alert. `name` and
 * `event_id.value` are owned by the enclosing CVec.
 */
typedef struct TimeEvent_t {
    char *name;
    UUID4_t event_id;
    uint64_t ts_event;
    uint64_t ts_init;
} TimeEvent_t;

typedef struct TestClock_API TestClock_API;

/* Buffers */

COBALT_API CVec cobalt_cvec_new(void);
COBALT_API void cobalt_cvec_drop(CVec cvec);

/* Strings */

COBALT_API void cobalt_cstr_drop(char *ptr);

/* Time conversions */

COBALT_API uint64_t cobalt_secs_to_nanos(double secs);
COBALT_API uint64_t cobalt_secs_to_millis(double secs);
COBALT_API uint64_t cobalt_millis_to_nanos(double millis);
COBALT_API uint64_t cobalt_micros_to_nanos(double micros);
COBALT_API double cobalt_nanos_to_secs(uint64_t nanos);
COBALT_API uint64_t cobalt_nanos_to_millis(uint64_t nanos);
COBALT_API uint64_t cobalt_nanos_to_micros(uint64_t nanos);

/* ISO 8601 UTC with nanoseconds; release with cobalt_cstr_drop */
COBALT_API char *cobalt_unix_nanos_to_iso8601(uint64_t nanos);

/* Wall clock, non-decreasing within the process */

COBALT_API double cobalt_unix_timestamp(void);
COBALT_API uint64_t cobalt_unix_timestamp_ms(void);
COBALT_API uint64_t cobalt_unix_timestamp_us(void);
COBALT_API uint64_t cobalt_unix_timestamp_ns(void);

/* UUID4 */

COBALT_API UUID4_t cobalt_uuid4_new(void);
COBALT_API void cobalt_uuid4_free(UUID4_t uuid);
COBALT_API UUID4_t cobalt_uuid4_from_cstr(const char *ptr);
COBALT_API char *cobalt_uuid4_to_cstr(const UUID4_t *uuid);
COBALT_API uint8_t cobalt_uuid4_eq(const UUID4_t *lhs, const UUID4_t *rhs);
COBALT_API uint64_t cobalt_uuid4_hash(const UUID4_t *uuid);

/* Test clock; functions returning uint8_t report 1 on success, 0 on failure */

COBALT_API TestClock_API *cobalt_test_clock_new(void);
COBALT_API void cobalt_test_clock_drop(TestClock_API *clock);
COBALT_API void cobalt_test_clock_set_time(TestClock_API *clock, uint64_t to_time_ns);
COBALT_API uint64_t cobalt_test_clock_timestamp_ns(const TestClock_API *clock);
COBALT_API uint8_t cobalt_test_clock_set_time_alert_ns(TestClock_API *clock,
                                                       const char *name,
                                                       uint64_t alert_time_ns);
COBALT_API uint8_t cobalt_test_clock_set_timer_ns(TestClock_API *clock,
                                                  const char *name,
                                                  uint64_t interval_ns,
                                                  uint64_t start_time_ns,
                                                  uint64_t stop_time_ns);
COBALT_API CVec cobalt_test_clock_advance_time(TestClock_API *clock,
                                               uint64_t to_time_ns,
                                               uint8_t set_time);
COBALT_API void cobalt_vec_time_events_drop(CVec events);
COBALT_API CVec cobalt_test_clock_next_times(const TestClock_API *clock);
COBALT_API uint8_t cobalt_test_clock_cancel_timer(TestClock_API *clock, const char *name);
COBALT_API void cobalt_test_clock_cancel_timers(TestClock_API *clock);
COBALT_API uintptr_t cobalt_test_clock_timer_count(const TestClock_API *clock);
COBALT_API uint64_t cobalt_test_clock_next_time_ns(const TestClock_API *clock, const char *name);

/* Logging, configured from COBALT_* environment variables */

COBALT_API uint8_t cobalt_logging_init(void);

#ifdef __cplusplus
}
#endif

#endif /* COBALT_CORE_H */
