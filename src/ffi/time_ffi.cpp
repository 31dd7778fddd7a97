#include "ffi/cobalt_core.h"

#include "core/cstring.hpp"
#include "core/time.hpp"
#include "ffi/ffi_guard.hpp"

extern "C" {

uint64_t cobalt_secs_to_nanos(double secs) {
    return cobalt::secs_to_nanos(secs);
}

uint64_t cobalt_secs_to_millis(double secs) {
    return cobalt::secs_to_millis(secs);
}

uint64_t cobalt_millis_to_nanos(double millis) {
    return cobalt::millis_to_nanos(millis);
}

uint64_t cobalt_micros_to_nanos(double micros) {
    return cobalt::micros_to_nanos(micros);
}

double cobalt_nanos_to_secs(uint64_t nanos) {
    return cobalt::nanos_to_secs(nanos);
}

uint64_t cobalt_nanos_to_millis(uint64_t nanos) {
    return cobalt::nanos_to_millis(nanos);
}

uint64_t cobalt_nanos_to_micros(uint64_t nanos) {
    return cobalt::nanos_to_micros(nanos);
}

char *cobalt_unix_nanos_to_iso8601(uint64_t nanos) {
    return cobalt::ffi::fatal_on_exception("cobalt_unix_nanos_to_iso8601", [&] {
        return cobalt::make_owned_cstring(cobalt::unix_nanos_to_iso8601(nanos)).release();
    });
}

double cobalt_unix_timestamp(void) {
    return cobalt::unix_timestamp();
}

uint64_t cobalt_unix_timestamp_ms(void) {
    return cobalt::unix_timestamp_ms();
}

uint64_t cobalt_unix_timestamp_us(void) {
    return cobalt::unix_timestamp_us();
}

uint64_t cobalt_unix_timestamp_ns(void) {
    return cobalt::unix_timestamp_ns();
}

} // extern "C"
