#include "ffi/cobalt_core.h"

#include "core/config.hpp"
#include "ffi/ffi_guard.hpp"
#include "logging/logging.hpp"

extern "C" {

uint8_t cobalt_logging_init(void) {
    return cobalt::ffi::fatal_on_exception("cobalt_logging_init", []() -> uint8_t {
        return cobalt::logging::install(cobalt::CoreConfig::from_environment()) ? 1 : 0;
    });
}

} // extern "C"
