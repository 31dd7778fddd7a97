#pragma once

#include <string>

namespace cobalt {

/**
 * Runtime configuration of the core, read from COBALT_* environment
 * variables.
 */
struct CoreConfig {
    // COBALT_LOG_FILE; empty disables the file sink.
    std::string log_file_path;
    // COBALT_DEBUG_FFI
    bool debug_ffi = false;
    // COBALT_DEBUG_CLOCK
    bool debug_clock = false;

    [[nodiscard]] static CoreConfig from_environment();
};

} // namespace cobalt
