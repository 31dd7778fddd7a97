#pragma once

#include "logging/logging.hpp"

#include <exception>
#include <utility>

namespace cobalt::ffi {

/**
 * Run `body` at the C boundary. Exceptions must not unwind into C; the ones
 * that reach here (allocation failure, random source failure) are fatal.
 */
template<typename F>
auto fatal_on_exception(const char* where, F&& body) noexcept -> decltype(body()) {
    try {
        return std::forward<F>(body)();
    } catch (const std::exception& e) {
        qFatal("%s: %s", where, e.what());
    }
}

} // namespace cobalt::ffi
