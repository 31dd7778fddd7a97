#pragma once

#include <memory>
#include <optional>
#include <string_view>

namespace cobalt {

struct CStringDeleter {
    void operator()(char* ptr) const noexcept;
};

/**
 * A NUL-terminated string allocated by the core. Strings returned across
 * the C boundary are released from this type and come back through
 * cobalt_cstr_drop, which uses the same deleter.
 */
using OwnedCString = std::unique_ptr<char[], CStringDeleter>;

/**
 * Copy `text` into a new core-owned NUL-terminated buffer.
 */
[[nodiscard]] OwnedCString make_owned_cstring(std::string_view text);

/**
 * View a caller-owned string for the duration of a call. Null yields
 * std::nullopt. The view must not outlive the call it was taken in.
 */
[[nodiscard]] inline std::optional<std::string_view> borrow_cstring(const char* ptr) noexcept {
    if (ptr == nullptr) {
        return std::nullopt;
    }
    return std::string_view(ptr);
}

} // namespace cobalt
