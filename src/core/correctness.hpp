#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string_view>

namespace cobalt {

// Argument checks. Each returns ok or an InvalidArgument error naming `param`.

/**
 * A valid string is non-empty, not all whitespace and ASCII only.
 */
[[nodiscard]] Result<void> check_valid_string(std::string_view value, std::string_view param);

[[nodiscard]] Result<void> check_positive_u64(uint64_t value, std::string_view param);

[[nodiscard]] Result<void> check_predicate_true(bool predicate, std::string_view message);

} // namespace cobalt
