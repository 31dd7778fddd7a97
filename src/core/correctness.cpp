#include "core/correctness.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace cobalt {
namespace {

Result<void> invalid(std::string_view param, std::string_view reason) {
    std::string message(param);
    message += ' ';
    message += reason;
    return Result<void>::err(Error{std::move(message), ErrorKind::InvalidArgument});
}

} // namespace

Result<void> check_valid_string(std::string_view value, std::string_view param) {
    if (value.empty()) {
        return invalid(param, "string was empty");
    }
    const bool all_whitespace = std::all_of(value.begin(), value.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    if (all_whitespace) {
        return invalid(param, "string was all whitespace");
    }
    const bool ascii = std::all_of(value.begin(), value.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
    if (!ascii) {
        return invalid(param, "string contained non-ASCII characters");
    }
    return Result<void>::ok();
}

Result<void> check_positive_u64(uint64_t value, std::string_view param) {
    if (value == 0) {
        return invalid(param, "was not positive, was 0");
    }
    return Result<void>::ok();
}

Result<void> check_predicate_true(bool predicate, std::string_view message) {
    if (!predicate) {
        return Result<void>::err(Error{std::string(message), ErrorKind::InvalidArgument});
    }
    return Result<void>::ok();
}

} // namespace cobalt
