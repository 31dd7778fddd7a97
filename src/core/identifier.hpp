#pragma once

#include "core/result.hpp"

#include <compare>
#include <functional>
#include <string>
#include <string_view>

namespace cobalt {

/**
 * Identifier - a validated name for timers, alerts and similar entities.
 *
 * The value always passes check_valid_string.
 */
class Identifier {
public:
    [[nodiscard]] static Result<Identifier> create(std::string_view value);

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] std::string_view as_str() const noexcept { return value_; }

    auto operator<=>(const Identifier&) const = default;
    bool operator==(const Identifier&) const = default;

private:
    explicit Identifier(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace cobalt

namespace std {
    template<>
    struct hash<cobalt::Identifier> {
        size_t operator()(const cobalt::Identifier& id) const noexcept {
            return std::hash<std::string_view>{}(id.as_str());
        }
    };
}
