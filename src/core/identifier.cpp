#include "core/identifier.hpp"
#include "core/correctness.hpp"

namespace cobalt {

Result<Identifier> Identifier::create(std::string_view value) {
    const auto valid = check_valid_string(value, "value");
    if (valid.is_err()) {
        return Result<Identifier>::err(valid.unwrap_err());
    }
    return Result<Identifier>::ok(Identifier(std::string(value)));
}

} // namespace cobalt
