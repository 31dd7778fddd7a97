#include "ffi/cobalt_core.h"

#include "core/cstring.hpp"
#include "core/uuid.hpp"
#include "ffi/ffi_guard.hpp"

#include <optional>

namespace {

UUID4_t to_handle(const cobalt::UUID4& uuid) {
    char text[cobalt::UUID4::STRING_SIZE];
    uuid.write_canonical(text);
    return UUID4_t{cobalt::make_owned_cstring({text, sizeof(text)}).release()};
}

// The 128-bit value behind a handle; nullopt for null pointers and for the
// sentinel returned by a failed constructor.
std::optional<cobalt::UUID4> read_handle(const UUID4_t* uuid) {
    if (uuid == nullptr || uuid->value == nullptr) {
        return std::nullopt;
    }
    auto parsed = cobalt::UUID4::parse(uuid->value);
    if (parsed.is_err()) {
        qCWarning(cobaltFfiLog) << "corrupt UUID4 handle:" << parsed.unwrap_err().message.c_str();
        return std::nullopt;
    }
    return std::move(parsed).unwrap();
}

} // namespace

extern "C" {

UUID4_t cobalt_uuid4_new(void) {
    return cobalt::ffi::fatal_on_exception("cobalt_uuid4_new", [] {
        return to_handle(cobalt::UUID4::generate());
    });
}

void cobalt_uuid4_free(UUID4_t uuid) {
    cobalt::OwnedCString owned(uuid.value);
}

UUID4_t cobalt_uuid4_from_cstr(const char *ptr) {
    return cobalt::ffi::fatal_on_exception("cobalt_uuid4_from_cstr", [&] {
        const auto text = cobalt::borrow_cstring(ptr);
        if (!text) {
            qCWarning(cobaltFfiLog) << "cobalt_uuid4_from_cstr: null string";
            return UUID4_t{nullptr};
        }
        return cobalt::UUID4::parse(*text).match(
            [](const cobalt::UUID4& uuid) { return to_handle(uuid); },
            [](const cobalt::Error& error) {
                qCWarning(cobaltFfiLog) << "cobalt_uuid4_from_cstr:" << error.message.c_str();
                return UUID4_t{nullptr};
            });
    });
}

char *cobalt_uuid4_to_cstr(const UUID4_t *uuid) {
    return cobalt::ffi::fatal_on_exception("cobalt_uuid4_to_cstr", [&]() -> char* {
        const auto value = read_handle(uuid);
        if (!value) {
            return nullptr;
        }
        return cobalt::make_owned_cstring(value->to_string()).release();
    });
}

uint8_t cobalt_uuid4_eq(const UUID4_t *lhs, const UUID4_t *rhs) {
    return cobalt::ffi::fatal_on_exception("cobalt_uuid4_eq", [&]() -> uint8_t {
        const auto a = read_handle(lhs);
        const auto b = read_handle(rhs);
        return a && b && *a == *b ? 1 : 0;
    });
}

uint64_t cobalt_uuid4_hash(const UUID4_t *uuid) {
    return cobalt::ffi::fatal_on_exception("cobalt_uuid4_hash", [&]() -> uint64_t {
        const auto value = read_handle(uuid);
        return value ? value->hash() : 0;
    });
}

} // extern "C"
