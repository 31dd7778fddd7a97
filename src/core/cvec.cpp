#include "core/cvec.hpp"

#include <limits>
#include <new>

namespace cobalt {

static_assert(std::is_standard_layout_v<CVec>, "CVec must keep its C layout");
static_assert(offsetof(CVec, ptr) == 0, "CVec field order is ptr, len, cap");
static_assert(offsetof(CVec, len) == sizeof(void*), "CVec field order is ptr, len, cap");
static_assert(offsetof(CVec, cap) == sizeof(void*) + sizeof(uintptr_t),
              "CVec field order is ptr, len, cap");

void* allocate_block(std::size_t count, std::size_t element_size) {
    if (element_size != 0 && count > std::numeric_limits<std::size_t>::max() / element_size) {
        throw std::bad_array_new_length();
    }
    return ::operator new(count * element_size);
}

void deallocate_block(void* ptr) noexcept {
    ::operator delete(ptr);
}

} // namespace cobalt
