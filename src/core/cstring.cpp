#include "core/cstring.hpp"

#include <cstring>

namespace cobalt {

void CStringDeleter::operator()(char* ptr) const noexcept {
    delete[] ptr;
}

OwnedCString make_owned_cstring(std::string_view text) {
    OwnedCString out(new char[text.size() + 1]);
    if (!text.empty()) {
        std::memcpy(out.get(), text.data(), text.size());
    }
    out[text.size()] = '\0';
    return out;
}

} // namespace cobalt
