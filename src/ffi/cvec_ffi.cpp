#include "ffi/cobalt_core.h"

#include "core/cstring.hpp"
#include "core/cvec.hpp"

extern "C" {

CVec cobalt_cvec_new(void) {
    return cobalt::empty_cvec();
}

void cobalt_cvec_drop(CVec cvec) {
    cobalt::OwnedCVec<unsigned char> owned(cvec);
}

void cobalt_cstr_drop(char *ptr) {
    cobalt::OwnedCString owned(ptr);
}

} // extern "C"
