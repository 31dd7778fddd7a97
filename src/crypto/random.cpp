#include "crypto/random.hpp"
#include "logging/logging.hpp"

#include <sodium.h>

#include <stdexcept>

namespace cobalt::crypto {

Result<void, Error> init() {
    // sodium_init returns 0 on first success, 1 if already initialized.
    static const int status = sodium_init();
    if (status < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

void fill_random(uint8_t* data, std::size_t len) {
    const auto ready = init();
    if (ready.is_err()) {
        qCCritical(cobaltCryptoLog) << ready.unwrap_err().message.c_str();
        throw std::runtime_error(ready.unwrap_err().message);
    }
    randombytes_buf(data, len);
}

} // namespace cobalt::crypto
