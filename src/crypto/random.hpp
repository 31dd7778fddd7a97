#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace cobalt::crypto {

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads;
 * only the first call does any work.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Fill `len` bytes with cryptographically strong randomness.
 * Throws std::runtime_error if the random source cannot be initialized.
 */
void fill_random(uint8_t* data, std::size_t len);

template<std::size_t N>
[[nodiscard]] std::array<uint8_t, N> random_bytes() {
    std::array<uint8_t, N> out;
    fill_random(out.data(), out.size());
    return out;
}

} // namespace cobalt::crypto
