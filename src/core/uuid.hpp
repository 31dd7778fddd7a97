#pragma once

#include "core/result.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cobalt {

/**
 * UUID4 - a version 4 (random) Universally Unique Identifier.
 *
 * A 128-bit value stored as 16 bytes. Equality, ordering and hashing all
 * work on the bytes, never on a string form.
 */
class UUID4 {
public:
    static constexpr std::size_t BYTE_SIZE = 16;
    // Length of the hyphenated text form: 32 hex digits and 4 hyphens.
    static constexpr std::size_t STRING_SIZE = 36;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr UUID4() noexcept : bytes_{} {}

    /**
     * Create a UUID from raw bytes. The version and variant bits are kept
     * as given.
     */
    explicit constexpr UUID4(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4, RFC 4122 variant) from the
     * libsodium random source.
     */
    [[nodiscard]] static UUID4 generate();

    /**
     * Parse the hyphenated form xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
     * Hex digits may be of either case; any version is accepted.
     */
    [[nodiscard]] static Result<UUID4> parse(std::string_view text);

    /**
     * Lowercase hyphenated form.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * Write the lowercase hyphenated form into `out` (STRING_SIZE chars,
     * no terminator).
     */
    void write_canonical(char* out) const noexcept;

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(bytes_[6] >> 4);
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    /**
     * 64-bit hash of the 128-bit value; equal UUIDs hash equally.
     */
    [[nodiscard]] uint64_t hash() const noexcept;

    auto operator<=>(const UUID4&) const = default;
    bool operator==(const UUID4&) const = default;

private:
    Bytes bytes_;
};

} // namespace cobalt

namespace std {
    template<>
    struct hash<cobalt::UUID4> {
        size_t operator()(const cobalt::UUID4& uuid) const noexcept {
            return static_cast<size_t>(uuid.hash());
        }
    };
}
