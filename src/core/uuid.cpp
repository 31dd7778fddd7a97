#include "core/uuid.hpp"
#include "crypto/random.hpp"

#include <type_traits>

namespace cobalt {

static_assert(sizeof(UUID4) == 16, "UUID4 should be 16 bytes");
static_assert(std::is_trivially_copyable_v<UUID4>, "UUID4 should be trivially copyable");

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Offsets of the hyphens in the text form.
constexpr bool is_hyphen_position(std::size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// splitmix64 finalizer
constexpr uint64_t mix64(uint64_t x) noexcept {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

} // namespace

UUID4 UUID4::generate() {
    auto bytes = crypto::random_bytes<BYTE_SIZE>();

    // Set version 4 (random)
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    // Set variant (RFC 4122)
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return UUID4(bytes);
}

Result<UUID4> UUID4::parse(std::string_view text) {
    if (text.size() != STRING_SIZE) {
        return Result<UUID4>::err(Error{
            "UUID string must be " + std::to_string(STRING_SIZE) + " characters, was " +
                std::to_string(text.size()),
            ErrorKind::Parse});
    }

    Bytes bytes{};
    std::size_t nibble = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_hyphen_position(i)) {
            if (c != '-') {
                return Result<UUID4>::err(Error{
                    "expected '-' at position " + std::to_string(i), ErrorKind::Parse});
            }
            continue;
        }
        const int value = hex_value(c);
        if (value < 0) {
            return Result<UUID4>::err(Error{
                "invalid hex digit at position " + std::to_string(i), ErrorKind::Parse});
        }
        auto& byte = bytes[nibble / 2];
        byte = static_cast<uint8_t>(nibble % 2 == 0 ? value << 4 : byte | value);
        ++nibble;
    }

    return Result<UUID4>::ok(UUID4(bytes));
}

void UUID4::write_canonical(char* out) const noexcept {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out[pos++] = '-';
        }
        out[pos++] = HEX_DIGITS[bytes_[i] >> 4];
        out[pos++] = HEX_DIGITS[bytes_[i] & 0x0F];
    }
}

std::string UUID4::to_string() const {
    std::string out(STRING_SIZE, '\0');
    write_canonical(out.data());
    return out;
}

uint64_t UUID4::hash() const noexcept {
    uint64_t hi = 0;
    uint64_t lo = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        hi = (hi << 8) | bytes_[i];
        lo = (lo << 8) | bytes_[i + 8];
    }
    return mix64(hi ^ mix64(lo));
}

} // namespace cobalt
