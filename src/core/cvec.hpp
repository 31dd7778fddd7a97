#pragma once

#include "ffi/cobalt_core.h"

#include <cstddef>
#include <cstring>
#include <type_traits>
#include <utility>
#include <vector>

namespace cobalt {

/**
 * Allocate an uninitialized block for `count` elements of `element_size`
 * bytes with the core allocator. Throws std::bad_alloc on exhaustion.
 */
[[nodiscard]] void* allocate_block(std::size_t count, std::size_t element_size);

/**
 * Release a block obtained from allocate_block. Null is ignored.
 */
void deallocate_block(void* ptr) noexcept;

/**
 * An empty buffer: null pointer, zero length and capacity.
 */
[[nodiscard]] constexpr CVec empty_cvec() noexcept {
    return CVec{nullptr, 0, 0};
}

/**
 * Release the block of a buffer whose elements own nothing.
 */
struct BlockDrop {
    void operator()(CVec raw) const noexcept { deallocate_block(raw.ptr); }
};

/**
 * OwnedCVec - single owner of a CVec.
 *
 * Releases the buffer exactly once through `Drop` when destroyed. Move-only,
 * so the same block cannot end up with two owners. release() gives up
 * ownership and returns the raw triple for the C boundary; adopting a raw
 * triple back takes ownership again.
 */
template<typename T, typename Drop = BlockDrop>
class OwnedCVec {
    static_assert(std::is_trivially_copyable_v<T>,
                  "CVec elements are copied bitwise across the boundary");

public:
    OwnedCVec() noexcept = default;

    explicit OwnedCVec(CVec raw) noexcept : raw_(raw) {}

    /**
     * Copy `items` into a block of exactly items.size() elements.
     */
    [[nodiscard]] static OwnedCVec from_vector(const std::vector<T>& items) {
        if (items.empty()) {
            return OwnedCVec();
        }
        void* block = allocate_block(items.size(), sizeof(T));
        std::memcpy(block, items.data(), items.size() * sizeof(T));
        return OwnedCVec(CVec{block, items.size(), items.size()});
    }

    OwnedCVec(const OwnedCVec&) = delete;
    OwnedCVec& operator=(const OwnedCVec&) = delete;

    OwnedCVec(OwnedCVec&& other) noexcept
        : raw_(std::exchange(other.raw_, empty_cvec())) {}

    OwnedCVec& operator=(OwnedCVec&& other) noexcept {
        if (this != &other) {
            reset();
            raw_ = std::exchange(other.raw_, empty_cvec());
        }
        return *this;
    }

    ~OwnedCVec() { reset(); }

    [[nodiscard]] std::size_t size() const noexcept { return raw_.len; }
    [[nodiscard]] std::size_t capacity() const noexcept { return raw_.cap; }
    [[nodiscard]] bool empty() const noexcept { return raw_.len == 0; }

    [[nodiscard]] T* data() noexcept { return static_cast<T*>(raw_.ptr); }
    [[nodiscard]] const T* data() const noexcept { return static_cast<const T*>(raw_.ptr); }

    [[nodiscard]] T* begin() noexcept { return data(); }
    [[nodiscard]] T* end() noexcept { return data() + size(); }
    [[nodiscard]] const T* begin() const noexcept { return data(); }
    [[nodiscard]] const T* end() const noexcept { return data() + size(); }

    [[nodiscard]] T& operator[](std::size_t i) noexcept { return data()[i]; }
    [[nodiscard]] const T& operator[](std::size_t i) const noexcept { return data()[i]; }

    /**
     * Hand the buffer to the caller; this handle becomes empty.
     */
    [[nodiscard]] CVec release() noexcept {
        return std::exchange(raw_, empty_cvec());
    }

    void reset() noexcept {
        if (raw_.ptr != nullptr) {
            Drop{}(raw_);
        }
        raw_ = empty_cvec();
    }

private:
    CVec raw_{empty_cvec()};
};

} // namespace cobalt
