#include <catch2/catch_test_macros.hpp>
#include "core/cstring.hpp"
#include "core/cvec.hpp"

#include <cstring>
#include <utility>
#include <vector>

using namespace cobalt;

namespace {

// Counts releases instead of freeing twice; the block is still freed once.
int g_drops = 0;

struct CountingDrop {
    void operator()(CVec raw) const noexcept {
        ++g_drops;
        deallocate_block(raw.ptr);
    }
};

using CountedVec = OwnedCVec<uint64_t, CountingDrop>;

} // namespace

TEST_CASE("OwnedCVec: default is empty", "[cvec]") {
    OwnedCVec<int> vec;
    REQUIRE(vec.empty());
    REQUIRE(vec.size() == 0);
    REQUIRE(vec.capacity() == 0);
    REQUIRE(vec.data() == nullptr);

    const CVec raw = vec.release();
    REQUIRE(raw.ptr == nullptr);
    REQUIRE(raw.len == 0);
    REQUIRE(raw.cap == 0);
}

TEST_CASE("OwnedCVec: from_vector copies elements", "[cvec]") {
    const std::vector<uint64_t> items{3, 1, 4, 1, 5};
    auto vec = OwnedCVec<uint64_t>::from_vector(items);

    REQUIRE(vec.size() == items.size());
    REQUIRE(vec.capacity() >= vec.size());
    REQUIRE(std::vector<uint64_t>(vec.begin(), vec.end()) == items);
    REQUIRE(vec[2] == 4);
}

TEST_CASE("OwnedCVec: empty vector gives a null buffer", "[cvec]") {
    auto vec = OwnedCVec<uint64_t>::from_vector({});
    REQUIRE(vec.data() == nullptr);
}

TEST_CASE("OwnedCVec: releases exactly once", "[cvec]") {
    g_drops = 0;
    {
        auto a = CountedVec::from_vector({1, 2, 3});
        auto b = std::move(a);
        REQUIRE(a.data() == nullptr);
        CountedVec c;
        c = std::move(b);
        REQUIRE(c.size() == 3);
    }
    REQUIRE(g_drops == 1);
}

TEST_CASE("OwnedCVec: released buffer is not dropped by the handle", "[cvec]") {
    g_drops = 0;
    CVec raw{};
    {
        auto vec = CountedVec::from_vector({7, 8});
        raw = vec.release();
    }
    REQUIRE(g_drops == 0);
    REQUIRE(raw.len == 2);

    CountedVec adopted(raw);
    adopted.reset();
    REQUIRE(g_drops == 1);
    REQUIRE(adopted.empty());
}

TEST_CASE("OwnedCVec: empty handle never calls drop", "[cvec]") {
    g_drops = 0;
    {
        CountedVec vec(empty_cvec());
    }
    REQUIRE(g_drops == 0);
}

TEST_CASE("OwnedCString: copies and terminates", "[cvec][cstring]") {
    auto owned = make_owned_cstring("hello");
    REQUIRE(std::strcmp(owned.get(), "hello") == 0);

    auto empty = make_owned_cstring("");
    REQUIRE(empty[0] == '\0');
}

TEST_CASE("borrow_cstring: null gives nullopt", "[cvec][cstring]") {
    REQUIRE_FALSE(borrow_cstring(nullptr).has_value());
    REQUIRE(borrow_cstring("abc").value() == "abc");
}
