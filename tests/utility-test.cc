#include <util-core/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <type_traits>

namespace
{
struct tracked_value
{
    int value = 0;
    int* destroyed = nullptr;

    ~tracked_value()
    {
        if (destroyed)
            ++*destroyed;
    }
};

struct by_key
{
    int key = 0;
    int tag = 0;

    bool operator<(by_key const& rhs) const { return key < rhs.key; }
};
} // namespace

TEST("utility - move and forward")
{
    SECTION("move yields an rvalue reference")
    {
        int x = 0;
        static_assert(std::is_same_v<decltype(uc::move(x)), int&&>);

        auto p = std::make_unique<int>(5);
        auto q = uc::move(p);
        CHECK(p == nullptr);
        CHECK(*q == 5);
    }

    SECTION("forward keeps the value category")
    {
        int x = 0;
        static_assert(std::is_same_v<decltype(uc::forward<int&>(x)), int&>);
        static_assert(std::is_same_v<decltype(uc::forward<int>(x)), int&&>);
        CHECK(&uc::forward<int&>(x) == &x);
    }
}

TEST("utility - exchange")
{
    SECTION("returns the old value")
    {
        auto rows = uc::isize(7);
        auto const old = uc::exchange(rows, 0);
        CHECK(old == 7);
        CHECK(rows == 0);
    }

    SECTION("moves out of the target")
    {
        auto s = std::string("contents that do not fit into the small string buffer");
        auto const old = uc::exchange(s, "short");
        CHECK(old.size() > 20);
        CHECK(s == "short");
    }
}

TEST("utility - max and min")
{
    CHECK(uc::max(3, 5) == 5);
    CHECK(uc::min(3, 5) == 3);
    CHECK(uc::max(uc::isize(-1), uc::isize(0)) == 0);

    SECTION("return references into the arguments")
    {
        auto const a = by_key{1, 10};
        auto const b = by_key{2, 20};
        CHECK(&uc::max(a, b) == &b);
        CHECK(&uc::min(a, b) == &a);
    }

    SECTION("ties")
    {
        // max returns the second, min the first
        auto const a = by_key{1, 10};
        auto const b = by_key{1, 20};
        CHECK(uc::max(a, b).tag == 20);
        CHECK(uc::min(a, b).tag == 10);
    }

    SECTION("constant expressions")
    {
        static_assert(uc::max(2, 9) == 9);
        static_assert(uc::min(2, 9) == 2);
    }
}

TEST("utility - storage_for and placement_new")
{
    static_assert(std::is_trivially_copyable_v<uc::storage_for<int>>);
    static_assert(!std::is_trivially_destructible_v<uc::storage_for<std::string>>);

    SECTION("construction and destruction are explicit")
    {
        int destroyed = 0;
        {
            uc::storage_for<tracked_value> storage;
            auto* p = new (uc::placement_new, &storage.value) tracked_value{42, &destroyed};
            CHECK(p == &storage.value);
            CHECK(storage.value.value == 42);

            storage.value.~tracked_value();
            CHECK(destroyed == 1);
        }
        // leaving the scope does not destroy the value a second time
        CHECK(destroyed == 1);
    }
}
