#include <util-core/span.hh>

#include <nexus/test.hh>

#include "assert-helpers.hh"

#include <string>
#include <vector>

static_assert(std::is_trivially_copyable_v<uc::span<int>>);
static_assert(std::is_trivially_copyable_v<uc::span<std::string>>);
static_assert(std::is_convertible_v<uc::span<int>, uc::span<int const>>);
static_assert(!std::is_convertible_v<uc::span<int const>, uc::span<int>>);
static_assert(!std::is_convertible_v<std::vector<int>&, uc::span<int>>, "container conversion is explicit");

namespace
{
int sum(uc::span<int const> values)
{
    auto total = 0;
    for (auto v : values)
        total += v;
    return total;
}
} // namespace

TEST("span - construction")
{
    int data[] = {1, 2, 3, 4, 5};

    SECTION("default is empty")
    {
        auto const s = uc::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer and size")
    {
        auto const s = uc::span<int>(data, uc::isize(3));
        CHECK(s.data() == data);
        CHECK(s.size() == 3);
    }

    SECTION("pointer range")
    {
        auto const s = uc::span<int>(data + 1, data + 4);
        CHECK(s.size() == 3);
        CHECK(s[0] == 2);
    }

    SECTION("C array")
    {
        auto const s = uc::span<int>(data);
        CHECK(s.size() == 5);
        CHECK(s[4] == 5);
    }

    SECTION("container")
    {
        auto v = std::vector<int>{7, 8, 9};
        auto const s = uc::span<int>(v);
        CHECK(s.data() == v.data());
        CHECK(s.size() == 3);

        auto const& cv = v;
        auto const cs = uc::span<int const>(cv);
        CHECK(cs.size() == 3);
    }

    SECTION("braced list as a function argument")
    {
        CHECK(sum({1, 2, 3}) == 6);
        CHECK(sum({}) == 0);
    }

    SECTION("mutable to const")
    {
        auto const s = uc::span<int>(data);
        CHECK(sum(s) == 15);
    }
}

TEST("span - element access and subviews")
{
    int data[] = {10, 20, 30, 40, 50};
    auto const s = uc::span<int>(data);

    SECTION("elements")
    {
        CHECK(s.front() == 10);
        CHECK(s.back() == 50);
        CHECK(s[2] == 30);

        s[2] = 31;
        CHECK(data[2] == 31);
    }

    SECTION("subspan")
    {
        auto const mid = s.subspan(1, 3);
        CHECK(mid.size() == 3);
        CHECK(mid.front() == 20);
        CHECK(mid.back() == 40);

        CHECK(s.subspan(3, 2).front() == 40);
        CHECK(s.subspan(5, 0).empty());
        CHECK(s.subspan(0, 0).empty());
    }

    SECTION("iteration")
    {
        auto count = 0;
        for (auto v : s)
        {
            CHECK(v == data[count]);
            ++count;
        }
        CHECK(count == 5);
    }

#if UC_ASSERT_ENABLED
    SECTION("precondition violations")
    {
        UC_CHECK_ASSERTS(s[5]);
        UC_CHECK_ASSERTS(s[-1]);
        UC_CHECK_ASSERTS(s.subspan(4, 2));
        UC_CHECK_ASSERTS(uc::span<int>{}.front());
        UC_CHECK_ASSERTS(uc::span<int>{}.back());
        UC_CHECK_ASSERTS(uc::span<int>(data, uc::isize(-1)));
    }
#endif
}
