#include <util-core/sorted.hh>

#include <nexus/test.hh>

#include <algorithm>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace
{
struct descending
{
    int operator()(int a, int b) const { return b - a; }
};

struct record
{
    int key = 0;
    std::string name;
};
} // namespace

TEST("binary_search - found and not found")
{
    auto const values = std::vector<int>{1, 3, 5, 7};

    SECTION("present values are found at their index")
    {
        for (auto i = 0; i < 4; ++i)
        {
            auto const r = uc::binary_search(values, values[i]);
            CHECK(r.is_found());
            CHECK(r.outcome == uc::search_outcome::found);
            CHECK(r.index == i);
        }
    }

    SECTION("missing values report the insertion point")
    {
        CHECK(uc::binary_search(values, 0) == uc::search_result{uc::search_outcome::not_found, 0});
        CHECK(uc::binary_search(values, 2) == uc::search_result{uc::search_outcome::not_found, 1});
        CHECK(uc::binary_search(values, 4) == uc::search_result{uc::search_outcome::not_found, 2});
        CHECK(uc::binary_search(values, 6) == uc::search_result{uc::search_outcome::not_found, 3});
        CHECK(uc::binary_search(values, 8) == uc::search_result{uc::search_outcome::not_found, 4});
    }

    SECTION("empty range")
    {
        auto const empty = std::vector<int>{};
        auto const r = uc::binary_search(empty, 42);
        CHECK(!r.is_found());
        CHECK(r.insertion_index() == 0);
    }

    SECTION("single element")
    {
        auto const one = std::vector<int>{5};
        CHECK(uc::binary_search(one, 5).is_found());
        CHECK(uc::binary_search(one, 4).insertion_index() == 0);
        CHECK(uc::binary_search(one, 6).insertion_index() == 1);
    }

    SECTION("found value inserts before the equal element")
    {
        auto const r = uc::binary_search(values, 5);
        CHECK(r.insertion_index() == r.index);
    }

    SECTION("works on C arrays")
    {
        int const arr[] = {2, 4, 6, 8, 10};
        CHECK(uc::binary_search(arr, 8).index == 3);
        CHECK(uc::binary_search(arr, 9).insertion_index() == 4);
    }
}

TEST("binary_search - custom comparator")
{
    SECTION("descending order")
    {
        auto const values = std::vector<int>{9, 7, 5, 3};
        CHECK(uc::binary_search(values, 7, descending{}).index == 1);
        CHECK(uc::binary_search(values, 6, descending{}) == uc::search_result{uc::search_outcome::not_found, 2});
        CHECK(uc::binary_search(values, 10, descending{}).insertion_index() == 0);
        CHECK(uc::binary_search(values, 1, descending{}).insertion_index() == 4);
    }

    SECTION("comparing by key")
    {
        auto const records = std::vector<record>{{1, "one"}, {4, "four"}, {9, "nine"}};
        auto const by_key = [](record const& r, int key) { return r.key <=> key; };

        auto const r = uc::binary_search(records, 4, by_key);
        REQUIRE(r.is_found());
        CHECK(records[r.index].name == "four");
        CHECK(uc::binary_search(records, 5, by_key).insertion_index() == 2);
    }
}

TEST("insert_sorted - basics")
{
    SECTION("insert into the middle")
    {
        auto values = std::vector<int>{1, 3, 5, 7};
        auto const idx = uc::insert_sorted(values, 4);
        CHECK(idx == 2);
        CHECK(values == std::vector<int>{1, 3, 4, 5, 7});
    }

    SECTION("insert into empty container")
    {
        auto values = std::vector<int>{};
        CHECK(uc::insert_sorted(values, 10) == 0);
        CHECK(values == std::vector<int>{10});
    }

    SECTION("insert at front and back")
    {
        auto values = std::vector<int>{2, 4};
        CHECK(uc::insert_sorted(values, 1) == 0);
        CHECK(uc::insert_sorted(values, 5) == 3);
        CHECK(values == std::vector<int>{1, 2, 4, 5});
    }

    SECTION("duplicate lands next to its equal run")
    {
        auto values = std::vector<int>{1, 2, 2, 2, 3};
        auto const idx = uc::insert_sorted(values, 2);
        CHECK(1 <= idx);
        CHECK(idx <= 4);
        CHECK(values[idx] == 2);
        CHECK(values == std::vector<int>{1, 2, 2, 2, 2, 3});
    }

    SECTION("returned index holds the inserted value")
    {
        auto values = std::vector<std::string>{"apple", "cherry"};
        auto const idx = uc::insert_sorted(values, std::string("banana"));
        CHECK(values[idx] == "banana");
        CHECK(values == std::vector<std::string>{"apple", "banana", "cherry"});
    }
}

TEST("insert_sorted - keeps order over many insertions")
{
    auto const input = std::vector<int>{5, 3, 8, 1, 9, 2, 7, 3, 6, 0, 4, 8};

    SECTION("ascending")
    {
        auto values = std::vector<int>{};
        for (auto v : input)
        {
            auto const idx = uc::insert_sorted(values, v);
            CHECK(values[idx] == v);
            CHECK(std::is_sorted(values.begin(), values.end()));
        }
        CHECK(values.size() == input.size());
    }

    SECTION("descending comparator")
    {
        auto values = std::deque<int>{};
        for (auto v : input)
            uc::insert_sorted(values, v, descending{});

        CHECK(std::is_sorted(values.begin(), values.end(), std::greater<>{}));
        CHECK(values.front() == 9);
        CHECK(values.back() == 0);
    }
}
