#pragma once

#include <util-core/fwd.hh>
#include <util-core/utility.hh>

#include <compare>
#include <iterator>

// =========================================================================================================
// Operations on sorted sequences
// =========================================================================================================
//
// Searching:
//   binary_search(range, value)            - locate value, or its insertion point, in a sorted range
//   binary_search(range, value, cmp)       - same, ordered by a three-way comparator
//
// Insertion:
//   insert_sorted(container, value)        - insert value where it keeps the container sorted
//   insert_sorted(container, value, cmp)   - same, ordered by a three-way comparator
//
// A comparator is called as cmp(element, value) and its result is compared against 0
// (std::strong_ordering, std::weak_ordering or a plain int all work).
// The default comparator is std::compare_three_way, i.e. the natural <=> ordering.
//
// The caller owns the "is sorted under cmp" invariant.
// Searching or inserting into a range that is not sorted under the same comparator is undefined:
// nothing is validated and nothing is reported.
//

namespace uc
{
// where a binary search landed
enum class search_outcome
{
    // an element comparing equal to the value is at index
    found,
    // no equal element, index is where the value has to be inserted to keep the order
    not_found,
};
} // namespace uc

/// Tagged result of uc::binary_search.
/// For search_outcome::found, index is the position of *an* equal element
/// (not necessarily the first of an equal run).
/// For search_outcome::not_found, index is the unique insertion point in [0, size].
struct uc::search_result
{
    search_outcome outcome = search_outcome::not_found;
    isize index = 0;

    [[nodiscard]] constexpr bool is_found() const { return outcome == search_outcome::found; }

    /// The index at which the searched value can be inserted without breaking the order.
    /// For a found value this is the position of the equal element (insertion happens before it).
    [[nodiscard]] constexpr isize insertion_index() const { return index; }

    [[nodiscard]] constexpr bool operator==(search_result const&) const = default;
};

namespace uc
{
/// Binary search for value in a range sorted under cmp.
/// Probes mid = lo + (hi - lo) / 2 and stops at the first element comparing equal.
/// Complexity: O(log n) comparisons.
/// Usage:
///   auto r = uc::binary_search(values, 4);
///   if (r.is_found()) use(values[r.index]);
template <class Range, class T, class Compare = std::compare_three_way>
[[nodiscard]] constexpr search_result binary_search(Range const& range, T const& value, Compare&& cmp = {})
{
    auto const first = std::begin(range);
    isize lo = 0;
    isize hi = isize(std::size(range)) - 1;

    while (lo <= hi)
    {
        auto const mid = lo + (hi - lo) / 2;
        auto const c = cmp(first[mid], value);

        if (c == 0)
            return {search_outcome::found, mid};

        if (c < 0)
            lo = mid + 1;
        else
            hi = mid - 1;
    }

    return {search_outcome::not_found, lo};
}

/// Inserts value into a container sorted under cmp so that it stays sorted.
/// Returns the index at which the value now resides.
/// If equal elements exist, the value is placed directly before the equal element the search landed on;
/// which element of an equal run that is, is unspecified.
/// Container needs random access and insert(iterator, value), e.g. std::vector or std::deque.
/// Complexity: O(log n) comparisons + O(n) element shifts for the insertion itself.
/// Usage:
///   std::vector<int> v = {1, 3, 5, 7};
///   auto idx = uc::insert_sorted(v, 4); // v == {1, 3, 4, 5, 7}, idx == 2
template <class Container, class T, class Compare = std::compare_three_way>
isize insert_sorted(Container& container, T&& value, Compare&& cmp = {})
{
    auto const idx = uc::binary_search(container, value, cmp).insertion_index();
    container.insert(std::begin(container) + idx, uc::forward<T>(value));
    return idx;
}

} // namespace uc
