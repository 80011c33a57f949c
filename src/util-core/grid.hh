#pragma once

#include <util-core/assert.hh>
#include <util-core/fwd.hh>
#include <util-core/optional.hh>
#include <util-core/span.hh>
#include <util-core/utility.hh>

#include <initializer_list>
#include <iterator>
#include <memory>
#include <type_traits>
#include <vector>

// =========================================================================================================
// Rectangular and jagged 2D layouts
// =========================================================================================================
//
// Types:
//   grid<T>                          - rectangular rows x cols matrix, row-major, value semantics
//   jagged<T>                        - sequence of independently sized rows (std::vector<std::vector<T>>)
//
// Conversions (pure, never mutate their input):
//   to_jagged(grid)                  - one row per grid row, each exactly cols() long
//   to_grid(rows)                    - rows x (widest row), short and absent rows padded with T{}
//   transposed(grid)                 - cols x rows, out(c, r) == in(r, c)
//   transposed(rows)                 - to_jagged(transposed(to_grid(rows))), always rectangular in shape
//
// Every conversion also accepts a uc::optional of its input and maps an absent input to an absent output.
//
// to_grid / transposed(rows) accept any sized range of rows where each row is
//   - a sized range of T (std::vector<T>, uc::span<T>, ...)
//   - a uc::optional of such a range, empty meaning "absent row"
//   - a pointer to such a range, nullptr meaning "absent row"
// Absent rows behave exactly like empty rows.
//

namespace uc
{
template <class T>
using jagged = std::vector<std::vector<T>>;
}

/// Rectangular rows x cols matrix with row-major storage and deep-copy value semantics.
/// Every cell exists; freshly created grids hold value-initialized cells (T{}).
/// Zero rows and/or zero columns are valid shapes: a 3 x 0 grid has three (empty) rows.
/// Cells are addressed as g(row, col); rows can be viewed as spans via g.row(r).
template <class T>
struct uc::grid
{
    static_assert(std::is_default_constructible_v<T>, "grid cells are value-initialized, T must be default constructible");

    // factories
public:
    /// Creates a rows x cols grid with every cell value-initialized.
    /// Precondition: rows >= 0 && cols >= 0.
    [[nodiscard]] static grid create_defaulted(isize rows, isize cols)
    {
        UC_ASSERT(rows >= 0 && cols >= 0, "grid dimensions must be non-negative");
        grid g;
        g._rows = rows;
        g._cols = cols;
        if (rows * cols > 0)
            g._cells = std::make_unique<T[]>(std::size_t(rows * cols));
        return g;
    }

    /// Creates a rows x cols grid with every cell a copy of value.
    [[nodiscard]] static grid create_filled(isize rows, isize cols, T const& value)
    {
        auto g = create_defaulted(rows, cols);
        for (auto& cell : g)
            cell = value;
        return g;
    }

    // construction
public:
    /// Empty 0 x 0 grid.
    grid() = default;

    /// Creates a grid from nested lists, one inner list per row.
    /// Precondition: all rows have the same length.
    /// Usage:
    ///   auto g = uc::grid<int>{{1, 2, 3}, {4, 5, 6}}; // 2 x 3
    grid(std::initializer_list<std::initializer_list<T>> rows)
    {
        auto const row_count = isize(rows.size());
        auto const col_count = row_count == 0 ? isize(0) : isize(rows.begin()->size());
        *this = create_defaulted(row_count, col_count);

        isize r = 0;
        for (auto const& row : rows)
        {
            UC_ASSERT(isize(row.size()) == col_count, "all rows of a grid must have the same length");
            isize c = 0;
            for (auto const& v : row)
                (*this)(r, c++) = v;
            ++r;
        }
    }

    grid(grid&& rhs) noexcept
      : _cells(uc::move(rhs._cells)), _rows(uc::exchange(rhs._rows, 0)), _cols(uc::exchange(rhs._cols, 0))
    {
    }

    grid& operator=(grid&& rhs) noexcept
    {
        _cells = uc::move(rhs._cells);
        _rows = uc::exchange(rhs._rows, 0);
        _cols = uc::exchange(rhs._cols, 0);
        return *this;
    }

    grid(grid const& rhs) : _rows(rhs._rows), _cols(rhs._cols)
    {
        if (rhs._cells)
        {
            _cells = std::make_unique<T[]>(std::size_t(rhs.size()));
            for (isize i = 0; i < rhs.size(); ++i)
                _cells[i] = rhs._cells[i];
        }
    }

    grid& operator=(grid const& rhs)
    {
        if (this != &rhs)
            *this = grid(rhs);
        return *this;
    }

    ~grid() = default;

    // element access
public:
    /// Returns the cell at (row, col).
    /// Precondition: 0 <= row < rows() && 0 <= col < cols().
    [[nodiscard]] T& operator()(isize row, isize col)
    {
        UC_ASSERT(0 <= row && row < _rows && 0 <= col && col < _cols, "grid cell out of bounds");
        return _cells[row * _cols + col];
    }
    [[nodiscard]] T const& operator()(isize row, isize col) const
    {
        UC_ASSERT(0 <= row && row < _rows && 0 <= col && col < _cols, "grid cell out of bounds");
        return _cells[row * _cols + col];
    }

    /// Returns a view of the cols() cells of one row.
    /// Precondition: 0 <= r < rows().
    [[nodiscard]] span<T> row(isize r)
    {
        UC_ASSERT(0 <= r && r < _rows, "grid row out of bounds");
        return span<T>(data(), size()).subspan(r * _cols, _cols);
    }
    [[nodiscard]] span<T const> row(isize r) const
    {
        UC_ASSERT(0 <= r && r < _rows, "grid row out of bounds");
        return span<T const>(data(), size()).subspan(r * _cols, _cols);
    }

    /// Row-major cell storage, nullptr if the grid has no cells.
    [[nodiscard]] T* data() { return _cells.get(); }
    [[nodiscard]] T const* data() const { return _cells.get(); }

    // iterators (row-major over all cells)
public:
    [[nodiscard]] T* begin() { return data(); }
    [[nodiscard]] T* end() { return data() + size(); }
    [[nodiscard]] T const* begin() const { return data(); }
    [[nodiscard]] T const* end() const { return data() + size(); }

    // queries
public:
    [[nodiscard]] isize rows() const { return _rows; }
    [[nodiscard]] isize cols() const { return _cols; }

    /// Number of cells, rows() * cols().
    [[nodiscard]] isize size() const { return _rows * _cols; }

    /// True if the grid has no cells (it may still have rows, e.g. 3 x 0).
    [[nodiscard]] bool empty() const { return size() == 0; }

    // comparison
public:
    /// Grids are equal if they have the same shape and equal cells.
    [[nodiscard]] friend bool operator==(grid const& lhs, grid const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._rows != rhs._rows || lhs._cols != rhs._cols)
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._cells[i] == rhs._cells[i]))
                return false;
        return true;
    }

    // members
private:
    std::unique_ptr<T[]> _cells;
    isize _rows = 0;
    isize _cols = 0;
};

namespace uc::impl
{
// how a single entry of a jagged row range is read
// get(entry) returns nullptr for an absent row
template <class Row>
struct jagged_row
{
    using type = Row;
    static Row const* get(Row const& row) { return &row; }
};
template <class Row>
struct jagged_row<uc::optional<Row>>
{
    using type = Row;
    static Row const* get(uc::optional<Row> const& row) { return row.has_value() ? &row.value() : nullptr; }
};
template <class Row>
struct jagged_row<Row*>
{
    using type = std::remove_const_t<Row>;
    static Row const* get(Row* row) { return row; }
};

template <class Rows>
using jagged_entry_t = std::remove_cvref_t<decltype(*std::begin(std::declval<Rows const&>()))>;

template <class Rows>
using jagged_row_t = typename jagged_row<jagged_entry_t<Rows>>::type;

template <class Rows>
using jagged_element_t = std::remove_cvref_t<decltype(*std::begin(std::declval<jagged_row_t<Rows> const&>()))>;
} // namespace uc::impl

namespace uc
{
/// A sized range of rows, each row (or absent row) a sized range of cells.
template <class Rows>
concept jagged_rows = requires(Rows const& rows, impl::jagged_row_t<Rows> const& row) {
    std::size(rows);
    std::begin(rows);
    std::size(row);
    *std::begin(row);
};

// =========================================================================================================
// Rectangular -> jagged
// =========================================================================================================

/// Converts a grid to a jagged layout with rows() rows of exactly cols() cells each.
/// A grid without columns yields rows() empty rows, never fewer rows.
/// Usage:
///   uc::to_jagged(uc::grid<int>{{1, 2, 3}, {4, 5, 6}}); // {{1, 2, 3}, {4, 5, 6}}
template <class T>
[[nodiscard]] jagged<T> to_jagged(grid<T> const& g)
{
    jagged<T> result;
    result.reserve(std::size_t(g.rows()));
    for (isize r = 0; r < g.rows(); ++r)
    {
        auto const row = g.row(r);
        result.emplace_back(row.begin(), row.end());
    }
    return result;
}

/// Absent grid in, absent jagged layout out.
template <class T>
[[nodiscard]] optional<jagged<T>> to_jagged(optional<grid<T>> const& g)
{
    if (!g.has_value())
        return nullopt;
    return to_jagged(g.value());
}

// =========================================================================================================
// Jagged -> rectangular
// =========================================================================================================

/// Converts a jagged layout to a grid of (row count) x (widest row length).
/// Cells that the source does not have (short rows, absent rows) are T{}.
/// Zero rows yield a 0 x 0 grid.
/// Usage:
///   uc::to_grid(uc::jagged<int>{{1, 2}, {3}}); // {{1, 2}, {3, 0}}
template <jagged_rows Rows>
[[nodiscard]] auto to_grid(Rows const& rows)
{
    using entry_t = impl::jagged_entry_t<Rows>;
    using T = impl::jagged_element_t<Rows>;

    isize cols = 0;
    for (auto const& entry : rows)
        if (auto const* row = impl::jagged_row<entry_t>::get(entry))
            cols = uc::max(cols, isize(std::size(*row)));

    auto result = grid<T>::create_defaulted(isize(std::size(rows)), cols);

    isize r = 0;
    for (auto const& entry : rows)
    {
        if (auto const* row = impl::jagged_row<entry_t>::get(entry))
        {
            isize c = 0;
            for (auto const& v : *row)
                result(r, c++) = v;
        }
        ++r;
    }

    return result;
}

/// Absent jagged layout in, absent grid out.
template <jagged_rows Rows>
[[nodiscard]] optional<grid<impl::jagged_element_t<Rows>>> to_grid(optional<Rows> const& rows)
{
    if (!rows.has_value())
        return nullopt;
    return to_grid(rows.value());
}

// =========================================================================================================
// Transposition
// =========================================================================================================

/// Swaps rows and columns: the result is cols() x rows() with out(c, r) == g(r, c).
/// transposed(transposed(g)) == g.
template <class T>
[[nodiscard]] grid<T> transposed(grid<T> const& g)
{
    auto result = grid<T>::create_defaulted(g.cols(), g.rows());
    for (isize r = 0; r < g.rows(); ++r)
        for (isize c = 0; c < g.cols(); ++c)
            result(c, r) = g(r, c);
    return result;
}

template <class T>
[[nodiscard]] optional<grid<T>> transposed(optional<grid<T>> const& g)
{
    if (!g.has_value())
        return nullopt;
    return transposed(g.value());
}

/// Transposes a jagged layout by going through a grid: to_jagged(transposed(to_grid(rows))).
/// The result is always rectangular in shape, (widest row length) x (row count),
/// with cells missing from short or absent rows filled with T{}.
/// Usage:
///   uc::transposed(uc::jagged<int>{{1, 2, 3}, {4}}); // {{1, 4}, {2, 0}, {3, 0}}
template <jagged_rows Rows>
[[nodiscard]] auto transposed(Rows const& rows)
{
    return to_jagged(transposed(to_grid(rows)));
}

template <jagged_rows Rows>
[[nodiscard]] optional<jagged<impl::jagged_element_t<Rows>>> transposed(optional<Rows> const& rows)
{
    if (!rows.has_value())
        return nullopt;
    return transposed(rows.value());
}

} // namespace uc
