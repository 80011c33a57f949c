#pragma once

#include <util-core/assert.hh>
#include <util-core/fwd.hh>

#include <cstddef>
#include <utility> // for tuple_size


/// Fixed-size array of exactly N elements of type T.
/// Similar to std::array but follows util-core conventions (isize, asserted access).
/// Trivial aggregate type - supports aggregate initialization: fixed_array<int, 3> arr = {1, 2, 3}.
/// Owns the underlying memory.
/// Used as the raw result type of the digests (fixed_array<u8, 32> and fixed_array<u8, 16>).
template <class T, uc::isize N>
struct uc::fixed_array
{
    static_assert(N > 0, "fixed_array size must be positive");

    // members
public:
    T _data[N];

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < N.
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        UC_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        UC_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() { return _data[0]; }
    [[nodiscard]] constexpr T const& front() const { return _data[0]; }

    [[nodiscard]] constexpr T& back() { return _data[N - 1]; }
    [[nodiscard]] constexpr T const& back() const { return _data[N - 1]; }

    /// Returns a pointer to the underlying contiguous storage.
    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    // queries
public:
    /// Returns the compile-time size N.
    [[nodiscard]] constexpr isize size() const { return N; }
    [[nodiscard]] constexpr bool empty() const { return false; }

    // comparison
public:
    /// Element-wise equality.
    [[nodiscard]] friend constexpr bool operator==(fixed_array const& lhs, fixed_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        for (isize i = 0; i < N; ++i)
            if (!(lhs._data[i] == rhs._data[i]))
                return false;
        return true;
    }

    // tuple protocol
public:
    /// Returns a reference to the I-th element.
    /// Supports std::get<I>(arr) and structured bindings.
    template <isize I>
    [[nodiscard]] constexpr T& get()
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }
    template <isize I>
    [[nodiscard]] constexpr T const& get() const
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }
};

template <class T, uc::isize N>
struct std::tuple_size<uc::fixed_array<T, N>> : std::integral_constant<std::size_t, static_cast<std::size_t>(N)>
{
};

template <std::size_t I, class T, uc::isize N>
struct std::tuple_element<I, uc::fixed_array<T, N>>
{
    using type = T;
};
