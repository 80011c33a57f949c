#pragma once

#include <util-core/assert.hh>
#include <util-core/fwd.hh>

#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Object lifetime:
//   placement_new               - tag for the non-allocating placement new overload
//   storage_for<T>              - uninitialized, properly aligned storage for a single T
//

namespace uc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = uc::move(a);              // move construct b from a
template <class T>
[[nodiscard]] UC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] UC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] UC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto rows = uc::exchange(other._rows, 0);  // steal size, leave other empty
template <class T, class U = T>
[[nodiscard]] UC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// Returns a reference to allow selecting elements without copying (works with noncopyables)
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter) - returning reference is intentional
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter) - returning reference is intentional
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the util-core placement new overload
/// Unlike the <new> placement form, this one can never be shadowed by a class-specific operator new
/// Usage:
///   new (uc::placement_new, &storage.value) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Uninitialized storage for exactly one T
/// The value member is only alive if the owner constructed it (via placement_new)
/// and it is never destroyed implicitly.
/// Trivially copyable and destructible iff T is, so owners like optional<T> can stay trivial.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    storage_for(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace uc

/// Non-allocating placement new selected by uc::placement_new
[[nodiscard]] UC_FORCE_INLINE void* operator new(std::size_t, uc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
/// Matching placement delete, only called if a constructor throws during placement new
UC_FORCE_INLINE void operator delete(void*, uc::placement_new_t, void*) noexcept {}
