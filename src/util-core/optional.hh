#pragma once

#include <util-core/assert.hh>
#include <util-core/fwd.hh>
#include <util-core/utility.hh>

#include <type_traits>

/// Tag for the empty state of uc::optional, spelled uc::nullopt.
/// Not default constructible, so `opt = {}` cannot silently pick it.
struct uc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace uc
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace uc

/// A value of type T or nothing.
///
/// util-core uses it for "absent data": a matrix that was never given, or a missing row of a jagged input.
/// Absence is a valid outcome and is passed through, never reported as an error.
///
/// The interface is deliberately small:
///   - construct from a value or from uc::nullopt
///   - has_value() / value()
///   - compare against uc::nullopt
///
/// Usage:
///   uc::optional<uc::grid<int>> g = load();
///   if (g.has_value())
///       use(g.value());
///   auto t = uc::transposed(g); // absent in, absent out
///
/// Copies and moves are trivial whenever T's are, so optional<int> stays a plain value.
/// Otherwise a moved-from optional is left empty.
template <class T>
struct uc::optional
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) // NOLINT
    {
        construct_from(uc::forward<U>(value));
    }

    // copy and move
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            construct_from(rhs._storage.value);
    }

    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            construct_from(uc::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._has_value)
                construct_from(rhs._storage.value);
        }
        return *this;
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._has_value)
            {
                construct_from(uc::move(rhs._storage.value));
                rhs.reset();
            }
        }
        return *this;
    }

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns the held value with the value category of the optional itself.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        UC_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    // helpers
private:
    template <class U>
    void construct_from(U&& value)
    {
        new (uc::placement_new, &_storage.value) T(uc::forward<U>(value));
        _has_value = true;
    }

    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    // members
private:
    uc::storage_for<T> _storage;
    bool _has_value = false;
};
