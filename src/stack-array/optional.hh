#pragma once

#include <stack-array/assert.hh>
#include <stack-array/fwd.hh>
#include <stack-array/utility.hh>

#include <type_traits>

/// Tag for "no value", only obtainable as sa::nullopt.
/// Not default constructible, so `opt = {}` keeps meaning "empty optional".
struct sa::nullopt_t
{
    struct private_tag
    {
    };
    explicit constexpr nullopt_t(private_tag) {}
};

namespace sa
{
inline constexpr nullopt_t nullopt{nullopt_t::private_tag{}};
}

/// A T or nothing, the result type of the removals that may find nothing:
///   try_pop_back() on an empty container, drain::next() / next_back() on an exhausted cursor.
///
/// Deliberately small: has_value(), value(), value_or(), reset() and equality.
/// value() on an empty optional is a precondition violation (checked in every build).
/// optional<T> is trivially copyable whenever T is.
///
/// Usage:
///   while (auto e = cursor.next(); e.has_value())
///       consume(sa::move(e).value());
template <class T>
struct sa::optional
{
    // construction
public:
    constexpr optional() noexcept : _empty() {}
    constexpr optional(nullopt_t) noexcept : _empty() {}

    /// Implicit from anything T is implicitly constructible from.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
    {
        this->_construct_from(sa::forward<U>(value));
    }

    // trivially copyable T: everything is defaulted, the union is copied bytewise
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
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // other T: element-wise, a moved-from optional is empty
public:
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _empty()
    {
        if (rhs._has_value)
            this->_construct_from(rhs._value);
    }
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _empty()
    {
        if (rhs._has_value)
        {
            this->_construct_from(sa::move(rhs._value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (&rhs == this)
            return *this;
        this->reset();
        if (rhs._has_value)
            this->_construct_from(rhs._value);
        return *this;
    }
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (&rhs == this)
            return *this;
        this->reset();
        if (rhs._has_value)
        {
            this->_construct_from(sa::move(rhs._value));
            rhs.reset();
        }
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        this->reset();
    }

    // access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    [[nodiscard]] constexpr T& value() &
    {
        SA_ASSERT_ALWAYS(_has_value, "value() called on an empty optional");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        SA_ASSERT_ALWAYS(_has_value, "value() called on an empty optional");
        return _value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        SA_ASSERT_ALWAYS(_has_value, "value() called on an empty optional");
        return sa::move(_value);
    }

    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _value;
        return static_cast<T>(sa::forward<U>(fallback));
    }

    /// Destroys the value if there is one; the optional is empty afterwards.
    constexpr void reset() noexcept
    {
        if (!_has_value)
            return;
        _has_value = false;
        _value.~T();
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (!lhs._has_value || !rhs._has_value)
            return lhs._has_value == rhs._has_value;
        return lhs._value == rhs._value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._value == rhs;
    }

    // `opt == true` would otherwise compile for optional<int> through the converting constructor
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    template <class U>
    constexpr void _construct_from(U&& v)
    {
        new (sa::placement_new, &_value) T(sa::forward<U>(v));
        _has_value = true; // _after_ construction
    }

    union
    {
        char _empty;
        T _value;
    };
    bool _has_value = false;
};
