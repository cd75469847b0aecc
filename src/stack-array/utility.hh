#pragma once

#include <stack-array/assert.hh>
#include <stack-array/fwd.hh>

#include <type_traits>

// Small language-level helpers used throughout stack-array:
//
//   sa::move, sa::forward, sa::exchange   - <utility> equivalents without the header
//   sa::min, sa::max                      - by const reference, only need operator<
//   new (sa::placement_new, p) T(...)     - placement new without <new>
//   SA_DEFER { ... };                     - scope guard, the engine's exception-safety fixups
//   sa::sentinel                          - end marker of single-pass ranges (drain)

namespace sa
{
// =========================================================================================================
// Value categories
// =========================================================================================================

template <class T>
[[nodiscard]] constexpr std::remove_reference_t<T>&& move(T&& t) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(t);
}

template <class T>
[[nodiscard]] constexpr T&& forward(std::remove_reference_t<T>& t) noexcept
{
    return static_cast<T&&>(t);
}

template <class T>
[[nodiscard]] constexpr T&& forward(std::remove_reference_t<T>&& t) noexcept
{
    static_assert(!std::is_lvalue_reference_v<T>, "cannot forward an rvalue as an lvalue");
    return static_cast<T&&>(t);
}

/// Assigns new_val to obj and returns what obj held before.
/// Usage:
///   _size = sa::exchange(rhs._size, 0); // take the count, leave rhs empty
template <class T, class U = T>
constexpr T exchange(T& obj, U&& new_val)
{
    T previous = sa::move(obj);
    obj = sa::forward<U>(new_val);
    return previous;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

// on ties, min returns a and max returns b

template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a;
}

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return b < a ? a : b;
}

// =========================================================================================================
// Placement new
// =========================================================================================================

struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new{};

// =========================================================================================================
// Scope guard
// =========================================================================================================

namespace impl
{
template <class F>
struct scope_exit
{
    F on_exit;

    explicit scope_exit(F f) : on_exit(sa::move(f)) {}
    ~scope_exit() noexcept(false) { on_exit(); }

    scope_exit(scope_exit const&) = delete;
    scope_exit(scope_exit&&) = delete;
    scope_exit& operator=(scope_exit const&) = delete;
    scope_exit& operator=(scope_exit&&) = delete;
};

struct scope_exit_maker
{
    template <class F>
    scope_exit<F> operator->*(F f) const
    {
        return scope_exit<F>(sa::move(f));
    }
};
} // namespace impl

/// Runs the following block when the enclosing scope is left, normally or by an exception.
/// The block captures everything by reference.
/// Usage:
///   _storage.set_size(0);
///   SA_DEFER { _storage.set_size(original_size - deleted); };
///   // ... calls into a user predicate that may throw ...
#define SA_DEFER auto const SA_MACRO_JOIN(_sa_scope_exit_, __COUNTER__) = ::sa::impl::scope_exit_maker{}->*[&]()

// =========================================================================================================
// Ranges
// =========================================================================================================

/// end() of ranges whose end is a state rather than a position.
/// Usage:
///   for (auto&& v : vec.drain(1)) // drain::end() returns sa::sentinel
///       consume(sa::move(v));
struct sentinel
{
};
} // namespace sa

[[nodiscard]] inline void* operator new(std::size_t, sa::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}

// only called if a constructor invoked via placement_new throws
inline void operator delete(void*, sa::placement_new_tag, void*) noexcept {}
