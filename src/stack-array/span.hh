#pragma once

#include <stack-array/assert.hh>
#include <stack-array/fwd.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

/// Borrowed view of `size()` contiguous T, pointer plus length.
/// Never owns anything: whatever it points into has to outlive it.
/// Copying a span copies the view, not the elements (always trivially copyable).
///
/// fixed_vector hands these out for its sub-range access:
///   auto mid = vec.subspan(1, 3);         // elements [1, 3)
///   auto [left, right] = vec.split_at(2); // [0, 2) and [2, size)
///
/// Indexing and sub-range requests are bounds checked in every build (index_out_of_bounds).
template <class T>
struct sa::span
{
    // construction
public:
    /// Empty, data() is nullptr.
    constexpr span() = default;

    constexpr explicit span(T* first, isize count) : _data(first), _size(count)
    {
        SA_ASSERT(count >= 0, "negative span length");
    }

    constexpr explicit span(T* first, T* last) : _data(first), _size(last - first)
    {
        SA_ASSERT(first <= last, "span end before begin");
    }

    /// Lets `f({1, 2, 3})` bind to `f(span<int const>)`.
    /// The list only lives until the end of the full expression, do not store such a span.
    constexpr span(std::initializer_list<std::remove_const_t<T>> values)
        requires std::is_const_v<T>
      : _data(values.begin()), _size(isize(values.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&array)[N]) : _data(array), _size(isize(N))
    {
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> other) : _data(other.data()), _size(other.size())
    {
    }

    /// Any contiguous container with data() and size() (std::vector, fixed_vector, ...).
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(isize(c.size()))
    {
    }

    // element access
public:
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SA_CHECK_BOUNDS(0 <= i && i < _size, i, _size, "span index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        SA_ASSERT_ALWAYS(_size > 0, "front() of an empty span");
        return *_data;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        SA_ASSERT_ALWAYS(_size > 0, "back() of an empty span");
        return _data[_size - 1];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // sub-ranges
public:
    /// View of [start, end).
    /// Precondition: 0 <= start <= end <= size(), reported as index_out_of_bounds.
    [[nodiscard]] constexpr span subspan(isize start, isize end) const
    {
        SA_CHECK_BOUNDS(0 <= start && start <= end, start, end, "subspan start must lie in [0, end]");
        SA_CHECK_BOUNDS(end <= _size, end, _size, "subspan end past the end of the span");
        return span(_data + start, end - start);
    }

    /// View of [start, size()).
    [[nodiscard]] constexpr span subspan(isize start) const { return subspan(start, _size); }

    [[nodiscard]] constexpr span first(isize count) const { return subspan(0, count); }

    [[nodiscard]] constexpr span last(isize count) const
    {
        SA_CHECK_BOUNDS(0 <= count && count <= _size, count, _size, "last() count out of bounds");
        return subspan(_size - count, _size);
    }

    /// Splits into [0, mid) and [mid, size()).
    /// The halves do not overlap, so both may be written at the same time.
    [[nodiscard]] constexpr span_split<T> split_at(isize mid) const
    {
        SA_CHECK_BOUNDS(0 <= mid && mid <= _size, mid, _size, "split point out of bounds");
        return {span(_data, mid), span(_data + mid, _size - mid)};
    }

private:
    T* _data = nullptr;
    isize _size = 0;
};

/// Result of split_at, an aggregate so that `auto [left, right] = s.split_at(2);` works.
template <class T>
struct sa::span_split
{
    span<T> left;
    span<T> right;
};

namespace sa
{
/// True if both views have the same length and pairwise equal elements.
template <class T, class U>
    requires requires(T const& a, U const& b) { bool(a == b); }
[[nodiscard]] constexpr bool equal(span<T> lhs, span<U> rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    auto const* b = rhs.data();
    for (auto const& a : lhs)
        if (!(a == *b++))
            return false;
    return true;
}
} // namespace sa
