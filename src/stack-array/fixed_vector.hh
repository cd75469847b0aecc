#pragma once

#include <stack-array/impl/inline_storage.hh>
#include <stack-array/impl/sequence_engine.hh>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <type_traits>

namespace sa::impl
{
// a <=> b where available, otherwise derived from operator<
struct synth_three_way
{
    template <class U>
    [[nodiscard]] constexpr auto operator()(U const& a, U const& b) const
    {
        if constexpr (std::three_way_comparable<U>)
        {
            return a <=> b;
        }
        else
        {
            if (a < b)
                return std::weak_ordering::less;
            if (b < a)
                return std::weak_ordering::greater;
            return std::weak_ordering::equivalent;
        }
    }
};
} // namespace sa::impl

/// Vector of up to N elements of type T with all storage inline.
/// Never allocates: sizeof(fixed_vector<T, N>) is the element slots plus the live count.
/// Supports a runtime size up to the compile-time capacity N, including N == 0.
///
/// Exceeding the capacity (push_back when full, oversized initializers, append/extend that do not
/// fit) reports capacity_exceeded. Bad indices and ranges report index_out_of_bounds.
/// Both are checked before anything is modified, see assert.hh for how they are reported.
/// try_push_back / try_pop_back are the non-failing variants.
///
/// Elements must be nothrow move constructible and nothrow destructible.
/// Copies are deep, moves relocate the elements and leave the source empty.
///
/// Usage:
///   auto v = sa::fixed_vector<int, 4>{1, 2, 3};
///   v.push_back(4);
///   v.retain([](int x) { return x % 2 == 0; }); // [2, 4]
///   for (auto x : v.drain())
///       use(x);
template <class T, sa::isize N>
struct sa::fixed_vector : private sa::impl::sequence_engine<T, sa::impl::inline_storage<T, N>, sa::fixed_vector<T, N>>
{
    using base = impl::sequence_engine<T, impl::inline_storage<T, N>, fixed_vector<T, N>>;
    using storage_t = impl::inline_storage<T, N>;
    using value_type = T;

    // element access
public:
    using base::operator[]; // access element by index
    using base::back;       // access last element
    using base::data;       // get pointer to underlying storage
    using base::front;      // access first element

    // iterators
public:
    using base::begin; // get pointer to first element
    using base::end;   // get pointer to one past last element

    // views
public:
    using base::as_span;  // view of all elements
    using base::split_at; // two disjoint views [0, mid) and [mid, size)
    using base::subspan;  // view of [start, end) or [start, size)

    // queries
public:
    using base::capacity;           // compile-time capacity N
    using base::empty;              // check if vector is empty
    using base::is_full;            // check if size() == N
    using base::remaining_capacity; // N - size()
    using base::size;               // get number of elements
    using base::size_bytes;         // get total size in bytes

    // factories
public:
    using base::create_copy_of;   // create deep copy from span
    using base::create_defaulted; // create with value-initialized elements
    using base::create_filled;    // create with copies of a value
    using base::create_from;      // create by moving from a fixed-size array

    // modifiers - growth operations
public:
    using base::append;           // relocate all elements of another fixed_vector to the back
    using base::emplace_at;       // construct element at index
    using base::emplace_back;     // construct element at back
    using base::extend_from_span; // copy elements to the back (all or nothing)
    using base::insert_at;        // add element at index
    using base::push_back;        // add element at back
    using base::try_push_back;    // add element at back unless full

    // modifiers - removal operations
public:
    using base::clear;    // destroy all elements, size becomes 0
    using base::truncate; // keep the first k elements

    using base::pop_back;     // remove and return last element
    using base::remove_back;  // remove last element (fast path, no return value)
    using base::try_pop_back; // remove and return last element, nothing when empty

    using base::pop_at;              // remove and return element at index (preserves order)
    using base::pop_at_unordered;    // remove and return element at index (O(1), does not preserve order)
    using base::remove_at;           // remove element at index (preserves order)
    using base::remove_at_unordered; // remove element at index (O(1), does not preserve order)

    using base::dedup;        // remove consecutive equal elements
    using base::dedup_by;     // remove consecutive elements in the same bucket
    using base::dedup_by_key; // remove consecutive elements with equal keys
    using base::drain;        // remove a range, yielding its elements through a cursor
    using base::retain;       // keep elements matching a predicate
    using base::retain_mut;   // keep elements matching a predicate that may modify them

    /// Creates a vector holding copies of the listed values.
    /// Reports capacity_exceeded when the list is longer than N (nothing is truncated).
    fixed_vector(std::initializer_list<T> values)
    {
        auto const count = isize(values.size());
        SA_CHECK_CAPACITY(count, N, "initializer list longer than the capacity");
        base::extend_from_span(span<T const>(values.begin(), count));
    }

    // fixed_vector has deep-copy value semantics
    fixed_vector() = default;
    ~fixed_vector() = default;
    fixed_vector(fixed_vector&&) = default;
    fixed_vector& operator=(fixed_vector&&) = default;
    fixed_vector(fixed_vector const&) = default;
    fixed_vector& operator=(fixed_vector const&) = default;

    friend base;
    template <class, class, class>
    friend struct impl::sequence_engine;

    // comparison
public:
    /// Element-wise equality, also across different capacities.
    template <isize M>
    [[nodiscard]] friend bool operator==(fixed_vector const& lhs, fixed_vector<T, M> const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return sa::equal(lhs.as_span(), rhs.as_span());
    }

    [[nodiscard]] friend bool operator==(fixed_vector const& lhs, span<T const> rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return sa::equal(lhs.as_span(), rhs);
    }

    template <std::size_t S>
    [[nodiscard]] friend bool operator==(fixed_vector const& lhs, T const (&rhs)[S])
        requires requires(T const& v) { bool(v == v); }
    {
        return sa::equal(lhs.as_span(), span<T const>(rhs));
    }

    /// Lexicographic ordering, shorter prefix first. Works across capacities like operator==.
    template <isize M>
    [[nodiscard]] friend auto operator<=>(fixed_vector const& lhs, fixed_vector<T, M> const& rhs)
        requires requires(T const& v) { v < v; }
    {
        return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                                      impl::synth_three_way{});
    }
};

namespace std
{
/// Order-sensitive hash over the elements, available when std::hash<T> is.
template <class T, sa::isize N>
    requires requires(T const& v) { std::hash<T>{}(v); }
struct hash<sa::fixed_vector<T, N>>
{
    [[nodiscard]] std::size_t operator()(sa::fixed_vector<T, N> const& v) const noexcept
    {
        // boost-style hash_combine over the element hashes, seeded with the size
        auto h = std::size_t(v.size());
        for (auto const& e : v)
            h ^= std::hash<T>{}(e) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};
} // namespace std
