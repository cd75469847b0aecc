#pragma once

#include <stack-array/assert.hh>
#include <stack-array/fwd.hh>
#include <stack-array/impl/object_lifetime_util.hh>
#include <stack-array/optional.hh>
#include <stack-array/span.hh>
#include <stack-array/utility.hh>

#include <cstddef>
#include <iterator>

/// Cursor over a range removed from a container by drain(start, end).
///
/// The container already reports size() == start while the cursor is alive.
/// The drained elements are still in their slots; the cursor yields them by value, from the front
/// (next) or from the back (next_back), each exactly once.
///
/// When the cursor is destroyed, complete or abandoned half-way:
///   - every element it did not yield is destroyed
///   - the tail that followed the drained range moves back behind the container's live elements
///   - the container's size becomes start + tail length
///
/// The cursor holds the only mutable path to its container and can be neither copied nor moved.
///
/// Usage:
///   for (auto&& s : vec.drain(1, 3))
///       out.push_back(sa::move(s));
///
///   auto d = vec.drain();
///   while (auto v = d.next(); v.has_value())
///       consume(sa::move(v).value());
template <class T, class ContainerT>
struct sa::drain
{
    using storage_t = typename ContainerT::storage_t;

    // single-pass iteration
public:
    /// Range-for support.
    /// Dereferencing refers to the current front element, still owned by the cursor.
    /// Advancing destroys that element (the caller may have moved from it) and steps forward.
    struct iterator
    {
        using iterator_concept = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;

        [[nodiscard]] T& operator*() const { return *_drain->_front; }
        iterator& operator++()
        {
            _drain->_front->~T();
            ++_drain->_front;
            return *this;
        }
        void operator++(int) { ++*this; }
        [[nodiscard]] bool operator==(sentinel) const { return _drain->_front == _drain->_back; }

        drain* _drain = nullptr;
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] sentinel end() const { return {}; }

    // yielding
public:
    /// Moves out the next element from the front, or returns nothing when exhausted.
    [[nodiscard]] optional<T> next()
    {
        if (_front == _back)
            return nullopt;
        auto const p = _front++;
        optional<T> result(sa::move(*p));
        p->~T();
        return result;
    }

    /// Moves out the next element from the back, or returns nothing when exhausted.
    [[nodiscard]] optional<T> next_back()
    {
        if (_front == _back)
            return nullopt;
        auto const p = --_back;
        optional<T> result(sa::move(*p));
        p->~T();
        return result;
    }

    // queries
public:
    /// Number of elements not yielded yet.
    [[nodiscard]] isize remaining() const { return _back - _front; }
    [[nodiscard]] bool empty() const { return _front == _back; }

    /// View of the elements not yielded yet.
    [[nodiscard]] span<T const> as_span() const { return span<T const>(_front, _back); }

    // lifetime
public:
    ~drain()
    {
        // retire what was never yielded, then close the gap
        impl::destroy_objects(_front, _back);
        _front = _back;

        if (_tail_len > 0)
        {
            auto const start = _storage->size();
            if (_tail_start != start)
                impl::relocate_objects_down(_storage->data() + start, _storage->data() + _tail_start, _tail_len);
            _storage->set_size(start + _tail_len);
        }
    }

    drain(drain const&) = delete;
    drain(drain&&) = delete;
    drain& operator=(drain const&) = delete;
    drain& operator=(drain&&) = delete;

private:
    // only the container creates cursors, the container size is already `start`
    drain(storage_t& storage, isize start, isize end, isize old_size)
      : _storage(&storage),
        _front(storage.data() + start),
        _back(storage.data() + end),
        _tail_start(end),
        _tail_len(old_size - end)
    {
    }

    friend impl::sequence_engine<T, storage_t, ContainerT>;

    storage_t* _storage;
    T* _front;
    T* _back;
    isize _tail_start;
    isize _tail_len;
};
