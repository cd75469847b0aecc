#pragma once

#include <stack-array/assert.hh>
#include <stack-array/drain.hh>
#include <stack-array/fwd.hh>
#include <stack-array/impl/object_lifetime_util.hh>
#include <stack-array/optional.hh>
#include <stack-array/span.hh>
#include <stack-array/utility.hh>

#include <type_traits>


/// Mixin implementing every operation of a contiguous sequence on top of a slot storage policy.
///
/// This is a CRTP-style helper: concrete containers privately inherit it as
/// `sa::impl::sequence_engine<T, Storage, Derived>`, then selectively re-expose members via `using`.
/// Example (abridged):
///
///     template <class T, isize N>
///     struct sa::fixed_vector : private impl::sequence_engine<T, impl::inline_storage<T, N>, fixed_vector<T, N>> {
///         using base = impl::sequence_engine<T, impl::inline_storage<T, N>, fixed_vector<T, N>>;
///         using base::operator[];
///         using base::push_back;
///         // ...
///         friend base;
///     };
///
/// The storage policy provides raw slots, the live count and a growth hook:
///   data(), size(), set_size(n), capacity(), ensure_capacity_for(total, message)
/// ensure_capacity_for() is the only place where backends differ. The inline storage reports
/// capacity_exceeded, a heap-backed storage would reallocate instead. Everything else, all the
/// shifting and the exception-safety fixups, lives here once.
///
///
/// === Slot invariant ===
///
/// Slots [0, size) are live and slots [size, capacity) are vacant whenever a public member returns
/// or unwinds. No element is destroyed twice and no live element is relocated without its source
/// becoming vacant.
///
/// === Exception guarantees ===
///
/// Contract checks (capacity, bounds, non-empty) run before anything is touched. A handler that
/// throws out of a failed check leaves the container exactly as it was.
///
/// Constructing a new element (push_back, emplace_at, extend_from_span) either succeeds or leaves
/// the size and all live elements unchanged.
///
/// retain and dedup_by call user code in a loop. If that code throws, a scope guard closes the gap
/// left by removed elements and fixes the size before the exception propagates. Elements that were
/// already rejected stay destroyed, elements that were not visited yet are kept.
///
/// Element relocation never throws (elements are nothrow move constructible and destructible).
template <class T, class StorageT, class ContainerT>
struct sa::impl::sequence_engine
{
    using container_t = ContainerT;
    using storage_t = StorageT;

    static_assert(std::is_nothrow_move_constructible_v<T>, "elements must be nothrow move constructible");
    static_assert(std::is_nothrow_destructible_v<T>, "elements must be nothrow destructible");

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Reports index_out_of_bounds unless 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        SA_CHECK_BOUNDS(0 <= i && i < _storage.size(), i, _storage.size(), "index out of bounds");
        return _storage.data()[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        SA_CHECK_BOUNDS(0 <= i && i < _storage.size(), i, _storage.size(), "index out of bounds");
        return _storage.data()[i];
    }

    /// Returns a reference to the first element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "front() called on empty container");
        return _storage.data()[0];
    }
    [[nodiscard]] constexpr T const& front() const
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "front() called on empty container");
        return _storage.data()[0];
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "back() called on empty container");
        return _storage.data()[_storage.size() - 1];
    }
    [[nodiscard]] constexpr T const& back() const
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "back() called on empty container");
        return _storage.data()[_storage.size() - 1];
    }

    /// Returns a pointer to the first slot.
    /// Never nullptr, even for an empty container.
    [[nodiscard]] constexpr T* data() { return _storage.data(); }
    [[nodiscard]] constexpr T const* data() const { return _storage.data(); }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _storage.data(); }
    [[nodiscard]] constexpr T* end() { return _storage.data() + _storage.size(); }
    [[nodiscard]] constexpr T const* begin() const { return _storage.data(); }
    [[nodiscard]] constexpr T const* end() const { return _storage.data() + _storage.size(); }

    // views
public:
    /// View of all live elements.
    [[nodiscard]] constexpr span<T> as_span() { return span<T>(_storage.data(), _storage.size()); }
    [[nodiscard]] constexpr span<T const> as_span() const { return span<T const>(_storage.data(), _storage.size()); }

    /// View of the live elements [start, end).
    /// Reports index_out_of_bounds unless 0 <= start <= end <= size().
    [[nodiscard]] constexpr span<T> subspan(isize start, isize end) { return as_span().subspan(start, end); }
    [[nodiscard]] constexpr span<T const> subspan(isize start, isize end) const
    {
        return as_span().subspan(start, end);
    }

    /// View of the live elements [start, size()).
    [[nodiscard]] constexpr span<T> subspan(isize start) { return as_span().subspan(start); }
    [[nodiscard]] constexpr span<T const> subspan(isize start) const { return as_span().subspan(start); }

    /// Two disjoint mutable views [0, mid) and [mid, size()).
    [[nodiscard]] constexpr span_split<T> split_at(isize mid) { return as_span().split_at(mid); }
    [[nodiscard]] constexpr span_split<T const> split_at(isize mid) const { return as_span().split_at(mid); }

    // queries
public:
    /// Maximum number of live elements.
    [[nodiscard]] static constexpr isize capacity() { return StorageT::capacity(); }
    /// Number of live elements.
    [[nodiscard]] constexpr isize size() const { return _storage.size(); }
    /// Total size in bytes of all live elements.
    [[nodiscard]] constexpr isize size_bytes() const { return _storage.size() * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _storage.size() == 0; }
    [[nodiscard]] constexpr bool is_full() const { return _storage.size() == StorageT::capacity(); }
    /// How many more elements fit before the container is full.
    [[nodiscard]] constexpr isize remaining_capacity() const { return StorageT::capacity() - _storage.size(); }

    // appends
public:
    /// Constructs a new element at the back from the given arguments.
    /// Reports capacity_exceeded when full.
    /// If the constructor throws, the container is unchanged.
    /// O(1) complexity.
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args&&...>, "emplace_back: T is not constructible from "
                                                             "the provided argument types");
        auto const old_size = _storage.size();
        _storage.ensure_capacity_for(old_size + 1, "emplace_back on a full container");
        auto const p = new (sa::placement_new, _storage.data() + old_size) T(sa::forward<Args>(args)...);
        _storage.set_size(old_size + 1); // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    /// Copies value to the back. Reports capacity_exceeded when full.
    constexpr T& push_back(T const& value) { return this->emplace_back(value); }
    /// Moves value to the back. Reports capacity_exceeded when full.
    constexpr T& push_back(T&& value) { return this->emplace_back(sa::move(value)); }

    /// Appends value unless the container is full.
    /// Returns false (and leaves value untouched) when there is no room.
    [[nodiscard]] constexpr bool try_push_back(T const& value)
    {
        if (is_full())
            return false;
        this->emplace_back(value);
        return true;
    }
    [[nodiscard]] constexpr bool try_push_back(T&& value)
    {
        if (is_full())
            return false;
        this->emplace_back(sa::move(value));
        return true;
    }

    /// Constructs a new element at index, shifting [index, size()) one slot up.
    /// Reports capacity_exceeded when full and index_out_of_bounds unless 0 <= index <= size(),
    /// both before anything is modified.
    /// The new element is constructed before the shift, so arguments may refer to elements of
    /// this container and a throwing constructor leaves the container unchanged.
    /// O(size() - index) complexity.
    template <class... Args>
    constexpr T& emplace_at(isize index, Args&&... args)
    {
        auto const old_size = _storage.size();
        _storage.ensure_capacity_for(old_size + 1, "insert into a full container");
        SA_CHECK_BOUNDS(0 <= index && index <= old_size, index, old_size, "insertion index should be <= size");

        T value(sa::forward<Args>(args)...);

        auto const p = _storage.data() + index;
        impl::relocate_objects_up(p + 1, p, old_size - index);
        new (sa::placement_new, p) T(sa::move(value));
        _storage.set_size(old_size + 1);
        return *p;
    }

    constexpr T& insert_at(isize index, T const& value) { return this->emplace_at(index, value); }
    constexpr T& insert_at(isize index, T&& value) { return this->emplace_at(index, sa::move(value)); }

    /// Relocates all elements of `other` to the back of this container and leaves `other` empty.
    /// `other` may have a different capacity.
    /// Reports capacity_exceeded unless remaining_capacity() >= other.size(); nothing moves then.
    /// O(other.size()) complexity.
    template <class OtherContainerT>
    constexpr void append(OtherContainerT& other)
    {
        auto& src = static_cast<typename OtherContainerT::base&>(other)._storage;
        SA_ASSERT_ALWAYS(static_cast<void const*>(&src) != static_cast<void const*>(&_storage),
                         "cannot append a container to itself");

        auto const old_size = _storage.size();
        auto const count = src.size();
        _storage.ensure_capacity_for(old_size + count, "appended elements do not fit");

        impl::relocate_objects_nonoverlapping(_storage.data() + old_size, src.data(), count);
        src.set_size(0);
        _storage.set_size(old_size + count);
    }

    /// Copies all values to the back.
    /// Reports capacity_exceeded unless remaining_capacity() >= values.size().
    /// All-or-nothing: if a copy constructor throws, the copies made so far are destroyed and the
    /// container keeps its previous size.
    constexpr void extend_from_span(span<T const> values)
    {
        _storage.ensure_capacity_for(_storage.size() + values.size(), "extended elements do not fit");
        this->copy_append_unchecked(values.data(), values.size());
    }

    // removals
public:
    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    /// O(1) complexity.
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "cannot pop from empty container");
        auto const p = _storage.data() + _storage.size() - 1;
        auto value = sa::move(*p);
        _storage.set_size(_storage.size() - 1);
        p->~T();
        return value;
    }

    /// Removes and returns the last element, or nothing when empty.
    [[nodiscard]] constexpr optional<T> try_pop_back()
    {
        if (_storage.size() == 0)
            return nullopt;
        return optional<T>(this->pop_back());
    }

    /// Destroys the last element in place.
    /// Precondition: !empty().
    constexpr void remove_back()
    {
        SA_ASSERT_ALWAYS(_storage.size() > 0, "cannot remove from empty container");
        _storage.set_size(_storage.size() - 1);
        (_storage.data() + _storage.size())->~T();
    }

    /// Removes and returns the element at index, shifting everything after it one slot down.
    /// Reports index_out_of_bounds unless 0 <= index < size().
    /// O(size() - index) complexity.
    [[nodiscard("use remove_at() if you don't need the return value")]] constexpr T pop_at(isize index)
    {
        auto const old_size = _storage.size();
        SA_CHECK_BOUNDS(0 <= index && index < old_size, index, old_size, "removal index should be < size");

        auto const p = _storage.data() + index;
        auto value = sa::move(*p);
        p->~T();
        impl::relocate_objects_down(p, p + 1, old_size - index - 1);
        _storage.set_size(old_size - 1);
        return value;
    }

    /// Destroys the element at index, shifting everything after it one slot down.
    constexpr void remove_at(isize index)
    {
        auto const old_size = _storage.size();
        SA_CHECK_BOUNDS(0 <= index && index < old_size, index, old_size, "removal index should be < size");

        auto const p = _storage.data() + index;
        p->~T();
        impl::relocate_objects_down(p, p + 1, old_size - index - 1);
        _storage.set_size(old_size - 1);
    }

    /// Removes and returns the element at index, filling the hole with the last element.
    /// Does not preserve relative order of elements (hence _unordered suffix).
    /// Reports index_out_of_bounds unless 0 <= index < size().
    /// O(1) complexity.
    [[nodiscard("use remove_at_unordered() if you don't need the return value")]] constexpr T pop_at_unordered(isize index)
    {
        auto const old_size = _storage.size();
        SA_CHECK_BOUNDS(0 <= index && index < old_size, index, old_size, "swap removal index should be < size");

        auto const p = _storage.data() + index;
        auto const last = _storage.data() + old_size - 1;
        auto value = sa::move(*p);
        p->~T();
        if (p != last)
            impl::relocate_object(p, last);
        _storage.set_size(old_size - 1);
        return value;
    }

    /// Destroys the element at index, filling the hole with the last element.
    constexpr void remove_at_unordered(isize index)
    {
        auto const old_size = _storage.size();
        SA_CHECK_BOUNDS(0 <= index && index < old_size, index, old_size, "swap removal index should be < size");

        auto const p = _storage.data() + index;
        auto const last = _storage.data() + old_size - 1;
        p->~T();
        if (p != last)
            impl::relocate_object(p, last);
        _storage.set_size(old_size - 1);
    }

    /// Keeps the first new_size elements and destroys the rest.
    /// No-op if new_size >= size(). Negative new_size is a precondition violation.
    /// The size is lowered before the first destructor runs.
    constexpr void truncate(isize new_size)
    {
        SA_ASSERT_ALWAYS(new_size >= 0, "truncate length must not be negative");
        auto const old_size = _storage.size();
        if (new_size >= old_size)
            return;

        _storage.set_size(new_size);
        impl::destroy_objects(_storage.data() + new_size, _storage.data() + old_size);
    }

    /// Destroys all elements, size() == 0 afterwards.
    constexpr void clear() { this->truncate(0); }

    // filtering
public:
    /// Keeps exactly the elements for which pred(element) returns true, in their original order.
    /// Every element is visited once, front to back. Rejected elements are destroyed immediately.
    /// Returns the number of removed elements.
    template <class Pred>
    constexpr isize retain(Pred&& pred)
    {
        return this->retain_mut([&pred](T& value) -> bool { return pred(static_cast<T const&>(value)); });
    }

    /// Like retain() but the predicate may modify the elements it visits.
    template <class Pred>
    constexpr isize retain_mut(Pred&& pred)
    {
        auto const original_size = _storage.size();
        auto const p = _storage.data();
        isize processed = 0;
        isize deleted = 0;

        // nothing is live from the outside while the predicate runs
        _storage.set_size(0);
        SA_DEFER
        {
            // relocate the elements that were never visited behind the survivors
            if (deleted > 0)
                impl::relocate_objects_down(p + processed - deleted, p + processed, original_size - processed);
            _storage.set_size(original_size - deleted);
        };

        // first phase: nothing was removed yet, so nothing has to move
        while (processed != original_size)
        {
            auto const cur = p + processed;
            if (!pred(*cur))
            {
                ++processed; // _before_ destruction, the guard must not touch it again
                ++deleted;
                cur->~T();
                break;
            }
            ++processed;
        }

        // second phase: every survivor moves back by `deleted` slots
        while (processed != original_size)
        {
            auto const cur = p + processed;
            if (!pred(*cur))
            {
                ++processed;
                ++deleted;
                cur->~T();
                continue;
            }
            impl::relocate_object(cur - deleted, cur);
            ++processed;
        }

        return deleted;
    }

    /// Removes consecutive elements for which same_bucket(current, previous_kept) returns true.
    /// The first element of every run is kept.
    /// Returns the number of removed elements.
    /// O(size()) complexity, order preserving.
    template <class SameBucket>
    constexpr isize dedup_by(SameBucket&& same_bucket)
    {
        auto const old_size = _storage.size();
        if (old_size <= 1)
            return 0;

        auto const p = _storage.data();
        // [0, write) is the deduplicated prefix, [write, read) is vacant, [read, old_size) is unread
        isize read = 1;
        isize write = 1;

        SA_DEFER
        {
            impl::relocate_objects_down(p + write, p + read, old_size - read);
            _storage.set_size(old_size - (read - write));
        };

        while (read < old_size)
        {
            auto const cur = p + read;
            auto const prev = p + write - 1;
            if (same_bucket(*cur, *prev))
            {
                ++read; // _before_ destruction, the guard must not touch it again
                cur->~T();
            }
            else
            {
                if (read != write)
                    impl::relocate_object(p + write, cur);
                ++write;
                ++read;
            }
        }

        return read - write;
    }

    /// Removes consecutive elements that map to the same key.
    /// Usage:
    ///   v.dedup_by_key([](int x) { return x / 10; }); // [10, 11, 20, 21, 22, 30, 31] -> [10, 20, 30]
    template <class KeyFn>
    constexpr isize dedup_by_key(KeyFn&& key)
    {
        return this->dedup_by([&key](T& a, T& b) -> bool { return key(a) == key(b); });
    }

    /// Removes consecutive equal elements.
    constexpr isize dedup()
    {
        return this->dedup_by([](T& a, T& b) -> bool { return a == b; });
    }

    // draining
public:
    /// Removes the elements [start, end) and returns a cursor yielding them by value.
    /// Reports index_out_of_bounds unless 0 <= start <= end <= size().
    /// The container shrinks to `start` immediately. When the cursor is destroyed, elements it did
    /// not yield are destroyed and the tail [end, old size) moves back into place.
    /// While the cursor is alive it is the only way to modify this container.
    constexpr sa::drain<T, ContainerT> drain(isize start, isize end)
    {
        auto const old_size = _storage.size();
        SA_CHECK_BOUNDS(0 <= start && start <= end, start, end, "drain start should be <= end");
        SA_CHECK_BOUNDS(end <= old_size, end, old_size, "drain end should be <= size");

        _storage.set_size(start);
        return sa::drain<T, ContainerT>(_storage, start, end, old_size);
    }

    /// Removes the elements [start, size()).
    constexpr sa::drain<T, ContainerT> drain(isize start) { return this->drain(start, _storage.size()); }

    /// Removes all elements.
    constexpr sa::drain<T, ContainerT> drain() { return this->drain(0, _storage.size()); }

    // factories
public:
    /// Deep copy of the provided span.
    /// Reports capacity_exceeded when the span is longer than the capacity.
    [[nodiscard]] static container_t create_copy_of(span<T const> source)
    {
        container_t c;
        c.extend_from_span(source);
        return c;
    }

    /// Moves the elements of a fixed-size array in; arrays longer than the capacity do not compile.
    /// Usage:
    ///   auto v = sa::fixed_vector<std::string, 4>::create_from({"a", "b"});
    template <std::size_t S>
    [[nodiscard]] static container_t create_from(T (&&values)[S])
    {
        static_assert(isize(S) <= StorageT::capacity(), "array does not fit into the container");
        container_t c;
        for (auto& v : values)
            c.emplace_back(sa::move(v));
        return c;
    }

    /// `count` copies of `value`.
    [[nodiscard]] static container_t create_filled(isize count, T const& value)
    {
        SA_ASSERT_ALWAYS(count >= 0, "element count must not be negative");
        container_t c;
        c._storage.ensure_capacity_for(count, "filled size exceeds capacity");
        for (isize i = 0; i < count; ++i)
            c.emplace_back(value);
        return c;
    }

    /// `count` value-initialized elements (zero for arithmetic types).
    [[nodiscard]] static container_t create_defaulted(isize count)
    {
        SA_ASSERT_ALWAYS(count >= 0, "element count must not be negative");
        container_t c;
        c._storage.ensure_capacity_for(count, "defaulted size exceeds capacity");
        for (isize i = 0; i < count; ++i)
            c.emplace_back();
        return c;
    }

    sequence_engine() = default;
    ~sequence_engine() = default;

    // moves relocate through the storage and leave the source empty
    sequence_engine(sequence_engine&&) = default;
    sequence_engine& operator=(sequence_engine&&) = default;

    // deep copy semantics
    // containers that use this mix-in can simply delete their copy ctor if they do not want it
    sequence_engine(sequence_engine const& rhs) { this->copy_append_unchecked(rhs.data(), rhs.size()); }
    sequence_engine& operator=(sequence_engine const& rhs)
    {
        if (this != &rhs)
        {
            this->clear();
            this->copy_append_unchecked(rhs.data(), rhs.size());
        }
        return *this;
    }

protected:
    /// Copy-constructs [src, src + count) behind the live elements.
    /// The caller has checked the capacity.
    /// If a copy throws, the copies made so far are destroyed and the size is unchanged.
    constexpr void copy_append_unchecked(T const* src, isize count)
    {
        auto const old_size = _storage.size();
        auto const obj_start = _storage.data() + old_size;
        auto obj_end = obj_start;
        bool committed = false;
        SA_DEFER
        {
            if (!committed)
                impl::destroy_objects(obj_start, obj_end);
        };

        impl::copy_create_objects_to(obj_end, src, src + count);
        _storage.set_size(old_size + count);
        committed = true;
    }

    template <class, class, class>
    friend struct sa::impl::sequence_engine;

private:
    StorageT _storage;
};
