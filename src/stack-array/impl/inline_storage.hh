#pragma once

#include <stack-array/assert.hh>
#include <stack-array/fwd.hh>
#include <stack-array/impl/object_lifetime_util.hh>

#include <cstddef>
#include <new>
#include <type_traits>

/// Inline slot storage for up to N objects of type T plus the live count.
///
/// Slots [0, size) are live, slots [size, N) are vacant.
/// The storage owns the live objects: its destructor destroys them in slot order.
/// It never grows. ensure_capacity_for() is the growth hook the sequence engine calls before
/// it needs more slots, and for inline storage that hook only reports capacity_exceeded.
///
/// set_size() is the unchecked primitive the engine is built on.
/// The caller guarantees that slots [old, new) were initialized and slots [new, old) were
/// already destroyed or relocated away. It never constructs or destroys anything itself.
///
/// Slots are raw aligned bytes, so T does not need to be default constructible.
/// Layout: the live count comes first, then the slots. There is no pointer or heap indirection.
template <class T, sa::isize N>
struct sa::impl::inline_storage
{
    static_assert(N >= 0, "capacity must not be negative");
    static_assert(std::is_nothrow_move_constructible_v<T>, "elements must be nothrow move constructible");
    static_assert(std::is_nothrow_destructible_v<T>, "elements must be nothrow destructible");

    // slots
public:
    [[nodiscard]] SA_FORCE_INLINE_DEBUGGABLE T* data() noexcept
    {
        return std::launder(reinterpret_cast<T*>(_slots)); // NOLINT
    }
    [[nodiscard]] SA_FORCE_INLINE_DEBUGGABLE T const* data() const noexcept
    {
        return std::launder(reinterpret_cast<T const*>(_slots)); // NOLINT
    }

    // size
public:
    [[nodiscard]] static constexpr isize capacity() noexcept { return N; }
    [[nodiscard]] SA_FORCE_INLINE_DEBUGGABLE isize size() const noexcept { return _size; }

    SA_FORCE_INLINE_DEBUGGABLE void set_size(isize new_size) noexcept
    {
        SA_ASSERT(0 <= new_size && new_size <= N, "new size out of bounds [0, N]");
        _size = new_size;
    }

    // growth policy
public:
    /// Makes sure `total` live slots can exist at the same time.
    /// Inline storage cannot grow, so this raises capacity_exceeded for total > N.
    void ensure_capacity_for(isize total, char const* message) const { SA_CHECK_CAPACITY(total, N, message); }

    // ctors
public:
    inline_storage() noexcept = default;

    ~inline_storage() { impl::destroy_objects(data(), data() + _size); }

    // the engine implements deep copies element by element
    inline_storage(inline_storage const&) = delete;
    inline_storage& operator=(inline_storage const&) = delete;

    // moving relocates every live object and leaves rhs empty
    inline_storage(inline_storage&& rhs) noexcept
    {
        impl::relocate_objects_nonoverlapping(data(), rhs.data(), rhs._size);
        _size = sa::exchange(rhs._size, 0);
    }
    inline_storage& operator=(inline_storage&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl::destroy_objects(data(), data() + _size);
            impl::relocate_objects_nonoverlapping(data(), rhs.data(), rhs._size);
            _size = sa::exchange(rhs._size, 0);
        }
        return *this;
    }

private:
    isize _size = 0;

    // a zero-length array is ill-formed, N == 0 still reserves a single (never used) byte
    alignas(T) std::byte _slots[N == 0 ? 1 : sizeof(T) * N];
};
