#pragma once

#include <stack-array/fwd.hh>
#include <stack-array/utility.hh>

#include <cstring>
#include <type_traits>

// Slot-level primitives used by the sequence engine and the drain cursor.
//
// "Relocation" moves an object into a vacant slot and ends the lifetime of the source,
// leaving the source slot vacant. Every element type we store is nothrow move constructible
// and nothrow destructible, so relocations never fail half-way through a shift.
// Trivially copyable types are relocated with memmove/memcpy.
namespace sa::impl
{
/// Calls destructors on [start, end) in slot order.
/// Empty ranges (start == end) are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects(T* start, T* end) noexcept
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        for (; start != end; ++start)
            start->~T();
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the slots at [*dest_end, *dest_end + (src_end - src_start)) are vacant.
/// If copy construction throws, dest_end points to the slot that threw (still vacant), so
/// [original dest_end, dest_end) is exactly the range that has to be rolled back.
///
/// Usage pattern:
///   auto obj_end = first_vacant_slot;
///   copy_create_objects_to(obj_end, src, src + count);
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, count * sizeof(T));
            dest_end += count;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (sa::placement_new, dest_end) T(*src_start);
            ++dest_end; // _after_ construction
            ++src_start;
        }
    }
}

/// Relocates a single object from src into the vacant slot dest.
template <class T>
SA_FORCE_INLINE constexpr void relocate_object(T* dest, T* src) noexcept
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memcpy(static_cast<void*>(dest), src, sizeof(T));
    }
    else
    {
        new (sa::placement_new, dest) T(sa::move(*src));
        src->~T();
    }
}

/// Relocates [src, src + count) to [dest, dest + count) where dest <= src.
/// The ranges may overlap; objects are relocated lowest index first, so every destination slot
/// is vacant by the time it is written.
template <class T>
constexpr void relocate_objects_down(T* dest, T* src, isize count) noexcept
{
    SA_ASSERT(dest <= src, "downward relocation requires dest <= src");
    if (count <= 0 || dest == src)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memmove(static_cast<void*>(dest), src, count * sizeof(T));
    }
    else
    {
        for (isize i = 0; i < count; ++i)
            impl::relocate_object(dest + i, src + i);
    }
}

/// Relocates [src, src + count) to [dest, dest + count) where dest >= src.
/// The ranges may overlap; objects are relocated highest index first.
template <class T>
constexpr void relocate_objects_up(T* dest, T* src, isize count) noexcept
{
    SA_ASSERT(dest >= src, "upward relocation requires dest >= src");
    if (count <= 0 || dest == src)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memmove(static_cast<void*>(dest), src, count * sizeof(T));
    }
    else
    {
        for (isize i = count - 1; i >= 0; --i)
            impl::relocate_object(dest + i, src + i);
    }
}

/// Relocates [src, src + count) into the disjoint vacant range [dest, dest + count).
/// Used when elements move between two different buffers (append, move construction).
template <class T>
constexpr void relocate_objects_nonoverlapping(T* dest, T* src, isize count) noexcept
{
    if (count <= 0)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memcpy(static_cast<void*>(dest), src, count * sizeof(T));
    }
    else
    {
        for (isize i = 0; i < count; ++i)
            impl::relocate_object(dest + i, src + i);
    }
}
} // namespace sa::impl
