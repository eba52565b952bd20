#pragma once

#include <mirror-core/fwd.hh>
#include <mirror-core/utility.hh>

#include <type_traits>

namespace mc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Fill-constructs a count of objects by copy-constructing from a single value using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + count) are NOT yet constructed.
/// If copy construction throws, dest_end points to the element that threw (not yet constructed).
/// count == 0 is valid and results in a no-op.
///
/// Usage pattern:
///   auto obj_end = data + tail;
///   fill_create_objects_to(obj_end, count, value);
///   tail = obj_end - data;
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (mc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + (src_end - src_start)) are NOT yet constructed.
/// If copy construction throws, dest_end points to the element that threw (not yet constructed).
/// Trivially copyable types are optimized to use memcpy at compile time.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            mc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (mc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + (src_end - src_start)) are NOT yet constructed
/// and that the destination does not overlap the source (use relocate_objects_to for shifts).
/// The source objects stay alive in a moved-from state; the caller destroys them.
/// Trivially copyable types are optimized to use memcpy at compile time.
///
/// Usage pattern (buffer growth):
///   auto obj_end = new_buffer.data();
///   move_create_objects_to(obj_end, data + head, data + tail);
///   destroy_objects_in_reverse(data + head, data + tail);
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            mc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (mc::placement_new, dest_end) T(mc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Relocates the live objects [src_start, src_end) so that they start at dest.
/// Relocation = move-construct into the destination slot, then destroy the source slot.
/// Afterwards [dest, dest + count) is the live range; source slots outside of it are uninitialized.
/// Source and destination may overlap in either direction, the iteration order is chosen accordingly.
/// IMPORTANT: Assumes the destination slots outside of [src_start, src_end) are NOT yet constructed.
/// This is the primitive for shifting part of a ring window by a few slots (insert, remove, drain).
/// Trivially copyable types are optimized to use memmove at compile time.
template <class T>
constexpr void relocate_objects_to(T* dest, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if (dest == src_start)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        mc::memmove(dest, src_start, (src_end - src_start) * sizeof(T));
    }
    else if (dest < src_start)
    {
        // moving toward the front: first element first, so no live object is overwritten
        for (; src_start != src_end; ++src_start, ++dest)
        {
            new (mc::placement_new, dest) T(mc::move(*src_start));
            src_start->~T();
        }
    }
    else
    {
        // moving toward the back: last element first
        auto dest_end = dest + (src_end - src_start);
        while (src_end != src_start)
        {
            --src_end;
            --dest_end;
            new (mc::placement_new, dest_end) T(mc::move(*src_end));
            src_end->~T();
        }
    }
}
} // namespace mc::impl
