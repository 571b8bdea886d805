#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/utility.hh>

#include <type_traits>

// Construction, assignment, and destruction of element ranges in raw storage.
//
// The *_to(T*& dest_end, ...) helpers advance dest_end past every element they finished, so after an
// exception [dest_start, dest_end) is exactly the range that was processed.
// "Relocate" means move-construct into the destination and destroy the source, which is what
// moving out of a memory cell means for pointer-core: the source is left uninitialized.
// Trivially copyable types are reduced to memcpy / memmove at compile time.

namespace pc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
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

/// Copy-constructs count objects from a single value into uninitialized storage at dest_end.
/// On exception, dest_end points to the element whose construction threw.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (pc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs [src, src + count) into uninitialized storage at dest_end.
/// Ranges must not overlap (a live source cannot also be uninitialized destination).
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src, isize count)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        pc::memcpy(dest_end, src, count * isize(sizeof(T)));
        dest_end += count;
    }
    else
    {
        for (isize i = 0; i < count; ++i)
        {
            new (pc::placement_new, dest_end) T(src[i]);
            ++dest_end;
        }
    }
}

/// Relocates [src, src + count) to dest: move-construct, then destroy the source element.
/// Overlap-safe: walks forward when dest is below src, backward otherwise.
/// The non-overlapping part of the source is left uninitialized.
/// No exception guarantee if a move constructor throws.
template <class T>
constexpr void relocate_objects(T* dest, T* src, isize count)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if (dest == src || count == 0)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        pc::memmove(dest, src, count * isize(sizeof(T)));
    }
    else if (dest < src)
    {
        for (isize i = 0; i < count; ++i)
        {
            new (pc::placement_new, dest + i) T(pc::move(src[i]));
            src[i].~T();
        }
    }
    else
    {
        for (isize i = count - 1; i >= 0; --i)
        {
            new (pc::placement_new, dest + i) T(pc::move(src[i]));
            src[i].~T();
        }
    }
}

/// Copy-assigns count live objects from a single value.
/// On exception, dest_end points to the element whose assignment threw.
template <class T>
constexpr void fill_assign_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_assignable_v<T>, "T must be copy assignable");

    for (isize i = 0; i < count; ++i)
    {
        *dest_end = value;
        ++dest_end;
    }
}

/// Copy-assigns [src, src + count) onto live objects at dest.
/// Overlap-safe: equivalent to copying through a temporary buffer.
template <class T>
constexpr void copy_assign_objects(T* dest, T const* src, isize count)
{
    static_assert(std::is_copy_assignable_v<T>, "T must be copy assignable");

    if (dest == src || count == 0)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        pc::memmove(dest, src, count * isize(sizeof(T)));
    }
    else if (dest < src)
    {
        for (isize i = 0; i < count; ++i)
            dest[i] = src[i];
    }
    else
    {
        for (isize i = count - 1; i >= 0; --i)
            dest[i] = src[i];
    }
}

/// Move-assigns [src, src + count) onto live objects at dest and destroys the sources.
/// Ranges must not overlap.
template <class T>
constexpr void move_assign_objects(T* dest, T* src, isize count)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        pc::memcpy(dest, src, count * isize(sizeof(T)));
    }
    else
    {
        for (isize i = 0; i < count; ++i)
        {
            dest[i] = pc::move(src[i]);
            src[i].~T();
        }
    }
}

/// True if [a, a + a_count) and [b, b + b_count) share at least one element
template <class T>
[[nodiscard]] bool ranges_overlap(T const* a, isize a_count, T const* b, isize b_count)
{
    auto const a_start = reinterpret_cast<uptr>(a);
    auto const b_start = reinterpret_cast<uptr>(b);
    return a_count > 0 && b_count > 0 && a_start < b_start + uptr(b_count) * sizeof(T)
        && b_start < a_start + uptr(a_count) * sizeof(T);
}
} // namespace pc::impl
