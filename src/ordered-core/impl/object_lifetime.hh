#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <cstring>
#include <type_traits>

// Placement construction and destruction of element ranges in raw storage.
// All helpers take a T*& cursor that advances past every successfully constructed object,
// so on an exception the cursor marks exactly the constructed live range.

namespace oc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges and nullptr are a no-op, trivially destructible types compile to nothing.
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

/// Value-constructs count objects at dest_end (zero-initializes trivial types).
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (oc::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs count copies of value at dest_end.
/// value must not live inside the destination range.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (oc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs [src_start, src_end) at dest_end.
/// Trivially copyable types use memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size_t(size) * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (oc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs [src_start, src_end) at dest_end.
/// The moved-from source objects stay alive and must still be destroyed by the caller.
/// No exception guarantee if T's move constructor throws.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size_t(size) * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (oc::placement_new, dest_end) T(oc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace oc::impl
