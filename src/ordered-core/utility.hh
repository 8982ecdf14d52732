#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                      - cast value to rvalue reference for moving
//   forward<T>(value)                - perfect forwarding for template arguments
//
// Comparison and clamping:
//   max(a, b)                        - returns the larger of two values (requires operator<)
//   min(a, b)                        - returns the smaller of two values (requires operator<)
//   clamp(v, lo, hi)                 - clamps value v to range [lo, hi] (requires operator<)
//
// Object storage:
//   placement_new                    - tag for non-allocating placement new
//   storage_for<T>                   - uninitialized, correctly aligned storage for one T
//
// Element callbacks:
//   invoke_element_callback(f, elem, idx, self)
//                                    - calls f(elem, idx, self), f(elem, idx) or f(elem)
//   invoke_reducer(f, acc, elem, idx, self)
//                                    - same, with the accumulator as first argument
//

namespace oc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Comparison and clamping
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Clamps a value to the range [lo, hi]
/// Precondition: lo <= hi
template <class T>
[[nodiscard]] constexpr T const& clamp(T const& v, T const& lo, T const& hi)
{
    static_assert(requires { v < lo; }, "T must support operator<");
    OC_ASSERT(!(hi < lo), "clamp: hi must be >= lo");
    return (v < lo) ? lo : (hi < v) ? hi : v; // NOLINT
}

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Tag type selecting the non-allocating placement new below
/// Avoids <new>'s global placement operator so that overloaded operator new on T cannot interfere
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// Uninitialized storage for exactly one T
/// The value member is only alive after an explicit placement new and until an explicit destructor call
template <class T>
union storage_for
{
    // no-op ctor and dtor so the union never touches value on its own
    // stays trivially copyable and destructible whenever T is
    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&) = default;
    storage_for& operator=(storage_for const&) = default;

    T value;
};

// =========================================================================================================
// Element callbacks
// =========================================================================================================
//
// Traversal operations accept callbacks in three shapes and pick the richest one that is invocable:
//   f(elem, idx, self)
//   f(elem, idx)
//   f(elem)
// where idx is the isize element index and self the collection being traversed.
// The index is always available, unused indices are optimized away.

/// Invokes an element callback with as many of (elem, idx, self) as it accepts
template <class F, class E, class Self>
constexpr decltype(auto) invoke_element_callback(F& f, E&& elem, isize idx, Self const& self)
{
    if constexpr (std::is_invocable_v<F&, E, isize, Self const&>)
        return f(oc::forward<E>(elem), idx, self);
    else if constexpr (std::is_invocable_v<F&, E, isize>)
        return f(oc::forward<E>(elem), idx);
    else
    {
        static_assert(std::is_invocable_v<F&, E>, "callback must accept (elem), (elem, idx) or (elem, idx, self)");
        return f(oc::forward<E>(elem));
    }
}

/// Invokes a reducer with the accumulator followed by as many of (elem, idx, self) as it accepts
template <class F, class Acc, class E, class Self>
constexpr decltype(auto) invoke_reducer(F& f, Acc&& acc, E&& elem, isize idx, Self const& self)
{
    if constexpr (std::is_invocable_v<F&, Acc, E, isize, Self const&>)
        return f(oc::forward<Acc>(acc), oc::forward<E>(elem), idx, self);
    else if constexpr (std::is_invocable_v<F&, Acc, E, isize>)
        return f(oc::forward<Acc>(acc), oc::forward<E>(elem), idx);
    else
    {
        static_assert(std::is_invocable_v<F&, Acc, E>, "reducer must accept (acc, elem), (acc, elem, idx) or (acc, elem, idx, self)");
        return f(oc::forward<Acc>(acc), oc::forward<E>(elem));
    }
}

/// Result type of an element callback invoked on elements of type E
template <class F, class E, class Self>
using element_callback_result_t
    = std::decay_t<decltype(oc::invoke_element_callback(std::declval<F&>(), std::declval<E>(), isize(0), std::declval<Self const&>()))>;

} // namespace oc

/// Non-allocating placement new selected by oc::placement_new
[[nodiscard]] inline void* operator new(std::size_t, oc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
