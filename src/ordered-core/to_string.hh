#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/string.hh>

#include <concepts>

// String conversion used by collection::join and collection::to_string.
//
// Numbers follow the scripting-language convention:
//   integral doubles have no fractional part (2.0 -> "2"), other doubles use the
//   shortest round-trip form, NaN -> "NaN", infinities -> "Infinity" / "-Infinity", -0 -> "0"

namespace oc
{
// in hex
[[nodiscard]] string to_string(void const* ptr);

// true/false
[[nodiscard]] string to_string(bool b);

// simply the char
[[nodiscard]] string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] string to_string(signed char i);
[[nodiscard]] string to_string(unsigned char i);
[[nodiscard]] string to_string(signed short i);
[[nodiscard]] string to_string(unsigned short i);
[[nodiscard]] string to_string(signed int i);
[[nodiscard]] string to_string(unsigned int i);
[[nodiscard]] string to_string(signed long i);
[[nodiscard]] string to_string(unsigned long i);
[[nodiscard]] string to_string(signed long long i);
[[nodiscard]] string to_string(unsigned long long i);

// float/double
[[nodiscard]] string to_string(float f);
[[nodiscard]] string to_string(double f);

// no-op
[[nodiscard]] string to_string(char const* s);
[[nodiscard]] string to_string(string const& s);
[[nodiscard]] string to_string(string_view s);

namespace impl
{
// unqualified: sees the oc::to_string overloads above and, at instantiation, ADL overloads
template <class T>
concept has_free_to_string = requires(T const& v) {
    { to_string(v) } -> std::convertible_to<string>;
};

template <class T>
concept has_member_to_string = requires(T const& v) {
    { v.to_string() } -> std::convertible_to<string>;
};

/// The string representation of a collection element.
/// Dispatch order: oc::to_string / ADL to_string(v), then v.to_string().
template <class T>
[[nodiscard]] string element_to_string(T const& v)
{
    if constexpr (has_free_to_string<T>)
        return to_string(v);
    else if constexpr (has_member_to_string<T>)
        return v.to_string();
    else
        static_assert(sizeof(T) == 0, "element type needs to_string(T) (free, ADL or member) to be joined");
}
} // namespace impl
} // namespace oc
