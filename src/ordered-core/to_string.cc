#include "to_string.hh"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace
{
template <class T>
oc::string integer_to_string(T i)
{
    char buf[32];
    auto const res = std::to_chars(buf, buf + sizeof(buf), i);
    return oc::string(buf, res.ptr);
}

oc::string floating_to_string(double f)
{
    if (std::isnan(f))
        return "NaN";
    if (std::isinf(f))
        return f < 0 ? "-Infinity" : "Infinity";
    if (f == 0)
        return "0"; // also covers -0

    // shortest round-trip representation, integral values print without a fraction
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), f);
    return oc::string(buf, res.ptr);
}
} // namespace

oc::string oc::to_string(void const* ptr)
{
    char buf[2 + 2 * sizeof(void*) + 1];
    std::snprintf(buf, sizeof(buf), "%p", ptr);
    return buf;
}

oc::string oc::to_string(bool b)
{
    return b ? "true" : "false";
}

oc::string oc::to_string(char c)
{
    return oc::string(1, c);
}

oc::string oc::to_string(signed char i)
{
    return integer_to_string(int(i));
}

oc::string oc::to_string(unsigned char i)
{
    return integer_to_string(unsigned(i));
}

oc::string oc::to_string(signed short i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(unsigned short i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(signed int i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(unsigned int i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(signed long i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(unsigned long i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(signed long long i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(unsigned long long i)
{
    return integer_to_string(i);
}

oc::string oc::to_string(float f)
{
    if (std::isnan(f) || std::isinf(f) || f == 0)
        return floating_to_string(f);

    // shortest form of the float itself, not of its double widening (0.1f -> "0.1")
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), f);
    return oc::string(buf, res.ptr);
}

oc::string oc::to_string(double f)
{
    return floating_to_string(f);
}

oc::string oc::to_string(char const* s)
{
    return {s};
}

oc::string oc::to_string(string const& s)
{
    return s;
}

oc::string oc::to_string(string_view s)
{
    return oc::string(s);
}
