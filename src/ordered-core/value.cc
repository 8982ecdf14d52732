#include "value.hh"

#include <ordered-core/to_string.hh>

#include <cmath>

bool oc::operator==(value const& lhs, value const& rhs)
{
    if (lhs._kind != rhs._kind)
        return false;

    switch (lhs._kind)
    {
    case value::kind_t::undefined:
    case value::kind_t::null:
        return true;
    case value::kind_t::boolean:
        return lhs._bool == rhs._bool;
    case value::kind_t::number:
        return lhs._number == rhs._number;
    case value::kind_t::string:
        return lhs._string == rhs._string;
    }

    return false;
}

bool oc::operator<(value const& lhs, value const& rhs)
{
    if (lhs._kind != rhs._kind)
        return lhs._kind < rhs._kind;

    switch (lhs._kind)
    {
    case value::kind_t::undefined:
    case value::kind_t::null:
        return false;
    case value::kind_t::boolean:
        return !lhs._bool && rhs._bool;
    case value::kind_t::number:
        // NaN is greater than everything else and equivalent to itself
        if (std::isnan(lhs._number))
            return false;
        if (std::isnan(rhs._number))
            return true;
        return lhs._number < rhs._number;
    case value::kind_t::string:
        return lhs._string < rhs._string;
    }

    return false;
}

oc::string oc::to_string(value const& v)
{
    switch (v.kind())
    {
    case value::kind_t::undefined:
        return "undefined";
    case value::kind_t::null:
        return "null";
    case value::kind_t::boolean:
        return oc::to_string(v.as_bool());
    case value::kind_t::number:
        return oc::to_string(v.as_number());
    case value::kind_t::string:
        return v.as_string();
    }

    return {};
}
