#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/string.hh>

#include <type_traits>

/// A heterogeneous element: undefined, null, a boolean, a number or a string.
///
/// collection<value> (aka dynamic_collection) is the "any value" variant of the collection.
/// It runs through exactly the same code as every other collection<T>; value only provides
/// what the generic operations delegate to:
///   - operator==   for index_of / includes / last_index_of / remove
///   - operator<    for sort() (orders by kind first, then by payload)
///   - to_string()  for join()
///
/// Numbers are always f64, integer constructors convert.
/// A default-constructed value is undefined.
struct oc::value
{
    enum class kind_t : u8
    {
        undefined,
        null,
        boolean,
        number,
        string,
    };

    // construction
public:
    value() = default;

    value(nullptr_t) : _kind(kind_t::null) {}
    value(bool b) : _kind(kind_t::boolean), _bool(b) {}
    value(char c) : _kind(kind_t::string), _string(1, c) {}

    template <class I>
        requires(std::is_integral_v<I> && !std::is_same_v<I, bool> && !std::is_same_v<I, char>)
    value(I i) : _kind(kind_t::number), _number(f64(i))
    {
    }

    value(f32 f) : _kind(kind_t::number), _number(f) {}
    value(f64 f) : _kind(kind_t::number), _number(f) {}

    value(char const* s) : _kind(kind_t::string), _string(s) {}
    value(string_view s) : _kind(kind_t::string), _string(s) {}
    value(oc::string s) : _kind(kind_t::string), _string(static_cast<oc::string&&>(s)) {}

    [[nodiscard]] static value create_undefined() { return {}; }
    [[nodiscard]] static value create_null() { return {nullptr}; }

    // queries
public:
    [[nodiscard]] kind_t kind() const { return _kind; }

    [[nodiscard]] bool is_undefined() const { return _kind == kind_t::undefined; }
    [[nodiscard]] bool is_null() const { return _kind == kind_t::null; }
    [[nodiscard]] bool is_bool() const { return _kind == kind_t::boolean; }
    [[nodiscard]] bool is_number() const { return _kind == kind_t::number; }
    [[nodiscard]] bool is_string() const { return _kind == kind_t::string; }

    // access
public:
    /// Precondition: is_bool()
    [[nodiscard]] bool as_bool() const
    {
        OC_ASSERT(is_bool(), "value is not a boolean");
        return _bool;
    }

    /// Precondition: is_number()
    [[nodiscard]] f64 as_number() const
    {
        OC_ASSERT(is_number(), "value is not a number");
        return _number;
    }

    /// Precondition: is_string()
    [[nodiscard]] oc::string const& as_string() const
    {
        OC_ASSERT(is_string(), "value is not a string");
        return _string;
    }

    // comparison
public:
    /// Same kind and equal payload. Numbers compare numerically (NaN != NaN).
    friend bool operator==(value const& lhs, value const& rhs);

    /// Strict weak ordering: by kind (undefined < null < boolean < number < string), then by payload.
    /// NaN sorts after all other numbers.
    friend bool operator<(value const& lhs, value const& rhs);

    // members
private:
    kind_t _kind = kind_t::undefined;
    bool _bool = false;
    f64 _number = 0;
    oc::string _string;
};

namespace oc
{
[[nodiscard]] bool operator==(value const& lhs, value const& rhs);
[[nodiscard]] bool operator<(value const& lhs, value const& rhs);

// "undefined", "null", "true" / "false", numbers like oc::to_string(double), strings as-is
[[nodiscard]] string to_string(value const& v);
} // namespace oc
