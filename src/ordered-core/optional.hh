#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of oc::optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct oc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace oc
{
/// The canonical "no value": returned by pop() / shift() on empty collections and by find() without a match.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace oc

/// Either a value of type T or no value.
/// Collections use it wherever "found a default-valued element" must stay distinguishable from "found nothing".
/// No operator* or operator->: access goes through value(), which asserts that a value is present.
/// Trivially copyable when T is trivially copyable.
template <class T>
struct oc::optional
{
    // construction
public:
    optional() = default;

    /// Constructs an engaged optional; explicit when U does not implicitly convert to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (oc::placement_new, &_storage.value) T(oc::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (oc::placement_new, &_storage.value) T(oc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (oc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = oc::move(rhs._storage.value);
            else
                new (oc::placement_new, &_storage.value) T(oc::move(rhs._storage.value));

            _has_value = true;
        }
        else
            reset();

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rhs._storage.value;
            else
                new (oc::placement_new, &_storage.value) T(rhs._storage.value);

            _has_value = true;
        }
        else
            reset();

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modifiers
public:
    /// Destroys the held value, if any.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return oc::move(_storage.value);
    }

    /// Returns the held value or the given fallback.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(oc::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// False if lhs is empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted for non-bool T so that optional<int> never silently compares with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    oc::storage_for<T> _storage;
    bool _has_value = false;
};
