#pragma once

#include <mirror-core/assert.hh>
#include <mirror-core/fwd.hh>
#include <mirror-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as mc::nullopt to explicitly return or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct mc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace mc
{
/// The canonical instance of nullopt_t used to construct empty optionals.
/// Usage: return mc::nullopt; or if (deque.pop_front() == mc::nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace mc

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// Returned by ring_deque pops and drain iteration ("empty" is a regular outcome there, not an error).
/// Provides a safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Trivially copyable when T is trivially copyable; otherwise move-only.
template <class T>
struct mc::optional
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (mc::placement_new, &_storage.value) T(mc::forward<U>(value));
    }

    /// Constructs an empty optional from mc::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
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

    // non-trivial move/destroy
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        MC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        MC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        MC_ASSERT(_has_value, "attempted to access value of empty optional");
        return mc::move(_storage.value);
    }

    // comparison
public:
    /// Equality comparison with a value: false if the optional is empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Equality comparison with nullopt: true iff empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted for T != bool so optional<int> cannot be compared with true/false by accident.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    mc::storage_for<T> _storage;
    bool _has_value = false;
};
