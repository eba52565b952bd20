#pragma once

#include <mirror-core/assert.hh>
#include <mirror-core/fwd.hh>
#include <mirror-core/utility.hh>

#include <type_traits>

namespace mc
{
/// Wrapper marking a value as the error alternative of a result.
/// Usage: return mc::failure(mirror_error::allocation_failure);
template <class E>
struct failure
{
    E value;
};
template <class E>
failure(E) -> failure<E>;
} // namespace mc

/// Sum type representing either a success value T or an error value E.
/// Used for expected, recoverable failures (e.g. the OS refusing a mirrored mapping).
/// Programmer errors are assertions, not results.
///
/// Construction:
///   result<byte*, mirror_error> r = ptr;                                 // success
///   result<byte*, mirror_error> r = mc::failure(mirror_error::race_exhausted); // error
///
/// Like mc::optional, there is no operator* or operator->; use value() and error().
template <class T, class E>
struct mc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    /// Constructs a success result holding the given value.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _has_value(true) // NOLINT
    {
        new (mc::placement_new, &_storage.value) T(mc::forward<U>(value));
    }

    /// Constructs an error result.
    template <class G>
    result(failure<G> f) : _has_value(false) // NOLINT
    {
        new (mc::placement_new, &_storage.error) E(mc::move(f.value));
    }

    result(result&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
        else
            new (mc::placement_new, &_storage.error) E(mc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (mc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    result& operator=(result&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
            else
                new (mc::placement_new, &_storage.error) E(mc::move(rhs._storage.error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (mc::placement_new, &_storage.value) T(rhs._storage.value);
            else
                new (mc::placement_new, &_storage.error) E(rhs._storage.error);
        }
        return *this;
    }

    ~result() { impl_destroy(); }

    // queries and access
public:
    /// True if this result holds a success value.
    [[nodiscard]] bool has_value() const { return _has_value; }
    /// True if this result holds an error.
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Returns the success value.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        MC_ASSERT(_has_value, "attempted to access value of an error result");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        MC_ASSERT(_has_value, "attempted to access value of an error result");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        MC_ASSERT(_has_value, "attempted to access value of an error result");
        return mc::move(_storage.value);
    }

    /// Returns the error.
    /// Precondition: has_error() == true.
    [[nodiscard]] E const& error() const
    {
        MC_ASSERT(!_has_value, "attempted to access error of a success result");
        return _storage.error;
    }

private:
    void impl_destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    union storage
    {
        T value;
        E error;

        storage() {}
        ~storage() {}
    };

    storage _storage;
    bool _has_value;
};
