#pragma once

#include <mirror-core/fwd.hh>
#include <mirror-core/utility.hh>

#include <functional>
#include <mutex>

/// Thread-safe wrapper for data T protected by a mutex
/// Mutex that encapsulates both the data and the mutex protecting it
/// Access to the protected data is only possible through scoped lock operations
/// Used by mc::allocation_cache to guard its size-keyed pool
template <class T>
struct mc::mutex
{
    /// Acquire lock, invoke function with protected value, and return result
    /// The mutex is held for the duration of the function call
    /// Returns: The result of invoking f with the protected value (auto to prevent reference leaks)
    /// Usage:
    ///   mc::mutex<int> counter;
    ///   counter.lock([](int& val) { val++; });
    ///   int current = counter.lock([](int const& val) { return val; });
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return std::invoke(mc::forward<F>(f), _value);
    }

    /// Const overload, the protected value is only exposed as const
    template <class F>
    auto lock(F&& f) const
    {
        std::lock_guard lock(_mutex);
        return std::invoke(mc::forward<F>(f), static_cast<T const&>(_value));
    }

    /// Default constructor - default-constructs the protected value
    mutex() = default;

    /// Construct with initial value
    template <class... Args>
    explicit mutex(Args&&... args) : _value(mc::forward<Args>(args)...)
    {
    }

private:
    T _value;
    mutable std::mutex _mutex;
};
