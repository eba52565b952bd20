#pragma once

#include <mirror-core/assert.hh>
#include <mirror-core/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//   swap_by_move(a, b)          - swap two values via move construction/assignment
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//
// Integer arithmetic:
//   int_round_up_to_multiple(val, mult)    - round up value to next multiple
//   int_gcd(a, b), int_lcm(a, b)           - greatest common divisor / least common multiple (both > 0)
//   is_power_of_two(value)                 - check if value is a power of 2
//
// Raw memory:
//   placement_new               - tag for mc-owned placement new: new (mc::placement_new, p) T(...)
//   storage_for<T>              - uninitialized storage with size and alignment of T
//   memcpy / memmove            - byte copies with isize sizes
//
// Template metaprogramming:
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Scope utilities:
//   MC_DEFER { code }           - execute code at scope-exit (RAII cleanup)
//


namespace mc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   deque.push_back(mc::move(obj));  // transfer obj into the deque
template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto p = mc::exchange(_ptr, nullptr);     // take ownership of _ptr, set it to null
template <class T, class U = T>
[[nodiscard]] MC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

/// Swap via move construction and move assignment
/// Usage:
///   mc::swap_by_move(_buffer, new_buffer);
template <class T>
constexpr void swap_by_move(T& a, T& b)
{
    T tmp = static_cast<T&&>(a);
    a = static_cast<T&&>(b);
    b = static_cast<T&&>(tmp);
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<, b when they are equal
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Integer arithmetic
// =========================================================================================================

/// Round up to the next multiple of a given value
/// Returns the smallest multiple of 'multiple' that is >= val
/// Usage:
///   auto half = mc::int_round_up_to_multiple(bytes, granularity);
///   // mc::int_round_up_to_multiple(23, 10) == 30
///   // mc::int_round_up_to_multiple(30, 10) == 30
/// Corner cases:
///   val == 0: returns 0
/// Preconditions:
///   multiple > 0
template <class T>
[[nodiscard]] constexpr T int_round_up_to_multiple(T val, T multiple)
{
    MC_ASSERT(multiple > 0, "int_round_up_to_multiple: multiple must be positive");
    return ((val + multiple - 1) / multiple) * multiple;
}

/// Greatest common divisor of two positive integers (Euclid)
template <class T>
[[nodiscard]] constexpr T int_gcd(T a, T b)
{
    MC_ASSERT(a > 0 && b > 0, "int_gcd: both values must be positive");
    while (b != 0)
    {
        auto const r = a % b;
        a = b;
        b = r;
    }
    return a;
}

/// Least common multiple of two positive integers
/// Usage:
///   // mc::int_lcm(4096, 24) == 12288
///   // mc::int_lcm(4096, 8) == 4096
template <class T>
[[nodiscard]] constexpr T int_lcm(T a, T b)
{
    return (a / mc::int_gcd(a, b)) * b;
}

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    MC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag type selecting the mirror-core placement new overload
/// Avoids pulling in <new> in every header and keeps placement construction greppable
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// Uninitialized storage with the size and alignment of T
/// The value is neither constructed nor destroyed automatically
/// Trivially destructible and trivially copyable whenever T is
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

/// Byte copy between non-overlapping ranges
/// bytes == 0 is a valid no-op, even with nullptr arguments
MC_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    MC_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

/// Byte copy between possibly overlapping ranges
/// bytes == 0 is a valid no-op, even with nullptr arguments
MC_FORCE_INLINE void memmove(void* dest, void const* src, isize bytes)
{
    MC_ASSERT(bytes >= 0, "memmove: byte count must be non-negative");
    if (bytes > 0)
        std::memmove(dest, src, size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   mc::function_ptr<isize(void* userdata)>       -> isize (*)(void*)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(mc::forward<F>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   auto fd = ::memfd_create("mirror", 0);
///   MC_DEFER { ::close(fd); };
#define MC_DEFER auto const MC_MACRO_JOIN(_mc_deferred_, __COUNTER__) = ::mc::impl::deferred_tag{} + [&]

} // namespace mc

/// Placement new for mc::placement_new
/// Declared at global scope, as required for operator new overloads
[[nodiscard]] MC_FORCE_INLINE void* operator new(std::size_t, mc::placement_new_t, void* p) noexcept
{
    return p;
}

/// Matching placement delete, only called if a constructor throws during placement new
MC_FORCE_INLINE void operator delete(void*, mc::placement_new_t, void*) noexcept {}
