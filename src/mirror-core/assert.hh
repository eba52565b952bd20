#pragma once

// Lean header with minimal dependencies, included by every container and backend header.
#include <mirror-core/macros.hh>
#include <mirror-core/source_location.hh>

// =========================================================================================================
// MC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Simple string literal error messages (no formatting dependencies)
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Active in debug and release-with-debug-info builds by default
//
// When assertions are active:
//   Assertions are enabled in MC_DEBUG and MC_RELWITHDEBINFO builds.
//   In MC_RELEASE builds, assertions are disabled unless MC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In mirror-core this covers the ring invariants (head <= tail <= 2 * capacity),
//   out-of-range indices and drain ranges, odd buffer lengths, and over-aligned element types.
//
// What assertions are NOT for:
//   - NOT for allocation failures the OS reports (those are mc::result<T, mc::mirror_error>)
//   - NOT for common/expected error conditions
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> only thrown by user-installed assertion handlers to unwind to a recovery point
//   - result<T, E>    -> common/expected error handling (e.g. mirror_error::allocation_failure)
//
// Usage:
//   MC_ASSERT(idx < size(), "index out of bounds");
//   MC_ASSERT(n % 2 == 0, "mirrored buffer length must be even");
//
#define MC_ASSERT(cond, msg) MC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// MC_ASSERT_ALWAYS - Always-active assertion
//
// Like MC_ASSERT but remains active in all build configurations, including release builds.
// Used for structural preconditions whose violation would corrupt memory
// (insert/remove/drain/split ranges) and for unrecoverable OS failures (mirror race exhaustion).
//
// Usage:
//   MC_ASSERT_ALWAYS(start <= end, "drain range start must not exceed end");
//
#define MC_ASSERT_ALWAYS(cond, msg) MC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// MC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define MC_DEBUG_BREAK() MC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// MC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Triggers a debugger break (if attached) then unconditionally aborts the program.
// Used by MC_ASSERT after the assertion handler ran.
//
#define MC_BREAK_AND_ABORT() (MC_DEBUG_BREAK(), ::mc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace mc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (default: print diagnostics to stderr)
// Note: does not abort, caller must follow with MC_BREAK_AND_ABORT()
MC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, mc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace mc::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef MC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define MC_IMPL_DEBUG_BREAK() (::mc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(MC_COMPILER_POSIX)

// raise(SIGTRAP) so an attached debugger stops at the assertion site
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
//       SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
extern "C" int raise(int) noexcept;
#define MC_IMPL_DEBUG_BREAK() (::mc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define MC_IMPL_DEBUG_BREAK() void(0)

#endif

// MC_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define MC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::mc::impl::handle_assert_failure(#cond, msg, ::mc::source_location::current()); \
            MC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

// Assert implementation - enabled in debug/relwithdebinfo, optionally in release

#if MC_ASSERT_ENABLED

#define MC_IMPL_ASSERT(cond, msg) MC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// In release builds without MC_ENABLE_ASSERT_IN_RELEASE, assertions are stripped
// We still check that the expression and message compile
#define MC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        MC_UNUSED(cond);          \
        MC_UNUSED(msg);           \
    } while (false)

#endif
