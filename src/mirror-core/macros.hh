#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: MC_COMPILER_MSVC, MC_COMPILER_CLANG, MC_COMPILER_GCC, MC_COMPILER_MINGW, MC_COMPILER_POSIX

#if defined(_MSC_VER)
#define MC_COMPILER_MSVC
#elif defined(__clang__)
#define MC_COMPILER_CLANG
#elif defined(__GNUC__)
#define MC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define MC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(MC_COMPILER_CLANG) || defined(MC_COMPILER_GCC) || defined(MC_COMPILER_MINGW)
#define MC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: MC_DEBUG, MC_RELEASE, MC_RELWITHDEBINFO, MC_ASSERT_ENABLED
// From CMake (exactly one): MC_MIRROR_BACKEND_REMAP, MC_MIRROR_BACKEND_MACH, MC_MIRROR_BACKEND_SHM

#ifndef MC_ASSERT_ENABLED
#if defined(MC_DEBUG) || defined(MC_RELWITHDEBINFO) || defined(MC_ENABLE_ASSERT_IN_RELEASE)
#define MC_ASSERT_ENABLED 1
#else
#define MC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: MC_OS_WINDOWS, MC_OS_LINUX, MC_OS_APPLE, MC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define MC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define MC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define MC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define MC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// MC_FORCE_INLINE - Force function to be inlined
#define MC_FORCE_INLINE MC_IMPL_FORCE_INLINE

// MC_COLD_FUNC - Mark function as rarely executed (error paths, assertions, buffer growth)
// Usage: MC_COLD_FUNC void handle_error() { ... }
#define MC_COLD_FUNC MC_IMPL_COLD_FUNC

// MC_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Usage: MC_MACRO_JOIN(foo_, bar) -> foo_bar
// Note: Indirection ensures arguments are expanded before concatenation
#define MC_MACRO_JOIN(arg1, arg2) MC_IMPL_MACRO_JOIN(arg1, arg2)

// MC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: MC_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define MC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(MC_COMPILER_MSVC)

#define MC_IMPL_FORCE_INLINE __forceinline
#define MC_IMPL_COLD_FUNC

#elif defined(MC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define MC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define MC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define MC_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
