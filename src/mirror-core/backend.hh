#pragma once

#include <mirror-core/fwd.hh>
#include <mirror-core/result.hh>
#include <mirror-core/utility.hh>

// Mirrored memory backend
//
// A mirrored allocation of N bytes (N a positive multiple of 2 * allocation_granularity()) is a virtual range
// [p, p + N) whose two halves [p, p + N/2) and [p + N/2, p + N) are mapped onto the same physical pages:
// a write through p[i] is visible through p[i + N/2] and vice versa.
//
// Exactly one OS strategy is compiled into the library (CMake option MC_MIRROR_BACKEND):
//
//   remap  (Linux, Android)   mmap the full range as shared anonymous memory, munmap the second half,
//                             then mremap(first, 0, half, MREMAP_FIXED) duplicates the first half's pages
//                             into the hole.
//   mach   (macOS, iOS)       mach_vm_allocate the full range, mach_vm_deallocate the second half,
//                             then mach_vm_remap the first half into the hole without copying.
//   shm    (Windows, others)  create a half-sized shared memory object, reserve a full-sized virtual range,
//                             release it, then map the object at both halves of the reserved addresses.
//
// All three strategies free an address range and expect to claim it again right after.
// Another thread may map something into the hole in between (the "race window").
// Each attempt that loses the race releases everything it acquired and retries,
// at most max_mirror_attempts times before reporting mirror_error::race_exhausted.
//
// The backend is a POD struct of function pointers, the same shape as a memory resource:
// tests inject their own backends (e.g. plain heap memory to check sizing and cache traffic).
// A null backend pointer always means mc::default_mirror_backend.

namespace mc
{
/// Failure reasons of a mirrored allocation.
enum class mirror_error : u8
{
    /// The OS declined to provide memory (address space, memory objects, or quota exhausted).
    /// Recoverable: nothing is leaked and the caller may retry later or with a smaller size.
    allocation_failure,

    /// The double mapping lost the race for its second half max_mirror_attempts times in a row.
    /// All partially acquired resources were released before this is reported.
    /// mirrored_buffer escalates this to a fatal assertion.
    race_exhausted,
};

/// Human-readable name of a mirror_error.
[[nodiscard]] char const* to_string(mirror_error e);

/// Upper bound on double-mapping attempts per allocation.
#ifdef MC_OS_WINDOWS
inline constexpr int max_mirror_attempts = 5;
#else
inline constexpr int max_mirror_attempts = 3;
#endif

/// Backend compiled into this library, used whenever a backend pointer is null.
/// Stored in the data segment, so it is valid during static initialization.
extern mirror_backend const* const default_mirror_backend;

/// Name of the compiled-in strategy: "remap", "mach", or "shm".
[[nodiscard]] char const* default_mirror_backend_name();
} // namespace mc

/// Mirrored memory backend interface.
/// POD struct using function pointers, no virtual dispatch and no non-trivial constructors.
struct mc::mirror_backend
{
    /// Allocate a mirrored region of exactly `size_bytes` bytes.
    /// Precondition: size_bytes > 0 and size_bytes % (2 * allocation_granularity) == 0.
    /// Returns the base address (aligned to the granularity) or the reason of failure.
    /// On failure nothing was leaked.
    mc::function_ptr<mc::result<mc::byte*, mc::mirror_error>(isize size_bytes, void* userdata)> allocate_mirrored
        = nullptr;

    /// Release a region previously returned by allocate_mirrored with the same size.
    /// OS failure here is not recoverable (the mapping state is unknown) and is a fatal assertion.
    mc::function_ptr<void(mc::byte* p, isize size_bytes, void* userdata)> deallocate_mirrored = nullptr;

    /// Smallest unit (and alignment) of the OS mapping primitives, a power of two.
    mc::function_ptr<isize(void* userdata)> allocation_granularity = nullptr;

    /// User-defined data for custom backends. Can be nullptr for stateless backends.
    void* userdata = nullptr;
};

namespace mc
{
/// Allocates a mirrored region through `backend` (or the default backend if null).
/// See mirror_backend::allocate_mirrored.
[[nodiscard]] mc::result<mc::byte*, mc::mirror_error> allocate_mirrored(isize size_bytes,
                                                                        mirror_backend const* backend = nullptr);

/// Releases a mirrored region through `backend` (or the default backend if null).
void deallocate_mirrored(mc::byte* p, isize size_bytes, mirror_backend const* backend = nullptr);

/// Allocation granularity of `backend` (or the default backend if null).
[[nodiscard]] isize allocation_granularity(mirror_backend const* backend = nullptr);
} // namespace mc

namespace mc::impl
{
// Prints "mirror-core: <call> failed: <description of os_error>" to stderr in MC_DEBUG builds, no-op otherwise
// os_error is errno on POSIX, GetLastError() on Windows, and a kern_return_t on mach
MC_COLD_FUNC void report_os_error(char const* call, long os_error);
} // namespace mc::impl
