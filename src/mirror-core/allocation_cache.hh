#pragma once

#include <mirror-core/backend.hh>
#include <mirror-core/fwd.hh>
#include <mirror-core/mutex.hh>
#include <mirror-core/result.hh>

#include <unordered_map>
#include <vector>

namespace mc
{
/// The calling thread's allocation cache over mc::default_mirror_backend.
/// This is what a null allocation_cache pointer means everywhere in mirror-core.
/// Thread-confined: every thread has its own instance, released when the thread exits.
/// Must not be called once the cache of the calling thread was destroyed, see thread_allocation_cache_or_null.
[[nodiscard]] allocation_cache& thread_allocation_cache();

/// Like thread_allocation_cache, but returns nullptr once the cache of the calling thread was destroyed.
/// Objects with static or thread storage duration may outlive the thread cache: mirrored_buffer then
/// allocates from and releases to mc::default_mirror_backend directly.
[[nodiscard]] allocation_cache* thread_allocation_cache_or_null();
} // namespace mc

/// Pool of released mirrored regions, keyed by their exact byte size.
///
/// Creating a mirrored mapping takes several syscalls (and possibly retries), so regions released by
/// mirrored_buffer are parked here and handed out again for the next request of the same size.
/// A cached region is inert memory in the custody of the cache: nothing else references it.
///
/// The cache is an explicit capability: containers take an `allocation_cache*` at construction and
/// release their buffers back to that same cache. Regions are only returned to the OS by
/// release_all() (also called from the destructor).
///
/// All pool operations are serialized by an internal mc::mutex, so a cache may be shared between threads.
/// The destructor must not race with other operations.
///
/// Usage:
///   mc::allocation_cache cache;
///   auto d = mc::ring_deque<int>::create_with_capacity(100, &cache);
///   ...
///   cache.release_all(); // return all parked regions to the OS
struct mc::allocation_cache
{
    // construction
public:
    /// Creates an empty cache allocating through `backend` (nullptr = default_mirror_backend).
    explicit allocation_cache(mirror_backend const* backend = nullptr);

    /// Returns all cached regions to the backend.
    ~allocation_cache();

    allocation_cache(allocation_cache const&) = delete;
    allocation_cache& operator=(allocation_cache const&) = delete;
    allocation_cache(allocation_cache&&) = delete;
    allocation_cache& operator=(allocation_cache&&) = delete;

    // pool
public:
    /// Removes and returns a cached region of exactly `size_bytes`, or nullptr if there is none.
    [[nodiscard]] mc::byte* pop(isize size_bytes);

    /// Parks a region of `size_bytes` for reuse. Never fails, the pool is unbounded.
    /// Precondition: p was allocated by this cache's backend with the same size and is no longer referenced.
    void push(mc::byte* p, isize size_bytes);

    /// Deallocates every cached region through the backend and empties the pool.
    void release_all();

    // allocation
public:
    /// Returns a cached region of `size_bytes` if available, otherwise allocates a new one from the backend.
    [[nodiscard]] mc::result<mc::byte*, mc::mirror_error> allocate_mirrored(isize size_bytes);

    /// Returns a region to the cache (see push).
    void deallocate_mirrored(mc::byte* p, isize size_bytes);

    // queries
public:
    /// Allocation granularity of the backend.
    [[nodiscard]] isize allocation_granularity() const;

    /// The backend regions are allocated from (never nullptr).
    [[nodiscard]] mirror_backend const* backend() const { return _backend; }

    /// Number of regions currently parked.
    [[nodiscard]] isize cached_count() const;

    /// Total size of all parked regions in bytes.
    [[nodiscard]] isize cached_bytes() const;

    /// Number of distinct region sizes currently parked.
    [[nodiscard]] isize cached_size_count() const;

private:
    struct pool
    {
        // regions of 2 * granularity bytes, the size of every small deque
        std::vector<mc::byte*> smallest;
        // all other sizes
        std::unordered_map<isize, std::vector<mc::byte*>> by_size;
        isize count = 0;
        isize bytes = 0;
    };

    mirror_backend const* _backend;
    isize _smallest_size;
    mc::mutex<pool> _pool;
};
