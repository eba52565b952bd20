#pragma once

#include <mirror-core/allocation_cache.hh>
#include <mirror-core/assert.hh>
#include <mirror-core/fwd.hh>
#include <mirror-core/result.hh>
#include <mirror-core/utility.hh>

#include <limits>
#include <type_traits>

namespace mc
{
/// Whether a live T may be used, moved from and destroyed through an address other than the one it was
/// constructed at, as long as the bytes found there are the same.
/// ring_deque needs this: when its window switches mirror halves, live elements are reached through the alias.
/// Types that point into themselves break under that, e.g. libstdc++ std::string with its inline buffer
/// or std::list with its sentinel node.
///
/// True for trivially copyable types. Types that only own external memory may opt in:
///   template <>
///   inline constexpr bool mc::is_mirror_relocatable<my_handle> = true;
template <class T>
inline constexpr bool is_mirror_relocatable = std::is_trivially_copyable_v<T>;
} // namespace mc

/// Owning handle of one mirrored allocation, viewed as raw storage for T.
///
/// The buffer holds size() slots, size() is even, and slot i aliases slot i + size() / 2 for every
/// i in [0, size() / 2): both address the same physical memory. The buffer is raw storage: it does not
/// know which slots hold live objects, ring_deque<T> tracks that.
///
/// Sizing:
///   A request for n slots (n even) allocates 2 * h bytes where h is n / 2 * sizeof(T) rounded up to a multiple
///   of both the allocation granularity and sizeof(T). size() may therefore exceed n, and the mirror period
///   h is always a whole number of elements.
///
/// Memory comes from an allocation_cache and goes back to it on destruction.
/// A null cache means mc::thread_allocation_cache() of the thread performing the allocation or release,
/// so buffers using the default cache may be moved between threads.
/// Once that thread cache is destroyed (statics, late thread_locals) the default backend is used directly.
///
/// Preconditions (checked when creating a non-empty buffer):
///   - sizeof(T) > 0                          (static, T must be complete)
///   - alignof(T) <= allocation granularity   (MC_ASSERT_ALWAYS)
///   - n is non-negative and even             (MC_ASSERT_ALWAYS)
///
/// Move-only. An empty buffer (size() == 0) owns nothing and has data() == nullptr.
template <class T>
struct mc::mirrored_buffer
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(!std::is_reference_v<T> && !std::is_const_v<T>, "T must be a non-const object type");

    // construction
public:
    /// Byte size of the mirrored region backing a buffer of n slots on a backend with the given granularity.
    /// Returns 0 for n == 0.
    [[nodiscard]] static isize alloc_size_bytes_for(isize n, isize granularity)
    {
        MC_ASSERT(granularity > 0 && mc::is_power_of_two(granularity), "allocation granularity must be a power of 2");
        if (n == 0)
            return 0;

        MC_ASSERT_ALWAYS(n / 2 <= std::numeric_limits<isize>::max() / 4 / isize(sizeof(T)), "mirrored buffer size "
                                                                                              "overflow");
        auto const half_bytes = mc::max(n / 2 * isize(sizeof(T)), isize(1));
        auto const unit = mc::int_lcm(granularity, isize(sizeof(T)));
        return 2 * mc::int_round_up_to_multiple(half_bytes, unit);
    }

    /// Allocates an uninitialized buffer of at least n slots.
    /// n == 0 returns an empty buffer without allocating.
    /// Returns mirror_error::allocation_failure if the OS refuses the memory (nothing is leaked).
    /// A mirror race that could not be resolved is fatal (MC_ASSERT_ALWAYS), it never reaches the caller.
    [[nodiscard]] static mc::result<mirrored_buffer, mc::mirror_error> try_create_uninitialized(isize n,
                                                                                                allocation_cache* cache
                                                                                                = nullptr)
    {
        MC_ASSERT_ALWAYS(n >= 0, "mirrored buffer length must be non-negative");
        MC_ASSERT_ALWAYS(n % 2 == 0, "mirrored buffer length must be even");

        mirrored_buffer b;
        b._cache = cache;
        if (n == 0)
            return b;

        auto const c = impl_resolve_cache(cache);
        auto const granularity = c ? c->allocation_granularity() : mc::allocation_granularity();
        MC_ASSERT_ALWAYS(isize(alignof(T)) <= granularity, "element alignment exceeds the allocation granularity");

        auto const size_bytes = alloc_size_bytes_for(n, granularity);
        auto region = c ? c->allocate_mirrored(size_bytes) : mc::allocate_mirrored(size_bytes);
        if (region.has_error())
        {
            MC_ASSERT_ALWAYS(region.error() != mc::mirror_error::race_exhausted,
                             "could not establish a mirrored mapping (another thread kept claiming the address "
                             "range)");
            return mc::failure(region.error());
        }

        b._data = reinterpret_cast<T*>(region.value());
        b._size = size_bytes / isize(sizeof(T));
        b._size_bytes = size_bytes;
        return b;
    }

    /// Allocates an uninitialized buffer of at least n slots.
    /// Same as try_create_uninitialized, but allocation failure is fatal too.
    [[nodiscard]] static mirrored_buffer create_uninitialized(isize n, allocation_cache* cache = nullptr)
    {
        auto b = try_create_uninitialized(n, cache);
        MC_ASSERT_ALWAYS(b.has_value(), "mirrored allocation failed");
        return mc::move(b).value();
    }

    /// Empty buffer, owns nothing.
    mirrored_buffer() = default;

    mirrored_buffer(mirrored_buffer&& rhs) noexcept
      : _data(mc::exchange(rhs._data, nullptr)),
        _size(mc::exchange(rhs._size, 0)),
        _size_bytes(mc::exchange(rhs._size_bytes, 0)),
        _cache(rhs._cache)
    {
    }

    mirrored_buffer& operator=(mirrored_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            _data = mc::exchange(rhs._data, nullptr);
            _size = mc::exchange(rhs._size, 0);
            _size_bytes = mc::exchange(rhs._size_bytes, 0);
            _cache = rhs._cache;
        }
        return *this;
    }

    mirrored_buffer(mirrored_buffer const&) = delete;
    mirrored_buffer& operator=(mirrored_buffer const&) = delete;

    /// Returns the region to its cache. Does not run any element destructors.
    ~mirrored_buffer() { impl_release(); }

    /// Allocates a new buffer of the same size and cache and copies the first half.
    /// The second half of the copy mirrors its first half, so the copy is identical as a whole.
    [[nodiscard]] mirrored_buffer clone() const
    {
        static_assert(std::is_trivially_copyable_v<T>, "mirrored_buffer::clone copies raw bytes, T must be trivially "
                                                       "copyable");
        auto b = mirrored_buffer::create_uninitialized(_size, _cache);
        mc::memcpy(b._data, _data, _size_bytes / 2);
        return b;
    }

    // queries
public:
    /// Number of slots, always even. Both halves count.
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Size of the mirrored region in bytes (twice the physical memory).
    [[nodiscard]] isize size_bytes() const { return _size_bytes; }

    /// The cache this buffer returns its region to (nullptr = the releasing thread's cache).
    [[nodiscard]] allocation_cache* cache() const { return _cache; }

    /// Allocation granularity of the backend behind cache().
    [[nodiscard]] isize allocation_granularity() const
    {
        auto const c = impl_resolve_cache(_cache);
        return c ? c->allocation_granularity() : mc::allocation_granularity();
    }

    // access
public:
    /// Pointer to slot 0, nullptr for empty buffers.
    [[nodiscard]] T* data() { return _data; }
    [[nodiscard]] T const* data() const { return _data; }

    /// Bounds-checked slot access over the full mirrored view.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        MC_ASSERT(0 <= i && i < _size, "mirrored buffer index out of bounds");
        return _data[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        MC_ASSERT(0 <= i && i < _size, "mirrored buffer index out of bounds");
        return _data[i];
    }

    /// Slot access without bounds check.
    [[nodiscard]] T& get_unchecked(isize i) { return _data[i]; }
    [[nodiscard]] T const& get_unchecked(isize i) const { return _data[i]; }

private:
    // nullptr if the thread cache is meant but already destroyed, the default backend is used then
    static allocation_cache* impl_resolve_cache(allocation_cache* cache)
    {
        return cache ? cache : mc::thread_allocation_cache_or_null();
    }

    void impl_release()
    {
        if (_data == nullptr)
            return;

        auto const region = reinterpret_cast<mc::byte*>(_data);
        if (auto const c = impl_resolve_cache(_cache))
            c->deallocate_mirrored(region, _size_bytes);
        else
            mc::deallocate_mirrored(region, _size_bytes);
        _data = nullptr;
        _size = 0;
        _size_bytes = 0;
    }

    T* _data = nullptr;
    isize _size = 0;
    isize _size_bytes = 0;
    allocation_cache* _cache = nullptr;
};
