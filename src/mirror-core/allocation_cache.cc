#include "allocation_cache.hh"

#include <mirror-core/assert.hh>
#include <mirror-core/utility.hh>

mc::allocation_cache::allocation_cache(mirror_backend const* backend)
  : _backend(backend ? backend : default_mirror_backend),
    _smallest_size(2 * mc::allocation_granularity(_backend))
{
}

mc::allocation_cache::~allocation_cache()
{
    release_all();
}

mc::byte* mc::allocation_cache::pop(isize size_bytes)
{
    MC_ASSERT(size_bytes > 0, "cached region size must be positive");

    auto const smallest_size = _smallest_size;
    return _pool.lock(
        [&](pool& p) -> mc::byte*
        {
            mc::byte* region = nullptr;
            if (size_bytes == smallest_size)
            {
                if (p.smallest.empty())
                    return nullptr;
                region = p.smallest.back();
                p.smallest.pop_back();
            }
            else
            {
                // buckets exist only while they hold regions
                auto const it = p.by_size.find(size_bytes);
                if (it == p.by_size.end())
                    return nullptr;
                region = it->second.back();
                it->second.pop_back();
                if (it->second.empty())
                    p.by_size.erase(it);
            }

            p.count -= 1;
            p.bytes -= size_bytes;
            return region;
        });
}

void mc::allocation_cache::push(mc::byte* region, isize size_bytes)
{
    MC_ASSERT(region != nullptr, "cannot cache a null region");
    MC_ASSERT(size_bytes > 0 && size_bytes % _smallest_size == 0, "cached region size must be a multiple of twice the "
                                                                  "allocation granularity");

    auto const smallest_size = _smallest_size;
    _pool.lock(
        [&](pool& p)
        {
            if (size_bytes == smallest_size)
                p.smallest.push_back(region);
            else
                p.by_size[size_bytes].push_back(region);
            p.count += 1;
            p.bytes += size_bytes;
        });
}

void mc::allocation_cache::release_all()
{
    // swap the pool out under the lock, deallocate outside of it
    pool released;
    _pool.lock([&](pool& p) { mc::swap_by_move(p, released); });

    for (auto const region : released.smallest)
        mc::deallocate_mirrored(region, _smallest_size, _backend);

    for (auto const& [size, regions] : released.by_size)
        for (auto const region : regions)
            mc::deallocate_mirrored(region, size, _backend);
}

mc::result<mc::byte*, mc::mirror_error> mc::allocation_cache::allocate_mirrored(isize size_bytes)
{
    if (auto const cached = pop(size_bytes))
        return cached;

    return mc::allocate_mirrored(size_bytes, _backend);
}

void mc::allocation_cache::deallocate_mirrored(mc::byte* p, isize size_bytes)
{
    push(p, size_bytes);
}

mc::isize mc::allocation_cache::allocation_granularity() const
{
    return _smallest_size / 2;
}

mc::isize mc::allocation_cache::cached_count() const
{
    return _pool.lock([](pool const& p) { return p.count; });
}

mc::isize mc::allocation_cache::cached_bytes() const
{
    return _pool.lock([](pool const& p) { return p.bytes; });
}

mc::isize mc::allocation_cache::cached_size_count() const
{
    return _pool.lock([](pool const& p) { return isize(p.by_size.size()) + (p.smallest.empty() ? 0 : 1); });
}

namespace
{
// set once the calling thread's cache is gone, stays set until the thread ends
thread_local bool t_thread_cache_destroyed = false;

struct thread_cache_holder
{
    mc::allocation_cache cache;

    // runs before the cache member is destroyed
    ~thread_cache_holder() { t_thread_cache_destroyed = true; }
};
} // namespace

mc::allocation_cache* mc::thread_allocation_cache_or_null()
{
    if (t_thread_cache_destroyed)
        return nullptr;

    thread_local thread_cache_holder holder;
    return &holder.cache;
}

mc::allocation_cache& mc::thread_allocation_cache()
{
    auto const cache = thread_allocation_cache_or_null();
    MC_ASSERT_ALWAYS(cache != nullptr, "the allocation cache of this thread was already destroyed");
    return *cache;
}
