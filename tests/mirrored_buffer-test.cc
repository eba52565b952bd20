#include <mirror-core/allocation_cache.hh>
#include <mirror-core/mirrored_buffer.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <atomic>
#include <cstdint>
#include <thread>


namespace
{
struct Triple
{
    int a, b, c; // 12 bytes, not a divisor of any granularity
};

struct alignas(64) CacheLine
{
    char bytes[64];
};

std::atomic<int> g_late_releases{0};
std::atomic<int> g_late_mirror_ok{0};

// thread_local that is constructed before the thread cache and therefore destroyed after it
struct LateOwner
{
    mc::mirrored_buffer<int> buffer;

    ~LateOwner()
    {
        if (mc::thread_allocation_cache_or_null() != nullptr)
            return;
        ++g_late_releases;

        // allocation still works, straight from the default backend
        auto b = mc::mirrored_buffer<int>::create_uninitialized(2);
        b[0] = 11;
        if (b[b.size() / 2] == 11)
            ++g_late_mirror_ok;
    }
};
} // namespace

TEST("mirrored_buffer - alloc_size_bytes_for")
{
    SECTION("zero slots")
    {
        CHECK(mc::mirrored_buffer<int>::alloc_size_bytes_for(0, 4096) == 0);
    }

    SECTION("rounds each half up to the granularity")
    {
        CHECK(mc::mirrored_buffer<int>::alloc_size_bytes_for(2, 4096) == 8192);
        CHECK(mc::mirrored_buffer<int>::alloc_size_bytes_for(2048, 4096) == 8192);
        CHECK(mc::mirrored_buffer<int>::alloc_size_bytes_for(2050, 4096) == 16384);
        CHECK(mc::mirrored_buffer<int>::alloc_size_bytes_for(8, 16) == 32);
        CHECK(mc::mirrored_buffer<mc::u64>::alloc_size_bytes_for(8, 16) == 64);
    }

    SECTION("the mirror period is a whole number of elements")
    {
        // lcm(4096, 12) == 12288
        CHECK(mc::mirrored_buffer<Triple>::alloc_size_bytes_for(2, 4096) == 2 * 12288);
        // lcm(16, 12) == 48
        CHECK(mc::mirrored_buffer<Triple>::alloc_size_bytes_for(2, 16) == 96);
        CHECK(mc::mirrored_buffer<Triple>::alloc_size_bytes_for(10, 16) == 96);
        CHECK(mc::mirrored_buffer<Triple>::alloc_size_bytes_for(10, 16) / 2 % mc::isize(sizeof(Triple)) == 0);
    }
}

TEST("mirrored_buffer - empty buffer")
{
    mc::mirrored_buffer<int> b;
    CHECK(b.empty());
    CHECK(b.size() == 0);
    CHECK(b.size_bytes() == 0);
    CHECK(b.data() == nullptr);
    CHECK(b.cache() == nullptr);

    auto zero = mc::mirrored_buffer<int>::create_uninitialized(0);
    CHECK(zero.empty());
    CHECK(zero.data() == nullptr);
}

TEST("mirrored_buffer - sizing through a custom backend")
{
    SECTION("ints")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        auto b = mc::mirrored_buffer<int>::create_uninitialized(8, &cache);
        CHECK(b.size() == 8);
        CHECK(b.size_bytes() == 32);
        CHECK(b.cache() == &cache);
        CHECK(heap.allocations == 1);
    }

    SECTION("requests are rounded up")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        auto b = mc::mirrored_buffer<int>::create_uninitialized(2, &cache);
        CHECK(b.size() == 8);
    }

    SECTION("odd element sizes")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        auto b = mc::mirrored_buffer<Triple>::create_uninitialized(2, &cache);
        CHECK(b.size_bytes() == 96);
        CHECK(b.size() == 8);
    }

    SECTION("destruction returns the region to the cache")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        {
            auto b = mc::mirrored_buffer<int>::create_uninitialized(8, &cache);
            CHECK(cache.cached_count() == 0);
        }
        CHECK(cache.cached_count() == 1);
        CHECK(cache.cached_bytes() == 32);
        CHECK(heap.deallocations == 0);

        auto again = mc::mirrored_buffer<int>::create_uninitialized(8, &cache);
        CHECK(heap.allocations == 1);
        CHECK(cache.cached_count() == 0);
    }
}

TEST("mirrored_buffer - mirror invariant")
{
    auto b = mc::mirrored_buffer<mc::u32>::create_uninitialized(2);
    REQUIRE(!b.empty());
    REQUIRE(b.size() % 2 == 0);
    auto const half = b.size() / 2;

    for (mc::isize i = 0; i < half; ++i)
        b[i] = mc::u32(i * 7 + 1);
    for (mc::isize i = 0; i < half; ++i)
        CHECK(b[i + half] == mc::u32(i * 7 + 1));

    for (mc::isize i = 0; i < half; i += 13)
        b[i + half] = mc::u32(0xC0FFEE);
    for (mc::isize i = 0; i < half; i += 13)
        CHECK(b[i] == mc::u32(0xC0FFEE));
}

TEST("mirrored_buffer - mirror invariant with odd element sizes")
{
    auto b = mc::mirrored_buffer<Triple>::create_uninitialized(2);
    auto const half = b.size() / 2;
    REQUIRE(half > 0);
    CHECK(b.size_bytes() / 2 == half * mc::isize(sizeof(Triple)));

    b[half - 1] = Triple{1, 2, 3};
    CHECK(b[2 * half - 1].a == 1);
    CHECK(b[2 * half - 1].c == 3);

    b[half] = Triple{4, 5, 6};
    CHECK(b[0].b == 5);
}

TEST("mirrored_buffer - move semantics")
{
    auto a = mc::mirrored_buffer<int>::create_uninitialized(2);
    auto* const p = a.data();
    auto const size = a.size();

    auto b = mc::move(a);
    CHECK(a.empty());
    CHECK(a.data() == nullptr);
    CHECK(b.data() == p);
    CHECK(b.size() == size);

    mc::mirrored_buffer<int> c;
    c = mc::move(b);
    CHECK(b.empty());
    CHECK(c.data() == p);
}

TEST("mirrored_buffer - clone")
{
    auto a = mc::mirrored_buffer<int>::create_uninitialized(2);
    auto const half = a.size() / 2;
    for (mc::isize i = 0; i < half; ++i)
        a[i] = int(i);

    auto const b = a.clone();
    REQUIRE(b.size() == a.size());
    CHECK(b.data() != a.data());
    CHECK(b.cache() == a.cache());
    for (mc::isize i = 0; i < half; i += 31)
    {
        CHECK(b[i] == int(i));
        CHECK(b[i + half] == int(i));
    }
}

TEST("mirrored_buffer - allocation failures")
{
    SECTION("allocation_failure is returned")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        heap.failures_left = 1;
        auto r = mc::mirrored_buffer<int>::try_create_uninitialized(8, &cache);
        REQUIRE(r.has_error());
        CHECK(r.error() == mc::mirror_error::allocation_failure);
        CHECK(heap.live_bytes == 0);
    }

    SECTION("allocation_failure is fatal without try_")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        heap.failures_left = 1;
        CHECK(test::asserts_on([&] { (void)mc::mirrored_buffer<int>::create_uninitialized(8, &cache); }));
    }

    SECTION("race_exhausted is always fatal")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);

        heap.failures_left = 1;
        heap.failure = mc::mirror_error::race_exhausted;
        CHECK(test::asserts_on([&] { (void)mc::mirrored_buffer<int>::try_create_uninitialized(8, &cache); }));
    }
}

TEST("mirrored_buffer - preconditions")
{
    CHECK(test::asserts_on([] { (void)mc::mirrored_buffer<int>::create_uninitialized(3); }));
    CHECK(test::asserts_on([] { (void)mc::mirrored_buffer<int>::create_uninitialized(-2); }));

    SECTION("element alignment above the granularity is rejected")
    {
        auto heap = test::instrumented_backend::heap(16);
        auto const backend = heap.backend();
        mc::allocation_cache cache(&backend);
        CHECK(test::asserts_on([&] { (void)mc::mirrored_buffer<CacheLine>::create_uninitialized(2, &cache); }));
        CHECK(heap.allocations == 0);
    }

#if MC_ASSERT_ENABLED
    SECTION("out of bounds access")
    {
        auto b = mc::mirrored_buffer<int>::create_uninitialized(2);
        CHECK(test::asserts_on([&] { (void)b[b.size()]; }));
        CHECK(test::asserts_on([&] { (void)b[-1]; }));
    }
#endif
}

TEST("mirrored_buffer - buffers outliving the thread cache use the backend directly")
{
    g_late_releases = 0;
    g_late_mirror_ok = 0;

    std::thread(
        []
        {
            thread_local LateOwner owner;

            // first use of the thread cache happens after owner exists
            owner.buffer = mc::mirrored_buffer<int>::create_uninitialized(2);
            owner.buffer[0] = 5;
        })
        .join();

    // owner's destructor ran after the cache was gone, and its buffer was released without it
    CHECK(g_late_releases == 1);
    CHECK(g_late_mirror_ok == 1);
}
