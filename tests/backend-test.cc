#include <mirror-core/backend.hh>
#include <mirror-core/utility.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>


TEST("backend - default backend is the configured strategy")
{
    REQUIRE(mc::default_mirror_backend != nullptr);
    auto const name = std::string(mc::default_mirror_backend_name());

#if defined(MC_MIRROR_BACKEND_REMAP)
    CHECK(name == "remap");
#elif defined(MC_MIRROR_BACKEND_MACH)
    CHECK(name == "mach");
#elif defined(MC_MIRROR_BACKEND_SHM)
    CHECK(name == "shm");
#else
    CHECK((name == "remap" || name == "mach" || name == "shm"));
#endif
}

TEST("backend - allocation granularity")
{
    auto const g = mc::allocation_granularity();
    CHECK(g >= 4096);
    CHECK(mc::is_power_of_two(g));
    CHECK(mc::allocation_granularity(mc::default_mirror_backend) == g);
}

TEST("backend - both halves alias the same memory")
{
    auto const g = mc::allocation_granularity();

    for (auto const size : {2 * g, 4 * g, 16 * g})
    {
        auto r = mc::allocate_mirrored(size);
        REQUIRE(r.has_value());

        auto* const p = r.value();
        auto const half = size / 2;
        CHECK(p != nullptr);
        CHECK(reinterpret_cast<std::uintptr_t>(p) % std::uintptr_t(g) == 0);

        // first half to second half
        for (mc::isize i = 0; i < half; i += 97)
            p[i] = mc::byte(i & 0xFF);
        for (mc::isize i = 0; i < half; i += 97)
            CHECK(p[half + i] == mc::byte(i & 0xFF));

        // second half to first half
        p[half + half - 1] = mc::byte(0x5A);
        CHECK(p[half - 1] == mc::byte(0x5A));
        p[half] = mc::byte(0xA5);
        CHECK(p[0] == mc::byte(0xA5));

        // a write across the middle wraps around to the start of the first half
        char const text[] = "mirrored";
        auto const n = mc::isize(sizeof(text));
        std::memcpy(p + half - 3, text, size_t(n));
        CHECK(std::memcmp(p, text + 3, size_t(n - 3)) == 0);
        CHECK(std::memcmp(p + 2 * half - 3, text, 3) == 0);

        mc::deallocate_mirrored(p, size);
    }
}

TEST("backend - many allocations are independent")
{
    auto const g = mc::allocation_granularity();
    std::vector<mc::byte*> regions;

    for (auto i = 0; i < 16; ++i)
    {
        auto r = mc::allocate_mirrored(2 * g);
        REQUIRE(r.has_value());
        r.value()[0] = mc::byte(i);
        regions.push_back(r.value());
    }

    for (auto i = 0; i < 16; ++i)
    {
        CHECK(regions[i][0] == mc::byte(i));
        CHECK(regions[i][g] == mc::byte(i));
    }

    for (auto* const p : regions)
        mc::deallocate_mirrored(p, 2 * g);
}

TEST("backend - requests beyond the address space are allocation failures")
{
    // larger than any user address space, the OS refuses it outright
    auto const size = mc::isize(1) << 60;
    REQUIRE(size % (2 * mc::allocation_granularity()) == 0);

    auto const r = mc::allocate_mirrored(size);
    REQUIRE(r.has_error());
    CHECK(r.error() == mc::mirror_error::allocation_failure);

    // the backend is still usable afterwards
    auto const g = mc::allocation_granularity();
    auto ok = mc::allocate_mirrored(2 * g);
    REQUIRE(ok.has_value());
    mc::deallocate_mirrored(ok.value(), 2 * g);
}

TEST("backend - custom backends are called through the free functions")
{
    auto heap = test::instrumented_backend::heap(64);
    auto const backend = heap.backend();

    CHECK(mc::allocation_granularity(&backend) == 64);

    auto r = mc::allocate_mirrored(128, &backend);
    REQUIRE(r.has_value());
    CHECK(heap.allocations == 1);
    CHECK(heap.live_bytes == 128);

    mc::deallocate_mirrored(r.value(), 128, &backend);
    CHECK(heap.deallocations == 1);
    CHECK(heap.live_bytes == 0);

    heap.failures_left = 1;
    heap.failure = mc::mirror_error::race_exhausted;
    auto const failed = mc::allocate_mirrored(128, &backend);
    REQUIRE(failed.has_error());
    CHECK(failed.error() == mc::mirror_error::race_exhausted);
    CHECK(heap.allocations == 1);
}

#if MC_ASSERT_ENABLED
TEST("backend - size preconditions")
{
    auto const g = mc::allocation_granularity();
    CHECK(test::asserts_on([] { (void)mc::allocate_mirrored(0); }));
    CHECK(test::asserts_on([&] { (void)mc::allocate_mirrored(g); }));
    CHECK(test::asserts_on([&] { (void)mc::allocate_mirrored(2 * g + 2); }));
}
#endif
