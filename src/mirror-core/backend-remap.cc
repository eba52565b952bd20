// Mirrored memory via mremap (Linux, Android)
//
// mmap(size) as MAP_SHARED | MAP_ANONYMOUS so both halves can share pages,
// munmap the second half, then mremap(first, old_size = 0, half, MREMAP_FIXED | MREMAP_MAYMOVE, second).
// old_size == 0 on a shared mapping creates a second mapping of the same pages instead of moving them.

#include <mirror-core/assert.hh>
#include <mirror-core/backend.hh>

#include <cerrno>

#include <sys/mman.h>
#include <unistd.h>

namespace
{
// attempt outcome, race_lost means "everything released, try again"
enum class attempt_result
{
    success,
    race_lost,
    failed,
};

attempt_result try_map_mirrored(mc::byte** out_ptr, mc::isize size)
{
    auto const half = size / 2;

    void* const p = ::mmap(nullptr, size_t(size), PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (p == MAP_FAILED)
    {
        mc::impl::report_os_error("mmap", errno);
        return attempt_result::failed;
    }

    auto* const first = static_cast<mc::byte*>(p);
    auto* const second = first + half;

    // opens the race window: until mremap below, another thread may claim [second, second + half)
    if (::munmap(second, size_t(half)) != 0)
    {
        mc::impl::report_os_error("munmap (second half)", errno);
        auto const rc = ::munmap(first, size_t(size));
        MC_ASSERT_ALWAYS(rc == 0, "failed to release a partially created mirrored mapping");
        return attempt_result::failed;
    }

    void* const r = ::mremap(first, 0, size_t(half), MREMAP_FIXED | MREMAP_MAYMOVE, second);
    if (r == MAP_FAILED || r != second)
    {
        // out of memory is final, anything else means the second half was disturbed in the meantime
        auto const err = r == MAP_FAILED ? errno : 0;
        if (err != 0)
            mc::impl::report_os_error("mremap", err);

        if (r != MAP_FAILED)
        {
            auto const rc = ::munmap(r, size_t(half));
            MC_ASSERT_ALWAYS(rc == 0, "failed to release a misplaced mirror half");
        }
        auto const rc = ::munmap(first, size_t(half));
        MC_ASSERT_ALWAYS(rc == 0, "failed to release a partially created mirrored mapping");
        return err == ENOMEM || err == EAGAIN ? attempt_result::failed : attempt_result::race_lost;
    }

    *out_ptr = first;
    return attempt_result::success;
}

mc::result<mc::byte*, mc::mirror_error> remap_allocate_mirrored(mc::isize size_bytes, void* userdata)
{
    MC_UNUSED(userdata);

    mc::byte* p = nullptr;
    for (auto attempt = 0; attempt < mc::max_mirror_attempts; ++attempt)
    {
        switch (try_map_mirrored(&p, size_bytes))
        {
        case attempt_result::success:
            return p;
        case attempt_result::failed:
            return mc::failure(mc::mirror_error::allocation_failure);
        case attempt_result::race_lost:
            break;
        }
    }

    return mc::failure(mc::mirror_error::race_exhausted);
}

void remap_deallocate_mirrored(mc::byte* p, mc::isize size_bytes, void* userdata)
{
    MC_UNUSED(userdata);

    // both halves are adjacent mappings, a single munmap releases them
    auto const rc = ::munmap(p, size_t(size_bytes));
    if (rc != 0)
        mc::impl::report_os_error("munmap", errno);
    MC_ASSERT_ALWAYS(rc == 0, "failed to release a mirrored mapping");
}

mc::isize remap_allocation_granularity(void* userdata)
{
    MC_UNUSED(userdata);

    static mc::isize const page_size = ::sysconf(_SC_PAGESIZE);
    return page_size;
}

constinit mc::mirror_backend const remap_mirror_backend = {
    .allocate_mirrored = remap_allocate_mirrored,
    .deallocate_mirrored = remap_deallocate_mirrored,
    .allocation_granularity = remap_allocation_granularity,
    .userdata = nullptr,
};
} // namespace

constinit mc::mirror_backend const* const mc::default_mirror_backend = &remap_mirror_backend;

char const* mc::default_mirror_backend_name()
{
    return "remap";
}
