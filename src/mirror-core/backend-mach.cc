// Mirrored memory via mach_vm_remap (macOS, iOS)
//
// mach_vm_allocate(size), mach_vm_deallocate the second half,
// then mach_vm_remap the first half at the exact address of the second half (copy = false, shared pages).

#include <mirror-core/assert.hh>
#include <mirror-core/backend.hh>

#include <mach/mach.h>
#include <mach/mach_vm.h>

namespace
{
enum class attempt_result
{
    success,
    race_lost,
    failed,
};

kern_return_t vm_release(mc::byte* p, mc::isize size)
{
    return ::mach_vm_deallocate(::mach_task_self(), mach_vm_address_t(p), mach_vm_size_t(size));
}

attempt_result try_map_mirrored(mc::byte** out_ptr, mc::isize size)
{
    auto const half = size / 2;

    mach_vm_address_t addr = 0;
    auto r = ::mach_vm_allocate(::mach_task_self(), &addr, mach_vm_size_t(size), VM_FLAGS_ANYWHERE);
    if (r != KERN_SUCCESS)
    {
        mc::impl::report_os_error("mach_vm_allocate", r);
        return attempt_result::failed;
    }

    auto* const first = reinterpret_cast<mc::byte*>(addr);
    auto* const second = first + half;

    // opens the race window: until mach_vm_remap below, another thread may claim [second, second + half)
    r = vm_release(second, half);
    if (r != KERN_SUCCESS)
    {
        mc::impl::report_os_error("mach_vm_deallocate (second half)", r);
        auto const rc = vm_release(first, size);
        MC_ASSERT_ALWAYS(rc == KERN_SUCCESS, "failed to release a partially created mirrored mapping");
        return attempt_result::failed;
    }

    auto target = mach_vm_address_t(second);
    vm_prot_t cur_protection = 0;
    vm_prot_t max_protection = 0;
    r = ::mach_vm_remap(::mach_task_self(), &target, mach_vm_size_t(half),
                        /* mask: */ 0, VM_FLAGS_FIXED, ::mach_task_self(), mach_vm_address_t(first),
                        /* copy: */ false, &cur_protection, &max_protection, VM_INHERIT_COPY);
    if (r != KERN_SUCCESS)
    {
        mc::impl::report_os_error("mach_vm_remap", r);
        auto const rc = vm_release(first, half);
        MC_ASSERT_ALWAYS(rc == KERN_SUCCESS, "failed to release a partially created mirrored mapping");
        // KERN_NO_SPACE: the second half was claimed by someone else, everything else is final
        return r == KERN_NO_SPACE ? attempt_result::race_lost : attempt_result::failed;
    }

    *out_ptr = first;
    return attempt_result::success;
}

mc::result<mc::byte*, mc::mirror_error> mach_allocate_mirrored(mc::isize size_bytes, void* userdata)
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

void mach_deallocate_mirrored(mc::byte* p, mc::isize size_bytes, void* userdata)
{
    MC_UNUSED(userdata);

    // the remapped second half is a regular vm entry adjacent to the first, one call releases both
    auto const r = vm_release(p, size_bytes);
    if (r != KERN_SUCCESS)
        mc::impl::report_os_error("mach_vm_deallocate", r);
    MC_ASSERT_ALWAYS(r == KERN_SUCCESS, "failed to release a mirrored mapping");
}

mc::isize mach_allocation_granularity(void* userdata)
{
    MC_UNUSED(userdata);
    return mc::isize(vm_page_size);
}

constinit mc::mirror_backend const mach_mirror_backend = {
    .allocate_mirrored = mach_allocate_mirrored,
    .deallocate_mirrored = mach_deallocate_mirrored,
    .allocation_granularity = mach_allocation_granularity,
    .userdata = nullptr,
};
} // namespace

constinit mc::mirror_backend const* const mc::default_mirror_backend = &mach_mirror_backend;

char const* mc::default_mirror_backend_name()
{
    return "mach";
}
