#include "backend.hh"

#include <mirror-core/assert.hh>

#include <cstring>
#include <iostream>

char const* mc::to_string(mirror_error e)
{
    switch (e)
    {
    case mirror_error::allocation_failure:
        return "allocation_failure";
    case mirror_error::race_exhausted:
        return "race_exhausted";
    }
    return "<invalid mirror_error>";
}

mc::result<mc::byte*, mc::mirror_error> mc::allocate_mirrored(isize size_bytes, mirror_backend const* backend)
{
    auto const& b = backend ? *backend : *default_mirror_backend;
    MC_ASSERT(size_bytes > 0, "mirrored allocation size must be positive");
    MC_ASSERT(size_bytes % (2 * b.allocation_granularity(b.userdata)) == 0,
              "mirrored allocation size must be a multiple of twice the allocation granularity");
    return b.allocate_mirrored(size_bytes, b.userdata);
}

void mc::deallocate_mirrored(mc::byte* p, isize size_bytes, mirror_backend const* backend)
{
    auto const& b = backend ? *backend : *default_mirror_backend;
    MC_ASSERT(p != nullptr, "cannot deallocate a null mirrored region");
    MC_ASSERT(size_bytes > 0, "mirrored allocation size must be positive");
    b.deallocate_mirrored(p, size_bytes, b.userdata);
}

mc::isize mc::allocation_granularity(mirror_backend const* backend)
{
    auto const& b = backend ? *backend : *default_mirror_backend;
    return b.allocation_granularity(b.userdata);
}

MC_COLD_FUNC void mc::impl::report_os_error(char const* call, long os_error)
{
#ifdef MC_DEBUG
    std::cerr << "mirror-core: " << call << " failed: ";
#if defined(MC_MIRROR_BACKEND_MACH)
    std::cerr << "kern_return_t " << os_error << '\n';
#elif defined(MC_OS_WINDOWS)
    std::cerr << "error code " << os_error << '\n';
#else
    std::cerr << std::strerror(int(os_error)) << '\n';
#endif
#else
    MC_UNUSED(call);
    MC_UNUSED(os_error);
#endif
}
