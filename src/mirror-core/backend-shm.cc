// Mirrored memory via a shared memory object mapped twice (Windows, POSIX systems without mremap/mach)
//
// 1. create a memory object of half the size
//    (Windows: CreateFileMappingW on the page file, Linux: memfd_create, other POSIX: shm_open + shm_unlink)
// 2. find a free virtual range of the full size by reserving it and releasing it right away
// 3. map the object into the first half and into the second half at the exact reserved addresses
// 4. close the object handle, the two views keep the memory alive until both are unmapped
//
// Step 3 only passes an address hint, a hint that is not honored means another thread claimed the range.

#include <mirror-core/assert.hh>
#include <mirror-core/backend.hh>

#ifdef MC_OS_WINDOWS

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#else

#include <atomic>
#include <cerrno>
#include <cstdio>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#endif

namespace
{
enum class attempt_result
{
    success,
    race_lost,
    failed,
};

#ifdef MC_OS_WINDOWS

// =========================================================================================================
// Windows
// =========================================================================================================

using object_handle = HANDLE;

bool create_memory_object(object_handle* out, mc::isize half)
{
    auto const size = mc::u64(half);
    auto const h = ::CreateFileMappingW(INVALID_HANDLE_VALUE, nullptr, PAGE_READWRITE | SEC_COMMIT,
                                        DWORD(size >> 32), DWORD(size & 0xFFFFFFFFu), nullptr);
    if (h == nullptr)
    {
        mc::impl::report_os_error("CreateFileMappingW", long(::GetLastError()));
        return false;
    }
    *out = h;
    return true;
}

void close_memory_object(object_handle h)
{
    auto const ok = ::CloseHandle(h);
    if (!ok)
        mc::impl::report_os_error("CloseHandle", long(::GetLastError()));
    MC_ASSERT_ALWAYS(ok, "failed to close the shared memory object of a mirrored mapping");
}

mc::byte* find_free_range(mc::isize size)
{
    auto const p = ::VirtualAlloc(nullptr, SIZE_T(size), MEM_RESERVE, PAGE_NOACCESS);
    if (p == nullptr)
    {
        mc::impl::report_os_error("VirtualAlloc", long(::GetLastError()));
        return nullptr;
    }

    auto const ok = ::VirtualFree(p, 0, MEM_RELEASE);
    if (!ok)
        mc::impl::report_os_error("VirtualFree", long(::GetLastError()));
    MC_ASSERT_ALWAYS(ok, "failed to release a virtual memory reservation");
    return static_cast<mc::byte*>(p);
}

attempt_result map_view_at(object_handle h, mc::isize half, mc::byte* address)
{
    auto const p = ::MapViewOfFileEx(h, FILE_MAP_ALL_ACCESS, 0, 0, SIZE_T(half), address);
    if (p == nullptr)
    {
        auto const err = ::GetLastError();
        mc::impl::report_os_error("MapViewOfFileEx", long(err));
        // ERROR_INVALID_ADDRESS: the range is occupied again
        return err == ERROR_INVALID_ADDRESS ? attempt_result::race_lost : attempt_result::failed;
    }
    // MapViewOfFileEx fails instead of relocating, so a returned view is always at address
    MC_ASSERT(p == address, "MapViewOfFileEx placed the view at an unexpected address");
    return attempt_result::success;
}

void unmap_view(mc::byte* address, mc::isize half)
{
    MC_UNUSED(half);
    auto const ok = ::UnmapViewOfFile(address);
    if (!ok)
        mc::impl::report_os_error("UnmapViewOfFile", long(::GetLastError()));
    MC_ASSERT_ALWAYS(ok, "failed to unmap a view of a mirrored mapping");
}

mc::isize query_granularity()
{
    SYSTEM_INFO info;
    ::GetSystemInfo(&info);
    auto const page_size = mc::isize(info.dwPageSize);
    auto const alloc_granularity = mc::isize(info.dwAllocationGranularity);
    return mc::max(page_size, alloc_granularity);
}

#else

// =========================================================================================================
// POSIX
// =========================================================================================================

using object_handle = int;

bool create_memory_object(object_handle* out, mc::isize half)
{
#ifdef MC_OS_LINUX
    auto const fd = ::memfd_create("mirror-core", MFD_CLOEXEC);
    if (fd < 0)
    {
        mc::impl::report_os_error("memfd_create", errno);
        return false;
    }
#else
    // shm_open needs a name, we unlink it right away so the object is anonymous from here on
    static std::atomic<mc::u64> s_counter{0};
    char name[64];
    std::snprintf(name, sizeof(name), "/mirror-core-%ld-%llu", long(::getpid()),
                  static_cast<unsigned long long>(s_counter.fetch_add(1)));

    auto const fd = ::shm_open(name, O_RDWR | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0)
    {
        mc::impl::report_os_error("shm_open", errno);
        return false;
    }
    if (::shm_unlink(name) != 0)
    {
        mc::impl::report_os_error("shm_unlink", errno);
        ::close(fd);
        return false;
    }
#endif

    if (::ftruncate(fd, off_t(half)) != 0)
    {
        mc::impl::report_os_error("ftruncate", errno);
        ::close(fd);
        return false;
    }

    *out = fd;
    return true;
}

void close_memory_object(object_handle fd)
{
    auto const rc = ::close(fd);
    if (rc != 0)
        mc::impl::report_os_error("close", errno);
    MC_ASSERT_ALWAYS(rc == 0, "failed to close the shared memory object of a mirrored mapping");
}

mc::byte* find_free_range(mc::isize size)
{
    auto const p = ::mmap(nullptr, size_t(size), PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (p == MAP_FAILED)
    {
        mc::impl::report_os_error("mmap (reserve)", errno);
        return nullptr;
    }

    auto const rc = ::munmap(p, size_t(size));
    if (rc != 0)
        mc::impl::report_os_error("munmap (reserve)", errno);
    MC_ASSERT_ALWAYS(rc == 0, "failed to release a virtual memory reservation");
    return static_cast<mc::byte*>(p);
}

void unmap_view(mc::byte* address, mc::isize half)
{
    auto const rc = ::munmap(address, size_t(half));
    if (rc != 0)
        mc::impl::report_os_error("munmap", errno);
    MC_ASSERT_ALWAYS(rc == 0, "failed to unmap a view of a mirrored mapping");
}

attempt_result map_view_at(object_handle fd, mc::isize half, mc::byte* address)
{
    // without MAP_FIXED an occupied range never makes mmap fail, so a failure is a real one
    auto const p = ::mmap(address, size_t(half), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (p == MAP_FAILED)
    {
        mc::impl::report_os_error("mmap", errno);
        return attempt_result::failed;
    }

    // the address is only a hint, a view anywhere else is useless to us
    if (p != address)
    {
        unmap_view(static_cast<mc::byte*>(p), half);
        return attempt_result::race_lost;
    }
    return attempt_result::success;
}

mc::isize query_granularity()
{
    return mc::isize(::sysconf(_SC_PAGESIZE));
}

#endif

// =========================================================================================================
// Strategy (platform independent)
// =========================================================================================================

attempt_result try_map_mirrored(mc::byte** out_ptr, object_handle object, mc::isize size)
{
    auto const half = size / 2;

    auto* const first = find_free_range(size);
    if (first == nullptr)
        return attempt_result::failed;

    // the range is free again: the race window is open until both views are in place
    if (auto const r = map_view_at(object, half, first); r != attempt_result::success)
        return r;

    if (auto const r = map_view_at(object, half, first + half); r != attempt_result::success)
    {
        unmap_view(first, half);
        return r;
    }

    *out_ptr = first;
    return attempt_result::success;
}

mc::result<mc::byte*, mc::mirror_error> shm_allocate_mirrored(mc::isize size_bytes, void* userdata)
{
    MC_UNUSED(userdata);

    object_handle object;
    if (!create_memory_object(&object, size_bytes / 2))
        return mc::failure(mc::mirror_error::allocation_failure);

    // the views keep the memory alive, the handle is not needed after this function in any outcome
    MC_DEFER { close_memory_object(object); };

    mc::byte* p = nullptr;
    for (auto attempt = 0; attempt < mc::max_mirror_attempts; ++attempt)
    {
        switch (try_map_mirrored(&p, object, size_bytes))
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

void shm_deallocate_mirrored(mc::byte* p, mc::isize size_bytes, void* userdata)
{
    MC_UNUSED(userdata);

    // two independent views, each is unmapped on its own
    auto const half = size_bytes / 2;
    unmap_view(p, half);
    unmap_view(p + half, half);
}

mc::isize shm_allocation_granularity(void* userdata)
{
    MC_UNUSED(userdata);

    static mc::isize const granularity = query_granularity();
    return granularity;
}

constinit mc::mirror_backend const shm_mirror_backend = {
    .allocate_mirrored = shm_allocate_mirrored,
    .deallocate_mirrored = shm_deallocate_mirrored,
    .allocation_granularity = shm_allocation_granularity,
    .userdata = nullptr,
};
} // namespace

constinit mc::mirror_backend const* const mc::default_mirror_backend = &shm_mirror_backend;

char const* mc::default_mirror_backend_name()
{
    return "shm";
}
