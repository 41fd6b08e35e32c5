/**
 * @file platform.cpp
 * @brief Cross-platform implementations for core OS-specific utilities.
 *
 * Process and thread IDs, package version information, and the read-only
 * positional file primitives used by the archive layer. Preprocessor
 * directives select the Windows or POSIX implementation.
 */
#include "nj_base.hpp"
#include "nestjar_version.h"

#include <algorithm>
#include <limits>
#include <thread>

#if defined(NESTJAR_IS_POSIX)
#include <cerrno>
#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace nestjar::platform
{

uint64_t get_pid()
{
#if defined(NESTJAR_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @details Uses the cheapest OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(NESTJAR_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

// --- Version information (from nestjar_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return NESTJAR_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return NESTJAR_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return NESTJAR_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return NESTJAR_VERSION_STRING;
}

// ============================================================================
// Native file access
// ============================================================================

#if defined(NESTJAR_PLATFORM_WIN64)

NativeFile file_open_read(const std::filesystem::path &path, std::error_code &ec) noexcept
{
    ec.clear();
    NativeFile f{};
    std::wstring wpath = nestjar::format_tools::win32_to_long_path(path);
    if (wpath.empty())
    {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return f;
    }
    HANDLE h = CreateFileW(wpath.c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return f;
    }
    f.native = reinterpret_cast<intptr_t>(h);
    return f;
}

int64_t file_read_at(NativeFile file, void *dst, size_t size, int64_t offset,
                     std::error_code &ec) noexcept
{
    ec.clear();
    if (!file.valid())
    {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return -1;
    }
    if (size == 0)
        return 0;
    const DWORD to_read =
        static_cast<DWORD>(std::min<size_t>(size, std::numeric_limits<DWORD>::max()));
    OVERLAPPED ov{};
    ov.Offset = static_cast<DWORD>(static_cast<uint64_t>(offset) & 0xFFFFFFFFull);
    ov.OffsetHigh = static_cast<DWORD>(static_cast<uint64_t>(offset) >> 32);
    DWORD bytes_read = 0;
    if (!ReadFile(reinterpret_cast<HANDLE>(file.native), dst, to_read, &bytes_read, &ov))
    {
        const DWORD err = GetLastError();
        if (err == ERROR_HANDLE_EOF)
            return 0;
        if (err == ERROR_OPERATION_ABORTED)
        {
            ec = std::make_error_code(std::errc::interrupted);
            return -1;
        }
        ec = std::error_code(static_cast<int>(err), std::system_category());
        return -1;
    }
    return static_cast<int64_t>(bytes_read);
}

void file_close(NativeFile *file, std::error_code &ec) noexcept
{
    ec.clear();
    if (!file || !file->valid())
        return;
    if (!CloseHandle(reinterpret_cast<HANDLE>(file->native)))
    {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
    }
    file->native = -1;
}

#else // POSIX

NativeFile file_open_read(const std::filesystem::path &path, std::error_code &ec) noexcept
{
    ec.clear();
    NativeFile f{};
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return f;
    }
    f.native = static_cast<intptr_t>(fd);
    return f;
}

int64_t file_read_at(NativeFile file, void *dst, size_t size, int64_t offset,
                     std::error_code &ec) noexcept
{
    ec.clear();
    if (!file.valid())
    {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return -1;
    }
    if (size == 0)
        return 0;
    const size_t to_read =
        std::min<size_t>(size, static_cast<size_t>(std::numeric_limits<ssize_t>::max()));
    ssize_t n = ::pread(static_cast<int>(file.native), dst, to_read, static_cast<off_t>(offset));
    if (n == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return -1;
    }
    return static_cast<int64_t>(n);
}

void file_close(NativeFile *file, std::error_code &ec) noexcept
{
    ec.clear();
    if (!file || !file->valid())
        return;
    if (::close(static_cast<int>(file->native)) == -1)
    {
        ec = std::error_code(errno, std::generic_category());
    }
    file->native = -1;
}

#endif

} // namespace nestjar::platform
