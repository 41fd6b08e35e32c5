#pragma once
/**
 * @file nj_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (NESTJAR_PLATFORM_WIN64, NESTJAR_IS_POSIX, etc.) or Windows
 * headers should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#if defined(PLATFORM_WIN64)

#define NESTJAR_PLATFORM_WIN64 1
#undef NESTJAR_PLATFORM_APPLE
#undef NESTJAR_PLATFORM_LINUX
#undef NESTJAR_PLATFORM_FREEBSD
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)

#define NESTJAR_PLATFORM_APPLE 1
#undef NESTJAR_PLATFORM_WIN64
#undef NESTJAR_PLATFORM_LINUX
#undef NESTJAR_PLATFORM_FREEBSD

#elif defined(PLATFORM_FREEBSD)

#define NESTJAR_PLATFORM_FREEBSD 1
#undef NESTJAR_PLATFORM_APPLE
#undef NESTJAR_PLATFORM_WIN64
#undef NESTJAR_PLATFORM_LINUX

#elif defined(PLATFORM_LINUX)

#define NESTJAR_PLATFORM_LINUX 1
#undef NESTJAR_PLATFORM_APPLE
#undef NESTJAR_PLATFORM_WIN64
#undef NESTJAR_PLATFORM_FREEBSD

#else
// Fallback detection
#if defined(_WIN64)
#define NESTJAR_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define NESTJAR_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define NESTJAR_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define NESTJAR_PLATFORM_LINUX 1
#else
#define NESTJAR_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(NESTJAR_PLATFORM_WIN64)
#define NESTJAR_IS_WINDOWS 1
#undef NESTJAR_IS_POSIX
#elif defined(NESTJAR_PLATFORM_APPLE) || defined(NESTJAR_PLATFORM_FREEBSD) ||                      \
    defined(NESTJAR_PLATFORM_LINUX)
#undef NESTJAR_IS_WINDOWS
#define NESTJAR_IS_POSIX 1
#else
#undef NESTJAR_IS_WINDOWS
#undef NESTJAR_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "nestjar_utils_export.h"

namespace nestjar::platform
{

// ============================================================================
// Native file access (read-only, positional)
// ============================================================================

/**
 * @brief Opaque handle for a file opened with file_open_read().
 * @details `native` holds the POSIX file descriptor, or the Windows HANDLE value
 *          cast to an integer. -1 means "not open".
 */
struct NativeFile
{
    intptr_t native = -1;

    [[nodiscard]] bool valid() const noexcept { return native != -1; }
};

/**
 * @brief Opens an existing file for reading only.
 * @param path File to open.
 * @param ec Cleared on success; holds the OS error on failure.
 * @return A valid NativeFile on success, an invalid one on failure.
 */
NESTJAR_UTILS_EXPORT NativeFile file_open_read(const std::filesystem::path &path,
                                               std::error_code &ec) noexcept;

/**
 * @brief Reads up to `size` bytes starting at absolute `offset`, without moving any
 *        shared file cursor (pread / overlapped ReadFile).
 * @return Bytes read (0 at or past end of file), or -1 on error with `ec` set.
 *         An interrupted system call is reported as `std::errc::interrupted`
 *         and is not retried here.
 */
NESTJAR_UTILS_EXPORT int64_t file_read_at(NativeFile file, void *dst, size_t size, int64_t offset,
                                          std::error_code &ec) noexcept;

/**
 * @brief Closes the file and invalidates the handle. Safe to call on an invalid handle.
 * @param ec Holds the OS error if the close itself failed; the handle is invalidated anyway.
 */
NESTJAR_UTILS_EXPORT void file_close(NativeFile *file, std::error_code &ec) noexcept;

// ============================================================================
// Process / thread identity and version
// ============================================================================

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
NESTJAR_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
NESTJAR_UTILS_EXPORT uint64_t get_pid();

NESTJAR_UTILS_EXPORT int get_version_major() noexcept;
NESTJAR_UTILS_EXPORT int get_version_minor() noexcept;
NESTJAR_UTILS_EXPORT int get_version_rolling() noexcept;
/**
 * @brief Gets the full version string (major.minor.rolling), e.g. "0.1.0".
 */
NESTJAR_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace nestjar::platform
