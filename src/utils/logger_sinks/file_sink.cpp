#include "nj_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

#if defined(NESTJAR_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace nestjar::utils
{

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
#if defined(NESTJAR_PLATFORM_WIN64)
    (void)m_use_flock;
    const std::wstring wpath = format_tools::win32_to_long_path(m_path);
    HANDLE h = CreateFileW(wpath.c_str(), FILE_APPEND_DATA,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        const std::error_code ec(static_cast<int>(GetLastError()), std::system_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), ec.message()));
    }
    m_file_handle = h;
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), ec.message()));
    }
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#if defined(NESTJAR_PLATFORM_WIN64)
    if (m_file_handle != nullptr)
    {
        CloseHandle(static_cast<HANDLE>(m_file_handle));
        m_file_handle = nullptr;
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
#if defined(NESTJAR_PLATFORM_WIN64)
    DWORD written = 0;
    if (!WriteFile(static_cast<HANDLE>(m_file_handle), line.data(),
                   static_cast<DWORD>(line.size()), &written, nullptr) ||
        written != line.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t written = ::write(m_fd, line.data(), line.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (written < 0 || static_cast<size_t>(written) != line.size())
    {
        throw std::system_error(written < 0 ? saved_errno : EIO, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(NESTJAR_PLATFORM_WIN64)
    FlushFileBuffers(static_cast<HANDLE>(m_file_handle));
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace nestjar::utils
