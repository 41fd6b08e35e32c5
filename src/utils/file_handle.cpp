#include "nj_base.hpp"
#include "utils/archive_errors.hpp"
#include "utils/file_handle.hpp"

#include <system_error>

namespace nestjar::archive
{

NativeFileHandle::NativeFileHandle(const std::filesystem::path &path) : m_path(path)
{
    std::error_code ec;
    m_file = platform::file_open_read(m_path, ec);
    if (!m_file.valid())
    {
        throw std::system_error(ec, fmt::format("cannot open '{}' for reading", m_path.string()));
    }
}

NativeFileHandle::~NativeFileHandle()
{
    std::error_code ec;
    platform::file_close(&m_file, ec);
    if (ec)
    {
        NJ_DEBUG("close of '{}' failed in destructor: {}", m_path.string(), ec.message());
    }
}

int64_t NativeFileHandle::read_at(std::span<std::byte> dst, int64_t offset)
{
    if (!m_file.valid())
    {
        throw ChannelClosedError(fmt::format("file handle for '{}' is closed", m_path.string()));
    }

    std::error_code ec;
    int64_t n = -1;
    if (!basics::this_thread_interrupt_flag().is_set())
    {
        n = platform::file_read_at(m_file, dst.data(), dst.size(), offset, ec);
    }
    else
    {
        ec = std::make_error_code(std::errc::interrupted);
    }

    if (ec == std::errc::interrupted)
    {
        std::error_code close_ec;
        platform::file_close(&m_file, close_ec);
        if (close_ec)
        {
            NJ_DEBUG("close of interrupted '{}' failed: {}", m_path.string(), close_ec.message());
        }
        throw ClosedByInterruptError(
            fmt::format("read of '{}' at offset {} was interrupted", m_path.string(), offset));
    }
    if (n < 0)
    {
        throw std::system_error(ec, fmt::format("read of '{}' at offset {} failed",
                                                m_path.string(), offset));
    }
    if (n == 0 && !dst.empty())
        return -1;
    return n;
}

void NativeFileHandle::close()
{
    std::error_code ec;
    platform::file_close(&m_file, ec);
    if (ec)
    {
        throw std::system_error(ec, fmt::format("close of '{}' failed", m_path.string()));
    }
}

std::string NativeFileHandle::description() const
{
    return fmt::format("NativeFileHandle[{}, fd={}]", m_path.string(), m_file.native);
}

std::unique_ptr<FileHandle> open_native_file(const std::filesystem::path &path)
{
    return std::make_unique<NativeFileHandle>(path);
}

} // namespace nestjar::archive
