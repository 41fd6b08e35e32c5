#include "nj_service.hpp"
#include "utils/archive_errors.hpp"
#include "utils/managed_channel.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace nestjar::archive
{

namespace fs = std::filesystem;

namespace
{

std::mutex g_tracker_mutex;
std::shared_ptr<ChannelTracker> g_tracker;

std::shared_ptr<ChannelTracker> current_tracker()
{
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    return g_tracker;
}

void require_regular_file(const fs::path &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        throw std::invalid_argument(fmt::format("'{}' must be a regular file", path.string()));
    }
}

} // namespace

struct ManagedChannel::Impl
{
    Impl(fs::path p, ChannelOptions opts, FileOpener op)
        : path(std::move(p)), options(opts), opener(std::move(op))
    {
    }

    void open_handle();
    void close_handle();
    void notify_closed(const FileHandle &closed) const;
    void fill_buffer(int64_t position);
    void repair_handle();

    const fs::path path;
    const ChannelOptions options;
    const FileOpener opener;

    mutable std::mutex mutex;
    std::unique_ptr<FileHandle> handle;
    std::unique_ptr<std::byte[]> buffer;
    int64_t buffer_position = -1;
    int64_t buffer_size = 0;
    int reference_count = 0;
};

void ManagedChannel::Impl::open_handle()
{
    std::unique_ptr<FileHandle> fresh = opener(path);
    if (!fresh)
    {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                fmt::format("no handle returned for '{}'", path.string()));
    }
    // A throwing tracker drops the new handle before it is published.
    if (auto tracker = current_tracker())
        tracker->opened_channel(path, *fresh);
    handle = std::move(fresh);
}

void ManagedChannel::Impl::notify_closed(const FileHandle &closed) const
{
    if (auto tracker = current_tracker())
        tracker->closed_channel(path, closed);
}

void ManagedChannel::Impl::close_handle()
{
    if (!handle)
        return;
    // The handle is released before the OS close, which may fail.
    std::unique_ptr<FileHandle> old = std::move(handle);
    try
    {
        old->close();
    }
    catch (const std::system_error &)
    {
        notify_closed(*old);
        throw;
    }
    notify_closed(*old);
}

void ManagedChannel::Impl::repair_handle()
{
    LOGGER_DEBUG("Repairing handle for '{}' after interrupt", path.string());
    close_handle();
    open_handle();
}

void ManagedChannel::Impl::fill_buffer(int64_t position)
{
    auto &flag = basics::this_thread_interrupt_flag();
    for (int attempt = 0; attempt < options.max_interrupt_retries; ++attempt)
    {
        const bool interrupted = (attempt != 0) && flag.test_and_clear();
        auto restore = basics::make_scope_guard(
            [&flag, interrupted]() noexcept
            {
                if (interrupted)
                    flag.set();
            });
        try
        {
            buffer_size = handle->read_at(std::span<std::byte>(buffer.get(), options.buffer_size),
                                          position);
            buffer_position = position;
            return;
        }
        catch (const ClosedByInterruptError &)
        {
            buffer_position = -1;
            buffer_size = 0;
            repair_handle();
        }
    }
    throw ClosedByInterruptError(
        fmt::format("read of '{}' at {} interrupted {} times", path.string(), position,
                    options.max_interrupt_retries));
}

ManagedChannel::ManagedChannel(fs::path path, ChannelOptions options, FileOpener opener)
{
    require_regular_file(path);
    if (options.buffer_size == 0)
        throw std::invalid_argument("channel buffer size must be positive");
    if (options.max_interrupt_retries <= 0)
        throw std::invalid_argument("channel max_interrupt_retries must be positive");
    if (!opener)
        throw std::invalid_argument("channel file opener must not be empty");
    pImpl = std::make_unique<Impl>(std::move(path), options, std::move(opener));
}

ManagedChannel::~ManagedChannel()
{
    if (!pImpl)
        return;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->reference_count > 0)
    {
        LOGGER_WARN("Channel for '{}' destroyed with {} open reference(s); closing handle",
                    pImpl->path.string(), pImpl->reference_count);
        pImpl->reference_count = 0;
        pImpl->buffer.reset();
        try
        {
            pImpl->close_handle();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("Closing leaked handle for '{}' failed: {}", pImpl->path.string(),
                        e.what());
        }
    }
}

void ManagedChannel::open()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->reference_count == 0)
    {
        LOGGER_DEBUG("Opening '{}'", pImpl->path.string());
        require_regular_file(pImpl->path);
        auto buffer = std::make_unique<std::byte[]>(pImpl->options.buffer_size);
        pImpl->open_handle();
        pImpl->buffer = std::move(buffer);
        pImpl->buffer_position = -1;
        pImpl->buffer_size = 0;
    }
    ++pImpl->reference_count;
    LOGGER_DEBUG("Reference count for '{}' incremented to {}", pImpl->path.string(),
                 pImpl->reference_count);
}

void ManagedChannel::close()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->reference_count == 0)
        return;
    --pImpl->reference_count;
    if (pImpl->reference_count == 0)
    {
        LOGGER_DEBUG("Closing '{}'", pImpl->path.string());
        pImpl->buffer.reset();
        pImpl->buffer_position = -1;
        pImpl->buffer_size = 0;
        pImpl->close_handle();
    }
    LOGGER_DEBUG("Reference count for '{}' decremented to {}", pImpl->path.string(),
                 pImpl->reference_count);
}

int64_t ManagedChannel::read(ByteBuffer &dst, int64_t position)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->reference_count == 0 || !pImpl->handle)
    {
        throw ChannelClosedError(fmt::format("channel for '{}' is closed", pImpl->path.string()));
    }
    if (!pImpl->buffer)
        NJ_PANIC("channel for '{}' is open without a cache buffer", pImpl->path.string());
    if (position < pImpl->buffer_position ||
        position >= pImpl->buffer_position + pImpl->buffer_size)
    {
        pImpl->fill_buffer(position);
    }
    if (pImpl->buffer_size <= 0)
        return pImpl->buffer_size;

    const int64_t offset = position - pImpl->buffer_position;
    const auto length = static_cast<std::size_t>(
        std::min<int64_t>(pImpl->buffer_size - offset, static_cast<int64_t>(dst.remaining())));
    dst.put(std::span<const std::byte>(pImpl->buffer.get() + offset, length));
    return static_cast<int64_t>(length);
}

bool ManagedChannel::is_open() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->reference_count > 0 && pImpl->handle && pImpl->handle->is_open();
}

int ManagedChannel::reference_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->reference_count;
}

std::size_t ManagedChannel::buffer_capacity() const noexcept
{
    return pImpl->options.buffer_size;
}

const ChannelOptions &ManagedChannel::options() const noexcept
{
    return pImpl->options;
}

const fs::path &ManagedChannel::path() const noexcept
{
    return pImpl->path;
}

std::string ManagedChannel::to_string() const
{
    return pImpl->path.string();
}

void ManagedChannel::set_tracker(std::shared_ptr<ChannelTracker> tracker)
{
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    g_tracker = std::move(tracker);
}

} // namespace nestjar::archive
