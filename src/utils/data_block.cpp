#include "nj_service.hpp"
#include "utils/archive_errors.hpp"
#include "utils/data_block.hpp"
#include "utils/data_block_input_stream.hpp"

#include <stdexcept>
#include <system_error>

namespace nestjar::archive
{

namespace fs = std::filesystem;

namespace
{

std::shared_ptr<ManagedChannel> make_channel(const fs::path &path, ChannelOptions options,
                                             FileOpener opener)
{
    return std::make_shared<ManagedChannel>(path, options, std::move(opener));
}

int64_t current_file_size(const fs::path &path)
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        throw std::system_error(ec, fmt::format("cannot size '{}'", path.string()));
    }
    return static_cast<int64_t>(size);
}

} // namespace

DataBlock::DataBlock(const fs::path &path, ChannelOptions options, FileOpener opener)
    : m_channel(make_channel(path, options, std::move(opener))), m_offset(0),
      m_size(current_file_size(path))
{
}

DataBlock::DataBlock(std::shared_ptr<ManagedChannel> channel, int64_t offset, int64_t size)
    : m_channel(std::move(channel)), m_offset(offset), m_size(size)
{
    if (!m_channel)
        throw std::invalid_argument("DataBlock requires a channel");
    if (m_offset < 0 || m_size < 0)
    {
        throw std::invalid_argument(
            fmt::format("DataBlock offset {} and size {} must not be negative", m_offset, m_size));
    }
}

int64_t DataBlock::read(ByteBuffer &dst, int64_t position)
{
    if (position < 0)
        throw std::invalid_argument("Position must not be negative");
    ensure_open(
        [this]
        {
            return ChannelClosedError(
                fmt::format("channel for '{}' is closed", m_channel->to_string()));
        });

    const int64_t remaining = m_size - position;
    if (remaining <= 0)
        return -1;

    if (static_cast<int64_t>(dst.remaining()) > remaining)
    {
        const std::size_t original_limit = dst.limit();
        dst.limit(dst.position() + static_cast<std::size_t>(remaining));
        auto restore = basics::make_scope_guard([&dst, original_limit]() noexcept
                                                { dst.limit(original_limit); });
        return m_channel->read(dst, m_offset + position);
    }
    return m_channel->read(dst, m_offset + position);
}

void DataBlock::read_fully(ByteBuffer &dst, int64_t position)
{
    while (dst.has_remaining())
    {
        const int64_t count = read(dst, position);
        if (count <= 0)
        {
            throw EndOfDataError(fmt::format("end of data at position {} of {} with {} bytes unread",
                                             position, m_size, dst.remaining()));
        }
        position += count;
    }
}

void DataBlock::open()
{
    m_channel->open();
}

void DataBlock::close()
{
    m_channel->close();
}

DataBlock DataBlock::slice(int64_t start) const
{
    if (start < 0)
        throw std::invalid_argument("Offset must not be negative");
    return slice(start, m_size - start);
}

DataBlock DataBlock::slice(int64_t start, int64_t slice_size) const
{
    if (start == 0 && slice_size == m_size)
        return *this;
    if (start < 0)
        throw std::invalid_argument("Offset must not be negative");
    // Compared as m_size - start so large sizes cannot overflow.
    if (start > m_size || slice_size < 0 || slice_size > m_size - start)
        throw std::invalid_argument("Size must not be negative and must be within bounds");
    LOGGER_DEBUG("Slicing {} at {} with size {}", m_channel->to_string(), start, slice_size);
    return DataBlock(m_channel, m_offset + start, slice_size);
}

DataBlockInputStream DataBlock::as_input_stream() const
{
    return DataBlockInputStream(*this);
}

} // namespace nestjar::archive
