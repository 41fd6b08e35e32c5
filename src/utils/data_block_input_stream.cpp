#include "nj_service.hpp"
#include "utils/archive_errors.hpp"
#include "utils/data_block_input_stream.hpp"

#include <algorithm>

namespace nestjar::archive
{

DataBlockInputStream::DataBlockInputStream(DataBlock block)
    : m_block(std::move(block)), m_remaining(m_block.size())
{
}

DataBlockInputStream::DataBlockInputStream(DataBlockInputStream &&other) noexcept
    : m_block(other.m_block), m_position(other.m_position), m_remaining(other.m_remaining),
      m_closed(other.m_closed)
{
    // The moved-from stream must not close the block a second time.
    other.m_closed = true;
    other.m_remaining = 0;
}

DataBlockInputStream::~DataBlockInputStream()
{
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("Closing input stream over '{}' failed: {}", m_block.channel()->to_string(),
                    e.what());
    }
}

void DataBlockInputStream::ensure_not_closed() const
{
    if (m_closed)
        throw ChannelClosedError("input stream is closed");
}

int DataBlockInputStream::read()
{
    std::byte b{};
    const int64_t count = read(std::span<std::byte>(&b, 1));
    return count == 1 ? static_cast<int>(std::to_integer<unsigned char>(b)) : -1;
}

int64_t DataBlockInputStream::read(std::span<std::byte> dst)
{
    ensure_not_closed();
    if (dst.empty())
        return 0;
    if (m_remaining <= 0)
        return -1;

    const auto wanted =
        static_cast<std::size_t>(std::min<int64_t>(m_remaining, static_cast<int64_t>(dst.size())));
    ByteBuffer buffer(dst.first(wanted));
    const int64_t count = m_block.read(buffer, m_position);
    if (count > 0)
    {
        m_position += count;
        m_remaining -= count;
    }
    return count;
}

int64_t DataBlockInputStream::skip(int64_t n)
{
    ensure_not_closed();
    const int64_t moved = (n > 0) ? std::min(n, m_remaining) : std::max(n, -m_position);
    m_position += moved;
    m_remaining -= moved;
    return moved;
}

int64_t DataBlockInputStream::available() const noexcept
{
    return m_closed ? 0 : m_remaining;
}

void DataBlockInputStream::close()
{
    if (m_closed)
        return;
    m_closed = true;
    m_block.close();
}

} // namespace nestjar::archive
