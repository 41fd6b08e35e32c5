#pragma once

/*******************************************************************************
 * @file data_block.hpp
 * @brief A fixed byte range of a file, readable through a shared ManagedChannel.
 *
 * A DataBlock is a small value: a shared channel pointer plus an offset and a
 * size. Copies and slices share the channel; none of them owns the OS handle.
 * The handle's lifetime follows `open()` / `close()` pairs made through any
 * block on the channel, not the lifetime of the block objects.
 *
 * @code
 *  nestjar::archive::DataBlock jar("app.jar");
 *  jar.open();
 *  auto entry = jar.slice(header_end, compressed_size); // shares jar's handle
 *  entry.open();
 *  entry.read(buffer, 0);
 *  entry.close();
 *  jar.close(); // last reference: the handle is closed here
 * @endcode
 ******************************************************************************/
#include <cstdint>
#include <filesystem>
#include <memory>

#include "utils/byte_buffer.hpp"
#include "utils/managed_channel.hpp"

namespace nestjar::archive
{

class DataBlockInputStream;

class NESTJAR_UTILS_EXPORT DataBlock
{
  public:
    /**
     * @brief A block over the whole file, backed by a new, unopened channel.
     * @throws std::invalid_argument if `path` is not a regular file.
     */
    explicit DataBlock(const std::filesystem::path &path, ChannelOptions options = {},
                       FileOpener opener = open_native_file);

    /// A view of `size` bytes at `offset` of `channel`. Does not open the channel.
    DataBlock(std::shared_ptr<ManagedChannel> channel, int64_t offset, int64_t size);

    int64_t size() const noexcept { return m_size; }
    int64_t offset() const noexcept { return m_offset; }
    const std::shared_ptr<ManagedChannel> &channel() const noexcept { return m_channel; }

    /**
     * @brief Reads bytes at block position `position` into `dst`.
     *
     * Never reads past the end of the block: `dst`'s limit is lowered for the
     * duration of the call when fewer than `dst.remaining()` bytes are left.
     * @return Bytes read, or -1 if `position >= size()`.
     * @throws std::invalid_argument if `position < 0`.
     * @throws ChannelClosedError if the channel is not open.
     */
    int64_t read(ByteBuffer &dst, int64_t position);

    /**
     * @brief Reads until `dst` is full.
     * @throws EndOfDataError if the block (or file) ends first.
     */
    void read_fully(ByteBuffer &dst, int64_t position);

    void open();
    void close();

    /// `slice(start, size() - start)`.
    DataBlock slice(int64_t start) const;

    /**
     * @brief A block over `[start, start + slice_size)` of this block, sharing the
     *        channel. The result is not opened.
     * @throws std::invalid_argument for negative or out-of-range bounds.
     */
    DataBlock slice(int64_t start, int64_t slice_size) const;

    /**
     * @brief A sequential reader over the block. The stream closes this block
     *        when it is closed, releasing a reference taken by `open()`.
     */
    DataBlockInputStream as_input_stream() const;

    template <typename ErrorFactory> void ensure_open(ErrorFactory &&make_error) const
    {
        m_channel->ensure_open(std::forward<ErrorFactory>(make_error));
    }

    /// Same channel, same range.
    bool operator==(const DataBlock &other) const noexcept
    {
        return m_channel == other.m_channel && m_offset == other.m_offset &&
               m_size == other.m_size;
    }

  private:
    std::shared_ptr<ManagedChannel> m_channel;
    int64_t m_offset = 0;
    int64_t m_size = 0;
};

} // namespace nestjar::archive
