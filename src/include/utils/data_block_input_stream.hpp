#pragma once

#include <cstdint>
#include <span>

#include "utils/data_block.hpp"

namespace nestjar::archive
{

/**
 * @class DataBlockInputStream
 * @brief Sequential reader over a DataBlock.
 *
 * The caller opens the block before creating the stream. Closing the stream
 * (explicitly or by destruction) closes the block once, handing that reference
 * back. Move-only.
 */
class NESTJAR_UTILS_EXPORT DataBlockInputStream
{
  public:
    explicit DataBlockInputStream(DataBlock block);
    ~DataBlockInputStream();

    DataBlockInputStream(DataBlockInputStream &&other) noexcept;
    DataBlockInputStream &operator=(DataBlockInputStream &&) = delete;
    DataBlockInputStream(const DataBlockInputStream &) = delete;
    DataBlockInputStream &operator=(const DataBlockInputStream &) = delete;

    /// Next byte as 0..255, or -1 at end of block.
    int read();

    /// Bytes read into `dst`, 0 if `dst` is empty, -1 at end of block.
    int64_t read(std::span<std::byte> dst);

    /**
     * @brief Moves forward by up to the remaining bytes, or back (negative `n`) by up
     *        to the bytes already consumed.
     * @return The signed distance actually moved.
     */
    int64_t skip(int64_t n);

    /// Bytes left; 0 once closed.
    int64_t available() const noexcept;

    /// Idempotent.
    void close();

    bool is_closed() const noexcept { return m_closed; }

  private:
    void ensure_not_closed() const;

    DataBlock m_block;
    int64_t m_position = 0;
    int64_t m_remaining = 0;
    bool m_closed = false;
};

} // namespace nestjar::archive
