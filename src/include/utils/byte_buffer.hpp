#pragma once

/**
 * @file byte_buffer.hpp
 * @brief Non-owning read destination with capacity / limit / position cursors.
 *
 * Every read in the archive layer copies into a ByteBuffer. The caller owns the
 * memory; the buffer only tracks how much of it has been filled.
 *
 * Invariant: `0 <= position() <= limit() <= capacity()`.
 */
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>

#include <fmt/format.h>

namespace nestjar::archive
{

class ByteBuffer
{
  public:
    ByteBuffer() noexcept = default;

    explicit ByteBuffer(std::span<std::byte> storage) noexcept
        : m_data(storage.data()), m_capacity(storage.size()), m_limit(storage.size())
    {
    }

    std::size_t capacity() const noexcept { return m_capacity; }
    std::size_t limit() const noexcept { return m_limit; }
    std::size_t position() const noexcept { return m_position; }
    std::size_t remaining() const noexcept { return m_limit - m_position; }
    bool has_remaining() const noexcept { return m_position < m_limit; }

    /// @throws std::out_of_range if `new_position > limit()`.
    void position(std::size_t new_position)
    {
        if (new_position > m_limit)
        {
            throw std::out_of_range(
                fmt::format("ByteBuffer position {} exceeds limit {}", new_position, m_limit));
        }
        m_position = new_position;
    }

    /// Lowering the limit below the position moves the position to the new limit.
    /// @throws std::out_of_range if `new_limit > capacity()`.
    void limit(std::size_t new_limit)
    {
        if (new_limit > m_capacity)
        {
            throw std::out_of_range(
                fmt::format("ByteBuffer limit {} exceeds capacity {}", new_limit, m_capacity));
        }
        m_limit = new_limit;
        if (m_position > m_limit)
            m_position = m_limit;
    }

    /// position = 0, limit = capacity.
    void clear() noexcept
    {
        m_position = 0;
        m_limit = m_capacity;
    }

    /// limit = position, position = 0: switch from filling to draining.
    void flip() noexcept
    {
        m_limit = m_position;
        m_position = 0;
    }

    /**
     * @brief Copies `bytes` at the current position and advances it.
     * @throws std::length_error if `bytes.size() > remaining()`; nothing is copied.
     */
    void put(std::span<const std::byte> bytes)
    {
        if (bytes.size() > remaining())
        {
            throw std::length_error(fmt::format("ByteBuffer overflow: {} bytes into {} remaining",
                                                bytes.size(), remaining()));
        }
        if (!bytes.empty())
            std::memcpy(m_data + m_position, bytes.data(), bytes.size());
        m_position += bytes.size();
    }

    /// The whole backing storage.
    std::span<std::byte> storage() const noexcept { return {m_data, m_capacity}; }

    /// Bytes between 0 and position: what has been written so far.
    std::span<const std::byte> written() const noexcept { return {m_data, m_position}; }

  private:
    std::byte *m_data = nullptr;
    std::size_t m_capacity = 0;
    std::size_t m_limit = 0;
    std::size_t m_position = 0;
};

} // namespace nestjar::archive
