#pragma once

/*******************************************************************************
 * @file managed_channel.hpp
 * @brief Reference-counted, buffered, positional-read access to one file.
 *
 * A ManagedChannel owns at most one OS handle for its path. `open()` calls are
 * counted: the handle is opened by the first and closed by the matching last
 * `close()`. Extra closes are no-ops.
 *
 * Reads go through a single cache buffer (10 KiB by default). A read whose
 * position lies outside the cached region refills the whole buffer with one
 * positional read starting at that position; reads inside it are served from
 * memory. A read never crosses the end of the cached region, so callers loop.
 *
 * If a refill fails because the handle was closed by an interrupt of the
 * reading thread (ClosedByInterruptError), the handle is replaced with a fresh
 * one and the read retried, up to `max_interrupt_retries` attempts. The thread's
 * interrupt flag is cleared for each retry and set again afterwards, so the
 * caller still sees the interruption.
 *
 * All state sits behind one mutex; concurrent readers of channels shared by many
 * blocks are serialized.
 ******************************************************************************/
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "utils/byte_buffer.hpp"
#include "utils/channel_options.hpp"
#include "utils/channel_tracker.hpp"
#include "utils/file_handle.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nestjar::archive
{

class NESTJAR_UTILS_EXPORT ManagedChannel
{
  public:
    /**
     * @throws std::invalid_argument if `path` is not a regular file.
     */
    explicit ManagedChannel(std::filesystem::path path, ChannelOptions options = {},
                            FileOpener opener = open_native_file);

    /// Closes a still-open handle and warns about the leaked references.
    ~ManagedChannel();

    ManagedChannel(const ManagedChannel &) = delete;
    ManagedChannel &operator=(const ManagedChannel &) = delete;
    ManagedChannel(ManagedChannel &&) = delete;
    ManagedChannel &operator=(ManagedChannel &&) = delete;

    /**
     * @brief Takes a reference; the first one opens the handle and allocates the cache.
     * @throws std::invalid_argument if the path is no longer a regular file.
     * @throws std::system_error if the OS refuses to open it.
     */
    void open();

    /// Drops a reference; the last one closes the handle and empties the cache.
    void close();

    /**
     * @brief Copies bytes at absolute `position` into `dst`, advancing its position.
     * @return Bytes copied (at most `dst.remaining()`), or -1 / 0 at end of file.
     * @throws ChannelClosedError if the channel is not open.
     * @throws ClosedByInterruptError if every refill attempt was interrupted.
     */
    int64_t read(ByteBuffer &dst, int64_t position);

    /**
     * @brief Throws `make_error()` unless the channel is open with a live handle.
     */
    template <typename ErrorFactory> void ensure_open(ErrorFactory &&make_error) const
    {
        if (!is_open())
            throw make_error();
    }

    [[nodiscard]] bool is_open() const;
    int reference_count() const;
    std::size_t buffer_capacity() const noexcept;
    const ChannelOptions &options() const noexcept;
    const std::filesystem::path &path() const noexcept;
    std::string to_string() const;

    /**
     * @brief Installs a process-wide observer of handle opens and closes.
     *        Pass nullptr to remove it.
     */
    static void set_tracker(std::shared_ptr<ChannelTracker> tracker);

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace nestjar::archive

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
