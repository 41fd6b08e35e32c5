#pragma once

/**
 * @file file_handle.hpp
 * @brief Positional-read file handles used by ManagedChannel.
 */
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include "nj_platform.hpp"

namespace nestjar::archive
{

/**
 * @class FileHandle
 * @brief A read-only OS file handle that reads at absolute offsets.
 *
 * Implementations are not required to be thread-safe; ManagedChannel serializes
 * every call under its own lock.
 */
class NESTJAR_UTILS_EXPORT FileHandle
{
  public:
    virtual ~FileHandle() = default;

    /**
     * @brief Reads up to `dst.size()` bytes starting at `offset`.
     * @return Bytes read, or -1 if `offset` is at or past end of file.
     * @throws ClosedByInterruptError if the read was interrupted; the handle is
     *         closed afterwards and must be replaced.
     * @throws ChannelClosedError if the handle is already closed.
     * @throws std::system_error for any other OS failure.
     */
    virtual int64_t read_at(std::span<std::byte> dst, int64_t offset) = 0;

    virtual bool is_open() const noexcept = 0;

    /// Idempotent.
    virtual void close() = 0;

    virtual std::string description() const = 0;
};

/// Opens a handle for a path. Throws std::system_error when the OS refuses.
using FileOpener = std::function<std::unique_ptr<FileHandle>(const std::filesystem::path &)>;

/**
 * @class NativeFileHandle
 * @brief FileHandle over the platform layer (pread / overlapped ReadFile).
 *
 * Honours the calling thread's InterruptFlag: a read started while the flag is
 * set, or a system call interrupted by a signal, closes the handle and throws
 * ClosedByInterruptError. The flag itself is left untouched.
 */
class NESTJAR_UTILS_EXPORT NativeFileHandle final : public FileHandle
{
  public:
    /// @throws std::system_error if the file cannot be opened.
    explicit NativeFileHandle(const std::filesystem::path &path);
    ~NativeFileHandle() override;

    NativeFileHandle(const NativeFileHandle &) = delete;
    NativeFileHandle &operator=(const NativeFileHandle &) = delete;

    int64_t read_at(std::span<std::byte> dst, int64_t offset) override;
    bool is_open() const noexcept override { return m_file.valid(); }
    void close() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    platform::NativeFile m_file;
};

/// The default FileOpener: a NativeFileHandle per call.
NESTJAR_UTILS_EXPORT std::unique_ptr<FileHandle> open_native_file(const std::filesystem::path &path);

} // namespace nestjar::archive
