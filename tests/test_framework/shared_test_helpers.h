// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines NESTJAR_IS_POSIX before any platform-conditional includes.
#include "nj_platform.hpp"

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases: scratch directories, patterned files,
 *        stderr capture, environment overrides and a thread racer.
 */

#if NESTJAR_IS_POSIX
#include <fcntl.h>
#include <unistd.h>
#else              // Windows
#include <cstdio>  // for _fileno, stderr
#include <fcntl.h> // For _O_BINARY
#include <io.h>
#define STDERR_FILENO _fileno(stderr)
typedef int ssize_t;
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace nestjar::tests::helper
{

/**
 * @brief Redirects a file descriptor (usually stderr) into a pipe until
 *        GetOutput() is called or the object is destroyed.
 *
 * Only suitable for output smaller than the pipe buffer (64 KiB on Linux).
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture)
    {
#if NESTJAR_IS_POSIX
        if (pipe(pipe_fds_) != 0)
            return;
        fflush(stderr);
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
#else
        if (_pipe(pipe_fds_, 65536, _O_BINARY) != 0)
            return;
        fflush(stderr);
        original_fd_ = _dup(fd_to_capture_);
        _dup2(pipe_fds_[1], fd_to_capture_);
        _close(pipe_fds_[1]);
#endif
    }

    ~StringCapture()
    {
        restore();
        if (pipe_fds_[0] != -1)
        {
#if NESTJAR_IS_POSIX
            close(pipe_fds_[0]);
#else
            _close(pipe_fds_[0]);
#endif
        }
    }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput()
    {
        restore();
        std::string output;
        if (pipe_fds_[0] == -1)
            return output;
        std::vector<char> buffer(1024);
        ssize_t bytes_read;
#if NESTJAR_IS_POSIX
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        close(pipe_fds_[0]);
#else
        while ((bytes_read = _read(pipe_fds_[0], buffer.data(),
                                   static_cast<unsigned int>(buffer.size()))) > 0)
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        _close(pipe_fds_[0]);
#endif
        pipe_fds_[0] = -1;
        return output;
    }

  private:
    void restore()
    {
        if (original_fd_ == -1)
            return;
        fflush(stderr);
#if NESTJAR_IS_POSIX
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
#else
        _dup2(original_fd_, fd_to_capture_);
        _close(original_fd_);
#endif
        original_fd_ = -1;
    }

    int fd_to_capture_;
    int original_fd_ = -1;
    int pipe_fds_[2] = {-1, -1};
};

/**
 * @brief A fresh directory under the system temp dir, removed with its contents
 *        on destruction.
 */
class TempDir
{
  public:
    explicit TempDir(std::string_view prefix = "nestjar_test");
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const noexcept { return path_; }
    fs::path operator/(std::string_view name) const { return path_ / fs::path(name); }

  private:
    fs::path path_;
};

/// The byte stored at `index` of a file written by write_pattern_file().
inline std::byte pattern_byte(size_t index)
{
    return static_cast<std::byte>(index % 251);
}

/// Writes `size` bytes of pattern_byte(0..size-1) to `path`.
void write_pattern_file(const fs::path &path, size_t size);

/// Writes raw bytes to `path`, replacing any existing file.
void write_file(const fs::path &path, std::string_view contents);

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const fs::path &path, std::string &out);

/**
 * @brief Counts lines of `text`, optionally only those containing `must_include`
 *        and not containing `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Sets (or, with std::nullopt, unsets) an environment variable for the
 *        lifetime of the object, restoring the previous value afterwards.
 */
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, std::optional<std::string> value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

// ============================================================================
// ThreadRacer
// ============================================================================

/**
 * @brief Runs N threads simultaneously to test concurrent behavior.
 *
 * All threads start together (spin barrier). Any exception thrown by a thread
 * is captured and available from exceptions().
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /// @return true if every thread completed without throwing.
    template <typename F> bool race(F fn)
    {
        exceptions_.assign(static_cast<size_t>(n_threads_), nullptr);

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        // Captured for the caller; race() reports it.
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace nestjar::tests::helper
