#pragma once

#include <filesystem>
#include <string>

#include "nj_platform.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace nestjar::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file.
 *
 * Each message goes out in one write call, so lines from several processes
 * sharing the file do not interleave mid-line. With `use_flock` an advisory
 * lock is held around the write on POSIX.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error on a short or failed write.
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
#ifdef NESTJAR_PLATFORM_WIN64
    void *m_file_handle = nullptr; // HANDLE; keeps <windows.h> out of this header
#else
    int m_fd = -1;
#endif
};

} // namespace nestjar::utils
