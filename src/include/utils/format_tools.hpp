// Tools for formatting strings
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "nestjar_utils_export.h"

namespace nestjar::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
NESTJAR_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Converts a path to its Windows long path representation (e.g., `\\?\C:\...`).
 * @return The long path as a wstring. Returns an empty string on non-Windows platforms.
 */
NESTJAR_UTILS_EXPORT std::wstring win32_to_long_path(const std::filesystem::path &);

/**
 * @brief Renders bytes as classic 16-per-row hex dump lines.
 *
 * Each line is `OFFSET  HH HH ... HH  |ascii|`, with the offset column starting at
 * `base_offset`. Non-printable bytes show as '.' in the ASCII column.
 */
NESTJAR_UTILS_EXPORT std::string hex_dump(std::span<const std::byte> bytes,
                                          uint64_t base_offset = 0);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace nestjar::format_tools
