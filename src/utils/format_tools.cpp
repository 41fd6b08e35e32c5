// format_tools.cpp
#include "nj_base.hpp"

#include <algorithm>
#include <cctype>

namespace nestjar::format_tools
{

// Formats with an explicit microsecond fraction; fmt's chrono subsecond support
// differs between releases, so the fraction is computed here.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string hex_dump(std::span<const std::byte> bytes, uint64_t base_offset)
{
    constexpr size_t kBytesPerRow = 16;
    fmt::memory_buffer out;
    for (size_t row = 0; row < bytes.size(); row += kBytesPerRow)
    {
        const size_t n = std::min(kBytesPerRow, bytes.size() - row);
        fmt::format_to(std::back_inserter(out), "{:08x}  ", base_offset + row);
        for (size_t i = 0; i < kBytesPerRow; ++i)
        {
            if (i < n)
                fmt::format_to(std::back_inserter(out), "{:02x} ",
                               std::to_integer<unsigned>(bytes[row + i]));
            else
                fmt::format_to(std::back_inserter(out), "   ");
        }
        fmt::format_to(std::back_inserter(out), " |");
        for (size_t i = 0; i < n; ++i)
        {
            const auto c = std::to_integer<unsigned char>(bytes[row + i]);
            out.push_back(std::isprint(c) ? static_cast<char>(c) : '.');
        }
        fmt::format_to(std::back_inserter(out), "|\n");
    }
    return fmt::to_string(out);
}

#if defined(NESTJAR_PLATFORM_WIN64)
static inline std::wstring normalize_backslashes(std::wstring s)
{
    for (auto &c : s)
        if (c == L'/')
            c = L'\\';
    return s;
}

/// Convert a path to Win32 long-path form with \\?\ or \\?\UNC\ prefix.
std::wstring win32_to_long_path(const std::filesystem::path &p_in)
{
    std::error_code ec;
    std::filesystem::path abs = p_in;
    if (!abs.is_absolute())
    {
        abs = std::filesystem::absolute(abs, ec);
        if (ec)
        {
            return std::wstring{};
        }
    }
    std::wstring ws = normalize_backslashes(abs.wstring());

    if (ws.rfind(L"\\\\?\\", 0) == 0)
    {
        return ws;
    }
    if (ws.rfind(L"\\\\", 0) == 0)
    {
        return std::wstring(L"\\\\?\\UNC\\") + ws.substr(2);
    }
    return std::wstring(L"\\\\?\\") + ws;
}
#else
std::wstring win32_to_long_path([[maybe_unused]] const std::filesystem::path &path)
{
    return {};
}
#endif

} // namespace nestjar::format_tools
