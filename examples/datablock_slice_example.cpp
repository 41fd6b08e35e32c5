/**
 * @file datablock_slice_example.cpp
 * @brief Example: hex dump of a byte range of any file through a DataBlock slice.
 *
 * Usage: datablock_slice_example <file> <offset> [length] [--config <json>]
 *
 * Shows the consumer contract of the archive layer:
 *  - a whole-file DataBlock, opened once;
 *  - a slice sharing its channel, opened and closed on its own;
 *  - sequential reads through a DataBlockInputStream.
 *
 * Set NESTJAR_LOADER_DEBUG=1 to see the channel's reference counting in the log.
 */
#include "nj_archive.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

using namespace nestjar::archive;
using namespace nestjar::utils;

namespace
{

constexpr int64_t kDefaultLength = 256;

std::optional<int64_t> parse_int(std::string_view text)
{
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

void usage(const char *argv0)
{
    std::cerr << "usage: " << argv0 << " <file> <offset> [length] [--config <json>]\n";
}

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string_view> positional;
    std::optional<std::filesystem::path> config_path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc)
            config_path = argv[++i];
        else
            positional.push_back(arg);
    }
    if (positional.size() < 2 || positional.size() > 3)
    {
        usage(argv[0]);
        return 2;
    }

    const auto offset = parse_int(positional[1]);
    const auto length = positional.size() == 3 ? parse_int(positional[2]) : kDefaultLength;
    if (!offset || !length)
    {
        usage(argv[0]);
        return 2;
    }

    try
    {
        const LoaderConfig config = LoaderConfig::load(config_path);
        config.apply_logging();

        DataBlock file(std::filesystem::path(positional[0]), config.channel_options());
        file.open();
        auto close_file = nestjar::basics::make_scope_guard(
            [&file]() noexcept
            {
                try
                {
                    file.close();
                }
                catch (const std::exception &e)
                {
                    LOGGER_WARN("close failed: {}", e.what());
                }
            });

        const int64_t start = std::min(*offset, file.size());
        const int64_t count = std::min(*length, file.size() - start);
        DataBlock slice = file.slice(start, count);
        LOGGER_INFO("Dumping {} bytes of '{}' at offset {}", slice.size(),
                    file.channel()->to_string(), slice.offset());

        slice.open();
        auto stream = slice.as_input_stream();
        std::vector<std::byte> bytes(static_cast<size_t>(slice.size()));
        std::span<std::byte> rest(bytes);
        while (!rest.empty())
        {
            const int64_t n = stream.read(rest);
            if (n <= 0)
                break;
            rest = rest.subspan(static_cast<size_t>(n));
        }
        stream.close();

        std::cout << nestjar::format_tools::hex_dump(bytes, static_cast<uint64_t>(slice.offset()));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("datablock_slice_example: {}", e.what());
        Logger::instance().shutdown();
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }

    Logger::instance().shutdown();
    return 0;
}
