#pragma once

/**
 * @file loader_config.hpp
 * @brief LoaderConfig: tunables for channels and logging, read from JSON.
 *
 * ## Loading (priority low -> high)
 *
 *  1. Built-in defaults: 10 KiB channel buffer, 10 interrupt retries, level "info",
 *     console logging.
 *  2. A JSON file: the path passed to `load()`, else `NESTJAR_CONFIG_FILE`.
 *     Keys present in the file replace the defaults; missing keys keep them.
 *  3. Environment overrides:
 *     - `NESTJAR_LOADER_DEBUG` - truthy ("1", "true", "yes", "on") forces level debug
 *     - `NESTJAR_BUFFER_SIZE`  - decimal channel buffer size in bytes
 *
 * ## File layout
 * @code{.json}
 * {
 *   "channel": { "buffer_size": 10240, "max_interrupt_retries": 10 },
 *   "logging": { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * Any invalid value (wrong type, non-positive size or retry count, unknown level,
 * unreadable or malformed file) throws `std::invalid_argument` naming the key.
 */

#include "nj_base.hpp"
#include "utils/channel_options.hpp"
#include "utils/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace nestjar::utils
{

class NESTJAR_UTILS_EXPORT LoaderConfig
{
  public:
    /// Built-in defaults only.
    LoaderConfig() = default;

    /**
     * @brief Runs the full layered load.
     * @param explicit_path File to read instead of `NESTJAR_CONFIG_FILE`.
     * @throws std::invalid_argument on any invalid source.
     */
    static LoaderConfig load(const std::optional<std::filesystem::path> &explicit_path = std::nullopt);

    /// Defaults overlaid with `j` (no file, no environment).
    static LoaderConfig from_json(const nlohmann::json &j);

    /// Applies `NESTJAR_LOADER_DEBUG` and `NESTJAR_BUFFER_SIZE` to this config.
    void apply_environment();

    std::size_t buffer_size() const noexcept { return m_channel.buffer_size; }
    int max_interrupt_retries() const noexcept { return m_channel.max_interrupt_retries; }
    Logger::Level log_level() const noexcept { return m_log_level; }
    const std::filesystem::path &log_file() const noexcept { return m_log_file; }

    /// The file the values were read from; empty when none was read.
    const std::filesystem::path &source_file() const noexcept { return m_source_file; }

    archive::ChannelOptions channel_options() const noexcept { return m_channel; }

    /**
     * @brief Pushes the level and, if configured, the log file into the Logger.
     * @throws std::runtime_error if the log file cannot be opened.
     */
    void apply_logging() const;

    nlohmann::json to_json() const;

  private:
    void merge_json(const nlohmann::json &j);

    archive::ChannelOptions m_channel{};
    Logger::Level m_log_level = Logger::Level::L_INFO;
    std::filesystem::path m_log_file;
    std::filesystem::path m_source_file;
};

} // namespace nestjar::utils
