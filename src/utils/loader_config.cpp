/**
 * @file loader_config.cpp
 * @brief Layered loading of LoaderConfig: defaults, JSON file, environment.
 */
#include "nj_service.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace nestjar::utils
{

namespace fs = std::filesystem;

namespace
{

/// Reads and parses a JSON file. Throws std::invalid_argument on any failure.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::invalid_argument(
            fmt::format("LoaderConfig: cannot open config file '{}'", path.string()));
    }
    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::invalid_argument(
            fmt::format("LoaderConfig: malformed config file '{}': {}", path.string(), e.what()));
    }
}

bool is_truthy(std::string_view value)
{
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

const nlohmann::json *section(const nlohmann::json &j, const char *name)
{
    if (!j.contains(name))
        return nullptr;
    const auto &s = j.at(name);
    if (!s.is_object())
    {
        throw std::invalid_argument(
            fmt::format("LoaderConfig: '{}' must be a JSON object", name));
    }
    return &s;
}

} // anonymous namespace

LoaderConfig LoaderConfig::from_json(const nlohmann::json &j)
{
    LoaderConfig cfg;
    cfg.merge_json(j);
    return cfg;
}

LoaderConfig LoaderConfig::load(const std::optional<fs::path> &explicit_path)
{
    LoaderConfig cfg;

    fs::path file;
    if (explicit_path && !explicit_path->empty())
    {
        file = *explicit_path;
    }
    else if (const char *env = std::getenv("NESTJAR_CONFIG_FILE"); env && *env)
    {
        file = fs::path(env);
    }

    if (!file.empty())
    {
        LOGGER_INFO("LoaderConfig: loading '{}'", file.string());
        cfg.merge_json(read_json_file(file));
        cfg.m_source_file = file;
    }
    else
    {
        LOGGER_DEBUG("LoaderConfig: no config file given, using built-in defaults");
    }

    cfg.apply_environment();
    return cfg;
}

void LoaderConfig::merge_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("LoaderConfig: top-level JSON value must be an object");

    if (const auto *ch = section(j, "channel"))
    {
        if (ch->contains("buffer_size"))
        {
            const auto &v = ch->at("buffer_size");
            if (!v.is_number_integer() || v.get<int64_t>() <= 0)
            {
                throw std::invalid_argument(
                    fmt::format("LoaderConfig: channel.buffer_size must be a positive integer, got {}",
                                v.dump()));
            }
            m_channel.buffer_size = static_cast<std::size_t>(v.get<int64_t>());
        }
        if (ch->contains("max_interrupt_retries"))
        {
            const auto &v = ch->at("max_interrupt_retries");
            if (!v.is_number_integer() || v.get<int64_t>() <= 0 ||
                v.get<int64_t>() > std::numeric_limits<int>::max())
            {
                throw std::invalid_argument(fmt::format(
                    "LoaderConfig: channel.max_interrupt_retries must be a positive integer, got {}",
                    v.dump()));
            }
            m_channel.max_interrupt_retries = static_cast<int>(v.get<int64_t>());
        }
    }

    if (const auto *lg = section(j, "logging"))
    {
        if (lg->contains("level"))
        {
            const auto &v = lg->at("level");
            std::optional<Logger::Level> lvl;
            if (v.is_string())
                lvl = Logger::level_from_string(v.get<std::string>());
            if (!lvl)
            {
                throw std::invalid_argument(
                    fmt::format("LoaderConfig: unknown logging.level {}", v.dump()));
            }
            m_log_level = *lvl;
        }
        if (lg->contains("file"))
        {
            const auto &v = lg->at("file");
            if (!v.is_string())
            {
                throw std::invalid_argument(
                    fmt::format("LoaderConfig: logging.file must be a string, got {}", v.dump()));
            }
            m_log_file = fs::path(v.get<std::string>());
        }
    }
}

void LoaderConfig::apply_environment()
{
    if (const char *dbg = std::getenv("NESTJAR_LOADER_DEBUG"); dbg && is_truthy(dbg))
    {
        m_log_level = Logger::Level::L_DEBUG;
    }

    if (const char *bs = std::getenv("NESTJAR_BUFFER_SIZE"); bs && *bs)
    {
        const std::string_view text(bs);
        std::size_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0)
        {
            throw std::invalid_argument(
                fmt::format("LoaderConfig: NESTJAR_BUFFER_SIZE must be a positive integer, got '{}'",
                            text));
        }
        m_channel.buffer_size = value;
    }
}

void LoaderConfig::apply_logging() const
{
    auto &logger = Logger::instance();
    logger.set_level(m_log_level);
    if (!m_log_file.empty() && !logger.set_logfile(m_log_file.string()))
    {
        throw std::runtime_error(
            fmt::format("LoaderConfig: cannot log to '{}'", m_log_file.string()));
    }
}

nlohmann::json LoaderConfig::to_json() const
{
    static constexpr const char *kLevelNames[] = {"trace", "debug", "info",
                                                  "warn",  "error", "system"};
    return nlohmann::json{
        {"channel",
         {{"buffer_size", m_channel.buffer_size},
          {"max_interrupt_retries", m_channel.max_interrupt_retries}}},
        {"logging",
         {{"level", kLevelNames[static_cast<int>(m_log_level)]}, {"file", m_log_file.string()}}}};
}

} // namespace nestjar::utils
