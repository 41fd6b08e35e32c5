#pragma once

#include <filesystem>

#include "utils/file_handle.hpp"

namespace nestjar::archive
{

/**
 * @class ChannelTracker
 * @brief Observer of every OS handle a ManagedChannel opens or closes.
 *
 * Test-only hook, installed with ManagedChannel::set_tracker(). Callbacks run
 * under the channel's lock and must not call back into the channel.
 */
class ChannelTracker
{
  public:
    virtual ~ChannelTracker() = default;

    virtual void opened_channel(const std::filesystem::path &path, const FileHandle &handle) = 0;
    virtual void closed_channel(const std::filesystem::path &path, const FileHandle &handle) = 0;
};

} // namespace nestjar::archive
