#pragma once

#include <cstddef>

namespace nestjar::archive
{

/// Default size of a channel's single read-cache buffer (10 KiB).
inline constexpr std::size_t kDefaultChannelBufferSize = 10 * 1024;

/// Default number of read attempts when a read keeps being interrupted.
inline constexpr int kDefaultMaxInterruptRetries = 10;

/**
 * @brief Tunables of a ManagedChannel, fixed at construction.
 */
struct ChannelOptions
{
    std::size_t buffer_size = kDefaultChannelBufferSize;
    int max_interrupt_retries = kDefaultMaxInterruptRetries;
};

} // namespace nestjar::archive
