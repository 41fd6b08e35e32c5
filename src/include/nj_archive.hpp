#pragma once
/**
 * @file nj_archive.hpp
 * @brief Layer 3: random-access reading of byte ranges within an archive file.
 *
 * Provides ByteBuffer, FileHandle, ChannelTracker, ManagedChannel, DataBlock and
 * DataBlockInputStream, plus the archive error types.
 * Include this when you need to read slices of a (possibly nested) archive.
 */
#include "nj_service.hpp"

#include "utils/archive_errors.hpp"
#include "utils/byte_buffer.hpp"
#include "utils/file_handle.hpp"
#include "utils/channel_tracker.hpp"
#include "utils/managed_channel.hpp"
#include "utils/data_block.hpp"
#include "utils/data_block_input_stream.hpp"
