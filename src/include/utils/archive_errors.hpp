#pragma once

/**
 * @file archive_errors.hpp
 * @brief Exception types raised by the archive layer.
 *
 * Argument errors use `std::invalid_argument` and OS failures `std::system_error`;
 * only the conditions callers need to tell apart get their own types.
 */
#include <stdexcept>
#include <string>

#include "nestjar_utils_export.h"

namespace nestjar::archive
{

/// Operation on a channel (or stream) that is not open.
class NESTJAR_UTILS_EXPORT ChannelClosedError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// The file handle was closed because the reading thread was interrupted.
class NESTJAR_UTILS_EXPORT ClosedByInterruptError : public ChannelClosedError
{
  public:
    using ChannelClosedError::ChannelClosedError;
};

/// A read that had to fill its destination ran out of data first.
class NESTJAR_UTILS_EXPORT EndOfDataError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace nestjar::archive
