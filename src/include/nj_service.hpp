#pragma once
/**
 * @file nj_service.hpp
 * @brief Layer 2: Service modules built on nj_base.
 *
 * Provides the asynchronous Logger (LOGGER_* macros) and LoaderConfig.
 * Include this when you need logging or the JSON-backed loader configuration.
 */
#include "nj_base.hpp"

#include "utils/logger.hpp"
#include "utils/channel_options.hpp"
#include "utils/loader_config.hpp"
