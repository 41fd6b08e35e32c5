#pragma once
/**
 * @file nj_base.hpp
 * @brief Layer 1: Basic modules built on nj_platform.
 *
 * Provides format_tools, debug_info (NJ_PANIC / NJ_DEBUG, stack traces), the
 * ScopeGuard RAII helper and the per-thread InterruptFlag.
 * Include this when you need formatting, debug utilities, or basic RAII guards.
 */
#include "nj_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/interrupt_flag.hpp"
