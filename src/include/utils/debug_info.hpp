/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messaging.
 *
 * Functions live in `nestjar::debug`. Format strings are checked at compile time
 * through `fmt`, and `std::source_location` supplies the call site.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace nestjar::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Windows uses `CaptureStackBackTrace` + DbgHelp; POSIX uses `backtrace` and
 * demangles with `abi::__cxa_demangle`. Not async-signal-safe.
 */
NESTJAR_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Only for broken internal invariants. Recoverable conditions are reported with
 * exceptions instead.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {}:{}:{} -- {}\n",
                   nestjar::format_tools::filename_only(loc.file_name()), loc.line(),
                   loc.function_name(), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] format failure during panic: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr`.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  format failure during debug_msg: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace nestjar::debug

/**
 * @brief Calls `nestjar::debug::panic` with the current source location.
 */
#ifndef NJ_PANIC
#define NJ_PANIC(fmt, ...)                                                                         \
    ::nestjar::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message to stderr; compiled out unless NESTJAR_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef NJ_DEBUG
#if defined(NESTJAR_ENABLE_DEBUG_MESSAGES)
#define NJ_DEBUG(fmt, ...) ::nestjar::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define NJ_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
