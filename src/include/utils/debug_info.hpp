// Fatal-error and developer diagnostics written straight to stderr.
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>

#include <fmt/format.h>

#include "servefleet_utils_export.h"
#include "utils/format_tools.hpp"

namespace servefleet::debug
{

/// `file:line:function` with the directory part of the file dropped.
inline std::string where(const std::source_location &loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/// One demangled line per frame, most recent call first. Allocates, so never call it from a
/// signal handler.
SERVEFLEET_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Reports a broken contract and aborts.
 *
 * Prints `[PANIC] <where> -- <message>` and a stack trace to stderr.
 */
template <typename... Args>
[[noreturn]] void panic(const std::source_location &loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[PANIC] {} -- {}\n", where(loc),
                   fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- (message lost: {})\n", where(loc), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

template <typename... Args>
void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  (message lost: {})\n", e.what());
    }
}

} // namespace servefleet::debug

#define SFL_PANIC(fmt, ...)                                                                        \
    ::servefleet::debug::panic(std::source_location::current(),                                   \
                               FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#if defined(SERVEFLEET_ENABLE_DEBUG_MESSAGES)
#define SFL_DEBUG(fmt, ...)                                                                        \
    ::servefleet::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define SFL_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
