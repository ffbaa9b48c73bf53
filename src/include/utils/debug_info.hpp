/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * Uses `fmt` for compile-time format string checks and `std::source_location` for
 * automatic source code location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lockhub_utils_export.h"
#include "utils/format_tools.hpp"

namespace lockhub::debug
{

/**
 * @brief Prints the current call stack to `stderr` (POSIX: backtrace/dladdr).
 */
LOCKHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief "file:line:function" for a source location.
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", lockhub::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * Intended for unrecoverable errors (API misuse, broken invariants). Formats the
 * message, prints it with the caller's source location, then aborts.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (...)
    {
        std::fputs("[PANIC] -- FATAL EXCEPTION WHILE FORMATTING PANIC MESSAGE\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (...)
    {
        std::fputs("[DBG]  FATAL EXCEPTION DURING DEBUG_MSG\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace lockhub::debug

// ---------------- thin macros for convenience --------------

#ifndef LKH_PANIC
#define LKH_PANIC(fmt, ...)                                                                        \
    ::lockhub::debug::panic(std::source_location::current(),                                      \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef LKH_DEBUG
#if defined(LOCKHUB_ENABLE_DEBUG_MESSAGES)
#define LKH_DEBUG(fmt, ...) ::lockhub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define LKH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
