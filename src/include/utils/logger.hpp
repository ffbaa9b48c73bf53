#pragma once
/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logger.
 *
 * Callers format a message with fmt and enqueue it; a single worker thread
 * owns the active `Sink` and writes messages in order. Configuration calls
 * (`set_console`, `set_logfile`, `flush`, ...) are commands on the same queue
 * and block until the worker has processed them.
 *
 * The Logger is a lifecycle module. Before `GetLifecycleModule()` has been
 * started, log calls are silently dropped and configuration calls panic.
 *
 * @code
 *   lockhub::utils::LifecycleGuard app(lockhub::utils::Logger::GetLifecycleModule());
 *   LOGGER_INFO("registry for domain '{}' holds {} managers", domain, count);
 * @endcode
 ******************************************************************************/
#include <atomic>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lockhub_utils_export.h"
#include "utils/module_def.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockhub::utils
{

class LOCKHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// Lifecycle module definition ("lockhub::utils::Logger"), 5s shutdown timeout.
    static ModuleDef GetLifecycleModule();

    /// True once the Logger module has been started (and stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Parses "trace", "debug", "info", "warning"/"warn", "error" or "system".
     * @throws std::invalid_argument for any other name.
     */
    static Level level_from_string(std::string_view name);
    static std::string_view level_to_string(Level lvl) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
    ~Logger();

    // --- Sinks ---
    /// Switches to the stderr sink. Returns true once the worker has switched.
    bool set_console();
    /// Switches to an appending file sink. Returns false if the file cannot be opened.
    bool set_logfile(const std::string &utf8_path, bool use_flock = false);

    void shutdown();
    void flush();

    // --- Configuration ---
    void set_level(Level lvl);
    Level level() const;

    /// Messages beyond this queue depth are dropped and counted.
    void set_max_queue_size(size_t max_size);
    size_t get_total_dropped() const;

    /// Called (on a separate thread) when a sink cannot be created or written.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }

    /// Enqueues an already formatted message body.
    bool log_preformatted(Level lvl, std::string &&body) noexcept;

    bool should_log(Level lvl) const noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);
};

void do_logger_startup(const char *arg);
void do_logger_shutdown(const char *arg);

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            log_preformatted(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace lockhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::lockhub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::lockhub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::lockhub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::lockhub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::lockhub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
