#pragma once
/**
 * @file logger_handle.hpp
 * @brief Channel-tagged facade over the process Logger.
 *
 * A `LoggerHandle` is a cheap value type handed to components that log under a
 * fixed channel name. Every message is prefixed with `[channel] ` and routed to
 * `Logger::instance()`; the usual level filtering and lifecycle rules apply.
 */
#include <string>
#include <utility>

#include <fmt/format.h>

#include "utils/logger.hpp"

namespace lockhub::utils
{

class LoggerHandle
{
  public:
    LoggerHandle() = default;
    explicit LoggerHandle(std::string channel) : m_channel(std::move(channel)) {}

    const std::string &channel() const noexcept { return m_channel; }

    template <typename... Args>
    void trace(fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        log(Logger::Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        log(Logger::Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        log(Logger::Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        log(Logger::Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        log(Logger::Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args>
    void log(Logger::Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) const noexcept
    {
        auto &logger = Logger::instance();
        if (!logger.should_log(lvl))
            return;
        try
        {
            std::string body = m_channel.empty() ? std::string() : fmt::format("[{}] ", m_channel);
            fmt::format_to(std::back_inserter(body), fmt_str, std::forward<Args>(args)...);
            logger.log_preformatted(lvl, std::move(body));
        }
        catch (const std::exception &ex)
        {
            logger.log_preformatted(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }

    std::string m_channel;
};

} // namespace lockhub::utils
