#pragma once

#include "lkh_base.hpp"

namespace lockhub::utils
{

class Logger;

// A single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int rather than Logger::Level to keep this header free of logger.hpp.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace lockhub::utils
