#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace lockhub::utils
{

/**
 * @brief Appends formatted messages to a file.
 *
 * With `use_flock`, each write holds an exclusive `flock` so that several
 * processes can share one log file without interleaving lines.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock;
    int m_fd{-1};
};

} // namespace lockhub::utils
