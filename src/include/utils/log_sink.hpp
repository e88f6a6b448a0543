#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace servefleet::utils
{

struct LogRecord
{
    std::chrono::system_clock::time_point when;
    std::uint64_t pid;
    std::uint64_t tid;
    int level; // Logger::Level value
    std::string component; // empty for records from the LOGGER_* macros
    std::string body;
};

/// Renders `[LOGGER] [LEVEL ] [time] [PID:.. TID:..] [component] body` plus a newline.
std::string render_log_line(const LogRecord &rec);

/// Destination for rendered records. Only the logger's writer thread calls into a sink.
class LogSink
{
  public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord &rec) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

class StderrSink final : public LogSink
{
  public:
    void write(const LogRecord &rec) override;
    void flush() override;
    std::string description() const override { return "stderr"; }
};

/**
 * @brief Appends to a file through one O_APPEND descriptor.
 *
 * With `use_flock` each line is written under an exclusive advisory lock, so several
 * processes can share one log file without tearing lines.
 */
class LogFileSink final : public LogSink
{
  public:
    /// @throws std::runtime_error naming the path if the file cannot be opened.
    LogFileSink(std::string path, bool use_flock);
    ~LogFileSink() override;

    LogFileSink(const LogFileSink &) = delete;
    LogFileSink &operator=(const LogFileSink &) = delete;

    /// @throws std::system_error on a short or failed write.
    void write(const LogRecord &rec) override;
    void flush() override;
    std::string description() const override { return "file " + m_path; }

  private:
    std::string m_path;
    bool m_use_flock;
    int m_fd = -1;
};

} // namespace servefleet::utils
