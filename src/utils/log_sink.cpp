#include "utils/log_sink.hpp"
#include "utils/format_tools.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/format.h>

namespace servefleet::utils
{

namespace
{
const char *level_label(int lvl)
{
    static constexpr const char *kLabels[] = {"TRACE", "DEBUG", "INFO", "WARN",
                                              "ERROR", "CRIT",  "SYSTEM"};
    if (lvl < 0 || lvl >= static_cast<int>(std::size(kLabels)))
        return "UNK";
    return kLabels[lvl];
}
} // namespace

std::string render_log_line(const LogRecord &rec)
{
    std::string out = fmt::format("[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}] ",
                                  level_label(rec.level),
                                  format_tools::formatted_time(rec.when), rec.pid, rec.tid);
    if (!rec.component.empty())
        out += fmt::format("[{}] ", rec.component);
    out += rec.body;
    out += '\n';
    return out;
}

void StderrSink::write(const LogRecord &rec)
{
    std::fputs(render_log_line(rec).c_str(), stderr);
}

void StderrSink::flush()
{
    std::fflush(stderr);
}

LogFileSink::LogFileSink(std::string path, bool use_flock)
    : m_path(std::move(path)), m_use_flock(use_flock)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path, std::strerror(errno)));
    }
}

LogFileSink::~LogFileSink()
{
    if (m_fd != -1)
        ::close(m_fd);
}

void LogFileSink::write(const LogRecord &rec)
{
    const std::string line = render_log_line(rec);
    if (m_use_flock)
        ::flock(m_fd, LOCK_EX);
    const ssize_t n = ::write(m_fd, line.data(), line.size());
    const int err = errno;
    if (m_use_flock)
        ::flock(m_fd, LOCK_UN);
    if (n < 0 || static_cast<size_t>(n) != line.size())
        throw std::system_error(err, std::generic_category(), "short write to " + m_path);
}

void LogFileSink::flush()
{
    ::fsync(m_fd);
}

} // namespace servefleet::utils
