#include "sfl_platform.hpp"
#include "servefleet_version.h"

#include <cerrno>
#include <climits>
#include <functional>
#include <thread>

#include <signal.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif

namespace servefleet::platform
{

std::uint64_t get_pid() noexcept
{
    return static_cast<std::uint64_t>(::getpid());
}

std::uint64_t get_native_thread_id() noexcept
{
#if defined(__linux__)
    return static_cast<std::uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
#if defined(__linux__)
    char buf[PATH_MAX];
    const ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf));
    if (n <= 0)
        return "unknown";
    std::string path(buf, static_cast<size_t>(n));
    if (include_path)
        return path;
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
#else
    static_cast<void>(include_path);
    return "unknown";
#endif
}

const char *get_version_string() noexcept
{
    return SERVEFLEET_VERSION_STRING;
}

bool is_process_alive(std::uint64_t pid) noexcept
{
    if (pid == 0)
        return false;
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

} // namespace servefleet::platform
