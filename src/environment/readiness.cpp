#include "environment/readiness.hpp"

#include "environment/errors.hpp"
#include "sfl_service.hpp"

#include <cerrno>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace servefleet::env
{

namespace
{
std::string join_entries(const std::vector<std::pair<std::string, int>> &entries)
{
    fmt::memory_buffer out;
    bool first = true;
    for (const auto &[name, port] : entries)
    {
        if (!first)
            fmt::format_to(std::back_inserter(out), ", ");
        first = false;
        fmt::format_to(std::back_inserter(out), "{}:{}", name, port);
    }
    return fmt::to_string(out);
}

bool connect_with_timeout(const addrinfo *ai, std::chrono::milliseconds timeout) noexcept
{
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd == -1)
        return false;
    auto close_fd = servefleet::basics::make_scope_guard([fd]() { ::close(fd); });

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
        return true;
    if (errno != EINPROGRESS)
        return false;

    pollfd pfd{fd, POLLOUT, 0};
    int r = 0;
    do
    {
        r = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (r == -1 && errno == EINTR);
    if (r <= 0)
        return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == -1)
        return false;
    return so_error == 0;
}
} // namespace

bool tcp_connectable(const std::string &host, int port, std::chrono::milliseconds timeout) noexcept
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0)
        return false;

    bool ok = false;
    for (const addrinfo *ai = res; ai != nullptr && !ok; ai = ai->ai_next)
    {
        ok = connect_with_timeout(ai, timeout);
    }
    ::freeaddrinfo(res);
    return ok;
}

ReadinessReport test_servers(const ServerFleet &fleet, const std::string &host, bool check_ports,
                             const std::set<std::string> &connect_exempt,
                             std::chrono::milliseconds connect_timeout)
{
    ReadinessReport report;
    for (const auto &[scheme, servers] : fleet)
    {
        for (const auto &entry : servers)
        {
            if (!entry.handle->is_alive())
                report.failed.emplace_back(scheme, entry.port);
        }
    }

    if (!report.failed.empty() || !check_ports)
        return report;

    for (const auto &[scheme, servers] : fleet)
    {
        if (connect_exempt.count(scheme) != 0)
            continue;
        for (const auto &entry : servers)
        {
            if (!tcp_connectable(host, entry.port, connect_timeout))
                report.pending.emplace_back(host, entry.port);
        }
    }
    return report;
}

int ensure_started(const ServerFleet &fleet, const std::string &host,
                   const ReadinessOptions &options)
{
    std::function<void(std::chrono::milliseconds)> sleep = options.sleep;
    if (!sleep)
    {
        sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

    // Elapsed time is the sum of connect time and sleeps, so an injected sleep advances it.
    std::chrono::milliseconds elapsed{0};
    int polls = 0;
    ReadinessReport report;
    while (elapsed < options.budget)
    {
        const auto t0 = std::chrono::steady_clock::now();
        report = test_servers(fleet, host, options.check_ports, options.connect_exempt,
                              options.connect_timeout);
        ++polls;
        elapsed += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);

        if (!report.failed.empty())
        {
            LOGGER_ERROR("Readiness: {} server(s) died: {}", report.failed.size(),
                         join_entries(report.failed));
            throw ReadinessError("Servers failed to start: " + join_entries(report.failed));
        }
        if (report.pending.empty())
        {
            LOGGER_INFO("Readiness: {} server(s) ready after {} poll(s)", fleet_size(fleet),
                        polls);
            return polls;
        }
        sleep(options.interval);
        elapsed += options.interval;
    }

    LOGGER_ERROR("Readiness: {} server(s) still not accepting after {} ms: {}",
                 report.pending.size(), options.budget.count(), join_entries(report.pending));
    throw ReadinessError("Servers failed to start: " + join_entries(report.pending));
}

} // namespace servefleet::env
