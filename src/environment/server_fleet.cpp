#include "environment/server_fleet.hpp"

#include "environment/errors.hpp"
#include "sfl_service.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace servefleet::env
{

namespace
{
constexpr std::chrono::milliseconds kExitPollInterval{50};

void write_json_file(const fs::path &path, const nlohmann::json &doc)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        throw FleetStartError(fmt::format("cannot write '{}'", path.string()));
    }
    out << doc.dump(2) << '\n';
    if (!out.good())
    {
        throw FleetStartError(fmt::format("error writing '{}'", path.string()));
    }
}

// Forks and execs argv. The child reports an exec failure through a close-on-exec pipe, so a
// missing or non-executable binary is detected here rather than as an early exit.
pid_t spawn_server(const std::vector<std::string> &argv)
{
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) == -1)
    {
        throw FleetStartError(fmt::format("pipe2 failed: {}", std::strerror(errno)));
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &a : argv)
        cargv.push_back(const_cast<char *>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        const int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw FleetStartError(fmt::format("fork failed: {}", std::strerror(err)));
    }
    if (pid == 0)
    {
        ::close(err_pipe[0]);
        // Servers get default signal dispositions even if the orchestrator ignores SIGINT.
        ::signal(SIGINT, SIG_DFL);
        ::execv(cargv[0], cargv.data());
        const int err = errno;
        static_cast<void>(::write(err_pipe[1], &err, sizeof(err)));
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do
    {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status = 0;
        static_cast<void>(::waitpid(pid, &status, 0));
        throw FleetStartError(
            fmt::format("cannot execute '{}': {}", argv.front(), std::strerror(child_errno)));
    }
    return pid;
}
} // namespace

std::size_t fleet_size(const ServerFleet &fleet) noexcept
{
    std::size_t n = 0;
    for (const auto &[scheme, servers] : fleet)
        n += servers.size();
    return n;
}

// ============================================================================
// ProcessServerHandle
// ============================================================================

ProcessServerHandle::ProcessServerHandle(pid_t pid, std::string label,
                                         std::chrono::milliseconds grace)
    : m_pid(pid), m_label(std::move(label)), m_grace(grace)
{
}

ProcessServerHandle::~ProcessServerHandle()
{
    try
    {
        terminate();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Server {} (pid {}): terminate in destructor failed: {}", m_label, m_pid,
                     e.what());
    }
}

bool ProcessServerHandle::poll_exit_locked()
{
    if (m_wait_status)
        return true;
    int status = 0;
    const pid_t r = ::waitpid(m_pid, &status, WNOHANG);
    if (r == m_pid)
    {
        m_wait_status = status;
        return true;
    }
    if (r == -1 && errno == ECHILD)
    {
        // Not our child (or already reaped elsewhere): fall back to a liveness check.
        if (!servefleet::platform::is_process_alive(static_cast<uint64_t>(m_pid)))
        {
            m_wait_status = 0;
            return true;
        }
    }
    return false;
}

bool ProcessServerHandle::is_alive()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return !poll_exit_locked();
}

std::optional<int> ProcessServerHandle::wait_status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_wait_status;
}

void ProcessServerHandle::terminate()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (poll_exit_locked())
        return;

    if (::kill(m_pid, SIGTERM) == -1 && errno != ESRCH)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("kill(SIGTERM) {} pid {}", m_label, m_pid));
    }

    const auto deadline = std::chrono::steady_clock::now() + m_grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (poll_exit_locked())
        {
            LOGGER_DEBUG("Server {} (pid {}) exited after SIGTERM", m_label, m_pid);
            return;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }

    LOGGER_WARN("Server {} (pid {}) ignored SIGTERM for {} ms; sending SIGKILL", m_label, m_pid,
                m_grace.count());
    if (::kill(m_pid, SIGKILL) == -1 && errno != ESRCH)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("kill(SIGKILL) {} pid {}", m_label, m_pid));
    }
    int status = 0;
    pid_t r = 0;
    do
    {
        r = ::waitpid(m_pid, &status, 0);
    } while (r == -1 && errno == EINTR);
    m_wait_status = (r == m_pid) ? status : 0;
}

// ============================================================================
// ProcessFleetLauncher
// ============================================================================

ProcessFleetLauncher::ProcessFleetLauncher(LaunchSpec spec) : m_spec(std::move(spec)) {}

std::vector<std::string> ProcessFleetLauncher::build_argv(const std::string &scheme, int port,
                                                          const fs::path &config_file,
                                                          const fs::path &routes_file,
                                                          const FleetContext &context) const
{
    std::vector<std::string> argv{m_spec.executable.string(),
                                  "--scheme",
                                  scheme,
                                  "--port",
                                  std::to_string(port),
                                  "--config",
                                  config_file.string(),
                                  "--routes",
                                  routes_file.string(),
                                  "--log-endpoint",
                                  context.log_endpoint,
                                  "--stash-endpoint",
                                  context.stash_endpoint,
                                  "--cache-endpoint",
                                  context.cache_endpoint};
    argv.insert(argv.end(), m_spec.extra_args.begin(), m_spec.extra_args.end());
    return argv;
}

ServerFleet ProcessFleetLauncher::start(const EffectiveConfig &config, const RouteTable &routes,
                                        const FleetContext &context)
{
    if (m_spec.executable.empty())
    {
        throw FleetStartError("fleet: no server executable configured");
    }

    std::error_code ec;
    fs::create_directories(m_spec.work_dir, ec);
    if (ec)
    {
        throw FleetStartError(fmt::format("fleet: cannot create work dir '{}': {}",
                                          m_spec.work_dir.string(), ec.message()));
    }
    const fs::path config_file = m_spec.work_dir / "config.json";
    const fs::path routes_file = m_spec.work_dir / "routes.json";
    write_json_file(config_file, config.to_json());
    write_json_file(routes_file, to_json(routes));

    ServerFleet fleet;
    auto rollback = servefleet::basics::make_scope_guard(
        [&fleet]()
        {
            for (auto &[scheme, servers] : fleet)
            {
                for (auto &entry : servers)
                {
                    entry.handle->terminate();
                }
            }
        });

    for (const auto &[scheme, ports] : config.ports)
    {
        auto &servers = fleet[scheme];
        for (int port : ports)
        {
            const std::string label = fmt::format("{}:{}", scheme, port);
            pid_t pid = 0;
            try
            {
                pid = spawn_server(build_argv(scheme, port, config_file, routes_file, context));
            }
            catch (const FleetStartError &e)
            {
                throw FleetStartError(fmt::format("fleet: server {} failed to start: {}", label,
                                                  e.what()));
            }
            servers.push_back({port, std::make_shared<ProcessServerHandle>(pid, label)});
            LOGGER_INFO("Fleet: started {} (pid {})", label, pid);
        }
    }

    rollback.dismiss();
    LOGGER_INFO("Fleet: {} server(s) started from {}", fleet_size(fleet),
                m_spec.executable.string());
    return fleet;
}

} // namespace servefleet::env
