#pragma once
/**
 * @file server_fleet.hpp
 * @brief Server handles, the fleet map and the process-based fleet launcher.
 */
#include "servefleet_utils_export.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "environment/effective_config.hpp"
#include "environment/route_builder.hpp"

namespace servefleet::env
{

class SERVEFLEET_UTILS_EXPORT ServerHandle
{
  public:
    virtual ~ServerHandle() = default;

    [[nodiscard]] virtual bool is_alive() = 0;
    /** @brief Stops the server. Must be safe to call on a server that already exited. */
    virtual void terminate() = 0;
    /** @brief OS process id, or 0 for servers that are not processes. */
    [[nodiscard]] virtual int pid() const = 0;
};

struct FleetEntry
{
    int port{0};
    std::shared_ptr<ServerHandle> handle;
};

/// scheme -> servers in port order of the config.
using ServerFleet = std::map<std::string, std::vector<FleetEntry>>;

SERVEFLEET_UTILS_EXPORT std::size_t fleet_size(const ServerFleet &fleet) noexcept;

/**
 * @brief Endpoints of the shared services, handed to every server.
 */
struct FleetContext
{
    std::string log_endpoint;
    std::string stash_endpoint;
    std::string cache_endpoint;
};

class SERVEFLEET_UTILS_EXPORT FleetLauncher
{
  public:
    virtual ~FleetLauncher() = default;

    /**
     * @brief Starts one server per (scheme, port) of `config.ports`.
     * @throws FleetStartError if any server cannot be started; servers already started are
     *         terminated first.
     */
    virtual ServerFleet start(const EffectiveConfig &config, const RouteTable &routes,
                              const FleetContext &context) = 0;
};

/**
 * @class ProcessServerHandle
 * @brief A child process. `is_alive()` reaps it once it exits.
 */
class SERVEFLEET_UTILS_EXPORT ProcessServerHandle : public ServerHandle
{
  public:
    static constexpr std::chrono::milliseconds kTerminateGrace{2000};

    ProcessServerHandle(pid_t pid, std::string label,
                        std::chrono::milliseconds grace = kTerminateGrace);
    ~ProcessServerHandle() override;

    ProcessServerHandle(const ProcessServerHandle &) = delete;
    ProcessServerHandle &operator=(const ProcessServerHandle &) = delete;

    bool is_alive() override;
    /**
     * @brief SIGTERM, wait up to the grace period, then SIGKILL.
     * @throws std::system_error if the process cannot be signalled.
     */
    void terminate() override;
    int pid() const override { return static_cast<int>(m_pid); }

    [[nodiscard]] const std::string &label() const noexcept { return m_label; }
    /** @brief Raw wait status once the process has been reaped. */
    [[nodiscard]] std::optional<int> wait_status() const;

  private:
    bool poll_exit_locked();

    pid_t m_pid;
    std::string m_label;
    std::chrono::milliseconds m_grace;
    mutable std::mutex m_mutex;
    std::optional<int> m_wait_status;
};

struct LaunchSpec
{
    std::filesystem::path executable;
    std::vector<std::string> extra_args;
    /// Receives config.json and routes.json for the servers.
    std::filesystem::path work_dir;
};

/**
 * @class ProcessFleetLauncher
 * @brief Spawns `executable` once per (scheme, port):
 *
 *     <executable> --scheme <s> --port <p> --config <file> --routes <file>
 *                  --log-endpoint <ep> --stash-endpoint <ep> --cache-endpoint <ep> [extra...]
 */
class SERVEFLEET_UTILS_EXPORT ProcessFleetLauncher : public FleetLauncher
{
  public:
    explicit ProcessFleetLauncher(LaunchSpec spec);

    ServerFleet start(const EffectiveConfig &config, const RouteTable &routes,
                      const FleetContext &context) override;

    [[nodiscard]] const LaunchSpec &spec() const noexcept { return m_spec; }

    /** @brief Command line for one server (argv[0] included). */
    [[nodiscard]] std::vector<std::string> build_argv(const std::string &scheme, int port,
                                                      const std::filesystem::path &config_file,
                                                      const std::filesystem::path &routes_file,
                                                      const FleetContext &context) const;

  private:
    LaunchSpec m_spec;
};

} // namespace servefleet::env
