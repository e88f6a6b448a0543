#pragma once
/**
 * @file readiness.hpp
 * @brief Verifies that every fleet server is alive and accepting connections.
 */
#include "servefleet_utils_export.h"

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "environment/server_fleet.hpp"

namespace servefleet::env
{

struct ReadinessReport
{
    /// (scheme, port) of servers whose process is gone.
    std::vector<std::pair<std::string, int>> failed;
    /// (host, port) of servers that did not accept a TCP connection.
    std::vector<std::pair<std::string, int>> pending;

    [[nodiscard]] bool ready() const noexcept { return failed.empty() && pending.empty(); }
};

struct ReadinessOptions
{
    std::chrono::milliseconds budget{30000};
    std::chrono::milliseconds interval{500};
    std::chrono::milliseconds connect_timeout{100};
    bool check_ports{true};
    /// Schemes that cannot be checked with a TCP connect (UDP transports).
    std::set<std::string> connect_exempt{"quic-transport"};
    /// Sleep between polls; replaced in tests.
    std::function<void(std::chrono::milliseconds)> sleep;
};

/**
 * @brief Attempts one TCP connection to host:port within `timeout`. The socket is always
 *        closed before returning.
 */
SERVEFLEET_UTILS_EXPORT bool tcp_connectable(const std::string &host, int port,
                                       std::chrono::milliseconds timeout) noexcept;

/**
 * @brief Classifies every server once.
 *
 * Dead servers go to `failed`; if there are any, ports are not checked. Otherwise, when
 * `check_ports` is set, each server of a connectable scheme is connected to and added to
 * `pending` on failure.
 */
SERVEFLEET_UTILS_EXPORT ReadinessReport
test_servers(const ServerFleet &fleet, const std::string &host, bool check_ports,
             const std::set<std::string> &connect_exempt = {"quic-transport"},
             std::chrono::milliseconds connect_timeout = std::chrono::milliseconds{100});

/**
 * @brief Polls `test_servers` until every server is ready.
 * @return The number of polls taken.
 * @throws ReadinessError "Servers failed to start: scheme:port, ..." as soon as a server is
 *         dead, or "Servers failed to start: host:port, ..." once the budget is spent with
 *         servers still pending.
 */
SERVEFLEET_UTILS_EXPORT int ensure_started(const ServerFleet &fleet, const std::string &host,
                                           const ReadinessOptions &options = {});

} // namespace servefleet::env
