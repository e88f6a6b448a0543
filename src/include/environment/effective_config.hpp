#pragma once
/**
 * @file effective_config.hpp
 * @brief Test path mappings and the effective server configuration of one scope.
 */
#include "servefleet_utils_export.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace servefleet::env
{

/// Scheme names of the baseline fleet; every EffectiveConfig carries ports for all of them.
inline constexpr const char *kBaselineSchemes[] = {"http", "https", "ws", "wss", "h2"};
inline constexpr const char *kQuicScheme = "quic-transport";

struct TestPathEntry
{
    std::filesystem::path tests_path;
    std::optional<std::filesystem::path> metadata_path;
};

/**
 * @brief Mapping url_base -> test path entry. The "/" entry is the root test path.
 */
using TestPaths = std::map<std::string, TestPathEntry>;

/**
 * @brief Returns the tests_path of the "/" entry.
 * @throws ConfigurationError if there is no "/" entry.
 */
SERVEFLEET_UTILS_EXPORT std::filesystem::path root_tests_path(const TestPaths &paths);

using PortTable = std::map<std::string, std::vector<int>>;

/**
 * @brief Configuration handed to the fleet. Built once per scope; treated as immutable.
 */
struct SERVEFLEET_UTILS_EXPORT EffectiveConfig
{
    PortTable ports;
    nlohmann::json tls_settings = nlohmann::json::object();
    bool check_subdomains{false};
    std::optional<std::string> server_host;
    std::optional<std::string> bind_address;
    std::optional<std::string> browser_host;
    std::filesystem::path doc_root;
    /// Override keys without a dedicated field, kept verbatim.
    nlohmann::json extra = nlohmann::json::object();

    /** @brief `server_host`, or "127.0.0.1" when none was configured. */
    [[nodiscard]] std::string connect_host() const;

    [[nodiscard]] bool has_scheme(const std::string &scheme) const
    {
        return ports.find(scheme) != ports.end();
    }

    /**
     * @brief Serializes with the keys used by the override document
     *        ("ports", "ssl", "check_subdomains", "server_host", ...). Unknown keys from
     *        `extra` are emitted at top level.
     */
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace servefleet::env
