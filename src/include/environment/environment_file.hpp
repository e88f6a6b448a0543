#pragma once
/**
 * @file environment_file.hpp
 * @brief Loads EnvironmentSettings and a LaunchSpec from a JSON document.
 *
 * ```json
 * {
 *   "test_paths": {"/": {"tests_path": "tests", "metadata_path": "meta"}},
 *   "options": {"server_host": "127.0.0.1", "supports_debugger": false},
 *   "ssl": {"type": "none"},
 *   "enable_quic": false,
 *   "mojojs_path": "gen",
 *   "timeout_multiplier": 1.0, "pause_after_test": false, "debug_test": false,
 *   "debug_info": {"interactive": false, "debugger": "gdb", "args": []},
 *   "runner_dir": "runner", "repo_root": ".", "third_party_dir": "third_party",
 *   "server": {"executable": "/usr/bin/test-server", "args": [], "work_dir": "/tmp/fleet"}
 * }
 * ```
 * Relative paths are resolved against the directory holding the document.
 */
#include "servefleet_utils_export.h"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "environment/server_fleet.hpp"
#include "environment/test_environment.hpp"

namespace servefleet::env
{

struct EnvironmentFile
{
    EnvironmentSettings settings;
    LaunchSpec launch;
};

/**
 * @throws ConfigurationError on a missing, malformed or incomplete document.
 */
SERVEFLEET_UTILS_EXPORT EnvironmentFile load_environment_file(const std::filesystem::path &path);

/**
 * @brief Same as load_environment_file for an already parsed document.
 * @param base_dir Directory relative paths are resolved against.
 */
SERVEFLEET_UTILS_EXPORT EnvironmentFile parse_environment_document(
    const nlohmann::json &doc, const std::filesystem::path &base_dir, std::string_view origin);

} // namespace servefleet::env
