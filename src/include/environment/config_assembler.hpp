#pragma once
/**
 * @file config_assembler.hpp
 * @brief Merges defaults, the on-disk override document and caller options into one
 *        EffectiveConfig.
 *
 * Precedence, lowest first: built-in port table, `<root tests_path>/config.json`, TLS options
 * and the option bag. `checkSubdomains` is always forced off.
 */
#include "servefleet_utils_export.h"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "environment/effective_config.hpp"

namespace servefleet::env
{

class LoggerProxy;

struct ConfigInputs
{
    TestPaths test_paths;
    /// Copied into `tls_settings`; `encrypt_after_connect` is injected from the options.
    nlohmann::json tls_options = nlohmann::json::object();
    /// Option bag ("browser_host", "bind_address", "server_host", "encrypt_after_connect", ...).
    nlohmann::json options = nlohmann::json::object();
    bool enable_quic{false};
};

/** @brief http:[8000,8001] https:[8443,8444] ws:[8888] wss:[8889] h2:[9000] (+ quic:[10000]). */
SERVEFLEET_UTILS_EXPORT PortTable default_port_table(bool enable_quic);

/**
 * @brief Deep merge: objects merge key by key; any other value replaces.
 */
SERVEFLEET_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

/**
 * @brief Reads a JSON object from disk.
 * @param context Prefix for error messages (e.g. "config override").
 * @throws ConfigurationError "<context>: cannot open '<path>'" or
 *         "<context>: JSON parse error in '<path>': <detail>".
 */
SERVEFLEET_UTILS_EXPORT nlohmann::json read_json_document(const std::filesystem::path &path,
                                                          std::string_view context);

/**
 * @brief Converts a merged config document into an EffectiveConfig.
 * @throws ConfigurationError if a documented key has the wrong shape.
 */
SERVEFLEET_UTILS_EXPORT EffectiveConfig effective_config_from_json(const nlohmann::json &doc,
                                                                   std::string_view origin);

/**
 * @brief Builds the effective configuration for one scope.
 * @param diagnostics Optional proxy logger; receives an info record when an override applies.
 * @throws ConfigurationError on a malformed or unreadable override document, or when the test
 *         paths have no "/" entry.
 */
SERVEFLEET_UTILS_EXPORT EffectiveConfig assemble_config(const ConfigInputs &inputs,
                                                        LoggerProxy *diagnostics = nullptr);

} // namespace servefleet::env
