#include "environment/config_assembler.hpp"

#include "environment/errors.hpp"
#include "environment/proxy_logging.hpp"

#include <fmt/format.h>

#include <array>
#include <fstream>

namespace fs = std::filesystem;

namespace servefleet::env
{

namespace
{
// Override keys with a dedicated EffectiveConfig field.
constexpr std::array<const char *, 7> kDocumentedKeys = {
    "ports", "ssl", "check_subdomains", "server_host", "bind_address", "browser_host", "doc_root"};

bool is_documented_key(const std::string &key)
{
    for (const char *k : kDocumentedKeys)
    {
        if (key == k)
            return true;
    }
    return false;
}

std::optional<std::string> optional_string(const nlohmann::json &doc, const char *key,
                                           std::string_view origin)
{
    if (!doc.contains(key) || doc.at(key).is_null())
        return std::nullopt;
    if (!doc.at(key).is_string())
    {
        throw ConfigurationError(fmt::format("{}: '{}' must be a string", origin, key));
    }
    return doc.at(key).get<std::string>();
}

PortTable parse_ports(const nlohmann::json &ports, std::string_view origin)
{
    if (!ports.is_object())
    {
        throw ConfigurationError(
            fmt::format("{}: 'ports' must be an object of integer arrays", origin));
    }
    PortTable table;
    for (auto it = ports.begin(); it != ports.end(); ++it)
    {
        if (!it.value().is_array())
        {
            throw ConfigurationError(fmt::format(
                "{}: 'ports.{}' must be an array of integers", origin, it.key()));
        }
        std::vector<int> list;
        for (const auto &p : it.value())
        {
            if (!p.is_number_integer())
            {
                throw ConfigurationError(fmt::format(
                    "{}: 'ports.{}' must be an array of integers", origin, it.key()));
            }
            list.push_back(p.get<int>());
        }
        table.emplace(it.key(), std::move(list));
    }
    return table;
}

} // namespace

PortTable default_port_table(bool enable_quic)
{
    PortTable ports{
        {"http", {8000, 8001}},
        {"https", {8443, 8444}},
        {"ws", {8888}},
        {"wss", {8889}},
        {"h2", {9000}},
    };
    if (enable_quic)
    {
        ports.emplace(kQuicScheme, std::vector<int>{10000});
    }
    return ports;
}

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

nlohmann::json read_json_document(const fs::path &path, std::string_view context)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw ConfigurationError(fmt::format("{}: cannot open '{}'", context, path.string()));
    }
    nlohmann::json doc;
    try
    {
        f >> doc;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigurationError(
            fmt::format("{}: JSON parse error in '{}': {}", context, path.string(), e.what()));
    }
    if (!doc.is_object())
    {
        throw ConfigurationError(
            fmt::format("{}: JSON parse error in '{}': top-level value must be an object", context,
                        path.string()));
    }
    return doc;
}

EffectiveConfig effective_config_from_json(const nlohmann::json &doc, std::string_view origin)
{
    EffectiveConfig cfg;
    if (doc.contains("ports"))
    {
        cfg.ports = parse_ports(doc.at("ports"), origin);
    }
    if (doc.contains("ssl"))
    {
        if (!doc.at("ssl").is_object())
        {
            throw ConfigurationError(fmt::format("{}: 'ssl' must be an object", origin));
        }
        cfg.tls_settings = doc.at("ssl");
    }
    if (doc.contains("check_subdomains"))
    {
        if (!doc.at("check_subdomains").is_boolean())
        {
            throw ConfigurationError(
                fmt::format("{}: 'check_subdomains' must be a boolean", origin));
        }
        cfg.check_subdomains = doc.at("check_subdomains").get<bool>();
    }
    cfg.server_host = optional_string(doc, "server_host", origin);
    cfg.bind_address = optional_string(doc, "bind_address", origin);
    cfg.browser_host = optional_string(doc, "browser_host", origin);
    if (auto root = optional_string(doc, "doc_root", origin))
    {
        cfg.doc_root = *root;
    }
    for (auto it = doc.begin(); it != doc.end(); ++it)
    {
        if (!is_documented_key(it.key()))
        {
            cfg.extra[it.key()] = it.value();
        }
    }
    return cfg;
}

EffectiveConfig assemble_config(const ConfigInputs &inputs, LoggerProxy *diagnostics)
{
    const fs::path root = root_tests_path(inputs.test_paths);
    const fs::path override_path = root / "config.json";

    nlohmann::json doc = nlohmann::json::object();
    doc["ports"] = default_port_table(inputs.enable_quic);

    std::error_code ec;
    if (fs::exists(override_path, ec))
    {
        json_merge(doc, read_json_document(override_path, "config override"));
        if (diagnostics != nullptr)
        {
            diagnostics->info("Applied config override", {{"path", override_path.string()}});
        }
    }

    EffectiveConfig cfg = effective_config_from_json(doc, override_path.string());

    cfg.check_subdomains = false;

    const nlohmann::json opts =
        inputs.options.is_object() ? inputs.options : nlohmann::json::object();
    cfg.tls_settings =
        inputs.tls_options.is_object() ? inputs.tls_options : nlohmann::json::object();
    // Non-boolean values count as unset.
    const auto encrypt = opts.find("encrypt_after_connect");
    cfg.tls_settings["encrypt_after_connect"] =
        encrypt != opts.end() && encrypt->is_boolean() && encrypt->get<bool>();

    if (auto v = optional_string(opts, "browser_host", "options"))
        cfg.browser_host = std::move(v);
    if (auto v = optional_string(opts, "bind_address", "options"))
        cfg.bind_address = std::move(v);
    cfg.server_host = optional_string(opts, "server_host", "options");

    cfg.doc_root = root;
    return cfg;
}

} // namespace servefleet::env
