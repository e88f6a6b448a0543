#include "environment/effective_config.hpp"
#include "environment/errors.hpp"

namespace servefleet::env
{

std::filesystem::path root_tests_path(const TestPaths &paths)
{
    auto it = paths.find("/");
    if (it == paths.end())
    {
        throw ConfigurationError("test paths: no entry for url base '/'");
    }
    return it->second.tests_path;
}

std::string EffectiveConfig::connect_host() const
{
    return server_host.value_or("127.0.0.1");
}

nlohmann::json EffectiveConfig::to_json() const
{
    nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();
    j["ports"] = ports;
    j["ssl"] = tls_settings;
    j["check_subdomains"] = check_subdomains;
    j["doc_root"] = doc_root.string();
    j["server_host"] = server_host ? nlohmann::json(*server_host) : nlohmann::json(nullptr);
    if (bind_address)
        j["bind_address"] = *bind_address;
    if (browser_host)
        j["browser_host"] = *browser_host;
    return j;
}

} // namespace servefleet::env
