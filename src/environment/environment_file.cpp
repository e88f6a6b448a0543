#include "environment/environment_file.hpp"

#include "environment/config_assembler.hpp"
#include "environment/errors.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace servefleet::env
{

namespace
{
fs::path resolve(const fs::path &base_dir, const std::string &p)
{
    fs::path path(p);
    if (path.is_relative())
        path = base_dir / path;
    return path.lexically_normal();
}

template <typename T>
T get_or(const nlohmann::json &doc, const char *key, T fallback, std::string_view origin)
{
    if (!doc.contains(key) || doc.at(key).is_null())
        return fallback;
    try
    {
        return doc.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigurationError(fmt::format("{}: invalid value for '{}': {}", origin, key,
                                             e.what()));
    }
}

TestPaths parse_test_paths(const nlohmann::json &doc, const fs::path &base_dir,
                           std::string_view origin)
{
    if (!doc.contains("test_paths") || !doc.at("test_paths").is_object())
    {
        throw ConfigurationError(fmt::format("{}: 'test_paths' must be an object", origin));
    }
    TestPaths paths;
    for (auto it = doc.at("test_paths").begin(); it != doc.at("test_paths").end(); ++it)
    {
        const nlohmann::json &entry = it.value();
        if (!entry.is_object() || !entry.contains("tests_path") ||
            !entry.at("tests_path").is_string())
        {
            throw ConfigurationError(fmt::format(
                "{}: test_paths['{}'] needs a string 'tests_path'", origin, it.key()));
        }
        TestPathEntry tp;
        tp.tests_path = resolve(base_dir, entry.at("tests_path").get<std::string>());
        if (entry.contains("metadata_path") && entry.at("metadata_path").is_string())
        {
            tp.metadata_path = resolve(base_dir, entry.at("metadata_path").get<std::string>());
        }
        paths.emplace(it.key(), std::move(tp));
    }
    return paths;
}
} // namespace

EnvironmentFile parse_environment_document(const nlohmann::json &doc, const fs::path &base_dir,
                                           std::string_view origin)
{
    if (!doc.is_object())
    {
        throw ConfigurationError(fmt::format("{}: top-level value must be an object", origin));
    }

    EnvironmentFile out;
    EnvironmentSettings &s = out.settings;
    s.test_paths = parse_test_paths(doc, base_dir, origin);
    s.options = get_or(doc, "options", nlohmann::json::object(), origin);
    if (!s.options.is_object())
    {
        throw ConfigurationError(fmt::format("{}: 'options' must be an object", origin));
    }
    s.ssl_config = get_or(doc, "ssl", nlohmann::json::object(), origin);
    s.enable_quic = get_or(doc, "enable_quic", false, origin);
    s.timeout_multiplier = get_or(doc, "timeout_multiplier", 1.0, origin);
    s.pause_after_test = get_or(doc, "pause_after_test", false, origin);
    s.debug_test = get_or(doc, "debug_test", false, origin);
    s.server_component =
        get_or(doc, "server_component", std::string(ProxyLoggingContext::kDefaultComponent), origin);

    if (doc.contains("debug_info") && doc.at("debug_info").is_object())
    {
        const nlohmann::json &di = doc.at("debug_info");
        DebugInfo info;
        info.interactive = get_or(di, "interactive", false, origin);
        info.debugger = get_or(di, "debugger", std::string{}, origin);
        info.args = get_or(di, "args", std::vector<std::string>{}, origin);
        s.debug_info = std::move(info);
    }

    const std::string mojojs = get_or(doc, "mojojs_path", std::string{}, origin);
    if (!mojojs.empty())
        s.generated_bindings_path = resolve(base_dir, mojojs);

    s.runner_dir = resolve(base_dir, get_or(doc, "runner_dir", std::string("."), origin));
    s.repo_root = resolve(base_dir, get_or(doc, "repo_root", std::string("."), origin));
    s.third_party_dir =
        resolve(base_dir, get_or(doc, "third_party_dir", std::string("third_party"), origin));

    if (!doc.contains("server") || !doc.at("server").is_object())
    {
        throw ConfigurationError(fmt::format("{}: 'server' must be an object", origin));
    }
    const nlohmann::json &server = doc.at("server");
    const std::string exe = get_or(server, "executable", std::string{}, origin);
    if (exe.empty())
    {
        throw ConfigurationError(fmt::format("{}: 'server.executable' is required", origin));
    }
    out.launch.executable = resolve(base_dir, exe);
    out.launch.extra_args = get_or(server, "args", std::vector<std::string>{}, origin);
    const std::string work_dir = get_or(server, "work_dir", std::string{}, origin);
    out.launch.work_dir = work_dir.empty()
                              ? fs::temp_directory_path() / "servefleet"
                              : resolve(base_dir, work_dir);
    return out;
}

EnvironmentFile load_environment_file(const fs::path &path)
{
    const nlohmann::json doc = read_json_document(path, "environment file");
    fs::path base_dir = path.parent_path();
    if (base_dir.empty())
        base_dir = fs::current_path();
    return parse_environment_document(doc, base_dir, path.string());
}

} // namespace servefleet::env
